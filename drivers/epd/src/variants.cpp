/**
 * @file   variants.cpp
 * @author Dennis Sitelew
 * @date   Oct. 11, 2026
 */

#include <epd/controller/controller.hpp>
#include <epd/variants.hpp>

#include <zephyr/logging/log.h>

#include <vector>

LOG_MODULE_DECLARE(epd, CONFIG_EPD_LOG_LEVEL);

using namespace epd;

namespace {

using common::color_planes;

bool is_bw_panel(const panel::descriptor &panel) {
   return panel.planes == color_planes::mono || panel.planes == color_planes::gray4;
}

//! Built-in table of the family that fits the controller's LUT register
std::optional<lut::table> register_lut(const controller::base &chip, lut::mode mode) {
   auto table = lut::find(chip.family(), mode);
   if (!table || table->data.size() != chip.lut_size()) {
      return std::nullopt;
   }
   return table;
}

error mono_support(const panel::descriptor &panel) {
   const auto chip = controller::get(panel.family);
   if (!chip || !is_bw_panel(panel)) {
      return error::unsupported_feature;
   }

   if (!panel.default_lut.empty() && panel.default_lut.data.size() != chip->lut_size()) {
      return error::unsupported_feature;
   }

   return error::success;
}

error tri_color_support(const panel::descriptor &panel) {
   const auto chip = controller::get(panel.family);
   if (!chip || panel.planes != color_planes::tri_color || !chip->has_secondary_ram()) {
      return error::unsupported_feature;
   }

   if (!panel.default_lut.empty() && panel.default_lut.data.size() != chip->lut_size()) {
      return error::unsupported_feature;
   }

   return error::success;
}

error fast_support(const panel::descriptor &panel) {
   const auto chip = controller::get(panel.family);
   if (!chip || !is_bw_panel(panel)) {
      return error::unsupported_feature;
   }

   // The full waveform is needed to clean up after fast refreshes
   if (!register_lut(*chip, lut::mode::fast) || !register_lut(*chip, lut::mode::full)) {
      return error::unsupported_feature;
   }

   return error::success;
}

error gray_scale_support(const panel::descriptor &panel) {
   const auto chip = controller::get(panel.family);
   if (!chip || panel.planes != color_planes::gray4) {
      return error::unsupported_feature;
   }

   // The normal waveform clears the panel before the gray steps
   if (!register_lut(*chip, lut::mode::gray4) || !register_lut(*chip, lut::mode::full)) {
      return error::unsupported_feature;
   }

   return error::success;
}

} // namespace

namespace epd {

////////////////////////////////////////////////////////////////////////////////
// Mono
mono_driver::mono_driver(const panel::descriptor &panel, epd::bus &bus, const config &cfg)
   : driver{panel, bus, cfg} {
   set_support(mono_support(panel));
}

void_t mono_driver::configure() {
   auto upload = [&]() -> void_t {
      if (panel().default_lut.empty()) {
         return {};
      }
      return upload_lut(panel().default_lut);
   };

   // The red RAM takes part in every refresh, so it has to be blank
   return upload().and_then([&] {
      return chip().clear_secondary(engine(), panel());
   });
}

////////////////////////////////////////////////////////////////////////////////
// Tri-color
tri_color_driver::tri_color_driver(const panel::descriptor &panel, epd::bus &bus, const config &cfg)
   : driver{panel, bus, cfg} {
   set_support(tri_color_support(panel));
}

void_t tri_color_driver::configure() {
   if (panel().default_lut.empty()) {
      return {};
   }

   return upload_lut(panel().default_lut);
}

////////////////////////////////////////////////////////////////////////////////
// Fast
fast_driver::fast_driver(const panel::descriptor &panel, epd::bus &bus, const config &cfg)
   : driver{panel, bus, cfg} {
   set_support(fast_support(panel));
}

void_t fast_driver::configure() {
   const auto fast = register_lut(chip(), lut::mode::fast);
   if (!fast) {
      return unexpected(error::unsupported_feature);
   }

   return upload_lut(*fast).and_then([&] {
      return chip().clear_secondary(engine(), panel());
   });
}

void_t fast_driver::display_frame_full(bytes_t data) {
   return check_frame(data).and_then([&]() -> void_t {
      const auto full = register_lut(chip(), lut::mode::full);
      const auto fast = register_lut(chip(), lut::mode::fast);
      if (!full || !fast) {
         return unexpected(error::unsupported_feature);
      }

      LOG_DBG("Full refresh");
      return upload_lut(*full)
         .and_then([&] {
            return transfer_and_refresh(data);
         })
         .and_then([&] {
            return upload_lut(*fast);
         });
   });
}

void_t fast_driver::display_frame_full(const frame::buffer &frame) {
   if (frame.planes() != planes()) {
      return check_frame(frame.bytes()).and_then([]() -> void_t {
         return unexpected(error::invalid_buffer_size);
      });
   }

   return display_frame_full(frame.bytes());
}

////////////////////////////////////////////////////////////////////////////////
// Gray scale
gray_scale_driver::gray_scale_driver(const panel::descriptor &panel, epd::bus &bus, const config &cfg)
   : driver{panel, bus, cfg} {
   set_support(gray_scale_support(panel));
}

void_t gray_scale_driver::configure() {
   // The steps only write the B/W RAM, the red one has to select the same LUT for every pixel
   return restore_normal_waveform().and_then([&] {
      return chip().clear_secondary(engine(), panel());
   });
}

void_t gray_scale_driver::clear(frame::color c) {
   if (c != frame::color::black && c != frame::color::white) {
      return unexpected(error::unsupported_feature);
   }

   const auto value = c == frame::color::black ? frame::black_byte : frame::white_byte;
   const std::vector<std::uint8_t> plane(panel().plane_size(), value);

   return check_supported()
      .and_then([&] {
         return check_state(common::driver_state::idle);
      })
      .and_then([&] {
         return restore_normal_waveform();
      })
      .and_then([&] {
         return transfer_and_refresh(plane, 1);
      });
}

void_t gray_scale_driver::refresh_frame(bytes_t data) {
   const auto gray = register_lut(chip(), lut::mode::gray4);
   if (!gray) {
      return unexpected(error::unsupported_feature);
   }

   return upload_lut(*gray).and_then([&]() -> void_t {
      for (std::uint8_t level = levels - 1; level > 0; --level) {
         LOG_DBG("Gray step %d", static_cast<int>(level));

         const auto step = frame::gray_step(data, panel().plane_size(), level);
         if (auto res = transfer_and_refresh(step, 1); !res) {
            return res;
         }
      }
      return {};
   });
}

void_t gray_scale_driver::restore_normal_waveform() {
   const auto full = register_lut(chip(), lut::mode::full);
   if (!full) {
      return unexpected(error::unsupported_feature);
   }

   return upload_lut(*full);
}

} // namespace epd
