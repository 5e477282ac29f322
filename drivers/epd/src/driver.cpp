/**
 * @file   driver.cpp
 * @author Dennis Sitelew
 * @date   Oct. 10, 2026
 */

#include <epd/controller/controller.hpp>
#include <epd/driver.hpp>
#include <epd/variants.hpp>

#include <zephyr/logging/log.h>

LOG_MODULE_REGISTER(epd, CONFIG_EPD_LOG_LEVEL);

using namespace epd;

using common::driver_state;

driver::driver(const panel::descriptor &panel, epd::bus &bus, const config &cfg)
   : panel_{panel}
   , controller_{controller::get(panel.family)}
   , protocol_{bus, {.busy_timeout = cfg.busy_timeout, .refresh_timeout = cfg.refresh_timeout}} {
   if (!controller_) {
      LOG_ERR("No controller for chip family %d", static_cast<int>(panel.family));
      support_ = error::unsupported_feature;
   }
}

expected<std::unique_ptr<driver>> driver::make(variant v, const panel::descriptor &panel, epd::bus &bus,
                                               const config &cfg) {
   std::unique_ptr<driver> result;
   switch (v) {
      case variant::mono:
         result = std::make_unique<mono_driver>(panel, bus, cfg);
         break;
      case variant::tri_color:
         result = std::make_unique<tri_color_driver>(panel, bus, cfg);
         break;
      case variant::fast:
         result = std::make_unique<fast_driver>(panel, bus, cfg);
         break;
      case variant::gray_scale:
         result = std::make_unique<gray_scale_driver>(panel, bus, cfg);
         break;
      default:
         return unexpected(error::unsupported_feature);
   }

   if (const auto support = result->support(); support != error::success) {
      return unexpected(support);
   }

   return result;
}

void_t driver::init(k_timeout_t reset_delay) {
   return check_supported()
      .and_then([&] {
         // Rejected while a bus operation is in progress, before anything is reset
         return protocol_.transition(driver_state::initializing);
      })
      .and_then([&] {
         lut_.clear();
         return protocol_.reset(chip().reset_pulse(reset_delay));
      })
      .and_then([&] {
         return chip().wait_ready(protocol_);
      })
      .and_then([&] {
         return chip().power_on(protocol_, panel_);
      })
      .and_then([&] {
         return configure();
      })
      .and_then([&] {
         return chip().wait_ready(protocol_);
      })
      .and_then([&] {
         LOG_DBG("%s %.*s (%s) ready", common::to_string(panel_.family), static_cast<int>(panel_.size.size()),
                 panel_.size.data(), common::to_string(planes()));
         return protocol_.transition(driver_state::idle);
      })
      .or_else([&](const auto &ec) -> void_t {
         LOG_ERR("Initialization failed: %s", ec.message().c_str());
         return unexpected(ec);
      });
}

void_t driver::set_lut(const lut::table &table) {
   return check_supported()
      .and_then([&] {
         return check_state(driver_state::idle);
      })
      .and_then([&]() -> void_t {
         const auto size = chip().lut_size();
         if (size == 0 || table.data.size() != size) {
            LOG_WRN("LUT of %d bytes not accepted, register size is %d", static_cast<int>(table.data.size()),
                    static_cast<int>(size));
            return unexpected(error::unsupported_feature);
         }

         return upload_lut(table);
      });
}

void_t driver::display_frame(bytes_t data) {
   return check_frame(data).and_then([&] {
      return refresh_frame(data);
   });
}

void_t driver::display_frame(const frame::buffer &frame) {
   return check_supported()
      .and_then([&] {
         return check_state(driver_state::idle);
      })
      .and_then([&]() -> void_t {
         if (frame.planes() != planes()) {
            LOG_WRN("Frame has %s planes, driver expects %s", common::to_string(frame.planes()),
                    common::to_string(planes()));
            return unexpected(error::invalid_buffer_size);
         }

         return display_frame(frame.bytes());
      });
}

void_t driver::sleep() {
   return check_supported()
      .and_then([&] {
         return check_state(driver_state::idle);
      })
      .and_then([&] {
         return chip().deep_sleep(protocol_);
      })
      .and_then([&] {
         return protocol_.transition(driver_state::sleeping);
      });
}

void_t driver::wake(k_timeout_t reset_delay) {
   return check_supported()
      .and_then([&] {
         return check_state(driver_state::sleeping);
      })
      .and_then([&] {
         return init(reset_delay);
      });
}

std::size_t driver::frame_size() const {
   return panel_.plane_size() * common::plane_count(planes());
}

void driver::set_support(error support) {
   if (support_ != error::success || support == error::success) {
      return;
   }

   LOG_WRN("%s panel %.*s can't be driven as %s", common::to_string(panel_.family),
           static_cast<int>(panel_.size.size()), panel_.size.data(), common::to_string(planes()));
   support_ = support;
}

void_t driver::upload_lut(const lut::table &table) {
   lut_.assign(table.data.begin(), table.data.end());

   return chip()
      .load_lut(protocol_, {.mode = table.mode, .data = lut_})
      .or_else([&](const auto &ec) -> void_t {
         lut_.clear();
         return unexpected(ec);
      });
}

void_t driver::refresh_frame(bytes_t data) {
   return transfer_and_refresh(data);
}

void_t driver::transfer_and_refresh(bytes_t data) {
   return transfer_and_refresh(data, common::plane_count(planes()));
}

void_t driver::transfer_and_refresh(bytes_t data, std::uint8_t plane_count) {
   const auto plane_size = panel_.plane_size();

   return protocol_.transition(driver_state::transferring_data)
      .and_then([&]() -> void_t {
         for (std::uint8_t i = 0; i < plane_count; ++i) {
            auto res = chip().write_plane(protocol_, i, data.subspan(i * plane_size, plane_size));
            if (!res) {
               return res;
            }
         }
         return {};
      })
      .and_then([&] {
         return protocol_.transition(driver_state::refreshing);
      })
      .and_then([&] {
         return chip().refresh(protocol_, !lut_.empty());
      })
      .and_then([&] {
         return protocol_.transition(driver_state::idle);
      });
}

void_t driver::check_frame(bytes_t data) const {
   return check_supported()
      .and_then([&] {
         return check_state(driver_state::idle);
      })
      .and_then([&]() -> void_t {
         if (data.size() != frame_size()) {
            LOG_WRN("Frame of %d bytes, expected %d", static_cast<int>(data.size()), static_cast<int>(frame_size()));
            return unexpected(error::invalid_buffer_size);
         }
         return {};
      });
}

void_t driver::check_supported() const {
   if (support_ != error::success) {
      return unexpected(support_);
   }
   return {};
}

void_t driver::check_state(driver_state expected_state) const {
   if (protocol_.bus_in_use()) {
      LOG_WRN("Called from within a bus operation");
      return unexpected(error::not_ready);
   }

   if (state() != expected_state) {
      LOG_WRN("Not allowed while %s", common::to_string(state()));
      return unexpected(error::not_ready);
   }
   return {};
}
