/**
 * @file   uc81xx.cpp
 * @author Dennis Sitelew
 * @date   Oct. 08, 2026
 */

#include <epd/controller/commands.hpp>
#include <epd/controller/controller.hpp>
#include <epd/controller/util.hpp>
#include <epd/error.hpp>

#include <zephyr/logging/log.h>

#include <array>

LOG_MODULE_DECLARE(epd, CONFIG_EPD_LOG_LEVEL);

using namespace epd;
using namespace epd::controller;

namespace {

using common::busy_level;
using common::chip_family;
using uc81xx::command;

//! Argument of the power-on and refresh commands on controllers that take one
constexpr std::array<std::uint8_t, 1> trigger_argument{0x00};

void_t resolution(protocol &p, const panel::descriptor &panel) {
   const auto sources = panel.source_count();
   const auto gates = panel.gate_count();
   return send(p, command::resolution, {u8(sources >> 8U), u8(sources & 0xFFU), u8(gates >> 8U), u8(gates & 0xFFU)});
}

class uc81xx_controller : public base {
public:
   [[nodiscard]] busy_level busy() const override { return busy_level::low; }

   [[nodiscard]] common::reset_pulse reset_pulse(k_timeout_t settle) const override {
      return {
         .release = K_MSEC(10),
         .hold = K_MSEC(10),
         .settle = settle,
      };
   }

   void_t power_on(protocol &p, const panel::descriptor &panel) const override {
      return init(p).and_then([&] {
         return resolution(p, panel);
      });
   }

   [[nodiscard]] std::size_t lut_size() const override { return 0; }

   void_t load_lut(protocol &p, const lut::table &table) const override {
      ARG_UNUSED(p);
      ARG_UNUSED(table);
      return unexpected(error::unsupported_feature);
   }

   [[nodiscard]] bool has_secondary_ram() const override { return true; }

   void_t write_plane(protocol &p, std::uint8_t index, bytes_t data) const override {
      switch (index) {
         case 0:
            return send(p, command::write_ram_old, data);
         case 1:
            return send(p, command::write_ram_new, data);
         default:
            LOG_ERR("%s has no RAM plane %d", common::to_string(family()), static_cast<int>(index));
            return unexpected(error::unsupported_feature);
      }
   }

   void_t clear_secondary(protocol &p, const panel::descriptor &panel) const override {
      return fill(p, command::write_ram_new, 0x00, panel.plane_size());
   }

   void_t refresh(protocol &p, bool register_lut) const override {
      ARG_UNUSED(register_lut);

      return send(p, command::power_on, trigger_payload())
         .and_then([&] {
            return wait_ready(p);
         })
         .and_then([&] {
            return send(p, command::display_refresh, trigger_payload());
         })
         .and_then([&] {
            return wait(p, p.timeouts().refresh_timeout);
         });
   }

   void_t deep_sleep(protocol &p) const override {
      return send(p, command::power_off)
         .and_then([&] {
            return wait_ready(p);
         })
         .and_then([&] {
            return send(p, command::deep_sleep, {uc81xx::deep_sleep_check});
         });
   }

protected:
   //! Family specific power-on bytes
   virtual void_t init(protocol &p) const = 0;

   //! Payload of the power-on and refresh commands that start a refresh
   [[nodiscard]] virtual bytes_t trigger_payload() const { return {}; }
};

class uc8176 final : public uc81xx_controller {
public:
   [[nodiscard]] chip_family family() const override { return chip_family::uc8176; }

protected:
   [[nodiscard]] bytes_t trigger_payload() const override { return trigger_argument; }

   void_t init(protocol &p) const override {
      return send(p, command::power_setting, {0x03, 0x00, 0x2B, 0x2B, 0x13})
         .and_then([&] {
            return send(p, command::booster_soft_start, {0x17, 0x17, 0x17});
         })
         .and_then([&] {
            return send(p, command::power_on);
         })
         .and_then([&] {
            return wait_ready(p);
         })
         .and_then([&] {
            // KWR mode, LUT from OTP
            return send(p, command::panel_setting, {0x0F});
         })
         .and_then([&] {
            // 100 Hz frame rate
            return send(p, command::pll_control, {0x3C});
         })
         .and_then([&] {
            return send(p, command::vcm_dc, {0x12});
         })
         .and_then([&] {
            return send(p, command::vcom_data_interval, {0x97});
         });
   }
};

class uc8179 final : public uc81xx_controller {
public:
   [[nodiscard]] chip_family family() const override { return chip_family::uc8179; }

   //! The busy line only reflects the state after a status read
   void_t wait(protocol &p, k_timeout_t timeout) const override {
      return send(p, command::get_status).and_then([&] {
         return p.wait_ready(busy(), timeout);
      });
   }

protected:
   void_t init(protocol &p) const override {
      return send(p, command::power_setting, {0x07, 0x07, 0x3F, 0x3F})
         .and_then([&] {
            return send(p, command::power_on);
         })
         .and_then([&] {
            return wait_ready(p);
         })
         .and_then([&] {
            // KWR mode, LUT from OTP
            return send(p, command::panel_setting, {0x0F});
         })
         .and_then([&] {
            // Single SPI
            return send(p, command::dual_spi, {0x00});
         })
         .and_then([&] {
            return send(p, command::vcom_data_interval, {0x11, 0x07});
         })
         .and_then([&] {
            return send(p, command::tcon_setting, {0x22});
         });
   }
};

//! Pervasive Displays iTC panels: UC81xx command set with register LUTs
class pervasive_itc final : public uc81xx_controller {
public:
   static constexpr std::size_t vcom_lut_size = 44;
   static constexpr std::size_t color_lut_size = 42;

public:
   [[nodiscard]] chip_family family() const override { return chip_family::pervasive_itc; }

   [[nodiscard]] std::size_t lut_size() const override { return vcom_lut_size + 4 * color_lut_size; }

   //! The table holds the VCOM, WW, BW, WB and BB registers back to back. The second WW register gets WW again.
   void_t load_lut(protocol &p, const lut::table &table) const override {
      if (table.data.size() != lut_size()) {
         return unexpected(error::unsupported_feature);
      }

      const auto vcom = table.data.first(vcom_lut_size);
      auto color = [&](std::size_t index) {
         return table.data.subspan(vcom_lut_size + index * color_lut_size, color_lut_size);
      };

      const std::array registers{command::lut_ww, command::lut_bw, command::lut_wb, command::lut_bb};

      return send(p, command::lut_vcom, vcom)
         .and_then([&]() -> void_t {
            for (std::size_t i = 0; i < registers.size(); ++i) {
               if (auto res = send(p, registers[i], color(i)); !res) {
                  return res;
               }
            }
            return {};
         })
         .and_then([&] {
            return send(p, command::lut_ww2, color(0));
         });
   }

   void_t deep_sleep(protocol &p) const override {
      return send(p, command::power_off, {0x00}).and_then([&] {
         p.delay(K_MSEC(5));
         return wait_ready(p);
      });
   }

protected:
   [[nodiscard]] bytes_t trigger_payload() const override { return trigger_argument; }

   void_t init(protocol &p) const override {
      // Soft reset
      return send(p, command::panel_setting, {0xBF})
         .and_then([&] {
            p.delay(K_MSEC(5));
            // 25 degrees
            return send(p, command::force_temperature, {0x19});
         })
         .and_then([&] {
            // Use the forced temperature
            return send(p, command::cascade_setting, {0x02});
         });
   }
};

const uc8176 uc8176_instance{};
const uc8179 uc8179_instance{};
const pervasive_itc pervasive_instance{};

} // namespace

namespace epd::controller::detail {

const base *find_uc81xx(chip_family family) {
   switch (family) {
      case chip_family::uc8176:
         return &uc8176_instance;
      case chip_family::uc8179:
         return &uc8179_instance;
      case chip_family::pervasive_itc:
         return &pervasive_instance;
      default:
         return nullptr;
   }
}

} // namespace epd::controller::detail
