/**
 * @file   ssd16xx.cpp
 * @author Dennis Sitelew
 * @date   Oct. 07, 2026
 */

#include <epd/controller/commands.hpp>
#include <epd/controller/controller.hpp>
#include <epd/controller/util.hpp>
#include <epd/error.hpp>

#include <zephyr/logging/log.h>

LOG_MODULE_DECLARE(epd, CONFIG_EPD_LOG_LEVEL);

using namespace epd;
using namespace epd::controller;

namespace {

using common::busy_level;
using common::chip_family;
using ssd16xx::command;

using init_func_t = void_t (*)(protocol &p, const panel::descriptor &panel);
using lut_setup_func_t = void_t (*)(protocol &p, lut::mode mode);

//! Per-family differences within the SSD16xx command set
struct profile {
   chip_family family;
   std::uint16_t reset_ms;
   std::size_t lut_size;
   bool secondary_ram;

   //! Settle time after entering deep sleep, 0 if the controller needs none
   std::uint16_t sleep_settle_ms;

   //! IL3895 / SSD1608: fixed update sequence followed by a NOP
   bool legacy_update;
   std::uint8_t register_lut_update;

   init_func_t init;

   //! Extra voltage setup that goes along with a LUT upload, may be null
   lut_setup_func_t lut_setup;
};

void_t wait_ready(protocol &p) {
   return p.wait_ready(busy_level::high);
}

void_t driver_output(protocol &p, const panel::descriptor &panel) {
   const auto gates = panel.gate_count() - 1U;
   return send(p, command::driver_output_control, {u8(gates & 0xFFU), u8(gates >> 8U), 0x00});
}

void_t ram_window(protocol &p, const panel::descriptor &panel) {
   const auto x_end = (panel.source_count() - 1U) >> 3U;
   const auto y_end = panel.gate_count() - 1U;

   return send(p, command::ram_x_window, {0x00, u8(x_end)}).and_then([&] {
      return send(p, command::ram_y_window, {0x00, 0x00, u8(y_end & 0xFFU), u8(y_end >> 8U)});
   });
}

void_t ram_cursor(protocol &p) {
   return send(p, command::ram_x_counter, {0x00}).and_then([&] {
      return send(p, command::ram_y_counter, {0x00, 0x00});
   });
}

void_t init_il3895(protocol &p, const panel::descriptor &panel) {
   return driver_output(p, panel)
      .and_then([&] {
         return send(p, command::write_vcom, {0xA8});
      })
      .and_then([&] {
         return send(p, command::dummy_line_period, {0x1A});
      })
      .and_then([&] {
         return send(p, command::gate_line_width, {0x08});
      })
      .and_then([&] {
         return send(p, command::border_waveform, {0x63});
      })
      .and_then([&] {
         // X increment, Y increment
         return send(p, command::data_entry_mode, {0x03});
      });
}

void_t init_ssd1608(protocol &p, const panel::descriptor &panel) {
   return send(p, command::booster_soft_start, {0xD7, 0xD6, 0x9D})
      .and_then([&] {
         return send(p, command::write_vcom, {0x7C});
      })
      .and_then([&] {
         return send(p, command::dummy_line_period, {0x1A});
      })
      .and_then([&] {
         return send(p, command::gate_line_width, {0x08});
      })
      .and_then([&] {
         // Follow LUT, VSL (white) border
         return send(p, command::border_waveform, {0xE0});
      })
      .and_then([&] {
         return send(p, command::data_entry_mode, {0x03});
      })
      .and_then([&] {
         return driver_output(p, panel);
      });
}

//! SSD1619A and SSD1675B share the analog setup
void_t init_ssd1619a(protocol &p, const panel::descriptor &panel) {
   return send(p, command::analog_block_control, {0x54})
      .and_then([&] {
         return send(p, command::digital_block_control, {0x3B});
      })
      .and_then([&] {
         // Reduce glitches under ACVCOM
         return send(p, command::acvcom, {0x03, 0x63});
      })
      .and_then([&] {
         return send(p, command::booster_soft_start, {0x8B, 0x9C, 0x96, 0x0F});
      })
      .and_then([&] {
         return driver_output(p, panel);
      })
      .and_then([&] {
         return send(p, command::data_entry_mode, {0x03});
      })
      .and_then([&] {
         // HiZ border
         return send(p, command::border_waveform, {0x01});
      })
      .and_then([&] {
         // Internal temperature sensor
         return send(p, command::temperature_sensor, {0x80});
      })
      .and_then([&] {
         return send(p, command::display_update_control_2, {ssd16xx::update::load_waveform});
      })
      .and_then([&] {
         return send(p, command::master_activation);
      })
      .and_then([&] {
         return wait_ready(p);
      });
}

void_t init_ssd1680(protocol &p, const panel::descriptor &panel) {
   return driver_output(p, panel)
      .and_then([&] {
         return send(p, command::data_entry_mode, {0x03});
      })
      .and_then([&] {
         // Normal RAM content, source outputs from S8
         return send(p, command::display_update_control_1, {0x00, 0x80});
      })
      .and_then([&] {
         return send(p, command::border_waveform, {0x05});
      })
      .and_then([&] {
         return send(p, command::temperature_sensor, {0x80});
      });
}

//! Gray steps need lower source voltages to stay small
void_t ssd1608_lut_setup(protocol &p, lut::mode mode) {
   switch (mode) {
      case lut::mode::gray3:
         return send(p, command::source_voltage, {0x00});

      case lut::mode::gray4:
         // A higher VCOM separates the gray levels better
         return send(p, command::write_vcom, {0xB8})
            .and_then([&] {
               return send(p, command::source_voltage, {0x00});
            })
            .and_then([&] {
               return send(p, command::gate_line_width, {0x00});
            });

      default:
         return {};
   }
}

//! The fast waveform needs lower drive voltages and a tighter line timing
void_t ssd1619a_lut_setup(protocol &p, lut::mode mode) {
   if (mode != lut::mode::fast) {
      return {};
   }

   return send(p, command::gate_voltage, {0x19})
      .and_then([&] {
         // VSH1, VSH2, VSL
         return send(p, command::source_voltage, {0x4B, 0xA8, 0x32});
      })
      .and_then([&] {
         return send(p, command::dummy_line_period, {0x1A});
      })
      .and_then([&] {
         return send(p, command::gate_line_width, {0x0B});
      });
}

class ssd16xx_controller final : public base {
public:
   explicit ssd16xx_controller(const profile &profile)
      : profile_{profile} {
      // Nothing to do here
   }

public:
   [[nodiscard]] chip_family family() const override { return profile_.family; }

   [[nodiscard]] busy_level busy() const override { return busy_level::high; }

   [[nodiscard]] common::reset_pulse reset_pulse(k_timeout_t settle) const override {
      return {
         .release = K_MSEC(profile_.reset_ms),
         .hold = K_MSEC(profile_.reset_ms),
         .settle = settle,
      };
   }

   void_t power_on(protocol &p, const panel::descriptor &panel) const override {
      return send(p, command::sw_reset)
         .and_then([&] {
            return wait_ready(p);
         })
         .and_then([&] {
            return profile_.init(p, panel);
         })
         .and_then([&] {
            return ram_window(p, panel);
         })
         .and_then([&] {
            return ram_cursor(p);
         });
   }

   [[nodiscard]] std::size_t lut_size() const override { return profile_.lut_size; }

   void_t load_lut(protocol &p, const lut::table &table) const override {
      if (table.data.size() != profile_.lut_size) {
         return unexpected(error::unsupported_feature);
      }

      return send(p, command::write_lut, table.data).and_then([&]() -> void_t {
         if (!profile_.lut_setup) {
            return {};
         }
         return profile_.lut_setup(p, table.mode);
      });
   }

   [[nodiscard]] bool has_secondary_ram() const override { return profile_.secondary_ram; }

   void_t write_plane(protocol &p, std::uint8_t index, bytes_t data) const override {
      if (index > 1 || (index == 1 && !profile_.secondary_ram)) {
         LOG_ERR("%s has no RAM plane %d", common::to_string(profile_.family), static_cast<int>(index));
         return unexpected(error::unsupported_feature);
      }

      const auto ram = index == 0 ? command::write_ram_bw : command::write_ram_red;
      return ram_cursor(p).and_then([&] {
         return send(p, ram, data);
      });
   }

   void_t clear_secondary(protocol &p, const panel::descriptor &panel) const override {
      if (!profile_.secondary_ram) {
         return {};
      }

      return ram_cursor(p).and_then([&] {
         return fill(p, command::write_ram_red, 0x00, panel.plane_size());
      });
   }

   void_t refresh(protocol &p, bool register_lut) const override {
      std::uint8_t sequence = ssd16xx::update::otp_lut;
      if (profile_.legacy_update) {
         sequence = ssd16xx::update::legacy;
      } else if (register_lut) {
         sequence = profile_.register_lut_update;
      }

      return send(p, command::display_update_control_2, {sequence})
         .and_then([&] {
            return send(p, command::master_activation);
         })
         .and_then([&]() -> void_t {
            if (!profile_.legacy_update) {
               return {};
            }
            return send(p, command::nop);
         })
         .and_then([&] {
            return wait(p, p.timeouts().refresh_timeout);
         });
   }

   void_t deep_sleep(protocol &p) const override {
      // Deep sleep mode 1, RAM is retained but the busy line stays high until the next reset
      return send(p, command::deep_sleep, {0x01}).and_then([&]() -> void_t {
         if (profile_.sleep_settle_ms > 0) {
            p.delay(K_MSEC(profile_.sleep_settle_ms));
         }
         return {};
      });
   }

private:
   profile profile_;
};

// clang-format off
const ssd16xx_controller il3895{{
   .family = chip_family::il3895, .reset_ms = 200, .lut_size = 30, .secondary_ram = false, .sleep_settle_ms = 0,
   .legacy_update = true, .register_lut_update = ssd16xx::update::legacy,
   .init = init_il3895, .lut_setup = nullptr,
}};

const ssd16xx_controller ssd1608{{
   .family = chip_family::ssd1608, .reset_ms = 200, .lut_size = 30, .secondary_ram = false, .sleep_settle_ms = 0,
   .legacy_update = true, .register_lut_update = ssd16xx::update::legacy,
   .init = init_ssd1608, .lut_setup = ssd1608_lut_setup,
}};

const ssd16xx_controller ssd1619a{{
   .family = chip_family::ssd1619a, .reset_ms = 200, .lut_size = 70, .secondary_ram = true, .sleep_settle_ms = 0,
   .legacy_update = false, .register_lut_update = ssd16xx::update::register_lut_ssd1619,
   .init = init_ssd1619a, .lut_setup = ssd1619a_lut_setup,
}};

const ssd16xx_controller ssd1675b{{
   .family = chip_family::ssd1675b, .reset_ms = 200, .lut_size = 105, .secondary_ram = true, .sleep_settle_ms = 0,
   .legacy_update = false, .register_lut_update = ssd16xx::update::register_lut_ssd1619,
   .init = init_ssd1619a, .lut_setup = nullptr,
}};

const ssd16xx_controller ssd1680{{
   .family = chip_family::ssd1680, .reset_ms = 10, .lut_size = 153, .secondary_ram = true, .sleep_settle_ms = 100,
   .legacy_update = false, .register_lut_update = ssd16xx::update::register_lut,
   .init = init_ssd1680, .lut_setup = nullptr,
}};
// clang-format on

} // namespace

namespace epd::controller::detail {

const base *find_ssd16xx(chip_family family) {
   switch (family) {
      case chip_family::il3895:
         return &il3895;
      case chip_family::ssd1608:
         return &ssd1608;
      case chip_family::ssd1619a:
         return &ssd1619a;
      case chip_family::ssd1675b:
         return &ssd1675b;
      case chip_family::ssd1680:
         return &ssd1680;
      default:
         return nullptr;
   }
}

} // namespace epd::controller::detail
