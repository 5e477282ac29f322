/**
 * @file   commands.hpp
 * @author Dennis Sitelew
 * @date   Oct. 07, 2026
 */

#pragma once

#include <cstdint>

namespace epd::controller {

namespace ssd16xx {

enum class command : std::uint8_t {
   driver_output_control = 0x01,
   gate_voltage = 0x03,
   source_voltage = 0x04,
   booster_soft_start = 0x0C,
   deep_sleep = 0x10,
   data_entry_mode = 0x11,
   sw_reset = 0x12,
   temperature_sensor = 0x18,
   master_activation = 0x20,
   display_update_control_1 = 0x21,
   display_update_control_2 = 0x22,
   write_ram_bw = 0x24,
   write_ram_red = 0x26,
   acvcom = 0x2B,
   write_vcom = 0x2C,
   write_lut = 0x32,
   dummy_line_period = 0x3A,
   gate_line_width = 0x3B,
   border_waveform = 0x3C,
   ram_x_window = 0x44,
   ram_y_window = 0x45,
   ram_x_counter = 0x4E,
   ram_y_counter = 0x4F,
   analog_block_control = 0x74,
   digital_block_control = 0x7E,
   nop = 0xFF,
};

//! Display update control 2 sequences
namespace update {

//! Clock, analog, temperature, OTP waveform, display, power off
constexpr std::uint8_t otp_lut = 0xF7;

//! Same as `otp_lut`, but with the waveform from the LUT register
constexpr std::uint8_t register_lut = 0xC7;

//! SSD1619A / SSD1675B flavour of `register_lut`
constexpr std::uint8_t register_lut_ssd1619 = 0xC5;

//! IL3895 / SSD1608: display with the register LUT, power stays on
constexpr std::uint8_t legacy = 0xC4;

//! Load temperature and waveform setting
constexpr std::uint8_t load_waveform = 0xB9;

} // namespace update

} // namespace ssd16xx

namespace uc81xx {

enum class command : std::uint8_t {
   panel_setting = 0x00,
   power_setting = 0x01,
   power_off = 0x02,
   power_on = 0x04,
   booster_soft_start = 0x06,
   deep_sleep = 0x07,
   write_ram_old = 0x10,
   display_refresh = 0x12,
   write_ram_new = 0x13,
   dual_spi = 0x15,
   lut_vcom = 0x20,
   lut_ww = 0x21,
   lut_bw = 0x22,
   lut_wb = 0x23,
   lut_bb = 0x24,
   lut_ww2 = 0x25,
   pll_control = 0x30,
   vcom_data_interval = 0x50,
   tcon_setting = 0x60,
   resolution = 0x61,
   get_status = 0x71,
   vcm_dc = 0x82,
   cascade_setting = 0xE0,
   force_temperature = 0xE5,
};

//! Deep sleep check code
constexpr std::uint8_t deep_sleep_check = 0xA5;

} // namespace uc81xx

} // namespace epd::controller
