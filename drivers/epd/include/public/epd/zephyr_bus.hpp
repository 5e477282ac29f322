/**
 * @file   zephyr_bus.hpp
 * @author Dennis Sitelew
 * @date   Oct. 12, 2026
 */

#pragma once

#include <epd/bus.hpp>

#include <zephyr/drivers/gpio.h>
#include <zephyr/drivers/spi.h>

namespace epd {

//! Bus capability over a Zephyr SPI device and four GPIOs. Pin levels are logical, the devicetree flags decide which
//! physical level is "active": CS and reset are active while asserted, DC is active for data, busy is active while
//! the line is at its high level.
class zephyr_bus final : public bus {
public:
   struct config {
      spi_dt_spec spi;
      gpio_dt_spec cs_pin;
      gpio_dt_spec dc_pin;
      gpio_dt_spec reset_pin;
      gpio_dt_spec busy_pin;
   };

public:
   //! Check and configure all peripherals. Outputs start deasserted.
   static expected<zephyr_bus> make(const config &cfg);

public:
   void_t chip_select(bool asserted) override;
   void_t write_command(std::uint8_t opcode) override;
   void_t write_data(bytes_t data) override;
   void_t reset(const common::reset_pulse &pulse) override;
   void_t wait_until_ready(common::busy_level busy, k_timeout_t timeout) override;

private:
   explicit zephyr_bus(const config &cfg);

private:
   config config_;
};

} // namespace epd
