/**
 * @file   zephyr_bus.cpp
 * @author Dennis Sitelew
 * @date   Oct. 12, 2026
 */

#include <epd/error.hpp>
#include <epd/zephyr_bus.hpp>

#include <zephyr-cpp/drivers/gpio.hpp>
#include <zephyr-cpp/drivers/spi.hpp>
#include <zephyr-cpp/error.hpp>

#include <zephyr/logging/log.h>

#include <array>

LOG_MODULE_DECLARE(epd, CONFIG_EPD_LOG_LEVEL);

using namespace epd;

namespace {

void_t check_and_init_input_pin(const gpio_dt_spec &spec) {
   return zephyr::gpio::ready(spec).and_then([&] {
      return zephyr::gpio::configure(spec, GPIO_INPUT);
   });
}

void_t check_and_init_output_pin(const gpio_dt_spec &spec, bool initial_state) {
   return zephyr::gpio::ready(spec)
      .and_then([&] {
         return zephyr::gpio::configure(spec, GPIO_OUTPUT);
      })
      .and_then([&] {
         return zephyr::gpio::set(spec, initial_state);
      });
}

} // namespace

namespace epd {

zephyr_bus::zephyr_bus(const config &cfg)
   : config_{cfg} {
   // Nothing to do here
}

expected<zephyr_bus> zephyr_bus::make(const config &cfg) {
   return check_and_init_input_pin(cfg.busy_pin)
      .and_then([&] {
         return check_and_init_output_pin(cfg.reset_pin, false);
      })
      .and_then([&] {
         return check_and_init_output_pin(cfg.dc_pin, false);
      })
      .and_then([&] {
         return check_and_init_output_pin(cfg.cs_pin, false);
      })
      .and_then([&] {
         return zephyr::spi::ready(cfg.spi);
      })
      .and_then([&]() -> expected<zephyr_bus> {
         return zephyr_bus{cfg};
      });
}

void_t zephyr_bus::chip_select(bool asserted) {
   return zephyr::gpio::set(config_.cs_pin, asserted);
}

void_t zephyr_bus::write_command(std::uint8_t opcode) {
   std::array data{opcode};
   return zephyr::gpio::set(config_.dc_pin, false).and_then([&] {
      return zephyr::spi::write(config_.spi, data, CONFIG_EPD_SPI_CHUNK_SIZE);
   });
}

void_t zephyr_bus::write_data(bytes_t data) {
   return zephyr::gpio::set(config_.dc_pin, true).and_then([&] {
      return zephyr::spi::write(config_.spi, data, CONFIG_EPD_SPI_CHUNK_SIZE);
   });
}

void_t zephyr_bus::reset(const common::reset_pulse &pulse) {
   return zephyr::gpio::set(config_.reset_pin, false)
      .and_then([&] {
         k_sleep(pulse.release);
         return zephyr::gpio::set(config_.reset_pin, true);
      })
      .and_then([&] {
         k_sleep(pulse.hold);
         return zephyr::gpio::set(config_.reset_pin, false);
      })
      .and_then([&]() -> void_t {
         k_sleep(pulse.settle);
         return {};
      });
}

void_t zephyr_bus::wait_until_ready(common::busy_level busy, k_timeout_t timeout) {
   const bool ready_level = busy == common::busy_level::low;
   return zephyr::gpio::wait_for(config_.busy_pin, ready_level, timeout).or_else([&](const auto &ec) -> void_t {
      if (zephyr::error::is(ec, ETIMEDOUT)) {
         return unexpected(error::busy_timeout);
      }
      return unexpected(ec);
   });
}

} // namespace epd
