/**
 * @file   gpio.cpp
 * @author Dennis Sitelew
 * @date   Nov. 01, 2024
 */

#include <zephyr-cpp/drivers/gpio.hpp>
#include <zephyr-cpp/error.hpp>

#include <zephyr/logging/log.h>

#include <cstdint>

LOG_MODULE_REGISTER(zpp_gpio, CONFIG_ZEPHYR_CPP_LOG_LEVEL);

namespace zephyr::gpio {

void_t ready(const gpio_dt_spec &spec) {
   if (!gpio_is_ready_dt(&spec)) {
      LOG_ERR("GPIO port %s not ready", spec.port->name);
      return unexpected(ENODEV);
   }

   return {};
}

void_t configure(const gpio_dt_spec &spec, gpio_flags_t extra_flags) {
   if (auto err = gpio_pin_configure_dt(&spec, extra_flags)) {
      LOG_ERR("Pin configure failed for %s: %d", spec.port->name, err);
      return unexpected(err);
   }

   return {};
}

void_t set(const gpio_dt_spec &spec, bool logic_high) {
   const auto value = logic_high ? 1 : 0;
   if (auto err = gpio_pin_set_dt(&spec, value)) {
      LOG_ERR("Error setting pin %d of %s to %d: %d", static_cast<int>(spec.pin), spec.port->name, value, err);
      return unexpected(err);
   }

   return {};
}

expected<bool> get(const gpio_dt_spec &spec) {
   if (const auto res = gpio_pin_get_dt(&spec); res == 0) {
      return false;
   } else if (res == 1) {
      return true;
   } else {
      LOG_ERR("Error getting pin %d of %s: %d", static_cast<int>(spec.pin), spec.port->name, res);
      return unexpected(res);
   }
}

void_t wait_for(const gpio_dt_spec &spec, bool logic_high, k_timeout_t timeout, k_timeout_t poll_interval) {
   const auto deadline = sys_timepoint_calc(timeout);
   while (true) {
      auto level = get(spec);
      if (!level) {
         return tl::unexpected{level.error()};
      }

      if (*level == logic_high) {
         return {};
      }

      if (sys_timepoint_expired(deadline)) {
         LOG_WRN("Pin %d of %s did not reach %d in time", static_cast<int>(spec.pin), spec.port->name,
                 logic_high ? 1 : 0);
         return unexpected(ETIMEDOUT);
      }

      k_sleep(poll_interval);
   }
}

} // namespace zephyr::gpio
