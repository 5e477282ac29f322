/**
 * @file   gpio.hpp
 * @author Dennis Sitelew
 * @date   Nov. 01, 2024
 */

#pragma once

#include <zephyr-cpp/expected.hpp>

#include <zephyr/drivers/gpio.h>
#include <zephyr/kernel.h>

namespace zephyr::gpio {

void_t ready(const gpio_dt_spec &spec);

void_t configure(const gpio_dt_spec &spec, gpio_flags_t extra_flags);

void_t set(const gpio_dt_spec &spec, bool logic_high);
expected<bool> get(const gpio_dt_spec &spec);

//! Poll the pin until it reads `logic_high`. Fails with ETIMEDOUT once the timeout elapsed.
void_t wait_for(const gpio_dt_spec &spec, bool logic_high, k_timeout_t timeout,
                k_timeout_t poll_interval = K_MSEC(1));

} // namespace zephyr::gpio
