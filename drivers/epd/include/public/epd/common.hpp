/**
 * @file   common.hpp
 * @author Dennis Sitelew
 * @date   Oct. 04, 2026
 */

#pragma once

#include <zephyr-cpp/expected.hpp>

#include <cstdint>
#include <span>

#include <zephyr/kernel.h>

namespace epd {

template <typename T>
using expected = zephyr::expected<T>;

using void_t = zephyr::void_t;

using zephyr::unexpected;

using bytes_t = std::span<const std::uint8_t>;

namespace common {

//! Controller ICs the driver knows the command set of
enum class chip_family : std::uint8_t {
   il3895,
   ssd1608,
   ssd1619a,
   ssd1675b,
   ssd1680,
   uc8176,
   uc8179,
   pervasive_itc,
};

//! Color capability of a panel, and the plane layout a driver variant transfers
enum class color_planes : std::uint8_t {
   //! One B/W plane
   mono,

   //! B/W plane followed by a Red/Yellow plane
   tri_color,

   //! Two planes holding the low and high bit of a 4-level gray value
   gray4,
};

enum class driver_state : std::uint8_t {
   uninitialized,
   initializing,
   idle,
   transferring_data,
   refreshing,
   sleeping,
   faulted,
};

//! Level of the busy line while the controller is still working
enum class busy_level : std::uint8_t {
   high,
   low,
};

enum class rotation : std::uint8_t {
   rotate0,
   rotate90,
   rotate180,
   rotate270,
};

//! Applied after the rotation, for panels wired with a reversed source or gate scan
enum class mirroring : std::uint8_t {
   none,
   horizontal,
   vertical,

   //! Both axes
   origin,
};

//! Hardware reset pattern: reset released for `release`, held for `hold`, then
//! released again and given `settle` before the first command.
struct reset_pulse {
   k_timeout_t release;
   k_timeout_t hold;
   k_timeout_t settle;
};

constexpr std::uint8_t plane_count(color_planes planes) {
   return planes == color_planes::mono ? 1 : 2;
}

const char *to_string(chip_family family);
const char *to_string(color_planes planes);
const char *to_string(driver_state state);

} // namespace common

} // namespace epd
