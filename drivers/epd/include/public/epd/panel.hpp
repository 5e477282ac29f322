/**
 * @file   panel.hpp
 * @author Dennis Sitelew
 * @date   Oct. 05, 2026
 */

#pragma once

#include <epd/common.hpp>
#include <epd/lut.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace epd::panel {

//! Logical axis the controller's source outputs (the bit-packed direction) run along
enum class axis : std::uint8_t {
   width,
   height,
};

//! Panel preset. `width` x `height` is the logical size frames are drawn in; `sources` tells which of the two runs
//! along the controller's source outputs, the other one runs along its gate outputs.
struct descriptor {
   common::chip_family family;
   std::string_view size;

   std::uint16_t width;
   std::uint16_t height;
   common::color_planes planes;

   //! Empty when the controller runs its OTP waveform
   lut::table default_lut;

   panel::axis sources{panel::axis::width};

   [[nodiscard]] std::uint16_t source_count() const { return sources == axis::width ? width : height; }
   [[nodiscard]] std::uint16_t gate_count() const { return sources == axis::width ? height : width; }

   //! Bytes per gate line in controller RAM
   [[nodiscard]] std::size_t row_bytes() const { return (source_count() + 7U) / 8U; }
   [[nodiscard]] std::size_t plane_size() const { return row_bytes() * gate_count(); }
   [[nodiscard]] std::size_t frame_size() const { return plane_size() * common::plane_count(planes); }
};

//! All known presets
std::span<const descriptor> catalog();

//! Preset for the controller family and size name (e.g. "2in9", "4in2b")
std::optional<descriptor> find(common::chip_family family, std::string_view size);

} // namespace epd::panel
