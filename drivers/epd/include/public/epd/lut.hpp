/**
 * @file   lut.hpp
 * @author Dennis Sitelew
 * @date   Oct. 05, 2026
 */

#pragma once

#include <epd/common.hpp>

#include <cstdint>
#include <optional>

namespace epd::lut {

enum class mode : std::uint8_t {
   //! Flashing full refresh, lowest ghosting
   full,

   //! Short non-flashing black/white waveform
   fast,

   //! Incremental waveforms for gray levels. A refresh moves every pixel with a black RAM bit one step towards
   //! black and leaves the others as they are, so N gray levels take N - 1 refreshes on top of a white panel.
   gray2,
   gray3,
   gray4,
};

//! Waveform look-up table as uploaded to the controller. The bytes point to static data or to storage owned by
//! whoever built the table; drivers copy the bytes they upload.
struct table {
   lut::mode mode;
   bytes_t data;

   [[nodiscard]] bool empty() const { return data.empty(); }
};

//! Built-in waveform for a controller family, if there is one
std::optional<table> find(common::chip_family family, lut::mode mode);

} // namespace epd::lut
