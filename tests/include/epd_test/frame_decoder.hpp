/**
 * @file   frame_decoder.hpp
 * @author Dennis Sitelew
 * @date   Oct. 13, 2026
 */

#pragma once

#include <epd/frame.hpp>

#include <cstdint>
#include <vector>

namespace epd_test {

//! Unpack frame planes back into row-major colors (no rotation, sources along the width)
inline std::vector<epd::frame::color> decode(const epd::panel::descriptor &panel, epd::common::color_planes planes,
                                             epd::bytes_t data) {
   using epd::common::color_planes;
   using epd::frame::color;

   const auto plane_size = panel.plane_size();
   const auto row_bytes = panel.row_bytes();

   auto bit = [&](std::size_t plane, std::size_t x, std::size_t y) {
      const auto byte = data[plane * plane_size + y * row_bytes + x / 8];
      return (byte & (0x80U >> (x % 8))) != 0;
   };

   std::vector<color> result;
   result.reserve(static_cast<std::size_t>(panel.width) * panel.height);

   for (std::size_t y = 0; y < panel.height; ++y) {
      for (std::size_t x = 0; x < panel.width; ++x) {
         const bool bw = bit(0, x, y);
         const bool second = planes != color_planes::mono && bit(1, x, y);

         switch (planes) {
            case color_planes::mono:
               result.push_back(bw ? color::white : color::black);
               break;

            case color_planes::tri_color:
               result.push_back(second ? color::red : (bw ? color::white : color::black));
               break;

            case color_planes::gray4:
               if (second) {
                  result.push_back(bw ? color::light_gray : color::dark_gray);
               } else {
                  result.push_back(bw ? color::white : color::black);
               }
               break;
         }
      }
   }

   return result;
}

} // namespace epd_test
