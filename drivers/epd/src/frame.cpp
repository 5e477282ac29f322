/**
 * @file   frame.cpp
 * @author Dennis Sitelew
 * @date   Oct. 09, 2026
 */

#include <epd/error.hpp>
#include <epd/frame.hpp>

#include <zephyr/logging/log.h>

#include <optional>
#include <utility>

LOG_MODULE_DECLARE(epd, CONFIG_EPD_LOG_LEVEL);

using namespace epd;
using namespace epd::frame;

namespace {

using common::color_planes;
using common::mirroring;
using common::rotation;

//! Bit values of one pixel on the B/W plane and the second (red / gray high bit) plane
struct bits {
   bool bw;
   bool second;
};

//! Padding at the end of each row: white, no red
constexpr bits padding{.bw = true, .second = false};

std::optional<bits> encode(color c, color_planes planes) {
   switch (planes) {
      case color_planes::mono:
         if (c == color::black) {
            return bits{false, false};
         } else if (c == color::white) {
            return bits{true, false};
         }
         break;

      case color_planes::tri_color:
         if (c == color::black) {
            return bits{false, false};
         } else if (c == color::white) {
            return bits{true, false};
         } else if (c == color::red) {
            return bits{true, true};
         }
         break;

      case color_planes::gray4:
         switch (c) {
            case color::black:
               return bits{false, false};
            case color::dark_gray:
               return bits{false, true};
            case color::light_gray:
               return bits{true, true};
            case color::white:
               return bits{true, false};
            default:
               break;
         }
         break;
   }

   return std::nullopt;
}

//! Inverse of `encode` for gray4 planes
color gray_level(bool bw, bool second) {
   if (bw) {
      return second ? color::light_gray : color::white;
   }
   return second ? color::dark_gray : color::black;
}

//! Logical image size for the rotation
std::pair<std::uint16_t, std::uint16_t> logical_size(const panel::descriptor &panel, rotation r) {
   if (r == rotation::rotate90 || r == rotation::rotate270) {
      return {panel.height, panel.width};
   }
   return {panel.width, panel.height};
}

//! Panel position of the pixel at `source` on gate line `gate`
std::pair<std::uint16_t, std::uint16_t> to_panel(const panel::descriptor &panel, std::uint16_t source,
                                                 std::uint16_t gate) {
   if (panel.sources == panel::axis::height) {
      // Gate lines run left to right, sources bottom to top
      return {gate, static_cast<std::uint16_t>(panel.height - 1 - source)};
   }
   return {source, gate};
}

//! Each mirroring is its own inverse
std::pair<std::uint16_t, std::uint16_t> mirror(const panel::descriptor &panel, mirroring m, std::uint16_t x,
                                               std::uint16_t y) {
   const auto flip_x = static_cast<std::uint16_t>(panel.width - 1 - x);
   const auto flip_y = static_cast<std::uint16_t>(panel.height - 1 - y);

   switch (m) {
      case mirroring::horizontal:
         return {flip_x, y};
      case mirroring::vertical:
         return {x, flip_y};
      case mirroring::origin:
         return {flip_x, flip_y};
      default:
         return {x, y};
   }
}

//! Logical position that lands on the panel position (px, py)
std::pair<std::uint16_t, std::uint16_t> to_logical(const panel::descriptor &panel, rotation r, std::uint16_t px,
                                                   std::uint16_t py) {
   const auto w = panel.width;
   const auto h = panel.height;

   switch (r) {
      case rotation::rotate90:
         return {py, static_cast<std::uint16_t>(w - 1 - px)};
      case rotation::rotate180:
         return {static_cast<std::uint16_t>(w - 1 - px), static_cast<std::uint16_t>(h - 1 - py)};
      case rotation::rotate270:
         return {static_cast<std::uint16_t>(h - 1 - py), px};
      default:
         return {px, py};
   }
}

template <typename Sampler>
expected<buffer> pack_with(const panel::descriptor &panel, color_planes planes, rotation r, mirroring m,
                           Sampler &&sample) {
   const auto plane_size = panel.plane_size();
   const auto row_bytes = panel.row_bytes();
   const auto sources = panel.source_count();
   const bool two_planes = common::plane_count(planes) == 2;

   std::vector<std::uint8_t> data(plane_size * common::plane_count(planes), 0);
   auto bw_plane = std::span{data}.first(plane_size);
   auto second_plane = std::span{data}.subspan(two_planes ? plane_size : 0, two_planes ? plane_size : 0);

   auto put = [&](std::size_t offset, std::uint8_t mask, bits b) {
      if (b.bw) {
         bw_plane[offset] |= mask;
      }
      if (two_planes && b.second) {
         second_plane[offset] |= mask;
      }
   };

   for (std::uint16_t gate = 0; gate < panel.gate_count(); ++gate) {
      for (std::size_t column = 0; column < row_bytes * 8U; ++column) {
         const auto offset = gate * row_bytes + column / 8U;
         const auto mask = static_cast<std::uint8_t>(0x80U >> (column % 8U));

         if (column >= sources) {
            put(offset, mask, padding);
            continue;
         }

         const auto [px, py] = to_panel(panel, static_cast<std::uint16_t>(column), gate);
         const auto [mx, my] = mirror(panel, m, px, py);
         const auto [x, y] = to_logical(panel, r, mx, my);

         const auto c = sample(x, y);
         const auto encoded = encode(c, planes);
         if (!encoded) {
            LOG_WRN("Color %d can't be expressed in %s planes", static_cast<int>(c), common::to_string(planes));
            return unexpected(error::unsupported_feature);
         }

         put(offset, mask, *encoded);
      }
   }

   return buffer::make(panel, planes, std::move(data));
}

} // namespace

namespace epd::frame {

buffer::buffer(color_planes planes, std::size_t plane_size, std::vector<std::uint8_t> data)
   : planes_{planes}
   , plane_size_{plane_size}
   , data_{std::move(data)} {
   // Nothing to do here
}

expected<buffer> buffer::make(const panel::descriptor &panel, color_planes planes, std::vector<std::uint8_t> data) {
   const auto expected_size = panel.plane_size() * common::plane_count(planes);
   if (data.size() != expected_size) {
      LOG_WRN("Frame size mismatch: %d bytes, expected %d", static_cast<int>(data.size()),
              static_cast<int>(expected_size));
      return unexpected(error::invalid_buffer_size);
   }

   return buffer{planes, panel.plane_size(), std::move(data)};
}

bytes_t buffer::plane(std::uint8_t index) const {
   if (index >= plane_count()) {
      return {};
   }

   return bytes().subspan(index * plane_size_, plane_size_);
}

expected<buffer> pack(const panel::descriptor &panel, color_planes planes, const image &img, rotation rotation,
                      mirroring mirroring) {
   const auto [width, height] = logical_size(panel, rotation);
   if (img.width != width || img.height != height) {
      LOG_WRN("Image is %dx%d, panel expects %dx%d", img.width, img.height, width, height);
      return unexpected(error::invalid_buffer_size);
   }

   if (img.pixels.size() != static_cast<std::size_t>(width) * height) {
      LOG_WRN("Image has %d pixels, expected %d", static_cast<int>(img.pixels.size()), width * height);
      return unexpected(error::invalid_buffer_size);
   }

   const std::size_t stride = width;
   return pack_with(panel, planes, rotation, mirroring, [&](std::uint16_t x, std::uint16_t y) {
      return img.pixels[y * stride + x];
   });
}

expected<buffer> pack(const panel::descriptor &panel, color_planes planes, const pixel_func_t &generator,
                      rotation rotation, mirroring mirroring) {
   if (!generator) {
      return unexpected(error::unsupported_feature);
   }

   return pack_with(panel, planes, rotation, mirroring, generator);
}

std::vector<std::uint8_t> gray_step(bytes_t data, std::size_t plane_size, std::uint8_t level) {
   if (data.size() < 2 * plane_size) {
      // Nothing to darken
      return std::vector<std::uint8_t>(plane_size, white_byte);
   }

   std::vector<std::uint8_t> result(plane_size, 0);

   const auto low = data.first(plane_size);
   const auto high = data.subspan(plane_size, plane_size);

   for (std::size_t i = 0; i < plane_size; ++i) {
      for (unsigned bit = 0; bit < 8; ++bit) {
         const auto mask = static_cast<std::uint8_t>(0x80U >> bit);
         const auto c = gray_level((low[i] & mask) != 0, (high[i] & mask) != 0);
         if (static_cast<std::uint8_t>(c) >= level) {
            result[i] |= mask;
         }
      }
   }

   return result;
}

expected<buffer> fill(const panel::descriptor &panel, color_planes planes, color c) {
   return pack_with(panel, planes, rotation::rotate0, mirroring::none, [c](std::uint16_t, std::uint16_t) {
      return c;
   });
}

} // namespace epd::frame
