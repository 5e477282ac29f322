/**
 * @file   frame.hpp
 * @author Dennis Sitelew
 * @date   Oct. 09, 2026
 */

#pragma once

#include <epd/common.hpp>
#include <epd/panel.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace epd::frame {

enum class color : std::uint8_t {
   black = 0,
   dark_gray = 1,
   light_gray = 2,
   white = 3,

   //! Red or yellow, depending on the panel
   red = 4,
};

//! Eight black pixels on the B/W plane
constexpr std::uint8_t black_byte = 0x00;

//! Eight white pixels on the B/W plane
constexpr std::uint8_t white_byte = 0xFF;

//! Row-major logical pixels
struct image {
   std::uint16_t width;
   std::uint16_t height;
   std::span<const color> pixels;
};

//! @return color for the logical position (x, y)
using pixel_func_t = std::function<color(std::uint16_t x, std::uint16_t y)>;

//! Bit-packed planes in the order the driver writes them to the controller RAM: one row of `row_bytes()` per gate
//! line, most significant bit first
class buffer {
public:
   //! Wrap already packed bytes, checking the length against the panel and plane layout
   static expected<buffer> make(const panel::descriptor &panel, common::color_planes planes,
                                std::vector<std::uint8_t> data);

public:
   [[nodiscard]] bytes_t bytes() const { return data_; }
   [[nodiscard]] bytes_t plane(std::uint8_t index) const;

   [[nodiscard]] common::color_planes planes() const { return planes_; }
   [[nodiscard]] std::uint8_t plane_count() const { return common::plane_count(planes_); }
   [[nodiscard]] std::size_t plane_size() const { return plane_size_; }

private:
   buffer(common::color_planes planes, std::size_t plane_size, std::vector<std::uint8_t> data);

private:
   common::color_planes planes_;
   std::size_t plane_size_;
   std::vector<std::uint8_t> data_;
};

//! Pack an image. With a 90 or 270 degree rotation the image is `height` x `width` of the panel. The mirroring is
//! applied to the rotated image.
expected<buffer> pack(const panel::descriptor &panel, common::color_planes planes, const image &img,
                      common::rotation rotation = common::rotation::rotate0,
                      common::mirroring mirroring = common::mirroring::none);

//! Pack the output of a pixel generator, called once for every logical position
expected<buffer> pack(const panel::descriptor &panel, common::color_planes planes, const pixel_func_t &generator,
                      common::rotation rotation = common::rotation::rotate0,
                      common::mirroring mirroring = common::mirroring::none);

//! Single color frame
expected<buffer> fill(const panel::descriptor &panel, common::color_planes planes, color c);

//! B/W plane for one step of an incremental gray refresh: black where the gray level of a pixel of the `gray4`
//! planes is below `level` (0 black to 3 white), white everywhere else. `data` holds both planes.
std::vector<std::uint8_t> gray_step(bytes_t data, std::size_t plane_size, std::uint8_t level);

} // namespace epd::frame
