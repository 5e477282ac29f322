/**
 * @file   test_frame.cpp
 * @author Dennis Sitelew
 * @date   Oct. 14, 2026
 */

#include <epd_test/frame_decoder.hpp>
#include <epd_test/mock_bus.hpp>

#include <epd/error.hpp>
#include <epd/frame.hpp>
#include <epd/panel.hpp>

#include <zephyr/ztest.h>

#include <algorithm>
#include <vector>

using namespace epd;
using namespace epd_test;

using common::chip_family;
using common::color_planes;
using common::mirroring;
using common::rotation;
using frame::color;

namespace {

//! Two bytes per row, eight rows
panel::descriptor small_panel(color_planes planes = color_planes::mono) {
   return {.family = chip_family::ssd1680, .size = "16x8", .width = 16, .height = 8, .planes = planes, .default_lut = {}};
}

bool all_equal(bytes_t data, std::uint8_t value) {
   return std::all_of(data.begin(), data.end(), [value](auto b) {
      return b == value;
   });
}

//! Black at the logical origin, white everywhere else
color origin_marker(std::uint16_t x, std::uint16_t y) {
   return (x == 0 && y == 0) ? color::black : color::white;
}

} // namespace

ZTEST(frame, test_black_mono_frame) {
   const auto panel = *panel::find(chip_family::ssd1680, "2in9");

   const auto filled = frame::fill(panel, color_planes::mono, color::black);
   zassert_true(filled.has_value());
   zassert_equal(filled->bytes().size(), 4736);
   zassert_true(all_equal(filled->bytes(), frame::black_byte));

   const std::vector<color> pixels(296 * 128, color::black);
   const auto packed = frame::pack(panel, color_planes::mono, {.width = 296, .height = 128, .pixels = pixels});
   zassert_true(packed.has_value());
   zassert_true(std::equal(packed->bytes().begin(), packed->bytes().end(), filled->bytes().begin()));
}

ZTEST(frame, test_rows_are_padded_white) {
   const auto panel = *panel::find(chip_family::il3895, "2in13");

   const auto filled = frame::fill(panel, color_planes::mono, color::black);
   zassert_true(filled.has_value());
   zassert_equal(filled->bytes().size(), 16 * 250);

   const auto bytes = filled->bytes();
   for (std::size_t row = 0; row < 250; ++row) {
      const auto line = bytes.subspan(row * 16, 16);
      zassert_true(all_equal(line.first(15), 0x00));

      // Pixels 120 and 121 are black, the remaining six bits are padding
      zassert_equal(line[15], 0x3F, "row %d ends with 0x%02X", static_cast<int>(row), line[15]);
   }
}

ZTEST(frame, test_tri_color_planes) {
   const auto panel = *panel::find(chip_family::ssd1680, "2in9b");

   const auto red = frame::fill(panel, color_planes::tri_color, color::red);
   zassert_true(red.has_value());
   zassert_equal(red->plane_count(), 2);
   zassert_equal(red->plane_size(), panel.plane_size());
   zassert_true(all_equal(red->plane(0), 0xFF));
   zassert_true(all_equal(red->plane(1), 0xFF));

   const auto white = frame::fill(panel, color_planes::tri_color, color::white);
   zassert_true(white.has_value());
   zassert_true(all_equal(white->plane(0), frame::white_byte));
   zassert_true(all_equal(white->plane(1), 0x00));

   // No third plane
   zassert_true(white->plane(2).empty());
}

ZTEST(frame, test_gray_levels) {
   const auto panel = small_panel(color_planes::gray4);

   const auto dark = frame::fill(panel, color_planes::gray4, color::dark_gray);
   zassert_true(dark.has_value());
   zassert_true(all_equal(dark->plane(0), 0x00));
   zassert_true(all_equal(dark->plane(1), 0xFF));

   const auto light = frame::fill(panel, color_planes::gray4, color::light_gray);
   zassert_true(light.has_value());
   zassert_true(all_equal(light->plane(0), 0xFF));
   zassert_true(all_equal(light->plane(1), 0xFF));

   const auto black = frame::fill(panel, color_planes::gray4, color::black);
   zassert_true(black.has_value());
   zassert_true(all_equal(black->bytes(), 0x00));
}

ZTEST(frame, test_gray_steps) {
   const auto panel = small_panel(color_planes::gray4);

   // Black, dark gray, light gray and white, four columns each
   const auto packed = frame::pack(panel, color_planes::gray4, [](std::uint16_t x, std::uint16_t) {
      return static_cast<color>(x / 4);
   });
   zassert_true(packed.has_value());

   auto check = [&](std::uint8_t level, std::uint8_t left, std::uint8_t right) {
      const auto step = frame::gray_step(packed->bytes(), panel.plane_size(), level);
      if (step.size() != panel.plane_size()) {
         return false;
      }

      for (std::size_t row = 0; row < 8; ++row) {
         if (step[row * 2] != left || step[row * 2 + 1] != right) {
            return false;
         }
      }
      return true;
   };

   zassert_true(check(3, 0x00, 0x0F));
   zassert_true(check(2, 0x00, 0xFF));
   zassert_true(check(1, 0x0F, 0xFF));

   // A single plane has nothing to darken
   const auto single = frame::gray_step(packed->plane(0), panel.plane_size(), 3);
   zassert_true(all_equal(single, frame::white_byte));
}

ZTEST(frame, test_colors_outside_the_plane_layout) {
   const auto panel = small_panel();

   zassert_true(failed_with(frame::fill(panel, color_planes::mono, color::red), error::unsupported_feature));
   zassert_true(failed_with(frame::fill(panel, color_planes::mono, color::dark_gray), error::unsupported_feature));
   zassert_true(failed_with(frame::fill(panel, color_planes::tri_color, color::light_gray), error::unsupported_feature));
   zassert_true(failed_with(frame::fill(panel, color_planes::gray4, color::red), error::unsupported_feature));

   zassert_true(failed_with(frame::pack(panel, color_planes::mono, frame::pixel_func_t{}), error::unsupported_feature));
}

ZTEST(frame, test_image_size_mismatch) {
   const auto panel = small_panel();
   const std::vector<color> pixels(16 * 8, color::white);

   // Right pixel count, wrong shape
   zassert_true(failed_with(frame::pack(panel, color_planes::mono, {.width = 8, .height = 16, .pixels = pixels}),
                            error::invalid_buffer_size));

   // Rotated by 90 degrees the image has to be 8x16
   zassert_true(failed_with(
      frame::pack(panel, color_planes::mono, {.width = 16, .height = 8, .pixels = pixels}, rotation::rotate90),
      error::invalid_buffer_size));
   zassert_true(
      frame::pack(panel, color_planes::mono, {.width = 8, .height = 16, .pixels = pixels}, rotation::rotate90)
         .has_value());

   // Too few pixels
   const std::vector<color> short_pixels(16 * 8 - 1, color::white);
   zassert_true(failed_with(frame::pack(panel, color_planes::mono, {.width = 16, .height = 8, .pixels = short_pixels}),
                            error::invalid_buffer_size));
}

ZTEST(frame, test_rotation) {
   const auto panel = small_panel();

   const auto r0 = frame::pack(panel, color_planes::mono, origin_marker);
   zassert_true(r0.has_value());
   zassert_equal(r0->bytes()[0], 0x7F);
   zassert_equal(std::count(r0->bytes().begin(), r0->bytes().end(), 0xFF), 15);

   const auto r90 = frame::pack(panel, color_planes::mono, origin_marker, rotation::rotate90);
   zassert_true(r90.has_value());
   zassert_equal(r90->bytes()[1], 0xFE);
   zassert_equal(std::count(r90->bytes().begin(), r90->bytes().end(), 0xFF), 15);

   const auto r180 = frame::pack(panel, color_planes::mono, origin_marker, rotation::rotate180);
   zassert_true(r180.has_value());
   zassert_equal(r180->bytes()[15], 0xFE);
   zassert_equal(std::count(r180->bytes().begin(), r180->bytes().end(), 0xFF), 15);

   const auto r270 = frame::pack(panel, color_planes::mono, origin_marker, rotation::rotate270);
   zassert_true(r270.has_value());
   zassert_equal(r270->bytes()[7 * 2], 0x7F);
   zassert_equal(std::count(r270->bytes().begin(), r270->bytes().end(), 0xFF), 15);
}

ZTEST(frame, test_mirroring) {
   const auto panel = small_panel();

   const auto horizontal = frame::pack(panel, color_planes::mono, origin_marker, rotation::rotate0, mirroring::horizontal);
   zassert_true(horizontal.has_value());
   zassert_equal(horizontal->bytes()[1], 0xFE);
   zassert_equal(std::count(horizontal->bytes().begin(), horizontal->bytes().end(), 0xFF), 15);

   const auto vertical = frame::pack(panel, color_planes::mono, origin_marker, rotation::rotate0, mirroring::vertical);
   zassert_true(vertical.has_value());
   zassert_equal(vertical->bytes()[7 * 2], 0x7F);
   zassert_equal(std::count(vertical->bytes().begin(), vertical->bytes().end(), 0xFF), 15);

   const auto origin = frame::pack(panel, color_planes::mono, origin_marker, rotation::rotate0, mirroring::origin);
   zassert_true(origin.has_value());
   zassert_equal(origin->bytes()[15], 0xFE);
   zassert_equal(std::count(origin->bytes().begin(), origin->bytes().end(), 0xFF), 15);

   // The rotation moves the marker to the top right corner, the mirroring brings it back
   const auto both = frame::pack(panel, color_planes::mono, origin_marker, rotation::rotate90, mirroring::horizontal);
   zassert_true(both.has_value());
   zassert_equal(both->bytes()[0], 0x7F);
   zassert_equal(std::count(both->bytes().begin(), both->bytes().end(), 0xFF), 15);

   // Same for an image
   std::vector<color> pixels(16 * 8, color::white);
   pixels[0] = color::black;
   const auto image = frame::pack(panel, color_planes::mono, {.width = 16, .height = 8, .pixels = pixels},
                                  rotation::rotate0, mirroring::origin);
   zassert_true(image.has_value());
   zassert_true(std::equal(image->bytes().begin(), image->bytes().end(), origin->bytes().begin()));
}

ZTEST(frame, test_sources_along_height) {
   const auto panel = *panel::find(chip_family::ssd1680, "2in9");
   zassert_equal(panel.source_count(), 128);
   zassert_equal(panel.gate_count(), 296);
   zassert_equal(panel.row_bytes(), 16);

   // 296 x 128 logical pixels, stored as 296 gate lines of 16 bytes
   const auto packed = frame::pack(panel, color_planes::mono, origin_marker);
   zassert_true(packed.has_value());
   zassert_equal(packed->bytes().size(), 4736);

   // The top left pixel is the last source of the first gate line
   zassert_equal(packed->bytes()[15], 0xFE);
   zassert_equal(std::count(packed->bytes().begin(), packed->bytes().end(), 0xFF), 4735);

   // The bottom left pixel is the first source of the first gate line
   const auto bottom_left = frame::pack(panel, color_planes::mono, [](std::uint16_t x, std::uint16_t y) {
      return (x == 0 && y == 127) ? color::black : color::white;
   });
   zassert_true(bottom_left.has_value());
   zassert_equal(bottom_left->bytes()[0], 0x7F);

   // The top right pixel ends the last gate line
   const auto top_right = frame::pack(panel, color_planes::mono, [](std::uint16_t x, std::uint16_t y) {
      return (x == 295 && y == 0) ? color::black : color::white;
   });
   zassert_true(top_right.has_value());
   zassert_equal(top_right->bytes()[4735], 0xFE);
}

ZTEST(frame, test_decode_packed_image) {
   // Odd width, so every row carries padding
   const panel::descriptor panel{.family = chip_family::ssd1619a,
                                 .size = "13x5",
                                 .width = 13,
                                 .height = 5,
                                 .planes = color_planes::tri_color,
                                 .default_lut = {}};

   const color tri[] = {color::black, color::white, color::red};
   const color gray[] = {color::black, color::dark_gray, color::light_gray, color::white};

   std::vector<color> tri_pixels;
   std::vector<color> gray_pixels;
   for (std::size_t i = 0; i < 13 * 5; ++i) {
      tri_pixels.push_back(tri[(i * 7) % 3]);
      gray_pixels.push_back(gray[(i * 5 + i / 13) % 4]);
   }

   const auto tri_frame =
      frame::pack(panel, color_planes::tri_color, {.width = 13, .height = 5, .pixels = tri_pixels});
   zassert_true(tri_frame.has_value());
   zassert_true(decode(panel, color_planes::tri_color, tri_frame->bytes()) == tri_pixels);

   const auto gray_frame = frame::pack(panel, color_planes::gray4, {.width = 13, .height = 5, .pixels = gray_pixels});
   zassert_true(gray_frame.has_value());
   zassert_true(decode(panel, color_planes::gray4, gray_frame->bytes()) == gray_pixels);
}

ZTEST(frame, test_wrap_packed_bytes) {
   const auto panel = *panel::find(chip_family::ssd1680, "2in9");

   const auto mono = frame::buffer::make(panel, color_planes::mono, std::vector<std::uint8_t>(4736, 0xAA));
   zassert_true(mono.has_value());
   zassert_equal(mono->planes(), color_planes::mono);
   zassert_equal(mono->plane(0).size(), 4736);

   zassert_true(failed_with(frame::buffer::make(panel, color_planes::mono, std::vector<std::uint8_t>(4735, 0xAA)),
                            error::invalid_buffer_size));

   // Same panel, but two planes are expected
   zassert_true(failed_with(frame::buffer::make(panel, color_planes::tri_color, std::vector<std::uint8_t>(4736, 0)),
                            error::invalid_buffer_size));
}

ZTEST_SUITE(frame, nullptr, nullptr, nullptr, nullptr, nullptr);
