/**
 * @file   panel.cpp
 * @author Dennis Sitelew
 * @date   Oct. 05, 2026
 */

#include <epd/panel.hpp>

#include <algorithm>
#include <array>

using namespace epd;

namespace {

using common::chip_family;
using common::color_planes;

lut::table otp() {
   return {.mode = lut::mode::full, .data = {}};
}

lut::table builtin(chip_family family) {
   return lut::find(family, lut::mode::full).value_or(otp());
}

const std::array<panel::descriptor, 11> &presets() {
   // clang-format off
   static const std::array<panel::descriptor, 11> table{{
      {chip_family::il3895,        "2in13", 122, 250, color_planes::mono,      builtin(chip_family::il3895)},
      {chip_family::ssd1608,       "1in54", 200, 200, color_planes::gray4,     builtin(chip_family::ssd1608)},
      {chip_family::ssd1619a,      "4in2",  400, 300, color_planes::gray4,     otp()},
      {chip_family::ssd1619a,      "4in2b", 400, 300, color_planes::tri_color, otp()},
      {chip_family::ssd1675b,      "2in9b", 160, 296, color_planes::tri_color, otp()},
      {chip_family::ssd1680,       "2in9",  296, 128, color_planes::mono,      otp(), panel::axis::height},
      {chip_family::ssd1680,       "2in9b", 128, 296, color_planes::tri_color, otp()},
      {chip_family::uc8176,        "4in2b", 400, 300, color_planes::tri_color, otp()},
      {chip_family::uc8179,        "7in5",  800, 480, color_planes::mono,      otp()},
      {chip_family::uc8179,        "7in5b", 800, 480, color_planes::tri_color, otp()},
      {chip_family::pervasive_itc, "2in66", 152, 296, color_planes::mono,      builtin(chip_family::pervasive_itc)},
   }};
   // clang-format on
   return table;
}

} // namespace

namespace epd::panel {

std::span<const descriptor> catalog() {
   return presets();
}

std::optional<descriptor> find(common::chip_family family, std::string_view size) {
   const auto &table = presets();
   auto it = std::find_if(table.begin(), table.end(), [&](const descriptor &d) {
      return d.family == family && d.size == size;
   });

   if (it == table.end()) {
      return std::nullopt;
   }

   return *it;
}

} // namespace epd::panel
