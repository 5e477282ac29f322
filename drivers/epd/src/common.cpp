/**
 * @file   common.cpp
 * @author Dennis Sitelew
 * @date   Oct. 06, 2026
 */

#include <epd/common.hpp>

namespace epd::common {

const char *to_string(chip_family family) {
   switch (family) {
      case chip_family::il3895:
         return "IL3895";
      case chip_family::ssd1608:
         return "SSD1608";
      case chip_family::ssd1619a:
         return "SSD1619A";
      case chip_family::ssd1675b:
         return "SSD1675B";
      case chip_family::ssd1680:
         return "SSD1680";
      case chip_family::uc8176:
         return "UC8176";
      case chip_family::uc8179:
         return "UC8179";
      case chip_family::pervasive_itc:
         return "Pervasive iTC";
      default:
         return "(unknown)";
   }
}

const char *to_string(color_planes planes) {
   switch (planes) {
      case color_planes::mono:
         return "mono";
      case color_planes::tri_color:
         return "tri-color";
      case color_planes::gray4:
         return "gray4";
      default:
         return "(unknown)";
   }
}

const char *to_string(driver_state state) {
   switch (state) {
      case driver_state::uninitialized:
         return "uninitialized";
      case driver_state::initializing:
         return "initializing";
      case driver_state::idle:
         return "idle";
      case driver_state::transferring_data:
         return "transferring data";
      case driver_state::refreshing:
         return "refreshing";
      case driver_state::sleeping:
         return "sleeping";
      case driver_state::faulted:
         return "faulted";
      default:
         return "(unknown)";
   }
}

} // namespace epd::common
