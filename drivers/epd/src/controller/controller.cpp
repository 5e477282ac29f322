/**
 * @file   controller.cpp
 * @author Dennis Sitelew
 * @date   Oct. 08, 2026
 */

#include <epd/controller/controller.hpp>

namespace epd::controller {

const base *get(common::chip_family family) {
   if (auto ssd = detail::find_ssd16xx(family)) {
      return ssd;
   }

   return detail::find_uc81xx(family);
}

} // namespace epd::controller
