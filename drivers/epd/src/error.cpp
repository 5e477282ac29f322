/**
 * @file   error.cpp
 * @author Dennis Sitelew
 * @date   Oct. 04, 2026
 */

#include <epd/error.hpp>

#include <string>

namespace detail {

struct epd_error_category : std::error_category {
   [[nodiscard]] const char *name() const noexcept override;
   [[nodiscard]] std::string message(int ev) const override;
};

const char *epd_error_category::name() const noexcept {
   return "epd-error";
}

std::string epd_error_category::message(int ev) const {
   using namespace epd;
   switch (static_cast<error>(ev)) {
      case error::success:
         return "not an error";

      case error::busy_timeout:
         return "busy line timeout";

      case error::invalid_buffer_size:
         return "invalid frame buffer size";

      case error::not_ready:
         return "driver not ready";

      case error::bus_transfer_failed:
         return "bus transfer failed";

      case error::unsupported_feature:
         return "unsupported feature";

      default:
         return "(unrecognized error)";
   }
}

} // namespace detail

namespace epd {

const std::error_category &epd_category() noexcept {
   static const detail::epd_error_category category_const;
   return category_const;
}

} // namespace epd
