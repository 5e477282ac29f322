/**
 * @file   error.hpp
 * @author Dennis Sitelew
 * @date   Oct. 04, 2026
 */

#pragma once

#include <system_error>

namespace epd {

enum class error {
   //! Not an error
   success = 0,

   //! The busy line did not clear within the configured timeout
   busy_timeout,

   //! Frame buffer length does not match the panel and driver variant
   invalid_buffer_size,

   //! Operation is not allowed in the current driver state
   not_ready,

   //! The bus capability reported a transfer error
   bus_transfer_failed,

   //! The panel or controller can't do what was asked
   unsupported_feature,
};

const std::error_category &epd_category() noexcept;

inline std::error_code make_error_code(epd::error ec) {
   return {static_cast<int>(ec), epd_category()};
}

} // namespace epd

namespace std {

template <>
struct is_error_code_enum<epd::error> : true_type {};

} // namespace std
