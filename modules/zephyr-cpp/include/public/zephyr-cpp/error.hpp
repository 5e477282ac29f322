/**
 * @file   error.hpp
 * @author Dennis Sitelew
 * @date   Nov. 01, 2024
 */

#pragma once

#include <system_error>

namespace zephyr::error {

//! Construct a system error code out of a Zephyr error value (usually negative)
std::error_code make(int error);

//! Check whether `ec` holds the Zephyr error value `error`, regardless of its sign
bool is(const std::error_code &ec, int error);

} // namespace zephyr::error
