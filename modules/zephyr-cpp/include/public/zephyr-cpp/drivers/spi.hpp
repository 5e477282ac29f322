/**
 * @file   spi.hpp
 * @author Dennis Sitelew
 * @date   Nov. 01, 2024
 */

#pragma once

#include <zephyr-cpp/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

#include <zephyr/drivers/spi.h>

namespace zephyr::spi {

void_t ready(const spi_dt_spec &spec);
void_t write(const spi_dt_spec &spec, const spi_buf_set &buf_set);

//! Write the data in transfers of at most `chunk_size` bytes
void_t write(const spi_dt_spec &spec, std::span<const std::uint8_t> data, std::size_t chunk_size);

} // namespace zephyr::spi
