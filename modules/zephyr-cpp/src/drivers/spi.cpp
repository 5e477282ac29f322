/**
 * @file   spi.cpp
 * @author Dennis Sitelew
 * @date   Nov. 01, 2024
 */

#include <zephyr-cpp/drivers/spi.hpp>

#include <zephyr-cpp/error.hpp>

#include <zephyr/logging/log.h>

#include <algorithm>
#include <cstdint>

LOG_MODULE_REGISTER(zpp_spi, CONFIG_ZEPHYR_CPP_LOG_LEVEL);

namespace zephyr::spi {

void_t ready(const spi_dt_spec &spec) {
   if (!spi_is_ready_dt(&spec)) {
      LOG_ERR("SPI bus %s not ready", spec.bus->name);
      return unexpected(ENODEV);
   }

   return {};
}

void_t write(const spi_dt_spec &spec, const spi_buf_set &buf_set) {
   if (auto err = spi_write_dt(&spec, &buf_set)) {
      LOG_ERR("SPI write failed on %s: %d", spec.bus->name, err);
      return unexpected(err);
   }

   return {};
}

void_t write(const spi_dt_spec &spec, std::span<const std::uint8_t> data, std::size_t chunk_size) {
   if (chunk_size == 0) {
      return unexpected(EINVAL);
   }

   for (std::size_t i = 0; i < data.size(); i += chunk_size) {
      const auto chunk = data.subspan(i, std::min(data.size() - i, chunk_size));

      // note: we are casting the const-ness away, but the SPI driver won't touch the
      // data anyway, so it should be fine
      const spi_buf tx_buf = {
         .buf = const_cast<std::uint8_t *>(chunk.data()),
         .len = chunk.size(),
      };

      const spi_buf_set tx_buf_set = {
         .buffers = &tx_buf,
         .count = 1,
      };

      if (auto res = write(spec, tx_buf_set); !res) {
         return res;
      }
   }

   return {};
}

} // namespace zephyr::spi
