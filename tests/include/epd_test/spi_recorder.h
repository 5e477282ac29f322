/**
 * @file   spi_recorder.h
 * @author Dennis Sitelew
 * @date   Oct. 18, 2026
 */

#pragma once

#include <zephyr/device.h>
#include <zephyr/drivers/gpio.h>

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

//! A single SPI write seen by the emulated target
struct spi_recorder_transfer {
   size_t length;
   uint8_t first_byte;

   //! Level of the data/command line while the transfer was on the wire
   int dc_level;
};

#define SPI_RECORDER_MAX_TRANSFERS 16

//! Forgets all recorded transfers and samples @p dc_pin of @p gpio from now on
void spi_recorder_reset(const struct device *gpio, gpio_pin_t dc_pin);

size_t spi_recorder_count(void);
size_t spi_recorder_total_bytes(void);

//! Returns the @p index-th transfer, or NULL past the recorded ones
const struct spi_recorder_transfer *spi_recorder_get(size_t index);

#ifdef __cplusplus
}
#endif
