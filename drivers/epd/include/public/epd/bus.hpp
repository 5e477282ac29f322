/**
 * @file   bus.hpp
 * @author Dennis Sitelew
 * @date   Oct. 04, 2026
 */

#pragma once

#include <epd/common.hpp>

#include <cstdint>

namespace epd {

//! Capability set the host platform provides for one panel: a serial bus plus the chip-select, data/command, reset
//! and busy lines. The driver only frames transactions and never touches a peripheral directly.
//!
//! Errors are reported as std::error_code values. wait_until_ready must report a timeout as error::busy_timeout,
//! anything else is treated as a transfer failure.
class bus {
public:
   virtual ~bus() = default;

public:
   //! Assert (drive low) or deassert the chip-select line
   virtual void_t chip_select(bool asserted) = 0;

   //! Drive the data/command line low and clock out one opcode byte
   virtual void_t write_command(std::uint8_t opcode) = 0;

   //! Drive the data/command line high and clock out the payload
   virtual void_t write_data(bytes_t data) = 0;

   //! Run the hardware reset pulse, including all of its delays
   virtual void_t reset(const common::reset_pulse &pulse) = 0;

   //! Block until the busy line leaves `busy`, or the timeout elapses
   virtual void_t wait_until_ready(common::busy_level busy, k_timeout_t timeout) = 0;
};

} // namespace epd
