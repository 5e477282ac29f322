/**
 * @file   protocol.hpp
 * @author Dennis Sitelew
 * @date   Oct. 06, 2026
 */

#pragma once

#include <epd/bus.hpp>
#include <epd/common.hpp>
#include <epd/error.hpp>

#include <cstddef>
#include <cstdint>

#include <zephyr/kernel.h>

namespace epd {

//! Command/data framing and the lifecycle state machine shared by all driver variants.
//!
//! Every command is one chip-select transaction: CS asserted, opcode with DC low, optional payload with DC high, CS
//! released. Bus failures move the engine into the faulted state, which only a new `initializing` transition leaves.
class protocol {
public:
   struct config {
      //! Upper bound for ordinary busy waits (reset, power-on, sleep)
      k_timeout_t busy_timeout;

      //! Upper bound for the busy wait after a refresh trigger
      k_timeout_t refresh_timeout;
   };

public:
   protocol(epd::bus &bus, const config &cfg);

   protocol(const protocol &) = delete;
   protocol &operator=(const protocol &) = delete;

public:
   //! Send an opcode followed by an optional payload in a single transaction
   void_t send_command(std::uint8_t opcode, bytes_t payload = {});

   //! Send an opcode followed by `count` copies of `value` in a single transaction
   void_t send_fill(std::uint8_t opcode, std::uint8_t value, std::size_t count);

   //! Wait for the busy line to leave `busy`, using the busy timeout
   void_t wait_ready(common::busy_level busy);
   void_t wait_ready(common::busy_level busy, k_timeout_t timeout);

   void_t reset(const common::reset_pulse &pulse);

   //! Fixed delay required by some power-up sequences
   void delay(k_timeout_t duration);

   //! Move to `next` if the lifecycle allows it and no transaction holds the bus, otherwise fail with
   //! error::not_ready
   void_t transition(common::driver_state next);

public:
   [[nodiscard]] common::driver_state state() const { return state_; }

   //! Reason for the faulted state, error::success otherwise
   [[nodiscard]] error fault() const { return fault_; }

   [[nodiscard]] const config &timeouts() const { return config_; }

   //! True while a transaction, reset or busy wait is in progress
   [[nodiscard]] bool bus_in_use() const { return in_transaction_; }

private:
   tl::unexpected<std::error_code> on_bus_error(const std::error_code &ec);

   //! Fail with error::not_ready while another transaction holds the bus
   void_t check_idle_bus() const;

private:
   epd::bus *bus_;
   config config_;

   common::driver_state state_{common::driver_state::uninitialized};
   error fault_{error::success};

   //! Set while a transaction or busy wait is in progress
   bool in_transaction_{false};
};

} // namespace epd
