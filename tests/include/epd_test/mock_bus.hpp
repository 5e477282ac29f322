/**
 * @file   mock_bus.hpp
 * @author Dennis Sitelew
 * @date   Oct. 13, 2026
 */

#pragma once

#include <epd/bus.hpp>
#include <epd/error.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace epd_test {

enum class event_type : std::uint8_t {
   chip_select,
   command,
   data,
   reset,
   wait,
};

struct event {
   event_type type;

   //! chip_select
   bool asserted{false};

   //! command
   std::uint8_t opcode{0};

   //! data
   std::vector<std::uint8_t> data{};

   //! wait
   epd::common::busy_level busy{epd::common::busy_level::high};
   std::int64_t timeout_ms{0};

   bool operator==(const event &) const = default;
};

//! One command with everything written while its chip-select was held
struct transaction {
   std::uint8_t opcode;
   std::vector<std::uint8_t> payload;
};

//! Records every call and answers the busy wait immediately, unless told otherwise
class mock_bus : public epd::bus {
public:
   epd::void_t chip_select(bool asserted) override;
   epd::void_t write_command(std::uint8_t opcode) override;
   epd::void_t write_data(epd::bytes_t data) override;
   epd::void_t reset(const epd::common::reset_pulse &pulse) override;
   epd::void_t wait_until_ready(epd::common::busy_level busy, k_timeout_t timeout) override;

public:
   void clear() { events.clear(); }

   [[nodiscard]] std::vector<transaction> transactions() const;
   [[nodiscard]] std::vector<std::uint8_t> opcodes() const;
   [[nodiscard]] std::size_t count(std::uint8_t opcode) const;
   [[nodiscard]] std::size_t count(event_type type) const;

   //! Payload of the n-th transaction with `opcode`
   [[nodiscard]] std::optional<std::vector<std::uint8_t>> payload(std::uint8_t opcode, std::size_t n = 0) const;

public:
   std::vector<event> events;

   //! Fail the write of this opcode with EIO
   std::optional<std::uint8_t> fail_command;

   //! Fail any data write with EIO
   bool fail_data{false};

   //! Busy line never clears: sleep for the timeout, then report error::busy_timeout
   bool busy_stuck{false};

   //! Called from within every busy wait
   std::function<void()> on_wait;
};

//! True if the result holds the given driver error
template <typename T>
bool failed_with(const epd::expected<T> &res, epd::error e) {
   return !res && res.error() == e;
}

} // namespace epd_test
