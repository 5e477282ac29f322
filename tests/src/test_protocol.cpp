/**
 * @file   test_protocol.cpp
 * @author Dennis Sitelew
 * @date   Oct. 14, 2026
 */

#include <epd_test/mock_bus.hpp>

#include <epd/protocol.hpp>

#include <zephyr/ztest.h>

#include <algorithm>
#include <array>

using namespace epd;
using namespace epd_test;

using common::busy_level;
using common::driver_state;

namespace {

const protocol::config timeouts{
   .busy_timeout = K_MSEC(50),
   .refresh_timeout = K_MSEC(100),
};

} // namespace

ZTEST(protocol, test_command_without_payload) {
   mock_bus bus;
   protocol p{bus, timeouts};

   zassert_true(p.send_command(0x12).has_value());

   const std::vector<event> expected{
      {.type = event_type::chip_select, .asserted = true},
      {.type = event_type::command, .opcode = 0x12},
      {.type = event_type::chip_select, .asserted = false},
   };
   zassert_true(bus.events == expected);
}

ZTEST(protocol, test_command_with_payload) {
   mock_bus bus;
   protocol p{bus, timeouts};

   const std::array<std::uint8_t, 3> payload{0x27, 0x01, 0x00};
   zassert_true(p.send_command(0x01, payload).has_value());

   const std::vector<event> expected{
      {.type = event_type::chip_select, .asserted = true},
      {.type = event_type::command, .opcode = 0x01},
      {.type = event_type::data, .data = {0x27, 0x01, 0x00}},
      {.type = event_type::chip_select, .asserted = false},
   };
   zassert_true(bus.events == expected);
}

ZTEST(protocol, test_fill_is_one_transaction) {
   mock_bus bus;
   protocol p{bus, timeouts};

   const std::size_t count = CONFIG_EPD_FILL_CHUNK_SIZE * 3 + 5;
   zassert_true(p.send_fill(0x26, 0xAB, count).has_value());

   zassert_equal(bus.count(event_type::chip_select), 2);
   zassert_equal(bus.count(event_type::command), 1);
   zassert_equal(bus.count(event_type::data), 4);

   const auto transactions = bus.transactions();
   zassert_equal(transactions.size(), 1);
   zassert_equal(transactions[0].opcode, 0x26);
   zassert_equal(transactions[0].payload.size(), count);
   zassert_true(std::all_of(transactions[0].payload.begin(), transactions[0].payload.end(), [](auto b) {
      return b == 0xAB;
   }));
}

ZTEST(protocol, test_wait_uses_busy_timeout) {
   mock_bus bus;
   protocol p{bus, timeouts};

   zassert_true(p.wait_ready(busy_level::low).has_value());
   zassert_true(p.wait_ready(busy_level::high, K_MSEC(75)).has_value());

   zassert_equal(bus.events.size(), 2);
   zassert_equal(bus.events[0].busy, busy_level::low);
   zassert_equal(bus.events[0].timeout_ms, 50);
   zassert_equal(bus.events[1].busy, busy_level::high);
   zassert_equal(bus.events[1].timeout_ms, 75);
}

ZTEST(protocol, test_busy_timeout_faults) {
   mock_bus bus;
   bus.busy_stuck = true;
   protocol p{bus, timeouts};

   const auto start = k_uptime_get();
   const auto res = p.wait_ready(busy_level::high);
   const auto elapsed = k_uptime_get() - start;

   zassert_true(failed_with(res, error::busy_timeout));
   zassert_true(elapsed >= 50, "returned after %d ms", static_cast<int>(elapsed));
   zassert_equal(p.state(), driver_state::faulted);
   zassert_equal(p.fault(), error::busy_timeout);

   // No retries
   zassert_equal(bus.count(event_type::wait), 1);
}

ZTEST(protocol, test_transfer_error_faults_and_releases_cs) {
   mock_bus bus;
   bus.fail_data = true;
   protocol p{bus, timeouts};

   const std::array<std::uint8_t, 1> payload{0x03};
   zassert_true(failed_with(p.send_command(0x11, payload), error::bus_transfer_failed));
   zassert_equal(p.state(), driver_state::faulted);
   zassert_equal(p.fault(), error::bus_transfer_failed);

   zassert_equal(bus.events.back().type, event_type::chip_select);
   zassert_false(bus.events.back().asserted);

   // The engine is usable again right away
   bus.fail_data = false;
   zassert_true(p.send_command(0x11, payload).has_value());
}

ZTEST(protocol, test_nested_calls_are_rejected) {
   mock_bus bus;
   protocol p{bus, timeouts};

   std::size_t events_before = 0;
   std::size_t events_after = 0;
   bool nested_rejected = false;

   bus.on_wait = [&] {
      events_before = bus.events.size();
      nested_rejected = failed_with(p.send_command(0x20), error::not_ready) &&
                        failed_with(p.wait_ready(busy_level::high), error::not_ready);
      events_after = bus.events.size();
   };

   zassert_true(p.wait_ready(busy_level::high).has_value());
   zassert_true(nested_rejected);
   zassert_equal(events_before, events_after);

   // Rejection does not fault the engine
   zassert_equal(p.state(), driver_state::uninitialized);
}

ZTEST(protocol, test_lifecycle_transitions) {
   mock_bus bus;
   protocol p{bus, timeouts};

   zassert_true(failed_with(p.transition(driver_state::idle), error::not_ready));
   zassert_equal(p.state(), driver_state::uninitialized);

   zassert_true(p.transition(driver_state::initializing).has_value());
   zassert_true(failed_with(p.transition(driver_state::refreshing), error::not_ready));
   zassert_true(p.transition(driver_state::idle).has_value());

   zassert_true(failed_with(p.transition(driver_state::refreshing), error::not_ready));
   zassert_true(failed_with(p.transition(driver_state::faulted), error::not_ready));
   zassert_equal(p.state(), driver_state::idle);

   zassert_true(p.transition(driver_state::transferring_data).has_value());
   zassert_true(failed_with(p.transition(driver_state::idle), error::not_ready));
   zassert_true(p.transition(driver_state::refreshing).has_value());
   zassert_true(p.transition(driver_state::idle).has_value());

   zassert_true(p.transition(driver_state::sleeping).has_value());
   zassert_true(failed_with(p.transition(driver_state::idle), error::not_ready));
   zassert_true(p.transition(driver_state::initializing).has_value());

   // Transitions never touch the bus
   zassert_true(bus.events.empty());
}

ZTEST(protocol, test_initializing_clears_fault) {
   mock_bus bus;
   bus.fail_command = 0x12;
   protocol p{bus, timeouts};

   zassert_true(failed_with(p.send_command(0x12), error::bus_transfer_failed));
   zassert_equal(p.state(), driver_state::faulted);
   zassert_true(failed_with(p.transition(driver_state::idle), error::not_ready));

   zassert_true(p.transition(driver_state::initializing).has_value());
   zassert_equal(p.fault(), error::success);
}

ZTEST_SUITE(protocol, nullptr, nullptr, nullptr, nullptr, nullptr);
