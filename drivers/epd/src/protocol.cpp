/**
 * @file   protocol.cpp
 * @author Dennis Sitelew
 * @date   Oct. 06, 2026
 */

#include <epd/protocol.hpp>

#include <zephyr/logging/log.h>

#include <algorithm>
#include <array>
#include <utility>

LOG_MODULE_DECLARE(epd, CONFIG_EPD_LOG_LEVEL);

using namespace epd;

namespace {

using common::busy_level;
using common::driver_state;

//! Holds the chip-select line for one transaction. Releasing it explicitly reports the result, the destructor only
//! covers the error paths.
class chip_select {
private:
   chip_select(epd::bus &bus, bool &in_transaction)
      : bus_{&bus}
      , in_transaction_{&in_transaction} {
      *in_transaction_ = true;
   }

public:
   chip_select(const chip_select &) = delete;

   chip_select(chip_select &&o) noexcept
      : bus_{std::exchange(o.bus_, nullptr)}
      , in_transaction_{std::exchange(o.in_transaction_, nullptr)} {
      // Nothing to do here
   }

   ~chip_select() {
      if (!bus_) {
         return;
      }

      *in_transaction_ = false;
      bus_->chip_select(false).or_else([](const auto &ec) {
         LOG_WRN("CS release error: %s", ec.message().c_str());
      });
   }

public:
   chip_select &operator=(const chip_select &) = delete;
   chip_select &operator=(chip_select &&) = delete;

public:
   static expected<chip_select> take(epd::bus &bus, bool &in_transaction) {
      return bus.chip_select(true).and_then([&]() -> expected<chip_select> {
         return chip_select{bus, in_transaction};
      });
   }

   void_t release() {
      auto bus = std::exchange(bus_, nullptr);
      *std::exchange(in_transaction_, nullptr) = false;
      return bus->chip_select(false);
   }

private:
   epd::bus *bus_;
   bool *in_transaction_;
};

//! Marks a busy wait or reset as in progress
class operation_guard {
public:
   explicit operation_guard(bool &flag)
      : flag_{flag} {
      flag_ = true;
   }

   operation_guard(const operation_guard &) = delete;
   operation_guard &operator=(const operation_guard &) = delete;

   ~operation_guard() { flag_ = false; }

private:
   bool &flag_;
};

bool is_allowed(driver_state from, driver_state to) {
   switch (to) {
      case driver_state::initializing:
         return true;

      case driver_state::idle:
         return from == driver_state::initializing || from == driver_state::refreshing;

      case driver_state::transferring_data:
      case driver_state::sleeping:
         return from == driver_state::idle;

      case driver_state::refreshing:
         return from == driver_state::transferring_data;

      default:
         // uninitialized is never re-entered, faulted only by failures
         return false;
   }
}

} // namespace

namespace epd {

protocol::protocol(epd::bus &bus, const config &cfg)
   : bus_{&bus}
   , config_{cfg} {
   // Nothing to do here
}

void_t protocol::send_command(std::uint8_t opcode, bytes_t payload) {
   return check_idle_bus().and_then([&] {
      return chip_select::take(*bus_, in_transaction_)
         .and_then([&](auto cs) {
            return bus_->write_command(opcode)
               .and_then([&]() -> void_t {
                  if (payload.empty()) {
                     return {};
                  }
                  return bus_->write_data(payload);
               })
               .and_then([&] {
                  return cs.release();
               });
         })
         .or_else([&](const auto &ec) -> void_t {
            LOG_ERR("Command 0x%02x failed", static_cast<int>(opcode));
            return on_bus_error(ec);
         });
   });
}

void_t protocol::send_fill(std::uint8_t opcode, std::uint8_t value, std::size_t count) {
   std::array<std::uint8_t, CONFIG_EPD_FILL_CHUNK_SIZE> chunk{};
   chunk.fill(value);

   auto stream = [&]() -> void_t {
      for (std::size_t sent = 0; sent < count;) {
         const auto length = std::min(count - sent, chunk.size());
         if (auto res = bus_->write_data({chunk.data(), length}); !res) {
            return res;
         }
         sent += length;
      }
      return {};
   };

   return check_idle_bus().and_then([&] {
      return chip_select::take(*bus_, in_transaction_)
         .and_then([&](auto cs) {
            return bus_->write_command(opcode).and_then(stream).and_then([&] {
               return cs.release();
            });
         })
         .or_else([&](const auto &ec) -> void_t {
            LOG_ERR("Fill of 0x%02x failed after command 0x%02x", static_cast<int>(value),
                    static_cast<int>(opcode));
            return on_bus_error(ec);
         });
   });
}

void_t protocol::wait_ready(busy_level busy) {
   return wait_ready(busy, config_.busy_timeout);
}

void_t protocol::wait_ready(busy_level busy, k_timeout_t timeout) {
   return check_idle_bus().and_then([&] {
      operation_guard guard{in_transaction_};
      return bus_->wait_until_ready(busy, timeout).or_else([&](const auto &ec) -> void_t {
         return on_bus_error(ec);
      });
   });
}

void_t protocol::reset(const common::reset_pulse &pulse) {
   return check_idle_bus().and_then([&] {
      operation_guard guard{in_transaction_};
      return bus_->reset(pulse).or_else([&](const auto &ec) -> void_t {
         LOG_ERR("Hardware reset failed");
         return on_bus_error(ec);
      });
   });
}

void protocol::delay(k_timeout_t duration) {
   k_sleep(duration);
}

void_t protocol::transition(driver_state next) {
   // A nested call from a busy wait must not touch the state of the outer operation
   if (auto res = check_idle_bus(); !res) {
      return res;
   }

   if (!is_allowed(state_, next)) {
      LOG_WRN("Rejected transition %s -> %s", common::to_string(state_), common::to_string(next));
      return unexpected(error::not_ready);
   }

   LOG_DBG("%s -> %s", common::to_string(state_), common::to_string(next));
   if (next == driver_state::initializing) {
      fault_ = error::success;
   }

   state_ = next;
   return {};
}

tl::unexpected<std::error_code> protocol::on_bus_error(const std::error_code &ec) {
   const auto kind = (ec == error::busy_timeout) ? error::busy_timeout : error::bus_transfer_failed;

   LOG_ERR("Bus error while %s: %s", common::to_string(state_), ec.message().c_str());
   state_ = driver_state::faulted;
   fault_ = kind;

   return unexpected(kind);
}

void_t protocol::check_idle_bus() const {
   if (in_transaction_) {
      LOG_WRN("Bus already in use");
      return unexpected(error::not_ready);
   }
   return {};
}

} // namespace epd
