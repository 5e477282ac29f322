/**
 * @file   driver.hpp
 * @author Dennis Sitelew
 * @date   Oct. 10, 2026
 */

#pragma once

#include <epd/bus.hpp>
#include <epd/common.hpp>
#include <epd/error.hpp>
#include <epd/frame.hpp>
#include <epd/lut.hpp>
#include <epd/panel.hpp>
#include <epd/protocol.hpp>

#include <cstdint>
#include <memory>
#include <vector>

#include <zephyr/kernel.h>

namespace epd {

namespace controller {
class base;
} // namespace controller

//! Per-handle timeouts, defaulting to the Kconfig values
struct driver_config {
   k_timeout_t busy_timeout{K_MSEC(CONFIG_EPD_BUSY_TIMEOUT_MS)};
   k_timeout_t refresh_timeout{K_MSEC(CONFIG_EPD_REFRESH_TIMEOUT_MS)};
};

//! One panel behind one bus. The driver owns its lifecycle state and the LUT it uploaded last; the bus is only used
//! from within driver calls.
//!
//! Calls that are not allowed in the current state fail with error::not_ready without any bus traffic. A busy timeout
//! or a failed transfer leaves the driver faulted until the next `init`.
class driver {
public:
   using config = driver_config;

   enum class variant : std::uint8_t {
      mono,
      tri_color,
      fast,
      gray_scale,
   };

public:
   //! Build a driver variant, failing with error::unsupported_feature if the panel or its controller can't do it
   static expected<std::unique_ptr<driver>> make(variant v, const panel::descriptor &panel, epd::bus &bus,
                                                 const config &cfg = driver_config{});

public:
   driver(const driver &) = delete;
   driver(driver &&) = delete;
   virtual ~driver() = default;

public:
   driver &operator=(const driver &) = delete;
   driver &operator=(driver &&) = delete;

public:
   //! Reset and configure the controller. Allowed from any state, this is also the way out of `faulted`.
   void_t init(k_timeout_t reset_delay = K_MSEC(CONFIG_EPD_RESET_DELAY_MS));

   //! Replace the waveform. The table has to match the controller's LUT register.
   void_t set_lut(const lut::table &table);

   //! Transfer a frame of `frame_size()` bytes and refresh the panel
   void_t display_frame(bytes_t data);
   void_t display_frame(const frame::buffer &frame);

   void_t sleep();

   //! Leave deep sleep. The controller forgets its LUT and RAM, so this is a full `init`.
   void_t wake(k_timeout_t reset_delay = K_MSEC(CONFIG_EPD_RESET_DELAY_MS));

public:
   [[nodiscard]] common::driver_state state() const { return protocol_.state(); }
   [[nodiscard]] error fault() const { return protocol_.fault(); }

   [[nodiscard]] const panel::descriptor &panel() const { return panel_; }

   //! Plane layout this variant transfers
   [[nodiscard]] virtual common::color_planes planes() const = 0;

   [[nodiscard]] std::size_t frame_size() const;

   //! error::success, or the reason this variant can't drive the panel
   [[nodiscard]] error support() const { return support_; }

protected:
   driver(const panel::descriptor &panel, epd::bus &bus, const config &cfg);

   //! Variant part of `init`: LUT upload, clearing RAM the variant doesn't write
   virtual void_t configure() = 0;

   //! Set once by the variant constructor
   void set_support(error support);

   //! Copy the table and upload it
   void_t upload_lut(const lut::table &table);

   //! Transfer and refresh a checked frame
   virtual void_t refresh_frame(bytes_t data);

   //! Idle -> transferring data -> refreshing -> idle, writing the first `plane_count` planes of `data`
   void_t transfer_and_refresh(bytes_t data);
   void_t transfer_and_refresh(bytes_t data, std::uint8_t plane_count);

   //! Fails if the variant is unsupported, the driver is not idle or the frame has the wrong size
   void_t check_frame(bytes_t data) const;

   void_t check_supported() const;
   void_t check_state(common::driver_state expected_state) const;

   [[nodiscard]] const controller::base &chip() const { return *controller_; }
   [[nodiscard]] protocol &engine() { return protocol_; }

private:
   panel::descriptor panel_;
   const controller::base *controller_;
   protocol protocol_;
   error support_{error::success};

   //! Last uploaded waveform, empty while the OTP waveform is in use
   std::vector<std::uint8_t> lut_;
};

} // namespace epd
