/**
 * @file   controller.hpp
 * @author Dennis Sitelew
 * @date   Oct. 07, 2026
 */

#pragma once

#include <epd/common.hpp>
#include <epd/lut.hpp>
#include <epd/panel.hpp>
#include <epd/protocol.hpp>

#include <cstddef>
#include <cstdint>

#include <zephyr/kernel.h>

namespace epd::controller {

//! Command dialect of one controller family. Instances are stateless, all state lives in the protocol engine and the
//! driver that owns it.
class base {
public:
   virtual ~base() = default;

public:
   [[nodiscard]] virtual common::chip_family family() const = 0;

   //! Level of the busy line while the controller is working
   [[nodiscard]] virtual common::busy_level busy() const = 0;

   [[nodiscard]] virtual common::reset_pulse reset_pulse(k_timeout_t settle) const = 0;

   //! Fixed power-on bytes, followed by the RAM window for the panel
   virtual void_t power_on(protocol &p, const panel::descriptor &panel) const = 0;

   //! LUT register size in bytes, 0 when the controller only runs OTP waveforms
   [[nodiscard]] virtual std::size_t lut_size() const = 0;
   virtual void_t load_lut(protocol &p, const lut::table &table) const = 0;

   //! Whether there is a second (red) RAM next to the B/W one
   [[nodiscard]] virtual bool has_secondary_ram() const = 0;

   //! Write one plane: index 0 is the B/W RAM, 1 the red RAM
   virtual void_t write_plane(protocol &p, std::uint8_t index, bytes_t data) const = 0;

   //! Fill the red RAM with "no color"
   virtual void_t clear_secondary(protocol &p, const panel::descriptor &panel) const = 0;

   //! Trigger a refresh and wait for it to finish, with the refresh timeout
   virtual void_t refresh(protocol &p, bool register_lut) const = 0;

   virtual void_t deep_sleep(protocol &p) const = 0;

   //! Wait for the controller with the ordinary busy timeout
   void_t wait_ready(protocol &p) const { return wait(p, p.timeouts().busy_timeout); }

   virtual void_t wait(protocol &p, k_timeout_t timeout) const { return p.wait_ready(busy(), timeout); }
};

//! Dialect for a chip family, nullptr for an unknown one
const base *get(common::chip_family family);

namespace detail {

const base *find_ssd16xx(common::chip_family family);
const base *find_uc81xx(common::chip_family family);

} // namespace detail

} // namespace epd::controller
