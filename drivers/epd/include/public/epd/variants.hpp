/**
 * @file   variants.hpp
 * @author Dennis Sitelew
 * @date   Oct. 10, 2026
 */

#pragma once

#include <epd/driver.hpp>

namespace epd {

//! Black and white frames. Gray capable panels are driven as B/W panels.
class mono_driver final : public driver {
public:
   mono_driver(const panel::descriptor &panel, epd::bus &bus, const config &cfg = {});

public:
   [[nodiscard]] common::color_planes planes() const override { return common::color_planes::mono; }

protected:
   void_t configure() override;
};

//! B/W plane followed by the red (or yellow) plane
class tri_color_driver final : public driver {
public:
   tri_color_driver(const panel::descriptor &panel, epd::bus &bus, const config &cfg = {});

public:
   [[nodiscard]] common::color_planes planes() const override { return common::color_planes::tri_color; }

protected:
   void_t configure() override;
};

//! Black and white frames with the short non-flashing waveform
class fast_driver final : public driver {
public:
   fast_driver(const panel::descriptor &panel, epd::bus &bus, const config &cfg = {});

public:
   [[nodiscard]] common::color_planes planes() const override { return common::color_planes::mono; }

   //! Refresh with the full waveform to clear the ghosting fast refreshes leave behind, then switch back
   void_t display_frame_full(bytes_t data);
   void_t display_frame_full(const frame::buffer &frame);

protected:
   void_t configure() override;
};

//! Four gray levels through incremental refreshes. Each frame takes three refreshes with the gray waveform, every one
//! darkening the pixels below the next gray level by one step, so the panel has to start out white.
class gray_scale_driver final : public driver {
public:
   //! Gray levels, white included
   static constexpr std::uint8_t levels = 4;

public:
   gray_scale_driver(const panel::descriptor &panel, epd::bus &bus, const config &cfg = {});

public:
   [[nodiscard]] common::color_planes planes() const override { return common::color_planes::gray4; }

   //! Full refresh to black or white with the normal waveform
   void_t clear(frame::color c = frame::color::white);

protected:
   void_t configure() override;
   void_t refresh_frame(bytes_t data) override;

private:
   void_t restore_normal_waveform();
};

} // namespace epd
