/**
 * @file   lut.cpp
 * @author Dennis Sitelew
 * @date   Oct. 05, 2026
 */

#include <epd/lut.hpp>

#include <array>
#include <cstdint>

using namespace epd;

namespace {

//! IL3895 / SSD1608 LUT layout (30 bytes):
//!  - 10 bytes VS[n]: source voltage per phase pair, 2 bits per transition (HH, HL, LH, LL)
//!    00 - VSS, 01 - VSH, 10 - VSL, 11 - HiZ
//!  - 6 bytes padding
//!  - 10 bytes <<RP[n]:3, TP[n]:5>>: repeat counter and phase period
//!  - 4 bytes padding
// clang-format off
constexpr std::array<std::uint8_t, 30> il3895_full{
   0x22, 0x55, 0xAA, 0x55, 0xAA, 0x55, 0xAA, 0x11, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x1E, 0x1E, 0x1E, 0x1E, 0x1E, 0x1E, 0x1E, 0x1E, 0x01, 0x00,
   0x00, 0x00, 0x00, 0x00,
};

constexpr std::array<std::uint8_t, 30> il3895_fast{
   // HL: white to black, LH: black to white
   0x18, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x0F, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00,
};

//! SSD1608: 20 bytes VS, 8 bytes TP, then the VSH/VSL and dummy bytes
constexpr std::array<std::uint8_t, 30> ssd1608_full{
   0x50, 0xAA, 0x55, 0xAA, 0x11, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0xFF, 0xFF, 0x1F, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00,
};

constexpr std::array<std::uint8_t, 30> ssd1608_fast{
   0b10'01'10'01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x0A, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00,
};

//! Single VSH phase for the black-to-black transition, the step size is set by TP[0]
constexpr std::array<std::uint8_t, 30> ssd1608_gray2{
   0b00'01'00'01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00,
};

//! Used with lowered VSH/VSL
constexpr std::array<std::uint8_t, 30> ssd1608_gray3{
   0b00'01'00'01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00,
};

//! Used with lowered VSH/VSL, a raised VCOM and the shortest gate line width
constexpr std::array<std::uint8_t, 30> ssd1608_gray4{
   0b00'01'00'01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
};

//! SSD1619A LUT layout (70 bytes):
//!  - 5 x 7 bytes VS for LUT0..LUT3 and VCOM (LUT4), one byte per group, 2 bits per phase A..D
//!    00 - VSS, 01 - VSH1, 10 - VSL, 11 - VSH2
//!  - 7 x 5 bytes TP[nA], TP[nB], TP[nC], TP[nD], RP[n]
//! LUTn is selected by the (red, b/w) RAM bit pair: 00 - LUT0, 01 - LUT1, 10 - LUT2, 11 - LUT3.
constexpr std::array<std::uint8_t, 70> ssd1619a_full{
   0b10'10'10'10, 0b01'01'01'01, 0b01'00'00'00, 0x00, 0x00, 0x00, 0x00,
   0b10'10'10'10, 0b01'01'01'01, 0b10'00'00'00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,

   0x0F, 0x00, 0x00, 0x00, 0x00,
   0x0F, 0x00, 0x00, 0x00, 0x00,
   0x1F, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
};

constexpr std::array<std::uint8_t, 70> ssd1619a_fast{
   0b10'01'00'00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0b01'10'00'00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,

   0x1F, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
};

//! One VSH1 phase for LUT0 (black RAM bit), nothing for LUT1 (white RAM bit)
constexpr std::array<std::uint8_t, 70> ssd1619a_gray4{
   0b01'00'00'00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,

   0x01, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00,
};

//! SSD1675B LUT layout (105 bytes): 5 x 10 bytes VS, 5 x 10 bytes timing, 5 bytes frame rate. The same waveform
//! serves the full and the fast refresh.
constexpr std::array<std::uint8_t, 105> ssd1675b_waveform{
   0x2A, 0x05, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x05, 0x2A, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x2A, 0x15, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x05, 0x0A, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,

   0x00, 0x02, 0x03, 0x0A, 0x00, 0x02, 0x06, 0x0A, 0x05, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,

   0x22, 0x22, 0x22, 0x22, 0x22,
};

//! Pervasive Displays iTC register LUTs, concatenated in register order:
//! VCOM (44 bytes), WW, BW, WB, BB (42 bytes each).
constexpr std::array<std::uint8_t, 212> pervasive_full{
   // VCOM
   0x00, 0x00, 0x00, 0x0A, 0x00, 0x00,
   0x00, 0x01, 0x60, 0x14, 0x14, 0x00,
   0x00, 0x01, 0x00, 0x14, 0x00, 0x00,
   0x00, 0x01, 0x00, 0x13, 0x0A, 0x01,
   0x00, 0x01, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00,
   // WW
   0x40, 0x0A, 0x00, 0x00, 0x00, 0x01,
   0x90, 0x14, 0x14, 0x00, 0x00, 0x01,
   0x10, 0x14, 0x0A, 0x00, 0x00, 0x01,
   0xA0, 0x13, 0x01, 0x00, 0x00, 0x01,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   // BW
   0x40, 0x0A, 0x00, 0x00, 0x00, 0x01,
   0x90, 0x14, 0x14, 0x00, 0x00, 0x01,
   0x00, 0x14, 0x0A, 0x00, 0x00, 0x01,
   0x99, 0x0C, 0x01, 0x03, 0x04, 0x01,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   // WB
   0x40, 0x0A, 0x00, 0x00, 0x00, 0x01,
   0x90, 0x14, 0x14, 0x00, 0x00, 0x01,
   0x00, 0x14, 0x0A, 0x00, 0x00, 0x01,
   0x99, 0x0B, 0x04, 0x04, 0x01, 0x01,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   // BB
   0x80, 0x0A, 0x00, 0x00, 0x00, 0x01,
   0x90, 0x14, 0x14, 0x00, 0x00, 0x01,
   0x20, 0x14, 0x0A, 0x00, 0x00, 0x01,
   0x50, 0x13, 0x01, 0x00, 0x00, 0x01,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
   0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
};
// clang-format on

template <std::size_t N>
lut::table make(lut::mode mode, const std::array<std::uint8_t, N> &data) {
   return {.mode = mode, .data = data};
}

} // namespace

namespace epd::lut {

std::optional<table> find(common::chip_family family, lut::mode mode) {
   using common::chip_family;

   switch (family) {
      case chip_family::il3895:
         if (mode == lut::mode::full) {
            return make(mode, il3895_full);
         } else if (mode == lut::mode::fast) {
            return make(mode, il3895_fast);
         }
         break;

      case chip_family::ssd1608:
         switch (mode) {
            case lut::mode::full:
               return make(mode, ssd1608_full);
            case lut::mode::fast:
               return make(mode, ssd1608_fast);
            case lut::mode::gray2:
               return make(mode, ssd1608_gray2);
            case lut::mode::gray3:
               return make(mode, ssd1608_gray3);
            case lut::mode::gray4:
               return make(mode, ssd1608_gray4);
         }
         break;

      case chip_family::ssd1619a:
         switch (mode) {
            case lut::mode::full:
               return make(mode, ssd1619a_full);
            case lut::mode::fast:
               return make(mode, ssd1619a_fast);
            case lut::mode::gray4:
               return make(mode, ssd1619a_gray4);
            default:
               break;
         }
         break;

      case chip_family::ssd1675b:
         if (mode == lut::mode::full || mode == lut::mode::fast) {
            return make(mode, ssd1675b_waveform);
         }
         break;

      case chip_family::pervasive_itc:
         if (mode == lut::mode::full) {
            return make(mode, pervasive_full);
         }
         break;

      default:
         // OTP waveforms only
         break;
   }

   return std::nullopt;
}

} // namespace epd::lut
