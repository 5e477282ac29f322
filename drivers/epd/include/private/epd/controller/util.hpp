/**
 * @file   util.hpp
 * @author Dennis Sitelew
 * @date   Oct. 07, 2026
 */

#pragma once

#include <epd/protocol.hpp>

#include <cstdint>
#include <initializer_list>
#include <type_traits>

namespace epd::controller {

template <typename T>
inline auto u8(T v) {
   return static_cast<std::uint8_t>(v);
}

template <typename Command>
   requires std::is_enum_v<Command>
inline void_t send(protocol &p, Command cmd, std::initializer_list<std::uint8_t> payload = {}) {
   return p.send_command(u8(cmd), bytes_t{payload.begin(), payload.size()});
}

template <typename Command>
   requires std::is_enum_v<Command>
inline void_t send(protocol &p, Command cmd, bytes_t payload) {
   return p.send_command(u8(cmd), payload);
}

template <typename Command>
   requires std::is_enum_v<Command>
inline void_t fill(protocol &p, Command cmd, std::uint8_t value, std::size_t count) {
   return p.send_fill(u8(cmd), value, count);
}

} // namespace epd::controller
