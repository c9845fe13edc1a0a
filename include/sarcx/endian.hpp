#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

#include "types.hpp"

namespace sarcx {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint16_t byteswap(uint16_t value) noexcept {
  return static_cast<uint16_t>((value << 8) | (value >> 8));
}

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

} // namespace detail

// Byte order of the machine we are running on
inline constexpr Endian hostEndian() noexcept {
  return std::endian::native == std::endian::little ? Endian::Little : Endian::Big;
}

// Convert between the archive byte order and host byte order (the conversion is symmetric)
inline constexpr uint16_t toHost16(uint16_t value, Endian endian) noexcept {
  return endian == hostEndian() ? value : detail::byteswap(value);
}

inline constexpr uint32_t toHost32(uint32_t value, Endian endian) noexcept {
  return endian == hostEndian() ? value : detail::byteswap(value);
}

inline constexpr uint16_t fromHost16(uint16_t value, Endian endian) noexcept {
  return toHost16(value, endian);
}

inline constexpr uint32_t fromHost32(uint32_t value, Endian endian) noexcept {
  return toHost32(value, endian);
}

// Unaligned loads from a raw byte pointer in the given byte order
inline uint16_t load16(const uint8_t *src, Endian endian) noexcept {
  uint16_t value;
  std::memcpy(&value, src, sizeof(value));
  return toHost16(value, endian);
}

inline uint32_t load32(const uint8_t *src, Endian endian) noexcept {
  uint32_t value;
  std::memcpy(&value, src, sizeof(value));
  return toHost32(value, endian);
}

// Unaligned stores to a raw byte pointer in the given byte order
inline void store16(uint8_t *dst, uint16_t value, Endian endian) noexcept {
  value = fromHost16(value, endian);
  std::memcpy(dst, &value, sizeof(value));
}

inline void store32(uint8_t *dst, uint32_t value, Endian endian) noexcept {
  value = fromHost32(value, endian);
  std::memcpy(dst, &value, sizeof(value));
}

} // namespace sarcx
