#pragma once

#include <cstdint>
#include <string_view>

namespace sarcx {

// Multiplier written by every known SARC producer
inline constexpr uint32_t kHashMultiplier = 0x65;

// SARC name hash: hash = hash * multiplier + byte, wrapping at 32 bits
// Distinct names can share a hash, lookups must compare the names themselves
inline constexpr uint32_t hashName(std::string_view name,
                                   uint32_t multiplier = kHashMultiplier) noexcept {
  uint32_t hash = 0;
  for (char c : name) {
    hash = hash * multiplier + static_cast<uint8_t>(c);
  }
  return hash;
}

} // namespace sarcx
