#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include "types.hpp"

namespace sarcx {

// Decides how much padding precedes each file's data in a written archive.
//
// The result is the least common multiple of:
//   - the minimum alignment (4 unless changed),
//   - the requirement for the file extension (caller override or built-in table),
//   - 0x2000 for nested SARC archives in legacy mode,
//   - an alignment sniffed from the data header, unless the extension is handled by the
//     engine's resource factories (always sniffed in legacy mode).
class AlignmentPolicy {
public:
  explicit AlignmentPolicy(Endian endian = Endian::Little) : endian_(endian) {}

  // Required alignment for a file, always a power of two
  uint32_t requiredAlignment(std::string_view name, std::span<const uint8_t> data) const;

  // Add or replace the requirement for an extension (without the dot, e.g. "bgparamlist")
  // Set the alignment to 1 to drop a built-in requirement
  bool addRequirement(std::string extension, uint32_t alignment, Error *outError = nullptr);

  bool setMinAlignment(uint32_t alignment, Error *outError = nullptr);
  uint32_t minAlignment() const { return minAlignment_; }

  // Legacy mode is for games without a BotW-style resource system
  void setLegacyMode(bool legacy) { legacy_ = legacy; }
  bool legacyMode() const { return legacy_; }

  void setEndian(Endian endian) { endian_ = endian; }
  Endian endian() const { return endian_; }

  // Requirement for an extension, or std::nullopt if there is none
  std::optional<uint32_t> extensionRequirement(std::string_view extension) const;

  // Built-in requirement table, some entries depend on the target byte order
  static std::optional<uint32_t> defaultRequirement(std::string_view extension, Endian endian);

  // Extensions loaded through the engine's resource factories, which align data themselves
  static bool isResourceFactoryExtension(std::string_view extension);

  // Text after the last '.' of the name, empty if there is none
  static std::string_view extensionOf(std::string_view name);

  // Whether data is a SARC archive (raw or Yaz0-compressed)
  static bool isSarc(std::span<const uint8_t> data);

  // Alignment declared in the header of a new-style binary file (BFRES, BNTX, ...), or 1
  static uint32_t alignmentForNewBinaryFile(std::span<const uint8_t> data);

  // Alignment declared in the footer of a Wii U BFLIM texture, or 1
  static uint32_t alignmentForCafeBflim(std::span<const uint8_t> data);

private:
  std::unordered_map<std::string, uint32_t> overrides_;
  uint32_t minAlignment_ = kDefaultMinAlignment;
  Endian endian_;
  bool legacy_ = false;
};

} // namespace sarcx
