#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace sarcx {

// Byte order of a SARC archive, identified by its byte-order mark
enum class Endian : uint8_t {
  Big,    // Wii U
  Little, // Switch
};

// Entry in a SARC archive (views into the archive buffer, no copies)
struct Entry {
  std::optional<std::string_view> name; // Absent when the record has no name table entry
  std::span<const uint8_t> data;
};

// Whether a pending file stores its name in the name table
enum class NameMode : uint8_t {
  Stored,   // Name written to the name table (default)
  HashOnly, // Only the name hash is written, the record has no name
};

// Archive header (0x14 bytes)
struct ArchiveHeader {
  static constexpr char magic[4] = {'S', 'A', 'R', 'C'};
  static constexpr uint16_t headerSize = 0x14;
  static constexpr uint16_t byteOrderMark = 0xFEFF;
  static constexpr uint16_t version = 0x0100;

  static constexpr size_t byteOrderOffset = 0x06;
};

// File allocation table header (0x0C bytes), followed by the records
struct FatHeader {
  static constexpr char magic[4] = {'S', 'F', 'A', 'T'};
  static constexpr uint16_t headerSize = 0x0C;

  // File count must fit in 14 bits
  static constexpr uint16_t maxFileCount = 0x3FFF;
};

// File allocation table record (0x10 bytes)
struct FatRecord {
  uint32_t nameHash = 0;
  uint32_t nameFlagAndOffset = 0; // Bits 24..31: has-name flag, bits 0..23: offset / 4
  uint32_t dataBegin = 0;         // Relative to the data offset
  uint32_t dataEnd = 0;           // Relative to the data offset

  static constexpr size_t size = 0x10;
  static constexpr uint32_t nameFlag = 0x01000000;
  static constexpr uint32_t nameOffsetMask = 0x00FFFFFF;
  static constexpr uint32_t nameOffsetUnit = 4;

  bool hasName() const { return (nameFlagAndOffset >> 24) != 0; }
  uint32_t nameOffset() const { return (nameFlagAndOffset & nameOffsetMask) * nameOffsetUnit; }
};

// File name table header (0x08 bytes), followed by the names
struct FntHeader {
  static constexpr char magic[4] = {'S', 'F', 'N', 'T'};
  static constexpr uint16_t headerSize = 0x08;
};

// Alignment of every name in the name table
inline constexpr uint32_t kNameAlignment = 4;

// Minimum data alignment used when nothing stricter applies
inline constexpr uint32_t kDefaultMinAlignment = 4;

enum class ErrorCode : uint8_t {
  None,
  InvalidMagic,
  InvalidByteOrder,
  TruncatedBuffer,
  UnsupportedVersion,
  InvalidSectionSize,
  OffsetOutOfRange,
  NameTableOffsetInvalid,
  IndexOutOfRange,
  DuplicateName,
  EmptyName,
  InvalidName,
  EntryTooLarge,
  TooManyEntries,
  InvalidAlignment,
  IoError,
};

// Error reported through the optional outError parameters
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;
};

const char *toString(ErrorCode code) noexcept;

// Fill outError if the caller asked for it
inline void setError(Error *outError, ErrorCode code, std::string message) {
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
  }
}

inline constexpr bool isValidAlignment(uint64_t alignment) noexcept {
  return alignment != 0 && (alignment & (alignment - 1)) == 0;
}

// Round value up to a multiple of alignment (power of two)
inline constexpr uint64_t alignUp(uint64_t value, uint64_t alignment) noexcept {
  return (value + alignment - 1) & ~(alignment - 1);
}

} // namespace sarcx
