#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace sarcx {

// SARC archive reader
// Borrows the archive buffer: the buffer must outlive the reader and every Entry it returns
class Reader {
public:
  Reader() = default;
  ~Reader() = default;

  Reader(const Reader &) = default;
  Reader &operator=(const Reader &) = default;
  Reader(Reader &&) noexcept = default;
  Reader &operator=(Reader &&) noexcept = default;

  // Parse and validate an archive held in memory
  // Returns std::nullopt on failure, with the error in outError if provided
  static std::optional<Reader> open(std::span<const uint8_t> data, Error *outError = nullptr);

  // Get all entries in archive order (ascending name hash)
  // Entries whose name cannot be resolved are left out, use entryAt() to diagnose them
  std::vector<Entry> files() const;

  // Get an entry by record index
  std::optional<Entry> entryAt(size_t index, Error *outError = nullptr) const;

  // Find an entry by exact name
  // Records sharing the name hash are told apart by comparing their names
  std::optional<Entry> findFile(std::string_view name) const;

  size_t fileCount() const { return records_.size(); }
  Endian endian() const { return endian_; }
  uint32_t fileSize() const { return fileSize_; }
  uint32_t dataOffset() const { return dataOffset_; }
  uint32_t hashMultiplier() const { return hashMultiplier_; }

  // Raw file allocation table records, in archive order
  const std::vector<FatRecord> &records() const { return records_; }

  // The whole archive buffer
  std::span<const uint8_t> data() const { return data_; }

  // Guess the minimum data alignment used by the producer of this archive
  uint32_t guessMinAlignment() const;

  // Returns true if both archives contain the same entries in the same order
  static bool areFilesEqual(const Reader &a, const Reader &b);

private:
  bool parse(Error *outError);

  // Resolve the name of a record through the name table
  bool resolveName(const FatRecord &record, size_t index, std::optional<std::string_view> &outName,
                   Error *outError) const;

  std::span<const uint8_t> fileData(const FatRecord &record) const;

  std::span<const uint8_t> data_;
  std::vector<FatRecord> records_;
  Endian endian_ = Endian::Little;
  uint32_t fileSize_ = 0;
  uint32_t dataOffset_ = 0;
  uint32_t namesOffset_ = 0;
  uint32_t hashMultiplier_ = 0;
};

} // namespace sarcx
