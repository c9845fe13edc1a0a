#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "alignment.hpp"
#include "types.hpp"

namespace sarcx {

class Reader;

// SARC archive writer
// Files are written sorted by name hash; insertion order only breaks ties between equal hashes
class Writer {
public:
  explicit Writer(Endian endian = Endian::Little) : policy_(endian), endian_(endian) {}
  ~Writer() = default;

  // Delete copy, enable move
  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;
  Writer(Writer &&) noexcept = default;
  Writer &operator=(Writer &&) noexcept = default;

  // Create a writer holding copies of all named files of an existing archive,
  // using its byte order and its guessed minimum alignment
  static std::optional<Writer> fromReader(const Reader &reader, Error *outError = nullptr);

  // Add a file to the archive (the data is copied)
  // Fails on an empty name or a name that was already added (the first file is kept)
  bool addFile(std::string_view name, std::span<const uint8_t> data, Error *outError = nullptr);
  bool addFile(std::string_view name, std::span<const uint8_t> data, NameMode mode,
               Error *outError = nullptr);

  // Add a file without copying its data
  // The data must stay alive and unchanged until the last write() call
  bool addFileView(std::string_view name, std::span<const uint8_t> data,
                   Error *outError = nullptr);
  bool addFileView(std::string_view name, std::span<const uint8_t> data, NameMode mode,
                   Error *outError = nullptr);

  // Remove a pending file, returns false if there is none with that name
  bool removeFile(std::string_view name);

  bool contains(std::string_view name) const;

  // Serialize the archive using the writer's byte order
  // Returns std::nullopt on failure, with the error in outError if provided
  std::optional<std::vector<uint8_t>> write(Error *outError = nullptr) const;

  // Serialize the archive using the given byte order
  std::optional<std::vector<uint8_t>> write(Endian endian, Error *outError = nullptr) const;

  void setEndian(Endian endian) {
    endian_ = endian;
    policy_.setEndian(endian);
  }
  Endian endian() const { return endian_; }

  // Use legacy alignment rules (for games without a BotW-style resource system)
  void setLegacyMode(bool legacy) { policy_.setLegacyMode(legacy); }

  bool setMinAlignment(uint32_t alignment, Error *outError = nullptr) {
    return policy_.setMinAlignment(alignment, outError);
  }

  // Add or modify the data alignment for an extension (without the dot)
  bool addAlignmentRequirement(std::string extension, uint32_t alignment,
                               Error *outError = nullptr) {
    return policy_.addRequirement(std::move(extension), alignment, outError);
  }

  // Alignment rules for the writer's byte order (write(Endian) may target the other one)
  const AlignmentPolicy &alignmentPolicy() const { return policy_; }

  // Clear all files
  void clear() { pendingFiles_.clear(); }

  // Get number of files to be written
  size_t fileCount() const { return pendingFiles_.size(); }

private:
  struct PendingFile {
    std::string name;
    std::vector<uint8_t> ownedData;      // File data if copied
    std::span<const uint8_t> borrowed;   // Caller memory if added as a view
    bool owned = false;
    NameMode mode = NameMode::Stored;

    std::span<const uint8_t> bytes() const {
      return owned ? std::span<const uint8_t>(ownedData) : borrowed;
    }
  };

  bool checkName(std::string_view name, Error *outError) const;

  std::vector<PendingFile> pendingFiles_;
  AlignmentPolicy policy_;
  Endian endian_;
};

} // namespace sarcx
