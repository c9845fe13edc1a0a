#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace sarcx {

// Forward declarations
class MappedFile;
class Reader;
class Writer;

// High-level archive interface that combines reading and writing capabilities
// with file access. An archive opened for reading keeps its file mapped, so the
// entries it returns stay valid until it is closed or destroyed.
class Archive {
public:
  Archive();
  ~Archive();

  // Delete copy, enable move
  Archive(const Archive &) = delete;
  Archive &operator=(const Archive &) = delete;
  Archive(Archive &&) noexcept;
  Archive &operator=(Archive &&) noexcept;

  // Open existing SARC archive for reading (memory-mapped)
  // Returns std::nullopt on failure, with the error in outError if provided
  static std::optional<Archive> open(const std::filesystem::path &path,
                                     Error *outError = nullptr);

  // Create new SARC archive for writing
  static Archive create(Endian endian = Endian::Little);

  // Add file to archive (from disk)
  bool addFile(const std::filesystem::path &sourcePath, std::string_view archivePath,
               Error *outError = nullptr);

  // Add file to archive (from memory, the data is copied)
  bool addFile(std::span<const uint8_t> data, std::string_view archivePath,
               Error *outError = nullptr);

  // Write archive to disk
  bool write(const std::filesystem::path &destPath, Error *outError = nullptr) const;

  // Get list of all entries (only available when reading)
  std::vector<Entry> files() const;

  // Get file count
  size_t fileCount() const;

  // File lookup by exact name (only available when reading)
  std::optional<Entry> findFile(std::string_view name) const;

  // Extract entry to disk (only available when reading)
  bool extract(const Entry &entry, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;

  // Extract entry to memory (only available when reading)
  std::optional<std::vector<uint8_t>> extractToMemory(const Entry &entry,
                                                      Error *outError = nullptr) const;

  // Underlying reader / writer, nullptr when the archive is not in that mode
  const Reader *reader() const { return reader_.get(); }
  Writer *writer() { return writer_.get(); }

  // Check if archive is open for reading
  bool isReading() const { return reader_.get() != nullptr; }

  // Check if archive is open for writing
  bool isWriting() const { return writer_.get() != nullptr; }

  // Check if archive is open (either mode)
  bool isOpen() const { return isReading() || isWriting(); }

  // Close archive
  void close();

  // Clear all files (only available when writing)
  void clear();

private:
  std::unique_ptr<MappedFile> file_;
  std::unique_ptr<Reader> reader_;
  std::unique_ptr<Writer> writer_;
};

} // namespace sarcx
