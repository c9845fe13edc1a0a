#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "types.hpp"

namespace sarcx {

// RAII wrapper for a read-only memory-mapped file
// The view stays valid while the MappedFile (or the object it was moved into) is alive
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Map a whole file for reading, fails with IoError (empty files cannot be mapped)
  bool openRead(const std::filesystem::path &path, Error *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  // Unmap the file
  void close() noexcept;

  bool isOpen() const { return data_ != nullptr; }
  size_t size() const { return size_; }

private:
  void *data_ = nullptr;
  size_t size_ = 0;
};

} // namespace sarcx
