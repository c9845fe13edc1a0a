#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace sarcx {

// Bounds-checked reader over a borrowed byte buffer
// Every read advances the position; a read past the end fails without moving
class ByteReader {
public:
  ByteReader(std::span<const uint8_t> data, Endian endian) : data_(data), endian_(endian) {}

  std::optional<uint8_t> readU8(Error *outError = nullptr);
  std::optional<uint16_t> readU16(Error *outError = nullptr);
  std::optional<uint32_t> readU32(Error *outError = nullptr);

  // Read a 4-byte tag and compare it with the expected magic
  // Fails with TruncatedBuffer if the tag does not fit, InvalidMagic if it differs
  bool expectMagic(const char (&magic)[4], Error *outError = nullptr);

  // Move to an absolute position (may equal size())
  bool seek(size_t pos, Error *outError = nullptr);

  size_t tell() const { return pos_; }
  size_t size() const { return data_.size(); }
  size_t remaining() const { return data_.size() - pos_; }

  Endian endian() const { return endian_; }
  void setEndian(Endian endian) { endian_ = endian; }

private:
  bool require(size_t count, Error *outError) const;

  std::span<const uint8_t> data_;
  size_t pos_ = 0;
  Endian endian_;
};

// Writer into a growable output buffer
class ByteWriter {
public:
  explicit ByteWriter(Endian endian) : endian_(endian) {}

  void reserve(size_t size) { buffer_.reserve(size); }

  void writeU8(uint8_t value) { buffer_.push_back(value); }
  void writeU16(uint16_t value);
  void writeU32(uint32_t value);
  void writeMagic(const char (&magic)[4]);
  void writeBytes(std::span<const uint8_t> bytes);
  void writeString(std::string_view str);

  // Zero-fill up to the next multiple of alignment (power of two)
  void alignTo(size_t alignment);

  // Zero-fill up to an absolute position (no-op if already past it)
  void padTo(size_t pos);

  // Overwrite a previously written value
  void patchU32(size_t pos, uint32_t value);

  size_t tell() const { return buffer_.size(); }
  Endian endian() const { return endian_; }

  const std::vector<uint8_t> &buffer() const { return buffer_; }
  std::vector<uint8_t> take() { return std::move(buffer_); }

private:
  std::vector<uint8_t> buffer_;
  Endian endian_;
};

} // namespace sarcx
