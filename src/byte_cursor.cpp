#include <cstring>
#include <format>

#include <sarcx/byte_cursor.hpp>
#include <sarcx/endian.hpp>

namespace sarcx {

bool ByteReader::require(size_t count, Error *outError) const {
  if (count > data_.size() - pos_) {
    setError(outError, ErrorCode::TruncatedBuffer,
             std::format("Read of {} bytes at offset {:#x} exceeds buffer size {:#x}", count, pos_,
                         data_.size()));
    return false;
  }
  return true;
}

std::optional<uint8_t> ByteReader::readU8(Error *outError) {
  if (!require(1, outError)) {
    return std::nullopt;
  }
  return data_[pos_++];
}

std::optional<uint16_t> ByteReader::readU16(Error *outError) {
  if (!require(2, outError)) {
    return std::nullopt;
  }
  uint16_t value = load16(data_.data() + pos_, endian_);
  pos_ += 2;
  return value;
}

std::optional<uint32_t> ByteReader::readU32(Error *outError) {
  if (!require(4, outError)) {
    return std::nullopt;
  }
  uint32_t value = load32(data_.data() + pos_, endian_);
  pos_ += 4;
  return value;
}

bool ByteReader::expectMagic(const char (&magic)[4], Error *outError) {
  if (!require(4, outError)) {
    return false;
  }

  const char *found = reinterpret_cast<const char *>(data_.data() + pos_);
  if (std::memcmp(found, magic, 4) != 0) {
    setError(outError, ErrorCode::InvalidMagic,
             std::format("Invalid magic at offset {:#x} (expected '{}', got '{}')", pos_,
                         std::string_view(magic, 4), std::string_view(found, 4)));
    return false;
  }

  pos_ += 4;
  return true;
}

bool ByteReader::seek(size_t pos, Error *outError) {
  if (pos > data_.size()) {
    setError(outError, ErrorCode::TruncatedBuffer,
             std::format("Seek to {:#x} exceeds buffer size {:#x}", pos, data_.size()));
    return false;
  }
  pos_ = pos;
  return true;
}

void ByteWriter::writeU16(uint16_t value) {
  size_t pos = buffer_.size();
  buffer_.resize(pos + 2);
  store16(buffer_.data() + pos, value, endian_);
}

void ByteWriter::writeU32(uint32_t value) {
  size_t pos = buffer_.size();
  buffer_.resize(pos + 4);
  store32(buffer_.data() + pos, value, endian_);
}

void ByteWriter::writeMagic(const char (&magic)[4]) {
  buffer_.insert(buffer_.end(), magic, magic + 4);
}

void ByteWriter::writeBytes(std::span<const uint8_t> bytes) {
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::writeString(std::string_view str) {
  buffer_.insert(buffer_.end(), str.begin(), str.end());
}

void ByteWriter::alignTo(size_t alignment) {
  padTo(static_cast<size_t>(alignUp(buffer_.size(), alignment)));
}

void ByteWriter::padTo(size_t pos) {
  if (pos > buffer_.size()) {
    buffer_.resize(pos, 0);
  }
}

void ByteWriter::patchU32(size_t pos, uint32_t value) {
  store32(buffer_.data() + pos, value, endian_);
}

} // namespace sarcx
