#include <algorithm>
#include <cstring>
#include <format>
#include <numeric>

#include <sarcx/byte_cursor.hpp>
#include <sarcx/endian.hpp>
#include <sarcx/hash.hpp>
#include <sarcx/reader.hpp>

namespace sarcx {

std::optional<Reader> Reader::open(std::span<const uint8_t> data, Error *outError) {
  Reader reader;
  reader.data_ = data;

  if (!reader.parse(outError)) {
    return std::nullopt;
  }

  return reader;
}

bool Reader::parse(Error *outError) {
  ByteReader cursor(data_, Endian::Big);

  // Verify magic number
  if (!cursor.expectMagic(ArchiveHeader::magic, outError)) {
    return false;
  }

  // Check minimum size (header is 0x14 bytes)
  if (data_.size() < ArchiveHeader::headerSize) {
    setError(outError, ErrorCode::TruncatedBuffer,
             std::format("File too small to be a SARC archive (size: {})", data_.size()));
    return false;
  }

  // The byte-order mark reads as 0xFEFF in the archive's own byte order
  uint16_t bom = load16(data_.data() + ArchiveHeader::byteOrderOffset, Endian::Big);
  if (bom == ArchiveHeader::byteOrderMark) {
    endian_ = Endian::Big;
  } else if (bom == detail::byteswap(ArchiveHeader::byteOrderMark)) {
    endian_ = Endian::Little;
  } else {
    setError(outError, ErrorCode::InvalidByteOrder,
             std::format("Invalid SARC byte-order mark {:#06x}", bom));
    return false;
  }
  cursor.setEndian(endian_);

  // Read header
  auto headerSize = cursor.readU16(outError);
  auto byteOrderMark = cursor.readU16(outError);
  auto fileSize = cursor.readU32(outError);
  auto dataOffset = cursor.readU32(outError);
  auto version = cursor.readU16(outError);
  auto reserved = cursor.readU16(outError);
  if (!headerSize || !byteOrderMark || !fileSize || !dataOffset || !version || !reserved) {
    return false;
  }

  if (*headerSize != ArchiveHeader::headerSize) {
    setError(outError, ErrorCode::InvalidSectionSize,
             std::format("Invalid SARC header size {:#x}", *headerSize));
    return false;
  }

  if (*version != ArchiveHeader::version) {
    setError(outError, ErrorCode::UnsupportedVersion,
             std::format("Unsupported SARC version {:#06x}", *version));
    return false;
  }

  if (*fileSize > data_.size()) {
    setError(outError, ErrorCode::TruncatedBuffer,
             std::format("SARC header declares {} bytes but only {} are available", *fileSize,
                         data_.size()));
    return false;
  }

  // File allocation table header
  if (!cursor.expectMagic(FatHeader::magic, outError)) {
    return false;
  }

  auto fatHeaderSize = cursor.readU16(outError);
  auto fileCount = cursor.readU16(outError);
  auto hashMultiplier = cursor.readU32(outError);
  if (!fatHeaderSize || !fileCount || !hashMultiplier) {
    return false;
  }

  if (*fatHeaderSize != FatHeader::headerSize) {
    setError(outError, ErrorCode::InvalidSectionSize,
             std::format("Invalid SFAT header size {:#x}", *fatHeaderSize));
    return false;
  }

  if (*fileCount > FatHeader::maxFileCount) {
    setError(outError, ErrorCode::InvalidSectionSize,
             std::format("Invalid SFAT file count {}", *fileCount));
    return false;
  }

  // File allocation table records
  if (cursor.remaining() < static_cast<size_t>(*fileCount) * FatRecord::size) {
    setError(outError, ErrorCode::TruncatedBuffer,
             std::format("SFAT with {} records extends beyond file bounds", *fileCount));
    return false;
  }

  records_.clear();
  records_.reserve(*fileCount);
  for (uint16_t i = 0; i < *fileCount; ++i) {
    auto nameHash = cursor.readU32(outError);
    auto nameFlagAndOffset = cursor.readU32(outError);
    auto dataBegin = cursor.readU32(outError);
    auto dataEnd = cursor.readU32(outError);
    if (!nameHash || !nameFlagAndOffset || !dataBegin || !dataEnd) {
      return false;
    }

    FatRecord record;
    record.nameHash = *nameHash;
    record.nameFlagAndOffset = *nameFlagAndOffset;
    record.dataBegin = *dataBegin;
    record.dataEnd = *dataEnd;
    records_.push_back(record);
  }

  // File name table header
  if (!cursor.expectMagic(FntHeader::magic, outError)) {
    return false;
  }

  auto fntHeaderSize = cursor.readU16(outError);
  auto fntReserved = cursor.readU16(outError);
  if (!fntHeaderSize || !fntReserved) {
    return false;
  }

  if (*fntHeaderSize != FntHeader::headerSize) {
    setError(outError, ErrorCode::InvalidSectionSize,
             std::format("Invalid SFNT header size {:#x}", *fntHeaderSize));
    return false;
  }

  namesOffset_ = static_cast<uint32_t>(cursor.tell());
  if (*dataOffset < namesOffset_ || *dataOffset > data_.size()) {
    setError(outError, ErrorCode::OffsetOutOfRange,
             std::format("Invalid data offset {:#x} (name table at {:#x}, file size {:#x})",
                         *dataOffset, namesOffset_, data_.size()));
    return false;
  }

  // Validate data ranges
  for (size_t i = 0; i < records_.size(); ++i) {
    const auto &record = records_[i];
    if (record.dataBegin > record.dataEnd ||
        static_cast<uint64_t>(*dataOffset) + record.dataEnd > data_.size()) {
      setError(outError, ErrorCode::OffsetOutOfRange,
               std::format("File entry {} has invalid data range (begin={:#x}, end={:#x}, "
                           "dataOffset={:#x}, fileSize={:#x})",
                           i, record.dataBegin, record.dataEnd, *dataOffset, data_.size()));
      return false;
    }
  }

  fileSize_ = *fileSize;
  dataOffset_ = *dataOffset;
  hashMultiplier_ = *hashMultiplier;
  return true;
}

bool Reader::resolveName(const FatRecord &record, size_t index,
                         std::optional<std::string_view> &outName, Error *outError) const {
  if (!record.hasName()) {
    outName.reset();
    return true;
  }

  // Names live between the SFNT header and the data section
  uint64_t nameStart = static_cast<uint64_t>(namesOffset_) + record.nameOffset();
  if (nameStart >= dataOffset_) {
    setError(outError, ErrorCode::NameTableOffsetInvalid,
             std::format("File entry {} has name offset {:#x} outside the name table", index,
                         record.nameOffset()));
    return false;
  }

  const char *nameData = reinterpret_cast<const char *>(data_.data() + nameStart);
  const void *terminator = std::memchr(nameData, '\0', dataOffset_ - nameStart);
  if (!terminator) {
    setError(outError, ErrorCode::NameTableOffsetInvalid,
             std::format("File entry {} has unterminated name string", index));
    return false;
  }

  outName = std::string_view(nameData, static_cast<const char *>(terminator) - nameData);
  return true;
}

std::span<const uint8_t> Reader::fileData(const FatRecord &record) const {
  return data_.subspan(static_cast<size_t>(dataOffset_) + record.dataBegin,
                       record.dataEnd - record.dataBegin);
}

std::vector<Entry> Reader::files() const {
  std::vector<Entry> entries;
  entries.reserve(records_.size());

  for (size_t i = 0; i < records_.size(); ++i) {
    if (auto entry = entryAt(i)) {
      entries.push_back(*entry);
    }
  }

  return entries;
}

std::optional<Entry> Reader::entryAt(size_t index, Error *outError) const {
  if (index >= records_.size()) {
    setError(outError, ErrorCode::IndexOutOfRange,
             std::format("File index {} out of range (file count: {})", index, records_.size()));
    return std::nullopt;
  }

  const auto &record = records_[index];
  Entry entry;
  if (!resolveName(record, index, entry.name, outError)) {
    return std::nullopt;
  }
  entry.data = fileData(record);
  return entry;
}

std::optional<Entry> Reader::findFile(std::string_view name) const {
  uint32_t hash = hashName(name, hashMultiplier_);

  auto it = std::lower_bound(records_.begin(), records_.end(), hash,
                             [](const FatRecord &record, uint32_t value) {
                               return record.nameHash < value;
                             });

  // Several records may share the hash
  for (; it != records_.end() && it->nameHash == hash; ++it) {
    size_t index = static_cast<size_t>(it - records_.begin());
    std::optional<std::string_view> recordName;
    if (!resolveName(*it, index, recordName, nullptr)) {
      continue;
    }
    if (recordName && *recordName == name) {
      return Entry{recordName, fileData(*it)};
    }
  }

  return std::nullopt;
}

uint32_t Reader::guessMinAlignment() const {
  uint64_t gcd = kDefaultMinAlignment;
  for (const auto &record : records_) {
    gcd = std::gcd(gcd, static_cast<uint64_t>(dataOffset_) + record.dataBegin);
  }

  if (!isValidAlignment(gcd)) {
    return kDefaultMinAlignment;
  }
  return static_cast<uint32_t>(gcd);
}

bool Reader::areFilesEqual(const Reader &a, const Reader &b) {
  if (a.fileCount() != b.fileCount()) {
    return false;
  }

  for (size_t i = 0; i < a.fileCount(); ++i) {
    auto entryA = a.entryAt(i);
    auto entryB = b.entryAt(i);
    if (!entryA || !entryB) {
      return false;
    }
    if (entryA->name != entryB->name ||
        !std::equal(entryA->data.begin(), entryA->data.end(), entryB->data.begin(),
                    entryB->data.end())) {
      return false;
    }
  }

  return true;
}

} // namespace sarcx
