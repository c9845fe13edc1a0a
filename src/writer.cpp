#include <algorithm>
#include <format>
#include <limits>
#include <numeric>

#include <sarcx/byte_cursor.hpp>
#include <sarcx/hash.hpp>
#include <sarcx/reader.hpp>
#include <sarcx/writer.hpp>

namespace sarcx {

namespace {

// Header, SFAT header and SFNT header, excluding the records
constexpr uint64_t kFixedHeadersSize =
    ArchiveHeader::headerSize + FatHeader::headerSize + FntHeader::headerSize;

// Placement of one file in the output
struct FileLayout {
  const std::string *name = nullptr;
  std::span<const uint8_t> data;
  NameMode mode = NameMode::Stored;
  uint32_t hash = 0;
  uint32_t alignment = 1;
  uint32_t nameFlagAndOffset = 0;
  uint32_t dataBegin = 0;
  uint32_t dataEnd = 0;
};

} // namespace

std::optional<Writer> Writer::fromReader(const Reader &reader, Error *outError) {
  Writer writer(reader.endian());

  if (!writer.setMinAlignment(reader.guessMinAlignment(), outError)) {
    return std::nullopt;
  }

  for (const auto &entry : reader.files()) {
    // Nameless entries cannot be addressed and are dropped
    if (!entry.name) {
      continue;
    }
    if (!writer.addFile(*entry.name, entry.data, outError)) {
      return std::nullopt;
    }
  }

  return writer;
}

bool Writer::checkName(std::string_view name, Error *outError) const {
  if (name.empty()) {
    setError(outError, ErrorCode::EmptyName, "File name must not be empty");
    return false;
  }

  // Names are stored NUL-terminated, anything after an embedded NUL would be lost
  if (name.find('\0') != std::string_view::npos) {
    setError(outError, ErrorCode::InvalidName, "File name must not contain a NUL byte");
    return false;
  }

  if (contains(name)) {
    setError(outError, ErrorCode::DuplicateName,
             std::format("Duplicate file name in archive: {}", name));
    return false;
  }

  return true;
}

bool Writer::addFile(std::string_view name, std::span<const uint8_t> data, Error *outError) {
  return addFile(name, data, NameMode::Stored, outError);
}

bool Writer::addFile(std::string_view name, std::span<const uint8_t> data, NameMode mode,
                     Error *outError) {
  if (!checkName(name, outError)) {
    return false;
  }

  PendingFile pending;
  pending.name = std::string(name);
  pending.ownedData.assign(data.begin(), data.end());
  pending.owned = true;
  pending.mode = mode;
  pendingFiles_.push_back(std::move(pending));

  return true;
}

bool Writer::addFileView(std::string_view name, std::span<const uint8_t> data, Error *outError) {
  return addFileView(name, data, NameMode::Stored, outError);
}

bool Writer::addFileView(std::string_view name, std::span<const uint8_t> data, NameMode mode,
                         Error *outError) {
  if (!checkName(name, outError)) {
    return false;
  }

  PendingFile pending;
  pending.name = std::string(name);
  pending.borrowed = data;
  pending.mode = mode;
  pendingFiles_.push_back(std::move(pending));

  return true;
}

bool Writer::removeFile(std::string_view name) {
  auto it = std::find_if(pendingFiles_.begin(), pendingFiles_.end(),
                         [&](const PendingFile &pending) { return pending.name == name; });
  if (it == pendingFiles_.end()) {
    return false;
  }
  pendingFiles_.erase(it);
  return true;
}

bool Writer::contains(std::string_view name) const {
  return std::any_of(pendingFiles_.begin(), pendingFiles_.end(),
                     [&](const PendingFile &pending) { return pending.name == name; });
}

std::optional<std::vector<uint8_t>> Writer::write(Error *outError) const {
  return write(endian_, outError);
}

std::optional<std::vector<uint8_t>> Writer::write(Endian endian, Error *outError) const {
  constexpr uint64_t maxOffset = std::numeric_limits<uint32_t>::max();

  if (pendingFiles_.size() > FatHeader::maxFileCount) {
    setError(outError, ErrorCode::TooManyEntries,
             std::format("Cannot write {} files (maximum is {})", pendingFiles_.size(),
                         FatHeader::maxFileCount));
    return std::nullopt;
  }

  AlignmentPolicy policy = policy_;
  policy.setEndian(endian);

  // Step 1: Sort by name hash, insertion order breaks ties
  std::vector<FileLayout> layout;
  layout.reserve(pendingFiles_.size());
  for (const auto &pending : pendingFiles_) {
    FileLayout file;
    file.name = &pending.name;
    file.data = pending.bytes();
    file.mode = pending.mode;
    file.hash = hashName(pending.name);
    layout.push_back(file);
  }

  std::stable_sort(layout.begin(), layout.end(),
                   [](const FileLayout &a, const FileLayout &b) { return a.hash < b.hash; });

  // Step 2: Lay out the name table
  uint64_t nameTableSize = 0;
  for (auto &file : layout) {
    if (file.mode == NameMode::HashOnly) {
      continue;
    }

    uint64_t unitOffset = nameTableSize / FatRecord::nameOffsetUnit;
    if (unitOffset > FatRecord::nameOffsetMask) {
      setError(outError, ErrorCode::EntryTooLarge,
               std::format("Name table too large for file: {}", *file.name));
      return std::nullopt;
    }

    file.nameFlagAndOffset = FatRecord::nameFlag | static_cast<uint32_t>(unitOffset);
    nameTableSize += alignUp(file.name->size() + 1, kNameAlignment);
  }

  // Step 3: Resolve alignments and place the data
  uint32_t dataAlignment = 1;
  for (auto &file : layout) {
    file.alignment = policy.requiredAlignment(*file.name, file.data);
    dataAlignment = std::lcm(dataAlignment, file.alignment);
  }

  uint64_t namesOffset = kFixedHeadersSize + FatRecord::size * layout.size();
  uint64_t dataOffset = alignUp(namesOffset + nameTableSize, dataAlignment);

  uint64_t relOffset = 0;
  for (auto &file : layout) {
    uint64_t begin = alignUp(relOffset, file.alignment);
    uint64_t end = begin + file.data.size();
    if (dataOffset + end > maxOffset) {
      setError(outError, ErrorCode::EntryTooLarge,
               std::format("File does not fit in a SARC archive: {} ({} bytes at offset {:#x})",
                           *file.name, file.data.size(), dataOffset + begin));
      return std::nullopt;
    }

    file.dataBegin = static_cast<uint32_t>(begin);
    file.dataEnd = static_cast<uint32_t>(end);
    relOffset = end;
  }

  uint64_t fileSize = dataOffset + relOffset;
  if (fileSize > maxOffset) {
    setError(outError, ErrorCode::EntryTooLarge,
             std::format("Archive size {:#x} exceeds the SARC limit", fileSize));
    return std::nullopt;
  }

  // Step 4: Emit header, records, names and data
  ByteWriter out(endian);
  out.reserve(static_cast<size_t>(fileSize));

  out.writeMagic(ArchiveHeader::magic);
  out.writeU16(ArchiveHeader::headerSize);
  out.writeU16(ArchiveHeader::byteOrderMark);
  out.writeU32(static_cast<uint32_t>(fileSize));
  out.writeU32(static_cast<uint32_t>(dataOffset));
  out.writeU16(ArchiveHeader::version);
  out.writeU16(0);

  out.writeMagic(FatHeader::magic);
  out.writeU16(FatHeader::headerSize);
  out.writeU16(static_cast<uint16_t>(layout.size()));
  out.writeU32(kHashMultiplier);

  for (const auto &file : layout) {
    out.writeU32(file.hash);
    out.writeU32(file.nameFlagAndOffset);
    out.writeU32(file.dataBegin);
    out.writeU32(file.dataEnd);
  }

  out.writeMagic(FntHeader::magic);
  out.writeU16(FntHeader::headerSize);
  out.writeU16(0);

  for (const auto &file : layout) {
    if (file.mode == NameMode::HashOnly) {
      continue;
    }
    out.writeString(*file.name);
    out.writeU8(0);
    out.alignTo(kNameAlignment);
  }

  out.padTo(static_cast<size_t>(dataOffset));
  for (const auto &file : layout) {
    out.padTo(static_cast<size_t>(dataOffset + file.dataBegin));
    out.writeBytes(file.data);
  }

  return out.take();
}

} // namespace sarcx
