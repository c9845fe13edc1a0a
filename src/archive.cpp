
#include <sarcx/archive.hpp>
#include <sarcx/io.hpp>
#include <sarcx/mmap.hpp>
#include <sarcx/reader.hpp>
#include <sarcx/writer.hpp>

namespace sarcx {

Archive::Archive() = default;
Archive::~Archive() = default;
Archive::Archive(Archive &&) noexcept = default;
Archive &Archive::operator=(Archive &&) noexcept = default;

std::optional<Archive> Archive::open(const std::filesystem::path &path, Error *outError) {
  auto file = std::make_unique<MappedFile>();
  if (!file->openRead(path, outError)) {
    return std::nullopt;
  }

  auto reader = Reader::open(file->data(), outError);
  if (!reader) {
    return std::nullopt;
  }

  Archive archive;
  archive.file_ = std::move(file);
  archive.reader_ = std::make_unique<Reader>(std::move(*reader));
  return archive;
}

Archive Archive::create(Endian endian) {
  Archive archive;
  archive.writer_ = std::make_unique<Writer>(endian);
  return archive;
}

bool Archive::addFile(const std::filesystem::path &sourcePath, std::string_view archivePath,
                      Error *outError) {
  if (!writer_) {
    setError(outError, ErrorCode::IoError, "Archive not open for writing");
    return false;
  }

  auto data = readFile(sourcePath, outError);
  if (!data) {
    return false;
  }
  return writer_->addFile(archivePath, *data, outError);
}

bool Archive::addFile(std::span<const uint8_t> data, std::string_view archivePath,
                      Error *outError) {
  if (!writer_) {
    setError(outError, ErrorCode::IoError, "Archive not open for writing");
    return false;
  }
  return writer_->addFile(archivePath, data, outError);
}

bool Archive::write(const std::filesystem::path &destPath, Error *outError) const {
  if (!writer_) {
    setError(outError, ErrorCode::IoError, "Archive not open for writing");
    return false;
  }

  auto bytes = writer_->write(outError);
  if (!bytes) {
    return false;
  }
  return writeFile(destPath, *bytes, outError);
}

std::vector<Entry> Archive::files() const {
  if (!reader_) {
    return {};
  }
  return reader_->files();
}

size_t Archive::fileCount() const {
  if (reader_) {
    return reader_->fileCount();
  }
  if (writer_) {
    return writer_->fileCount();
  }
  return 0;
}

std::optional<Entry> Archive::findFile(std::string_view name) const {
  if (!reader_) {
    return std::nullopt;
  }
  return reader_->findFile(name);
}

bool Archive::extract(const Entry &entry, const std::filesystem::path &destPath,
                      Error *outError) const {
  if (!reader_) {
    setError(outError, ErrorCode::IoError, "Archive not open for reading");
    return false;
  }
  return writeFile(destPath, entry.data, outError);
}

std::optional<std::vector<uint8_t>> Archive::extractToMemory(const Entry &entry,
                                                             Error *outError) const {
  if (!reader_) {
    setError(outError, ErrorCode::IoError, "Archive not open for reading");
    return std::nullopt;
  }
  return std::vector<uint8_t>(entry.data.begin(), entry.data.end());
}

void Archive::close() {
  reader_.reset();
  writer_.reset();
  file_.reset();
}

void Archive::clear() {
  if (writer_) {
    writer_->clear();
  }
}

} // namespace sarcx
