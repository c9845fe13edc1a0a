#include <format>
#include <utility>

#include <sarcx/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace sarcx {

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(std::exchange(other.data_, nullptr)), size_(std::exchange(other.size_, 0)) {}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

#ifdef _WIN32
  // The view keeps the mapping alive, both handles are closed once it exists
  HANDLE file = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (file == INVALID_HANDLE_VALUE) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to open file for reading: {}", path.string()));
    return false;
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(file, &fileSize)) {
    CloseHandle(file);
    setError(outError, ErrorCode::IoError, std::format("Failed to get file size: {}", path.string()));
    return false;
  }

  if (fileSize.QuadPart == 0) {
    CloseHandle(file);
    setError(outError, ErrorCode::IoError, std::format("File is empty: {}", path.string()));
    return false;
  }

  HANDLE mapping = CreateFileMappingW(file, nullptr, PAGE_READONLY, 0, 0, nullptr);
  CloseHandle(file);
  if (!mapping) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to create file mapping: {}", path.string()));
    return false;
  }

  void *view = MapViewOfFile(mapping, FILE_MAP_READ, 0, 0, 0);
  CloseHandle(mapping);
  if (!view) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to map view of file: {}", path.string()));
    return false;
  }

  data_ = view;
  size_ = static_cast<size_t>(fileSize.QuadPart);
  return true;

#else
  // The mapping outlives the descriptor, so it is closed right away
  int fd = ::open(path.string().c_str(), O_RDONLY);
  if (fd < 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to open file for reading: {} (errno: {})", path.string(), errno));
    return false;
  }

  struct stat st;
  if (fstat(fd, &st) < 0) {
    int err = errno;
    ::close(fd);
    setError(outError, ErrorCode::IoError,
             std::format("Failed to get file size: {} (errno: {})", path.string(), err));
    return false;
  }

  if (st.st_size == 0) {
    ::close(fd);
    setError(outError, ErrorCode::IoError, std::format("File is empty: {}", path.string()));
    return false;
  }

  size_t size = static_cast<size_t>(st.st_size);
  void *view = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
  int err = errno;
  ::close(fd);
  if (view == MAP_FAILED) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to map file: {} (errno: {})", path.string(), err));
    return false;
  }

  data_ = view;
  size_ = size;
  return true;
#endif
}

void MappedFile::close() noexcept {
  if (!data_) {
    return;
  }

#ifdef _WIN32
  UnmapViewOfFile(data_);
#else
  munmap(data_, size_);
#endif

  data_ = nullptr;
  size_ = 0;
}

} // namespace sarcx
