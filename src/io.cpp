#include <format>
#include <fstream>

#include <sarcx/io.hpp>

namespace sarcx {

std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path &path, Error *outError) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to open source file: {}", path.string()));
    return std::nullopt;
  }

  std::streamoff fileSize = in.tellg();
  if (fileSize < 0) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to get file size: {}", path.string()));
    return std::nullopt;
  }
  in.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(fileSize));
  if (!in.read(reinterpret_cast<char *>(buffer.data()), fileSize)) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to read source file: {}", path.string()));
    return std::nullopt;
  }

  return buffer;
}

bool writeFile(const std::filesystem::path &path, std::span<const uint8_t> data, Error *outError) {
  // Create parent directories if needed
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      setError(outError, ErrorCode::IoError,
               std::format("Failed to create directory {}: {}", path.parent_path().string(),
                           ec.message()));
      return false;
    }
  }

  std::ofstream out(path, std::ios::binary);
  if (!out) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to create output file: {}", path.string()));
    return false;
  }

  out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!out) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to write to output file: {}", path.string()));
    return false;
  }

  return true;
}

std::optional<std::string> archivePathFor(const std::filesystem::path &sourcePath,
                                          const std::filesystem::path &baseDir, Error *outError) {
  std::filesystem::path path = sourcePath;
  if (path.is_absolute() || path.has_root_name()) {
    path = path.lexically_relative(baseDir);
  }
  path = path.lexically_normal();

  if (path.empty() || path == "." || path.is_absolute() || path.has_root_name() ||
      *path.begin() == "..") {
    setError(outError, ErrorCode::InvalidName,
             std::format("{} is not inside {}", sourcePath.string(), baseDir.string()));
    return std::nullopt;
  }

  return path.generic_string();
}

} // namespace sarcx
