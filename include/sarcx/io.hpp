#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace sarcx {

// Read a whole file into memory
std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path &path,
                                             Error *outError = nullptr);

// Write a buffer to disk, creating parent directories as needed
bool writeFile(const std::filesystem::path &path, std::span<const uint8_t> data,
               Error *outError = nullptr);

// Archive name for a file on disk: its path relative to baseDir (an absolute directory),
// with forward slashes. Fails with InvalidName for paths that leave baseDir.
std::optional<std::string> archivePathFor(const std::filesystem::path &sourcePath,
                                          const std::filesystem::path &baseDir,
                                          Error *outError = nullptr);

} // namespace sarcx
