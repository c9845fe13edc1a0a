#include <filesystem>
#include <iostream>

#include <sarcx/sarcx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <archive.sarc> <output_dir>\n";
    return 1;
  }

  sarcx::Error error;
  auto archive = sarcx::Archive::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  std::filesystem::path outputDir = argv[2];

  int extractedCount = 0;
  int skippedCount = 0;
  for (const auto &entry : archive->files()) {
    // Nameless entries have no path to extract to
    if (!entry.name) {
      ++skippedCount;
      continue;
    }

    std::filesystem::path relativePath = std::filesystem::path(*entry.name).lexically_normal();
    if (relativePath.is_absolute() || relativePath.has_root_name() ||
        (!relativePath.empty() && *relativePath.begin() == "..")) {
      std::cerr << "Refusing to extract " << *entry.name << ": path leaves the output directory\n";
      ++skippedCount;
      continue;
    }

    std::filesystem::path outputPath = outputDir / relativePath;
    if (!archive->extract(entry, outputPath, &error)) {
      std::cerr << "Failed to extract " << *entry.name << ": " << error.message << "\n";
      continue;
    }
    ++extractedCount;
  }

  std::cout << "Extracted " << extractedCount << " files to " << outputDir << "\n";
  if (skippedCount > 0) {
    std::cout << "Skipped " << skippedCount << " files\n";
  }
  return 0;
}
