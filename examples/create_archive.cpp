#include <filesystem>
#include <iostream>
#include <string>

#include <sarcx/sarcx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 4) {
    std::cerr << "Usage: " << argv[0] << " <output.sarc> <be|le> <file>...\n";
    return 1;
  }

  std::string order = argv[2];
  if (order != "be" && order != "le") {
    std::cerr << "Error: byte order must be 'be' or 'le', got '" << order << "'\n";
    return 1;
  }

  auto archive = sarcx::Archive::create(order == "be" ? sarcx::Endian::Big : sarcx::Endian::Little);

  sarcx::Error error;
  std::error_code ec;
  std::filesystem::path baseDir = std::filesystem::current_path(ec);
  if (ec) {
    std::cerr << "Error: cannot get the current directory: " << ec.message() << "\n";
    return 1;
  }

  for (int i = 3; i < argc; ++i) {
    std::filesystem::path sourcePath = argv[i];
    auto archivePath = sarcx::archivePathFor(sourcePath, baseDir, &error);
    if (!archivePath) {
      std::cerr << "Error: " << error.message << "\n";
      return 1;
    }

    if (!archive.addFile(sourcePath, *archivePath, &error)) {
      std::cerr << "Error: " << *archivePath << ": " << error.message << "\n";
      return 1;
    }
  }

  if (!archive.write(argv[1], &error)) {
    std::cerr << "Error: " << sarcx::toString(error.code) << ": " << error.message << "\n";
    return 1;
  }

  std::cout << "Wrote " << archive.fileCount() << " files to " << argv[1] << "\n";
  return 0;
}
