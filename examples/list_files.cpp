#include <format>
#include <iostream>

#include <sarcx/sarcx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.sarc>\n";
    return 1;
  }

  sarcx::Error error;
  auto archive = sarcx::Archive::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << sarcx::toString(error.code) << ": " << error.message << "\n";
    return 1;
  }

  const sarcx::Reader *reader = archive->reader();
  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Byte order: " << (reader->endian() == sarcx::Endian::Big ? "big" : "little")
            << "\n";
  std::cout << "Files: " << reader->fileCount() << "\n";
  std::cout << "Minimum alignment: " << reader->guessMinAlignment() << "\n\n";

  for (size_t i = 0; i < reader->fileCount(); ++i) {
    auto entry = reader->entryAt(i, &error);
    if (!entry) {
      std::cerr << "  [" << i << "] " << error.message << "\n";
      continue;
    }

    if (entry->name) {
      std::cout << "  " << *entry->name;
    } else {
      std::cout << std::format("  <hash {:08x}>", reader->records()[i].nameHash);
    }
    std::cout << " (" << entry->data.size() << " bytes)\n";
  }

  return 0;
}
