#pragma once

// SARC Archive Library
// A C++20 library for reading and writing the SARC archive format used by
// Nintendo's first-party engines on Wii U and Switch (The Legend of Zelda:
// Breath of the Wild, Splatoon, Super Mario Odyssey, ...).

#include "alignment.hpp"
#include "archive.hpp"
#include "hash.hpp"
#include "io.hpp"
#include "reader.hpp"
#include "types.hpp"
#include "writer.hpp"

// The library provides two levels of abstraction:
//
// 1. Low-level: Reader / Writer classes, memory only
//    - Reader::open() parses an archive held in a caller-owned buffer; entries are
//      views into that buffer
//    - Writer collects files and write() returns the archive bytes for either
//      byte order, with the padding each file type needs
//
// 2. High-level: Archive class
//    - Unified interface for both reading and writing, with file access
//    - Use Archive::open() to read (memory-mapped), Archive::create() to write
//
// Example usage:
//
//   // Reading an archive
//   sarcx::Error error;
//   auto archive = sarcx::Archive::open("Dungeon119.pack", &error);
//   if (archive) {
//     for (const auto& entry : archive->files()) {
//       std::cout << entry.name.value_or("<unnamed>") << std::endl;
//     }
//     auto entry = archive->findFile("Map/CDungeon/Dungeon119/Dungeon119_Static.smubin");
//     if (entry) {
//       archive->extract(*entry, "Dungeon119_Static.smubin", &error);
//     }
//   }
//
//   // Creating a new archive in memory
//   sarcx::Writer writer(sarcx::Endian::Big);
//   writer.addFile("Actor/ActorInfo.product.sbyml", data, &error);
//   auto bytes = writer.write(&error);

namespace sarcx {}
