#include <algorithm>
#include <array>
#include <cstring>
#include <format>
#include <numeric>

#include <sarcx/alignment.hpp>
#include <sarcx/endian.hpp>

namespace sarcx {

namespace {

struct ExtensionAlignment {
  std::string_view extension;
  uint32_t alignment;
};

// Requirements that do not depend on the byte order (bffnt does, see defaultRequirement)
constexpr std::array<ExtensionAlignment, 6> kExtensionTable = {{
    {"ksky", 0x8},
    {"bksky", 0x8},
    {"baglmf", 0x80},
    {"sharc", 0x1000},
    {"sharcb", 0x1000},
    {"gtx", 0x2000},
}};

// File types created through BotW's resource factories
constexpr std::array<std::string_view, 58> kResourceFactoryExtensions = {
    "baischedule", "baiprog",    "baniminfo",     "bars",       "bas",         "baslist",
    "bassetting",  "batcl",      "batcllist",     "batpl",      "bawareness",  "bbonectrl",
    "bcamanim",    "bchemical",  "bdemo",         "bdgnenv",    "bdmgparam",   "bdrop",
    "bfevfl",      "bfevtm",     "bfres",         "bgapkginfo", "bgapkglist",  "bgdata",
    "bgenv",       "bgparamlist", "bgsdw",        "bgsvdata",   "bitemico",    "blifecondition",
    "blod",        "bmaptex",    "bmodellist",    "bmscdef",    "bnfprl",      "bphysics",
    "bphyssb",     "bplacement", "brecipe",       "brgbw",      "brgcon",      "brgconfig",
    "brgconfiglist", "bshop",    "bstftex",       "bumii",      "bxml",        "byml",
    "esetlist",    "hkcl",       "hknm2",         "hkrb",       "hkrg",        "hksc",
    "hktmrb",      "jpg",        "lua",           "sarc",
};

} // namespace

uint32_t AlignmentPolicy::requiredAlignment(std::string_view name,
                                            std::span<const uint8_t> data) const {
  std::string_view extension = extensionOf(name);
  uint32_t alignment = minAlignment_;

  if (auto requirement = extensionRequirement(extension)) {
    alignment = std::lcm(alignment, *requirement);
  }

  // Nested archives are mounted in place by older engines
  if (legacy_ && isSarc(data)) {
    alignment = std::lcm(alignment, 0x2000u);
  }

  if (legacy_ || !isResourceFactoryExtension(extension)) {
    alignment = std::lcm(alignment, alignmentForNewBinaryFile(data));
    if (endian_ == Endian::Big) {
      alignment = std::lcm(alignment, alignmentForCafeBflim(data));
    }
  }

  return alignment;
}

bool AlignmentPolicy::addRequirement(std::string extension, uint32_t alignment, Error *outError) {
  if (!isValidAlignment(alignment)) {
    setError(outError, ErrorCode::InvalidAlignment,
             std::format("{} is not a valid alignment for extension '{}'", alignment, extension));
    return false;
  }
  overrides_[std::move(extension)] = alignment;
  return true;
}

bool AlignmentPolicy::setMinAlignment(uint32_t alignment, Error *outError) {
  if (!isValidAlignment(alignment)) {
    setError(outError, ErrorCode::InvalidAlignment,
             std::format("{} is not a valid minimum alignment", alignment));
    return false;
  }
  minAlignment_ = alignment;
  return true;
}

std::optional<uint32_t> AlignmentPolicy::extensionRequirement(std::string_view extension) const {
  auto it = overrides_.find(std::string(extension));
  if (it != overrides_.end()) {
    return it->second;
  }
  return defaultRequirement(extension, endian_);
}

std::optional<uint32_t> AlignmentPolicy::defaultRequirement(std::string_view extension,
                                                            Endian endian) {
  if (extension == "bffnt") {
    return endian == Endian::Big ? 0x2000u : 0x1000u;
  }

  auto it = std::find_if(kExtensionTable.begin(), kExtensionTable.end(),
                         [&](const ExtensionAlignment &e) { return e.extension == extension; });
  if (it == kExtensionTable.end()) {
    return std::nullopt;
  }
  return it->alignment;
}

bool AlignmentPolicy::isResourceFactoryExtension(std::string_view extension) {
  return std::find(kResourceFactoryExtensions.begin(), kResourceFactoryExtensions.end(),
                   extension) != kResourceFactoryExtensions.end();
}

std::string_view AlignmentPolicy::extensionOf(std::string_view name) {
  size_t dot = name.rfind('.');
  if (dot == std::string_view::npos) {
    return {};
  }
  return name.substr(dot + 1);
}

bool AlignmentPolicy::isSarc(std::span<const uint8_t> data) {
  if (data.size() < 0x20) {
    return false;
  }
  if (std::memcmp(data.data(), "SARC", 4) == 0) {
    return true;
  }
  return std::memcmp(data.data(), "Yaz0", 4) == 0 && std::memcmp(data.data() + 0x11, "SARC", 4) == 0;
}

uint32_t AlignmentPolicy::alignmentForNewBinaryFile(std::span<const uint8_t> data) {
  if (data.size() <= 0x20) {
    return 1;
  }

  // Byte-order mark at 0x0C, file size at 0x1C, alignment exponent at 0x0E
  Endian endian;
  uint16_t bom = load16(data.data() + 0x0C, Endian::Big);
  if (bom == 0xFEFF) {
    endian = Endian::Big;
  } else if (bom == 0xFFFE) {
    endian = Endian::Little;
  } else {
    return 1;
  }

  uint32_t fileSize = load32(data.data() + 0x1C, endian);
  if (fileSize != data.size()) {
    return 1;
  }

  uint8_t shift = data[0x0E];
  if (shift > 31) {
    return 1;
  }
  return 1u << shift;
}

uint32_t AlignmentPolicy::alignmentForCafeBflim(std::span<const uint8_t> data) {
  if (data.size() <= 0x28 || std::memcmp(data.data() + data.size() - 0x28, "FLIM", 4) != 0) {
    return 1;
  }

  uint16_t alignment = load16(data.data() + data.size() - 0x08, Endian::Big);
  if (!isValidAlignment(alignment)) {
    return 1;
  }
  return alignment;
}

} // namespace sarcx
