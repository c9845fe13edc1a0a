#include <sarcx/types.hpp>

namespace sarcx {

const char *toString(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::InvalidMagic:
    return "InvalidMagic";
  case ErrorCode::InvalidByteOrder:
    return "InvalidByteOrder";
  case ErrorCode::TruncatedBuffer:
    return "TruncatedBuffer";
  case ErrorCode::UnsupportedVersion:
    return "UnsupportedVersion";
  case ErrorCode::InvalidSectionSize:
    return "InvalidSectionSize";
  case ErrorCode::OffsetOutOfRange:
    return "OffsetOutOfRange";
  case ErrorCode::NameTableOffsetInvalid:
    return "NameTableOffsetInvalid";
  case ErrorCode::IndexOutOfRange:
    return "IndexOutOfRange";
  case ErrorCode::DuplicateName:
    return "DuplicateName";
  case ErrorCode::EmptyName:
    return "EmptyName";
  case ErrorCode::InvalidName:
    return "InvalidName";
  case ErrorCode::EntryTooLarge:
    return "EntryTooLarge";
  case ErrorCode::TooManyEntries:
    return "TooManyEntries";
  case ErrorCode::InvalidAlignment:
    return "InvalidAlignment";
  case ErrorCode::IoError:
    return "IoError";
  }
  return "Unknown";
}

} // namespace sarcx
