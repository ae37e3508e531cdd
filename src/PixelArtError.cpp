#include "PixelArtError.h"

const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
    case ErrorKind::InvalidPaletteSource: return "InvalidPaletteSource";
    case ErrorKind::EmptyPalette: return "EmptyPalette";
    case ErrorKind::InvalidConfig: return "InvalidConfig";
    case ErrorKind::WriteFailed: return "WriteFailed";
    case ErrorKind::Cancelled: return "Cancelled";
  }
  return "Unknown";
}

PixelArtError::PixelArtError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(ToString(kind)) + ": " + message), kind_(kind) {}
