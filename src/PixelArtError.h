#pragma once

#include <stdexcept>
#include <string>

// Error categories raised by the pixel-art engine.
enum class ErrorKind {
  UnsupportedFormat,    // extension not on the allow-list, or decode failed
  InvalidPaletteSource, // palette image missing/corrupt, or no colors in it
  EmptyPalette,         // mapping against a zero-length palette
  InvalidConfig,        // out-of-range configuration value
  WriteFailed,          // encoder or filesystem refused the output
  Cancelled             // cooperative cancellation was requested
};

const char* ToString(ErrorKind kind);

// Single exception type for the engine. Callers that need to branch on the
// failure (batch mode downgrading per-file errors, CLI exit codes) use kind().
class PixelArtError : public std::runtime_error {
public:
  PixelArtError(ErrorKind kind, const std::string& message);

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};
