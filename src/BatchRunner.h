#pragma once

#include "PaletteLibrary.h"
#include "PixelTypes.h"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

struct BatchReport {
  int discovered = 0; // supported images found
  int written = 0;    // outputs written successfully
  int failed = 0;     // files that raised an error (logged and skipped)
  int cancelled = 0;  // files not finished because cancellation was requested
  std::vector<std::string> failures; // "<relative path>: <message>"
};

// BatchRunner: applies a PixelPipeline to a single file or a whole folder tree.
// - Directory input: recursive walk, supported extensions only (case-insensitive),
//   output tree mirrors the input tree under outputRoot.
// - Per-file errors are logged and counted; the run keeps going.
// - config.workers threads share one pipeline; shared palettes are built once.
// - cancel (optional) is checked before each file and inside pixelation. Files
//   already written are left alone.
class BatchRunner {
public:
  // Folder runs only: called once per finished file (not for cancelled ones),
  // serialized across workers. ok is false when the file failed.
  using FileDoneCallback = std::function<void(const std::string& relativePath, bool ok)>;

  // Single-file input: outputRoot is the output file if it has a supported
  // image extension, otherwise a directory that receives the input's filename.
  // In that mode errors propagate as PixelArtError.
  // Throws PixelArtError(InvalidConfig) if inputRoot does not exist, plus any
  // error raised while building a shared palette.
  static BatchReport Run(const std::string& inputRoot, const std::string& outputRoot,
                         const PixelationConfig& config, const PaletteLibrary& library,
                         const std::atomic<bool>* cancel = nullptr,
                         const FileDoneCallback& onFileDone = FileDoneCallback());

  // Supported images under inputRoot, as paths relative to it, sorted.
  // Anything under excludeRoot (e.g. an output folder nested in the input) is skipped.
  static std::vector<std::string> DiscoverImages(const std::string& inputRoot,
                                                 const std::string& excludeRoot = std::string());

  static std::string SingleFileOutputPath(const std::string& inputFile, const std::string& outputRoot);
};
