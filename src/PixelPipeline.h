#pragma once

#include "ColorClusterer.h"
#include "PaletteLibrary.h"
#include "PixelTypes.h"

#include <opencv2/core.hpp>

#include <atomic>
#include <memory>
#include <string>

// PixelPipeline: one configured run of load -> palette -> pixelate -> sharpen -> save.
// Palettes that do not depend on the input (reference image, predefined) are
// built once in the constructor and shared read-only afterwards, so a single
// pipeline can be used from several worker threads at once.
class PixelPipeline {
public:
  // Validates config and resolves any shared palette.
  // Throws PixelArtError (InvalidConfig, InvalidPaletteSource).
  PixelPipeline(const PixelationConfig& config, const PaletteLibrary& library);

  PixelPipeline(const PixelPipeline&) = delete;
  PixelPipeline& operator=(const PixelPipeline&) = delete;

  const PixelationConfig& Config() const { return config_; }

  bool HasSharedPalette() const { return hasSharedPalette_; }
  const Palette& SharedPalette() const { return sharedPalette_; }

  // Shared palette, or a palette clustered from image's block colors.
  Palette ResolvePalette(const cv::Mat& image) const;

  // In-memory processing. usedPalette (optional) receives the palette applied.
  cv::Mat ProcessImage(const cv::Mat& image, const std::atomic<bool>* cancel = nullptr,
                       Palette* usedPalette = nullptr) const;

  // Reads inputPath, writes outputPath (parent directories are created).
  // Throws PixelArtError: UnsupportedFormat for unreadable input, WriteFailed
  // for output errors, plus anything ProcessImage throws.
  void ProcessFile(const std::string& inputPath, const std::string& outputPath,
                   const std::atomic<bool>* cancel = nullptr) const;

  // "<dir>/<stem>_<ext>_palette.png" beside an output image (ext lower-cased, no dot).
  static std::string PalettePathFor(const std::string& outputPath);

private:
  PixelationConfig config_;
  const PaletteLibrary& library_;
  std::unique_ptr<ColorClusterer> clusterer_;
  Palette sharedPalette_;
  bool hasSharedPalette_ = false;
};
