#pragma once

#include "ColorClusterer.h"
#include "PixelTypes.h"

#include <opencv2/core.hpp>
#include <string>
#include <vector>

// PaletteBuilder:
// - Derives an ordered, deduplicated palette (<= 256 entries) from an image.
// - Every result is finalized the same way: exact duplicates removed, sorted by
//   ascending brightness, truncated to maxColors.
// - Stateless: nothing is cached between calls.
class PaletteBuilder {
public:
  enum class Mode {
    ExtractFromInput, // cluster the image colors down to maxColors
    FromReference,    // unique colors, clustered only if there are more than maxColors
    Predefined        // unique colors taken directly, no clustering
  };

  // source: CV_8UC3/CV_8UC4 (or anything ImageLoader::ToBgrOrBgra accepts).
  // Throws PixelArtError(InvalidPaletteSource) if source is empty or yields no colors,
  // PixelArtError(InvalidConfig) if maxColors is outside 1..256.
  static Palette Build(const cv::Mat& source, Mode mode, int maxColors, const ColorClusterer& clusterer);

  // Decodes path with ImageLoader, then Build(). Decode failures are InvalidPaletteSource.
  static Palette BuildFromFile(const std::string& path, Mode mode, int maxColors, const ColorClusterer& clusterer);

  // Reads a 1xN palette strip left to right. Taller images are read row by row.
  static Palette LoadPalette(const std::string& path);

  // Dedupe, sort by brightness, truncate.
  static Palette Finalize(const std::vector<cv::Vec3b>& colors, int maxColors);

  // Unique colors of an image in row-major first-occurrence order.
  static std::vector<cv::Vec3b> UniqueColors(const cv::Mat& image);

  // Integer Rec.601 luma scaled by 1000: 299*R + 587*G + 114*B.
  static int Brightness(const cv::Vec3b& bgr);

  // Parses "#rrggbb" or "rrggbb" into a BGR color. Returns false on malformed input.
  static bool ParseHexColor(const std::string& text, cv::Vec3b& outBgr);

private:
  static std::vector<cv::Vec3b> AllColors(const cv::Mat& image);
};
