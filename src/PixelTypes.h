#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Palette colors are stored in OpenCV channel order (B, G, R) so they can be
// compared and written directly against CV_8UC3 / CV_8UC4 pixels.
using Palette = std::vector<cv::Vec3b>;

constexpr int kMaxPaletteSize = 256;

// How a cell color is assigned from the palette.
enum class ColorMode {
  Normal, // single nearest palette color
  Blend   // distance-weighted mix of the two nearest palette colors
};

// Where the palette comes from.
enum class PaletteSource {
  FromInput,     // cluster the colors of the image being processed
  FromReference, // unique colors of another image, clustered down if needed
  Predefined     // curated palette (library preset or palette strip image)
};

// Clustering backend used to reduce a color set to K representatives.
enum class ClusterMethod {
  KMeans,
  MedianCut,
  Octree,
  Random
};

enum class SharpenStage {
  Before, // sharpen the source before pixelation
  After   // sharpen the pixelated result
};

struct PixelationConfig {
  int downscaleFactor = 4;      // block size in pixels; 0 or 1 disables downscaling
  ColorMode colorMode = ColorMode::Normal;
  int sharpenAmount = 0;        // -100..100, 0 disables
  SharpenStage sharpenStage = SharpenStage::After;

  PaletteSource paletteSource = PaletteSource::FromInput;
  std::string palettePath;      // reference image, or palette strip for Predefined
  std::string paletteName;      // PaletteLibrary preset for Predefined (used when palettePath is empty)
  ClusterMethod clusterMethod = ClusterMethod::KMeans;
  int maxColors = 32;           // 1..256
  std::uint32_t seed = 42;      // clustering seed; same seed => same palette

  bool restoreSize = true;      // false => emit the coarse grid instead of full-size blocks
  bool savePalette = false;     // write <stem>_<ext>_palette.png next to each output
  int workers = 1;              // batch worker threads

  // Throws PixelArtError(InvalidConfig) on out-of-range values.
  void Validate() const;
};

// Case-insensitive parsers for CLI tokens. Return false on unknown names.
bool ParseColorMode(const std::string& text, ColorMode& out);
bool ParseClusterMethod(const std::string& text, ClusterMethod& out);
bool ParseSharpenStage(const std::string& text, SharpenStage& out);

const char* ToString(ColorMode mode);
const char* ToString(ClusterMethod method);
const char* ToString(PaletteSource source);
