#include "PixelTypes.h"

#include "PixelArtError.h"

#include <algorithm>
#include <cctype>

namespace {
std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}
} // namespace

void PixelationConfig::Validate() const {
  if (downscaleFactor < 0) {
    throw PixelArtError(ErrorKind::InvalidConfig,
                        "downscale factor must be >= 0 (got " + std::to_string(downscaleFactor) + ")");
  }
  if (sharpenAmount < -100 || sharpenAmount > 100) {
    throw PixelArtError(ErrorKind::InvalidConfig,
                        "sharpen amount must be in -100..100 (got " + std::to_string(sharpenAmount) + ")");
  }
  if (maxColors < 1 || maxColors > kMaxPaletteSize) {
    throw PixelArtError(ErrorKind::InvalidConfig,
                        "color count must be in 1..256 (got " + std::to_string(maxColors) + ")");
  }
  if (workers < 1) {
    throw PixelArtError(ErrorKind::InvalidConfig,
                        "worker count must be >= 1 (got " + std::to_string(workers) + ")");
  }
  if (paletteSource == PaletteSource::FromReference && palettePath.empty()) {
    throw PixelArtError(ErrorKind::InvalidConfig, "reference palette source needs a reference image path");
  }
  if (paletteSource == PaletteSource::Predefined && palettePath.empty() && paletteName.empty()) {
    throw PixelArtError(ErrorKind::InvalidConfig, "predefined palette source needs a preset name or palette file");
  }
}

bool ParseColorMode(const std::string& text, ColorMode& out) {
  const std::string t = ToLower(text);
  if (t == "normal") { out = ColorMode::Normal; return true; }
  if (t == "blend") { out = ColorMode::Blend; return true; }
  return false;
}

bool ParseClusterMethod(const std::string& text, ClusterMethod& out) {
  const std::string t = ToLower(text);
  if (t == "kmeans") { out = ClusterMethod::KMeans; return true; }
  if (t == "mediancut") { out = ClusterMethod::MedianCut; return true; }
  if (t == "octree") { out = ClusterMethod::Octree; return true; }
  if (t == "random") { out = ClusterMethod::Random; return true; }
  return false;
}

bool ParseSharpenStage(const std::string& text, SharpenStage& out) {
  const std::string t = ToLower(text);
  if (t == "before" || t == "pre") { out = SharpenStage::Before; return true; }
  if (t == "after" || t == "post") { out = SharpenStage::After; return true; }
  return false;
}

const char* ToString(ColorMode mode) {
  return mode == ColorMode::Blend ? "Blend" : "Normal";
}

const char* ToString(ClusterMethod method) {
  switch (method) {
    case ClusterMethod::KMeans: return "KMeans";
    case ClusterMethod::MedianCut: return "MedianCut";
    case ClusterMethod::Octree: return "Octree";
    case ClusterMethod::Random: return "Random";
  }
  return "Unknown";
}

const char* ToString(PaletteSource source) {
  switch (source) {
    case PaletteSource::FromInput: return "FromInput";
    case PaletteSource::FromReference: return "FromReference";
    case PaletteSource::Predefined: return "Predefined";
  }
  return "Unknown";
}
