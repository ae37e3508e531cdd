#include "PaletteBuilder.h"

#include "ImageLoader.h"
#include "PixelArtError.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <tuple>
#include <unordered_set>

namespace {
inline std::uint32_t PackColor(const cv::Vec3b& c) {
  return (static_cast<std::uint32_t>(c[0]) << 16) | (static_cast<std::uint32_t>(c[1]) << 8) | c[2];
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower >= 'a' && lower <= 'f') return 10 + (lower - 'a');
  return -1;
}
} // namespace

int PaletteBuilder::Brightness(const cv::Vec3b& bgr) {
  return 299 * bgr[2] + 587 * bgr[1] + 114 * bgr[0];
}

std::vector<cv::Vec3b> PaletteBuilder::AllColors(const cv::Mat& image) {
  std::vector<cv::Vec3b> colors;
  colors.reserve(static_cast<size_t>(image.rows) * static_cast<size_t>(image.cols));
  if (image.channels() == 4) {
    for (int y = 0; y < image.rows; ++y) {
      const cv::Vec4b* row = image.ptr<cv::Vec4b>(y);
      for (int x = 0; x < image.cols; ++x) colors.emplace_back(row[x][0], row[x][1], row[x][2]);
    }
  } else {
    for (int y = 0; y < image.rows; ++y) {
      const cv::Vec3b* row = image.ptr<cv::Vec3b>(y);
      colors.insert(colors.end(), row, row + image.cols);
    }
  }
  return colors;
}

std::vector<cv::Vec3b> PaletteBuilder::UniqueColors(const cv::Mat& image) {
  cv::Mat img = ImageLoader::ToBgrOrBgra(image);
  std::vector<cv::Vec3b> unique;
  if (img.empty()) return unique;

  std::unordered_set<std::uint32_t> seen;
  for (const cv::Vec3b& c : AllColors(img)) {
    if (seen.insert(PackColor(c)).second) unique.push_back(c);
  }
  return unique;
}

Palette PaletteBuilder::Finalize(const std::vector<cv::Vec3b>& colors, int maxColors) {
  Palette palette;
  std::unordered_set<std::uint32_t> seen;
  for (const cv::Vec3b& c : colors) {
    if (seen.insert(PackColor(c)).second) palette.push_back(c);
  }

  // Equal brightness falls back to (R, G, B) so the order is total.
  std::sort(palette.begin(), palette.end(), [](const cv::Vec3b& a, const cv::Vec3b& b) {
    return std::make_tuple(Brightness(a), a[2], a[1], a[0]) < std::make_tuple(Brightness(b), b[2], b[1], b[0]);
  });

  const size_t limit = static_cast<size_t>(std::max(0, std::min(maxColors, kMaxPaletteSize)));
  if (palette.size() > limit) palette.resize(limit);
  return palette;
}

Palette PaletteBuilder::Build(const cv::Mat& source, Mode mode, int maxColors, const ColorClusterer& clusterer) {
  if (maxColors < 1 || maxColors > kMaxPaletteSize) {
    throw PixelArtError(ErrorKind::InvalidConfig,
                        "palette size must be in 1..256 (got " + std::to_string(maxColors) + ")");
  }
  if (source.empty()) {
    throw PixelArtError(ErrorKind::InvalidPaletteSource, "palette source image is empty");
  }
  cv::Mat img = ImageLoader::ToBgrOrBgra(source);
  if (img.empty()) {
    throw PixelArtError(ErrorKind::InvalidPaletteSource, "palette source has an unsupported channel layout");
  }

  std::vector<cv::Vec3b> colors;
  switch (mode) {
    case Mode::ExtractFromInput:
      colors = clusterer.Fit(AllColors(img), maxColors);
      break;
    case Mode::FromReference: {
      std::vector<cv::Vec3b> unique = UniqueColors(img);
      colors = static_cast<int>(unique.size()) > maxColors ? clusterer.Fit(unique, maxColors) : unique;
      break;
    }
    case Mode::Predefined:
      colors = UniqueColors(img);
      break;
  }

  Palette palette = Finalize(colors, maxColors);
  if (palette.empty()) {
    throw PixelArtError(ErrorKind::InvalidPaletteSource, "palette source yielded no colors");
  }
  return palette;
}

Palette PaletteBuilder::BuildFromFile(const std::string& path, Mode mode, int maxColors,
                                      const ColorClusterer& clusterer) {
  cv::Mat img;
  std::string err;
  if (!ImageLoader::Load(path, img, err)) {
    throw PixelArtError(ErrorKind::InvalidPaletteSource, err);
  }
  return Build(img, mode, maxColors, clusterer);
}

Palette PaletteBuilder::LoadPalette(const std::string& path) {
  cv::Mat strip;
  std::string err;
  if (!ImageLoader::Load(path, strip, err)) {
    throw PixelArtError(ErrorKind::InvalidPaletteSource, err);
  }
  Palette palette = Finalize(UniqueColors(strip), kMaxPaletteSize);
  if (palette.empty()) {
    throw PixelArtError(ErrorKind::InvalidPaletteSource, "palette image has no colors: " + path);
  }
  return palette;
}

bool PaletteBuilder::ParseHexColor(const std::string& text, cv::Vec3b& outBgr) {
  std::string hex = text;
  if (!hex.empty() && hex[0] == '#') hex.erase(0, 1);
  if (hex.size() != 6) return false;

  int rgb[3] = {0, 0, 0};
  for (int i = 0; i < 3; ++i) {
    const int hi = HexDigit(hex[static_cast<size_t>(2 * i)]);
    const int lo = HexDigit(hex[static_cast<size_t>(2 * i + 1)]);
    if (hi < 0 || lo < 0) return false;
    rgb[i] = hi * 16 + lo;
  }
  outBgr = cv::Vec3b(static_cast<uchar>(rgb[2]), static_cast<uchar>(rgb[1]), static_cast<uchar>(rgb[0]));
  return true;
}
