#include "ColorMapper.h"

#include "PixelArtError.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {
inline int ClampInt(int v, int lo, int hi) { return std::max(lo, std::min(v, hi)); }

// Squared Euclidean distance in RGB space. Integer so ties compare exactly.
inline int ColorDistanceSquared(const cv::Vec3b& a, const cv::Vec3b& b) {
  const int db = static_cast<int>(a[0]) - static_cast<int>(b[0]);
  const int dg = static_cast<int>(a[1]) - static_cast<int>(b[1]);
  const int dr = static_cast<int>(a[2]) - static_cast<int>(b[2]);
  return dr * dr + dg * dg + db * db;
}
} // namespace

size_t ColorMapper::NearestIndex(const cv::Vec3b& bgr, const Palette& palette) {
  if (palette.empty()) {
    throw PixelArtError(ErrorKind::EmptyPalette, "cannot map a color against an empty palette");
  }
  int minDist = std::numeric_limits<int>::max();
  size_t bestIdx = 0;
  for (size_t i = 0; i < palette.size(); ++i) {
    const int dist = ColorDistanceSquared(bgr, palette[i]);
    if (dist < minDist) {
      minDist = dist;
      bestIdx = i;
    }
  }
  return bestIdx;
}

cv::Vec3b ColorMapper::BlendTwoNearest(const cv::Vec3b& bgr, const Palette& palette) {
  // Two smallest distances; strict comparisons keep the earlier entry on ties.
  int d1 = std::numeric_limits<int>::max();
  int d2 = std::numeric_limits<int>::max();
  size_t i1 = 0;
  size_t i2 = 0;
  for (size_t i = 0; i < palette.size(); ++i) {
    const int dist = ColorDistanceSquared(bgr, palette[i]);
    if (dist < d1) {
      d2 = d1;
      i2 = i1;
      d1 = dist;
      i1 = i;
    } else if (dist < d2) {
      d2 = dist;
      i2 = i;
    }
  }

  // Exact hit (this also covers both distances being zero) or nothing to blend with.
  if (d1 == 0 || palette.size() == 1) return palette[i1];

  const double dist1 = std::sqrt(static_cast<double>(d1));
  const double dist2 = std::sqrt(static_cast<double>(d2));
  const double w1 = dist2 / (dist1 + dist2);
  const double w2 = dist1 / (dist1 + dist2);

  const cv::Vec3b& c1 = palette[i1];
  const cv::Vec3b& c2 = palette[i2];
  cv::Vec3b out;
  for (int ch = 0; ch < 3; ++ch) {
    const double v = w1 * c1[ch] + w2 * c2[ch];
    out[ch] = static_cast<uchar>(ClampInt(static_cast<int>(std::lround(v)), 0, 255));
  }
  return out;
}

cv::Vec3b ColorMapper::MapColor(const cv::Vec3b& bgr, const Palette& palette, ColorMode mode) {
  if (palette.empty()) {
    throw PixelArtError(ErrorKind::EmptyPalette, "cannot map a color against an empty palette");
  }
  if (mode == ColorMode::Blend) return BlendTwoNearest(bgr, palette);
  return palette[NearestIndex(bgr, palette)];
}

cv::Vec4b ColorMapper::MapColor(const cv::Vec4b& bgra, const Palette& palette, ColorMode mode) {
  const cv::Vec3b mapped = MapColor(cv::Vec3b(bgra[0], bgra[1], bgra[2]), palette, mode);
  return cv::Vec4b(mapped[0], mapped[1], mapped[2], bgra[3]);
}
