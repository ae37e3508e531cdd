#pragma once

#include "PixelTypes.h"

#include <opencv2/core.hpp>

// ColorMapper: assigns a palette color to an arbitrary pixel.
// Distances use the three color channels only; alpha is carried through.
class ColorMapper {
public:
  // Throws PixelArtError(EmptyPalette) when palette is empty.
  static cv::Vec3b MapColor(const cv::Vec3b& bgr, const Palette& palette, ColorMode mode);

  // Same as above; the alpha channel of the result is bgra[3] unchanged.
  static cv::Vec4b MapColor(const cv::Vec4b& bgra, const Palette& palette, ColorMode mode);

  // Index of the nearest entry (squared Euclidean), first occurrence on ties.
  static size_t NearestIndex(const cv::Vec3b& bgr, const Palette& palette);

private:
  static cv::Vec3b BlendTwoNearest(const cv::Vec3b& bgr, const Palette& palette);
};
