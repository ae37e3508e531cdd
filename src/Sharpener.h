#pragma once

#include <opencv2/core.hpp>

// Sharpener: unsharp-mask style contrast pass used around pixelation.
//   amount  > 0: add back (image - blur) scaled by 2*amount/100 (edge enhancement)
//   amount  < 0: move toward the blur by |amount|/100 (softening)
//   amount == 0: returns the input Mat itself, nothing allocated
// Strength grows monotonically with |amount|. Alpha is never touched.
class Sharpener {
public:
  // Accepts CV_8UC1, CV_8UC3, CV_8UC4.
  // Throws PixelArtError(InvalidConfig) if amount is outside -100..100 and
  // PixelArtError(UnsupportedFormat) for other image types.
  static cv::Mat Sharpen(const cv::Mat& image, int amount);
};
