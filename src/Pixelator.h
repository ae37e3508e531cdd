#pragma once

#include "PixelTypes.h"

#include <opencv2/core.hpp>

#include <atomic>

// Pixelator:
// - Independent of any UI or I/O.
// - Renders an image as flat palette-colored blocks:
//   1) Block-based representative colors (explicit N×N mean; NOT resize-based)
//   2) Each representative mapped through ColorMapper
//   3) Blocks written back at full resolution (or the coarse grid itself when
//      restoreSize is off)
// Accepts CV_8UC1 (promoted to BGR), CV_8UC3 and CV_8UC4. The output has the
// same channel count as the promoted input.
class Pixelator {
public:
  // Block edge length for a downscale factor: factor <= 1 means 1 (no downscale).
  static int BlockSize(int downscaleFactor);

  // Throws PixelArtError: EmptyPalette, InvalidConfig (negative factor),
  // UnsupportedFormat (empty/unrepresentable image), Cancelled.
  // cancel is polled between rows of cells and may be null.
  static cv::Mat Pixelate(const cv::Mat& image, const PixelationConfig& config, const Palette& palette,
                          const std::atomic<bool>* cancel = nullptr);

  // One pixel per cell holding the rounded per-channel mean (alpha included).
  // Edge cells cover whatever is left when dimensions do not divide evenly.
  static cv::Mat BuildBlockColorImage(const cv::Mat& image, int blockSize,
                                      const std::atomic<bool>* cancel = nullptr);

  // Maps every pixel of the coarse grid; alpha is left untouched.
  static cv::Mat QuantizeBlocks(const cv::Mat& smallImage, const Palette& palette, ColorMode mode,
                                const std::atomic<bool>* cancel = nullptr);

  // Fills each block of source's size with its cell color. For 4-channel
  // images every output pixel keeps the alpha of the same source pixel.
  static cv::Mat ExpandBlocks(const cv::Mat& smallImage, const cv::Mat& source, int blockSize);
};
