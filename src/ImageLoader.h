#pragma once

#include "PixelTypes.h"

#include <opencv2/core.hpp>
#include <string>

// ImageLoader: UI-agnostic image I/O wrapper around OpenCV's codecs.
// Everything that leaves this class is 8-bit BGR (CV_8UC3) or BGRA (CV_8UC4),
// which is what the rest of the engine expects.
class ImageLoader {
public:
  // Loads an image keeping its alpha channel. Grayscale is promoted to BGR,
  // gray+alpha to BGRA, and 16-bit/float data is scaled to 8-bit.
  // .ico files are unpacked here (largest entry, PNG or bitmap payload) since
  // OpenCV has no ICO codec.
  // Returns true on success.
  static bool Load(const std::string& path, cv::Mat& outImage, std::string& outError);

  // Encodes by file extension (.jfif/.jpg_large are written as JPEG, .tif as
  // TIFF). Formats without alpha support drop the alpha channel.
  static bool Save(const std::string& path, const cv::Mat& image, std::string& outError);

  // Writes a palette as a 1xN strip, one pixel per entry, left to right.
  static bool SavePaletteStrip(const std::string& path, const Palette& palette, std::string& outError);

  // Case-insensitive check against the input allow-list:
  // png, jpg, jpeg, jfif, jpg_large, webp, bmp, tif, tiff, ico.
  static bool IsSupportedImagePath(const std::string& path);

  // Converts any decoded cv::Mat to CV_8UC3 or CV_8UC4. Returns an empty Mat
  // for channel layouts that cannot be represented.
  static cv::Mat ToBgrOrBgra(const cv::Mat& src);

  // Lower-cased extension including the dot, e.g. ".png". Empty if none.
  static std::string LowerExtension(const std::string& path);
};
