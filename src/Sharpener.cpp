#include "Sharpener.h"

#include "PixelArtError.h"

#include <cstdlib>
#include <vector>

#include <opencv2/imgproc.hpp>

cv::Mat Sharpener::Sharpen(const cv::Mat& image, int amount) {
  if (amount < -100 || amount > 100) {
    throw PixelArtError(ErrorKind::InvalidConfig,
                        "sharpen amount must be in -100..100 (got " + std::to_string(amount) + ")");
  }
  if (amount == 0) return image;
  if (image.empty()) return image;
  if (image.depth() != CV_8U || (image.channels() != 1 && image.channels() != 3 && image.channels() != 4)) {
    throw PixelArtError(ErrorKind::UnsupportedFormat, "sharpen expects an 8-bit 1/3/4-channel image");
  }

  cv::Mat color = image;
  cv::Mat alpha;
  if (image.channels() == 4) {
    cv::cvtColor(image, color, cv::COLOR_BGRA2BGR);
    cv::extractChannel(image, alpha, 3);
  }

  cv::Mat blurred;
  cv::GaussianBlur(color, blurred, cv::Size(3, 3), 0.0, 0.0, cv::BORDER_DEFAULT);

  cv::Mat colorF, blurredF;
  color.convertTo(colorF, CV_32F);
  blurred.convertTo(blurredF, CV_32F);

  cv::Mat result;
  if (amount > 0) {
    // Unsharp mask: add back the high-frequency component.
    const float strength = 2.0f * static_cast<float>(amount) / 100.0f;
    cv::Mat high = colorF - blurredF;
    result = colorF + high * strength;
  } else {
    // Interpolate toward the blurred image.
    const float t = static_cast<float>(std::abs(amount)) / 100.0f;
    result = colorF + (blurredF - colorF) * t;
  }

  // Clamp and convert back.
  result = cv::min(cv::max(result, 0.0f), 255.0f);
  cv::Mat out;
  result.convertTo(out, CV_8U);

  if (!alpha.empty()) {
    std::vector<cv::Mat> planes;
    cv::split(out, planes);
    planes.push_back(alpha);
    cv::merge(planes, out);
  }
  return out;
}
