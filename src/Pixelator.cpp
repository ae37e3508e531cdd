#include "Pixelator.h"

#include "ColorMapper.h"
#include "ImageLoader.h"
#include "PixelArtError.h"

#include <algorithm>
#include <array>
#include <cstdint>

namespace {
inline void ThrowIfCancelled(const std::atomic<bool>* cancel) {
  if (cancel && cancel->load(std::memory_order_relaxed)) {
    throw PixelArtError(ErrorKind::Cancelled, "pixelation cancelled");
  }
}

inline uchar RoundedMean(std::uint64_t sum, std::uint64_t count) {
  return static_cast<uchar>((sum + count / 2) / count);
}
} // namespace

int Pixelator::BlockSize(int downscaleFactor) {
  return downscaleFactor > 1 ? downscaleFactor : 1;
}

cv::Mat Pixelator::Pixelate(const cv::Mat& image, const PixelationConfig& config, const Palette& palette,
                            const std::atomic<bool>* cancel) {
  if (palette.empty()) {
    throw PixelArtError(ErrorKind::EmptyPalette, "cannot pixelate with an empty palette");
  }
  if (config.downscaleFactor < 0) {
    throw PixelArtError(ErrorKind::InvalidConfig,
                        "downscale factor must be >= 0 (got " + std::to_string(config.downscaleFactor) + ")");
  }
  if (image.empty()) {
    throw PixelArtError(ErrorKind::UnsupportedFormat, "input image is empty");
  }

  // Grayscale is promoted to BGR here so callers may pass anything decoded.
  cv::Mat work = ImageLoader::ToBgrOrBgra(image);
  if (work.empty()) {
    throw PixelArtError(ErrorKind::UnsupportedFormat,
                        "unsupported channel count: " + std::to_string(image.channels()));
  }

  const int blockSize = BlockSize(config.downscaleFactor);

  cv::Mat smallBlocks = BuildBlockColorImage(work, blockSize, cancel);
  cv::Mat quantizedSmall = QuantizeBlocks(smallBlocks, palette, config.colorMode, cancel);

  if (!config.restoreSize) return quantizedSmall;
  return ExpandBlocks(quantizedSmall, work, blockSize);
}

cv::Mat Pixelator::BuildBlockColorImage(const cv::Mat& image, int blockSize, const std::atomic<bool>* cancel) {
  const int w = image.cols;
  const int h = image.rows;
  if (w <= 0 || h <= 0) return {};
  if (image.type() != CV_8UC3 && image.type() != CV_8UC4) return {};
  blockSize = std::max(1, blockSize);

  const int channels = image.channels();
  const int bw = (w + blockSize - 1) / blockSize;
  const int bh = (h + blockSize - 1) / blockSize;

  cv::Mat small(bh, bw, image.type(), cv::Scalar::all(0));

  for (int by = 0; by < bh; ++by) {
    ThrowIfCancelled(cancel);
    uchar* outRow = small.ptr<uchar>(by);

    for (int bx = 0; bx < bw; ++bx) {
      const int x0 = bx * blockSize;
      const int y0 = by * blockSize;
      const int x1 = std::min(x0 + blockSize, w);
      const int y1 = std::min(y0 + blockSize, h);

      // Representative color: rounded arithmetic mean of every channel,
      // alpha averaged on its own like the color channels.
      std::array<std::uint64_t, 4> sum{0, 0, 0, 0};
      for (int y = y0; y < y1; ++y) {
        const uchar* row = image.ptr<uchar>(y);
        for (int x = x0; x < x1; ++x) {
          const uchar* px = row + x * channels;
          for (int ch = 0; ch < channels; ++ch) sum[static_cast<size_t>(ch)] += px[ch];
        }
      }

      const std::uint64_t count = static_cast<std::uint64_t>(x1 - x0) * static_cast<std::uint64_t>(y1 - y0);
      uchar* cell = outRow + bx * channels;
      for (int ch = 0; ch < channels; ++ch) cell[ch] = RoundedMean(sum[static_cast<size_t>(ch)], count);
    }
  }
  return small;
}

cv::Mat Pixelator::QuantizeBlocks(const cv::Mat& smallImage, const Palette& palette, ColorMode mode,
                                  const std::atomic<bool>* cancel) {
  if (smallImage.empty()) return {};
  if (palette.empty()) {
    throw PixelArtError(ErrorKind::EmptyPalette, "cannot quantize with an empty palette");
  }

  cv::Mat result = smallImage.clone();
  for (int y = 0; y < result.rows; ++y) {
    ThrowIfCancelled(cancel);
    if (result.channels() == 4) {
      cv::Vec4b* row = result.ptr<cv::Vec4b>(y);
      for (int x = 0; x < result.cols; ++x) row[x] = ColorMapper::MapColor(row[x], palette, mode);
    } else {
      cv::Vec3b* row = result.ptr<cv::Vec3b>(y);
      for (int x = 0; x < result.cols; ++x) row[x] = ColorMapper::MapColor(row[x], palette, mode);
    }
  }
  return result;
}

cv::Mat Pixelator::ExpandBlocks(const cv::Mat& smallImage, const cv::Mat& source, int blockSize) {
  if (smallImage.empty() || source.empty()) return {};
  if (smallImage.type() != source.type()) return {};
  blockSize = std::max(1, blockSize);

  cv::Mat out(source.size(), source.type(), cv::Scalar::all(0));
  const bool hasAlpha = source.channels() == 4;

  for (int by = 0; by < smallImage.rows; ++by) {
    for (int bx = 0; bx < smallImage.cols; ++bx) {
      const int x0 = bx * blockSize;
      const int y0 = by * blockSize;
      const int x1 = std::min(x0 + blockSize, out.cols);
      const int y1 = std::min(y0 + blockSize, out.rows);
      if (x0 >= x1 || y0 >= y1) continue;

      cv::Rect roi(x0, y0, x1 - x0, y1 - y0);
      if (!hasAlpha) {
        const cv::Vec3b c = smallImage.at<cv::Vec3b>(by, bx);
        out(roi).setTo(cv::Scalar(c[0], c[1], c[2]));
        continue;
      }

      // Color from the cell, alpha from the matching source pixel.
      const cv::Vec4b c = smallImage.at<cv::Vec4b>(by, bx);
      for (int y = y0; y < y1; ++y) {
        const cv::Vec4b* srcRow = source.ptr<cv::Vec4b>(y);
        cv::Vec4b* dstRow = out.ptr<cv::Vec4b>(y);
        for (int x = x0; x < x1; ++x) dstRow[x] = cv::Vec4b(c[0], c[1], c[2], srcRow[x][3]);
      }
    }
  }
  return out;
}
