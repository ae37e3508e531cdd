#include "ImageLoader.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace {
const char* const kSupportedExtensions[] = {
    ".png", ".jpg", ".jpeg", ".jfif", ".jpg_large", ".webp", ".bmp", ".tif", ".tiff", ".ico"};

// Maps an output extension to the codec extension OpenCV understands.
std::string EncoderExtension(const std::string& ext) {
  if (ext == ".jfif" || ext == ".jpg_large" || ext == ".jpeg") return ".jpg";
  if (ext == ".tif") return ".tiff";
  return ext;
}

bool EncoderKeepsAlpha(const std::string& encoderExt) {
  return encoderExt != ".jpg" && encoderExt != ".bmp";
}

// Little-endian field access for the ICO and BMP headers.
inline std::uint32_t ReadLe16(const std::vector<uchar>& b, size_t at) {
  return static_cast<std::uint32_t>(b[at]) | (static_cast<std::uint32_t>(b[at + 1]) << 8);
}

inline std::uint32_t ReadLe32(const std::vector<uchar>& b, size_t at) {
  return ReadLe16(b, at) | (ReadLe16(b, at + 2) << 16);
}

inline void WriteLe32(std::vector<uchar>& out, std::uint32_t value) {
  out.push_back(static_cast<uchar>(value & 0xFF));
  out.push_back(static_cast<uchar>((value >> 8) & 0xFF));
  out.push_back(static_cast<uchar>((value >> 16) & 0xFF));
  out.push_back(static_cast<uchar>((value >> 24) & 0xFF));
}

bool ReadFileBytes(const std::string& path, std::vector<uchar>& out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return false;
  out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  return true;
}

// Icon bitmap: BITMAPINFOHEADER without a file header, height doubled for the
// XOR image plus the 1-bit AND mask, rows bottom-up.
cv::Mat DecodeIconBitmap(const std::vector<uchar>& dib, std::string& outError) {
  if (dib.size() < 40) {
    outError = "ICO bitmap entry is truncated.";
    return {};
  }
  const std::uint32_t headerSize = ReadLe32(dib, 0);
  const int width = static_cast<std::int32_t>(ReadLe32(dib, 4));
  const int height = static_cast<std::int32_t>(ReadLe32(dib, 8)) / 2;
  const int bits = static_cast<int>(ReadLe16(dib, 14));
  const std::uint32_t compression = ReadLe32(dib, 16);
  if (headerSize < 40 || headerSize > dib.size() || width <= 0 || height <= 0 || bits <= 0 || bits > 32) {
    outError = "ICO bitmap entry has an invalid header.";
    return {};
  }

  size_t paletteBytes = 0;
  if (bits <= 8) {
    const std::uint32_t used = ReadLe32(dib, 32);
    paletteBytes = static_cast<size_t>(used != 0 ? used : (1u << bits)) * 4;
  }
  if (compression == 3 && headerSize == 40) paletteBytes += 12; // BI_BITFIELDS masks

  const size_t xorOffset = headerSize + paletteBytes;
  const size_t xorStride = ((static_cast<size_t>(width) * static_cast<size_t>(bits) + 31) / 32) * 4;
  const size_t rows = static_cast<size_t>(height);
  if (xorOffset > dib.size() || xorStride * rows > dib.size() - xorOffset) {
    outError = "ICO bitmap entry is truncated.";
    return {};
  }

  cv::Mat color;
  bool useMask = true;
  if (bits == 32 && compression == 0) {
    // OpenCV's BMP reader drops the alpha of plain 32-bit bitmaps; copy BGRA rows directly.
    color.create(height, width, CV_8UC4);
    bool anyAlpha = false;
    for (int y = 0; y < height; ++y) {
      const uchar* src = dib.data() + xorOffset + (rows - 1 - static_cast<size_t>(y)) * xorStride;
      uchar* dst = color.ptr<uchar>(y);
      std::copy(src, src + static_cast<size_t>(width) * 4, dst);
      for (int x = 0; x < width && !anyAlpha; ++x) anyAlpha = dst[x * 4 + 3] != 0;
    }
    // Icons with a real alpha channel ignore the AND mask; older ones leave it all zero.
    useMask = !anyAlpha;
    if (useMask) {
      for (int y = 0; y < height; ++y) {
        cv::Vec4b* row = color.ptr<cv::Vec4b>(y);
        for (int x = 0; x < width; ++x) row[x][3] = 255;
      }
    }
  } else {
    // Prepend a BITMAPFILEHEADER and halve the height so only the XOR image is read.
    std::vector<uchar> bmp;
    bmp.reserve(14 + dib.size());
    bmp.push_back('B');
    bmp.push_back('M');
    WriteLe32(bmp, static_cast<std::uint32_t>(14 + dib.size()));
    WriteLe32(bmp, 0);
    WriteLe32(bmp, static_cast<std::uint32_t>(14 + xorOffset));
    bmp.insert(bmp.end(), dib.begin(), dib.end());
    const std::uint32_t halved = static_cast<std::uint32_t>(height);
    for (size_t i = 0; i < 4; ++i) bmp[14 + 8 + i] = static_cast<uchar>((halved >> (8 * i)) & 0xFF);

    cv::Mat decoded = cv::imdecode(bmp, cv::IMREAD_COLOR);
    if (decoded.empty()) {
      outError = "ICO bitmap entry could not be decoded.";
      return {};
    }
    cv::cvtColor(decoded, color, cv::COLOR_BGR2BGRA);
  }

  // AND mask: one bit per pixel, set means transparent. Icons without one stay opaque.
  const size_t andOffset = xorOffset + xorStride * rows;
  const size_t andStride = ((static_cast<size_t>(width) + 31) / 32) * 4;
  if (useMask && andOffset <= dib.size() && andStride * rows <= dib.size() - andOffset) {
    for (int y = 0; y < height; ++y) {
      const uchar* mask = dib.data() + andOffset + (rows - 1 - static_cast<size_t>(y)) * andStride;
      cv::Vec4b* row = color.ptr<cv::Vec4b>(y);
      for (int x = 0; x < width; ++x) {
        if (mask[x >> 3] & (0x80 >> (x & 7))) row[x][3] = 0;
      }
    }
  }
  return color;
}

// ICO container: 6-byte ICONDIR, 16-byte directory entries, then PNG or bitmap payloads.
// The largest entry is decoded; more bits per pixel wins between equal sizes.
cv::Mat DecodeIco(const std::vector<uchar>& bytes, std::string& outError) {
  if (bytes.size() < 6 || ReadLe16(bytes, 0) != 0 || ReadLe16(bytes, 2) != 1) {
    outError = "Not an ICO file.";
    return {};
  }
  const size_t count = ReadLe16(bytes, 4);
  if (count == 0 || bytes.size() < 6 + count * 16) {
    outError = "ICO directory is empty or truncated.";
    return {};
  }

  size_t best = 0;
  long bestArea = -1;
  std::uint32_t bestBits = 0;
  for (size_t i = 0; i < count; ++i) {
    const size_t entry = 6 + i * 16;
    const long w = bytes[entry] != 0 ? bytes[entry] : 256;
    const long h = bytes[entry + 1] != 0 ? bytes[entry + 1] : 256;
    const std::uint32_t bits = ReadLe16(bytes, entry + 6);
    if (w * h > bestArea || (w * h == bestArea && bits > bestBits)) {
      best = i;
      bestArea = w * h;
      bestBits = bits;
    }
  }

  const size_t entry = 6 + best * 16;
  const size_t size = ReadLe32(bytes, entry + 8);
  const size_t offset = ReadLe32(bytes, entry + 12);
  if (offset > bytes.size() || size > bytes.size() - offset || size < 8) {
    outError = "ICO entry points outside the file.";
    return {};
  }
  const std::vector<uchar> payload(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                                   bytes.begin() + static_cast<std::ptrdiff_t>(offset + size));

  static const uchar kPngSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  if (std::equal(kPngSignature, kPngSignature + 8, payload.begin())) {
    cv::Mat png = cv::imdecode(payload, cv::IMREAD_UNCHANGED);
    if (png.empty()) outError = "ICO PNG entry could not be decoded.";
    return png;
  }
  return DecodeIconBitmap(payload, outError);
}
} // namespace

std::string ImageLoader::LowerExtension(const std::string& path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

bool ImageLoader::IsSupportedImagePath(const std::string& path) {
  const std::string ext = LowerExtension(path);
  if (ext.empty()) return false;
  for (const char* supported : kSupportedExtensions) {
    if (ext == supported) return true;
  }
  return false;
}

cv::Mat ImageLoader::ToBgrOrBgra(const cv::Mat& src) {
  if (src.empty()) return {};

  cv::Mat img8;
  if (src.depth() == CV_8U) {
    img8 = src;
  } else if (src.depth() == CV_16U) {
    src.convertTo(img8, CV_8U, 1.0 / 257.0);
  } else if (src.depth() == CV_32F || src.depth() == CV_64F) {
    // Float images from OpenCV decoders (EXR/HDR-like TIFF) are 0..1.
    src.convertTo(img8, CV_8U, 255.0);
  } else {
    src.convertTo(img8, CV_8U);
  }

  cv::Mat out;
  switch (img8.channels()) {
    case 1:
      cv::cvtColor(img8, out, cv::COLOR_GRAY2BGR);
      break;
    case 2: {
      // Gray + alpha: expand the gray plane, keep alpha as the 4th channel.
      std::vector<cv::Mat> planes;
      cv::split(img8, planes);
      std::vector<cv::Mat> bgra = {planes[0], planes[0], planes[0], planes[1]};
      cv::merge(bgra, out);
      break;
    }
    case 3:
    case 4:
      out = img8;
      break;
    default:
      return {};
  }
  return out;
}

bool ImageLoader::Load(const std::string& path, cv::Mat& outImage, std::string& outError) {
  outError.clear();
  outImage.release();

  cv::Mat raw;
  try {
    if (LowerExtension(path) == ".ico") {
      // No ICO codec in OpenCV; unpack the container and decode its payload.
      std::vector<uchar> bytes;
      if (!ReadFileBytes(path, bytes)) {
        outError = "Cannot open file: " + path;
        return false;
      }
      std::string icoError;
      raw = DecodeIco(bytes, icoError);
      if (raw.empty()) {
        outError = icoError + " (" + path + ")";
        return false;
      }
    } else {
      // IMREAD_UNCHANGED keeps the alpha channel; color order is still BGR(A).
      raw = cv::imread(path, cv::IMREAD_UNCHANGED);
    }
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }
  if (raw.empty()) {
    outError = "Failed to decode image: " + path;
    return false;
  }

  cv::Mat img = ToBgrOrBgra(raw);
  if (img.empty()) {
    outError = "Unsupported channel layout (" + std::to_string(raw.channels()) + " channels): " + path;
    return false;
  }
  outImage = img;
  return true;
}

bool ImageLoader::Save(const std::string& path, const cv::Mat& image, std::string& outError) {
  outError.clear();
  if (image.empty()) {
    outError = "Nothing to save (image is empty).";
    return false;
  }

  const std::string encoderExt = EncoderExtension(LowerExtension(path));
  if (encoderExt.empty()) {
    outError = "Output path has no extension: " + path;
    return false;
  }

  cv::Mat toWrite = image;
  if (image.channels() == 4 && !EncoderKeepsAlpha(encoderExt)) {
    cv::cvtColor(image, toWrite, cv::COLOR_BGRA2BGR);
  }

  const std::string ext = LowerExtension(path);
  if (ext != ".jfif" && ext != ".jpg_large") {
    try {
      if (!cv::imwrite(path, toWrite)) {
        outError = "cv::imwrite returned false. Check file extension and output path.";
        return false;
      }
    } catch (const cv::Exception& e) {
      outError = std::string("OpenCV error: ") + e.what();
      return false;
    }
    return true;
  }

  // .jfif and .jpg_large are unknown to cv::imwrite: encode in memory and
  // write the bytes under the requested name.
  std::vector<uchar> encoded;
  try {
    if (!cv::imencode(encoderExt, toWrite, encoded)) {
      outError = "cv::imencode returned false for " + encoderExt + ".";
      return false;
    }
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    outError = "Cannot open output file: " + path;
    return false;
  }
  // uchar buffer viewed as the char stream ofstream::write takes.
  file.write(reinterpret_cast<const char*>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
  if (!file) {
    outError = "Failed writing output file: " + path;
    return false;
  }
  return true;
}

bool ImageLoader::SavePaletteStrip(const std::string& path, const Palette& palette, std::string& outError) {
  if (palette.empty()) {
    outError = "Palette is empty.";
    return false;
  }
  cv::Mat strip(1, static_cast<int>(palette.size()), CV_8UC3);
  for (int x = 0; x < strip.cols; ++x) {
    strip.at<cv::Vec3b>(0, x) = palette[static_cast<size_t>(x)];
  }
  return Save(path, strip, outError);
}
