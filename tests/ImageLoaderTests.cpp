#include "ImageLoader.h"
#include "TestHarness.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

#include <opencv2/imgcodecs.hpp>

namespace fs = std::filesystem;

namespace {

struct IconEntry {
  int width;
  int height;
  int bits;
  std::vector<uchar> payload;
};

void PutLe16(std::vector<uchar>& out, std::uint32_t v)
{
  out.push_back(static_cast<uchar>(v & 0xFF));
  out.push_back(static_cast<uchar>((v >> 8) & 0xFF));
}

void PutLe32(std::vector<uchar>& out, std::uint32_t v)
{
  PutLe16(out, v & 0xFFFF);
  PutLe16(out, v >> 16);
}

// ICONDIR + one 16-byte directory entry per icon, payloads in order after it.
std::vector<uchar> BuildIco(const std::vector<IconEntry>& entries)
{
  std::vector<uchar> out;
  PutLe16(out, 0);
  PutLe16(out, 1);
  PutLe16(out, static_cast<std::uint32_t>(entries.size()));

  std::uint32_t offset = static_cast<std::uint32_t>(6 + 16 * entries.size());
  for (const IconEntry& e : entries) {
    out.push_back(static_cast<uchar>(e.width >= 256 ? 0 : e.width));
    out.push_back(static_cast<uchar>(e.height >= 256 ? 0 : e.height));
    out.push_back(0); // color count
    out.push_back(0); // reserved
    PutLe16(out, 1);  // planes
    PutLe16(out, static_cast<std::uint32_t>(e.bits));
    PutLe32(out, static_cast<std::uint32_t>(e.payload.size()));
    PutLe32(out, offset);
    offset += static_cast<std::uint32_t>(e.payload.size());
  }
  for (const IconEntry& e : entries) out.insert(out.end(), e.payload.begin(), e.payload.end());
  return out;
}

// BITMAPINFOHEADER as stored inside an icon: height covers XOR image + AND mask.
std::vector<uchar> IconInfoHeader(int width, int height, int bits)
{
  std::vector<uchar> out;
  PutLe32(out, 40);
  PutLe32(out, static_cast<std::uint32_t>(width));
  PutLe32(out, static_cast<std::uint32_t>(height * 2));
  PutLe16(out, 1);
  PutLe16(out, static_cast<std::uint32_t>(bits));
  for (int i = 0; i < 6; ++i) PutLe32(out, 0);
  return out;
}

std::vector<uchar> EncodePng(const cv::Mat& img)
{
  std::vector<uchar> png;
  cv::imencode(".png", img, png);
  return png;
}

bool WriteBytes(const fs::path& path, const std::vector<uchar>& bytes)
{
  std::ofstream out(path, std::ios::binary);
  for (uchar b : bytes) out.put(static_cast<char>(b));
  return static_cast<bool>(out);
}

bool SameImage(const cv::Mat& a, const cv::Mat& b)
{
  if (a.size() != b.size() || a.type() != b.type()) return false;
  cv::Mat diff;
  cv::absdiff(a, b, diff);
  return cv::countNonZero(diff.reshape(1)) == 0;
}

cv::Mat MakeBgra(int w, int h, int seed)
{
  cv::Mat img(h, w, CV_8UC4);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      img.at<cv::Vec4b>(y, x) = cv::Vec4b(static_cast<uchar>(seed + 30 * x), static_cast<uchar>(seed + 50 * y),
                                          static_cast<uchar>(200 - seed), static_cast<uchar>(64 + 60 * x));
    }
  }
  return img;
}

} // namespace

static void TestIcoWithPngEntry()
{
  const fs::path dir = MakeTempPath("paletteforge_ico_png");
  fs::create_directories(dir);

  const cv::Mat icon = MakeBgra(5, 3, 10);
  ASSERT_TRUE(WriteBytes(dir / "app.ico", BuildIco({{5, 3, 32, EncodePng(icon)}})));

  cv::Mat loaded;
  std::string err;
  ASSERT_TRUE(ImageLoader::Load((dir / "app.ico").string(), loaded, err));
  EXPECT_TRUE(err.empty());
  EXPECT_TRUE(SameImage(loaded, icon));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

static void TestIcoPicksLargestEntry()
{
  const fs::path dir = MakeTempPath("paletteforge_ico_sizes");
  fs::create_directories(dir);

  const cv::Mat small = MakeBgra(4, 4, 0);
  const cv::Mat large = MakeBgra(8, 6, 40);
  ASSERT_TRUE(WriteBytes(dir / "multi.ICO",
                         BuildIco({{4, 4, 32, EncodePng(small)}, {8, 6, 32, EncodePng(large)}})));

  cv::Mat loaded;
  std::string err;
  ASSERT_TRUE(ImageLoader::Load((dir / "multi.ICO").string(), loaded, err));
  EXPECT_TRUE(SameImage(loaded, large));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

static void TestIcoWith32BitBitmap()
{
  const fs::path dir = MakeTempPath("paletteforge_ico_bgra");
  fs::create_directories(dir);

  const cv::Mat icon = MakeBgra(3, 2, 20);
  std::vector<uchar> dib = IconInfoHeader(3, 2, 32);
  for (int y = icon.rows - 1; y >= 0; --y) {
    const uchar* row = icon.ptr<uchar>(y);
    dib.insert(dib.end(), row, row + icon.cols * 4);
  }
  dib.insert(dib.end(), 2 * 4, 0); // AND mask, ignored when alpha is present

  ASSERT_TRUE(WriteBytes(dir / "bgra.ico", BuildIco({{3, 2, 32, dib}})));

  cv::Mat loaded;
  std::string err;
  ASSERT_TRUE(ImageLoader::Load((dir / "bgra.ico").string(), loaded, err));
  EXPECT_TRUE(SameImage(loaded, icon));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

static void TestIcoWith24BitBitmapAndMask()
{
  const fs::path dir = MakeTempPath("paletteforge_ico_mask");
  fs::create_directories(dir);

  // 2x2, top row blue/green, bottom row red/white. Rows are padded to 8 bytes.
  const cv::Vec3b top[2] = {cv::Vec3b(255, 0, 0), cv::Vec3b(0, 255, 0)};
  const cv::Vec3b bottom[2] = {cv::Vec3b(0, 0, 255), cv::Vec3b(255, 255, 255)};
  std::vector<uchar> dib = IconInfoHeader(2, 2, 24);
  for (const cv::Vec3b* row : {bottom, top}) {
    for (int x = 0; x < 2; ++x) dib.insert(dib.end(), {row[x][0], row[x][1], row[x][2]});
    dib.insert(dib.end(), 2, 0);
  }
  // AND mask rows, bottom-up: only the top-left pixel is transparent.
  dib.insert(dib.end(), {0x00, 0, 0, 0});
  dib.insert(dib.end(), {0x80, 0, 0, 0});

  ASSERT_TRUE(WriteBytes(dir / "masked.ico", BuildIco({{2, 2, 24, dib}})));

  cv::Mat loaded;
  std::string err;
  ASSERT_TRUE(ImageLoader::Load((dir / "masked.ico").string(), loaded, err));
  ASSERT_TRUE(loaded.type() == CV_8UC4);
  ASSERT_TRUE(loaded.rows == 2 && loaded.cols == 2);

  EXPECT_EQ(loaded.at<cv::Vec4b>(0, 0), cv::Vec4b(255, 0, 0, 0));
  EXPECT_EQ(loaded.at<cv::Vec4b>(0, 1), cv::Vec4b(0, 255, 0, 255));
  EXPECT_EQ(loaded.at<cv::Vec4b>(1, 0), cv::Vec4b(0, 0, 255, 255));
  EXPECT_EQ(loaded.at<cv::Vec4b>(1, 1), cv::Vec4b(255, 255, 255, 255));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

static void TestBrokenIcoIsRejected()
{
  const fs::path dir = MakeTempPath("paletteforge_ico_broken");
  fs::create_directories(dir);

  // Directory entry points past the end of the file.
  std::vector<uchar> bytes = BuildIco({{4, 4, 32, EncodePng(MakeBgra(4, 4, 0))}});
  bytes.resize(bytes.size() - 10);
  ASSERT_TRUE(WriteBytes(dir / "cut.ico", bytes));

  cv::Mat loaded;
  std::string err;
  EXPECT_FALSE(ImageLoader::Load((dir / "cut.ico").string(), loaded, err));
  EXPECT_FALSE(err.empty());
  EXPECT_TRUE(loaded.empty());

  ASSERT_TRUE(WriteBytes(dir / "text.ico", {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'c', 'o', 'n'}));
  EXPECT_FALSE(ImageLoader::Load((dir / "text.ico").string(), loaded, err));
  EXPECT_FALSE(err.empty());

  EXPECT_FALSE(ImageLoader::Load((dir / "missing.ico").string(), loaded, err));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

static void TestSaveByExtension()
{
  const fs::path dir = MakeTempPath("paletteforge_save");
  fs::create_directories(dir);

  const cv::Mat img = MakeBgra(6, 4, 5);
  std::string err;
  cv::Mat loaded;

  // Lossless formats with alpha round-trip exactly.
  ASSERT_TRUE(ImageLoader::Save((dir / "a.png").string(), img, err));
  ASSERT_TRUE(ImageLoader::Load((dir / "a.png").string(), loaded, err));
  EXPECT_TRUE(SameImage(loaded, img));

  ASSERT_TRUE(ImageLoader::Save((dir / "a.tif").string(), img, err));
  ASSERT_TRUE(ImageLoader::Load((dir / "a.tif").string(), loaded, err));
  EXPECT_TRUE(SameImage(loaded, img));

  // JPEG spellings OpenCV does not know are still written as JPEG, alpha dropped.
  ASSERT_TRUE(ImageLoader::Save((dir / "a.jfif").string(), img, err));
  ASSERT_TRUE(ImageLoader::Load((dir / "a.jfif").string(), loaded, err));
  EXPECT_EQ(loaded.channels(), 3);
  EXPECT_EQ(loaded.cols, 6);

  ASSERT_TRUE(ImageLoader::Save((dir / "a.BMP").string(), img, err));
  ASSERT_TRUE(ImageLoader::Load((dir / "a.BMP").string(), loaded, err));
  EXPECT_EQ(loaded.channels(), 3);

  EXPECT_FALSE(ImageLoader::Save((dir / "noext").string(), img, err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(ImageLoader::Save((dir / "b.png").string(), cv::Mat(), err));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

static void TestSupportedExtensions()
{
  EXPECT_TRUE(ImageLoader::IsSupportedImagePath("x/Photo.JPG_LARGE"));
  EXPECT_TRUE(ImageLoader::IsSupportedImagePath("icon.ico"));
  EXPECT_TRUE(ImageLoader::IsSupportedImagePath("scan.TIFF"));
  EXPECT_FALSE(ImageLoader::IsSupportedImagePath("notes.txt"));
  EXPECT_FALSE(ImageLoader::IsSupportedImagePath("png"));
  EXPECT_EQ(ImageLoader::LowerExtension("a/B.PnG"), std::string(".png"));
}

int main()
{
  TestIcoWithPngEntry();
  TestIcoPicksLargestEntry();
  TestIcoWith32BitBitmap();
  TestIcoWith24BitBitmapAndMask();
  TestBrokenIcoIsRejected();
  TestSaveByExtension();
  TestSupportedExtensions();

  return ReportAndExit("ImageLoaderTests");
}
