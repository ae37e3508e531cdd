#include "ImageLoader.h"
#include "PaletteBuilder.h"
#include "PaletteLibrary.h"
#include "PixelArtError.h"
#include "PixelPipeline.h"
#include "Pixelator.h"
#include "Sharpener.h"
#include "TestHarness.h"

#include <cstdint>
#include <filesystem>
#include <set>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

// Vertical step edge: columns [0, 4) are 100, columns [4, 8) are 150.
cv::Mat MakeStepImage()
{
  cv::Mat img(8, 8, CV_8UC3, cv::Scalar(100, 100, 100));
  img(cv::Rect(4, 0, 4, 8)).setTo(cv::Scalar(150, 150, 150));
  return img;
}

cv::Mat MakeGradient(int w, int h)
{
  cv::Mat img(h, w, CV_8UC3);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      img.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x * 255 / (w - 1)),
                                          static_cast<uchar>(y * 255 / (h - 1)), 60);
    }
  }
  return img;
}

// Every gray level, so pixelation itself never moves a gray value.
PaletteLibrary MakeGrayLibrary()
{
  Palette grays;
  for (int v = 0; v < 256; ++v) grays.emplace_back(static_cast<uchar>(v), static_cast<uchar>(v), static_cast<uchar>(v));
  PaletteLibrary library;
  library.Add("Grays", grays);
  return library;
}

PixelationConfig GrayConfig(SharpenStage stage)
{
  PixelationConfig cfg;
  cfg.downscaleFactor = 4;
  cfg.sharpenAmount = 50;
  cfg.sharpenStage = stage;
  cfg.paletteSource = PaletteSource::Predefined;
  cfg.paletteName = "Grays";
  cfg.maxColors = kMaxPaletteSize;
  return cfg;
}

bool SameImage(const cv::Mat& a, const cv::Mat& b)
{
  if (a.size() != b.size() || a.type() != b.type()) return false;
  cv::Mat diff;
  cv::absdiff(a, b, diff);
  return cv::countNonZero(diff.reshape(1)) == 0;
}

std::uint32_t Pack(const cv::Vec3b& c)
{
  return (static_cast<std::uint32_t>(c[0]) << 16) | (static_cast<std::uint32_t>(c[1]) << 8) | c[2];
}

bool AllPixelsIn(const cv::Mat& img, const Palette& palette)
{
  const std::set<std::uint32_t> allowed = [&palette] {
    std::set<std::uint32_t> s;
    for (const cv::Vec3b& c : palette) s.insert(Pack(c));
    return s;
  }();
  for (int y = 0; y < img.rows; ++y) {
    for (int x = 0; x < img.cols; ++x) {
      const cv::Vec3b c = img.at<cv::Vec3b>(y, x);
      if (allowed.count(Pack(c)) == 0) return false;
    }
  }
  return true;
}

} // namespace

static void TestSharpenAfterPixelation()
{
  const PaletteLibrary library = MakeGrayLibrary();
  const PixelationConfig cfg = GrayConfig(SharpenStage::After);
  const PixelPipeline pipeline(cfg, library);
  const cv::Mat img = MakeStepImage();

  const cv::Mat out = pipeline.ProcessImage(img);
  const cv::Mat expected = Sharpener::Sharpen(Pixelator::Pixelate(img, cfg, pipeline.SharedPalette()), 50);
  EXPECT_TRUE(SameImage(out, expected));

  // Block interiors are untouched; only the edge between the blocks is boosted.
  EXPECT_EQ(static_cast<int>(out.at<cv::Vec3b>(0, 0)[1]), 100);
  EXPECT_TRUE(out.at<cv::Vec3b>(0, 3)[1] < 100);
  EXPECT_TRUE(out.at<cv::Vec3b>(0, 4)[1] > 150);
}

static void TestSharpenBeforePixelation()
{
  const PaletteLibrary library = MakeGrayLibrary();
  const PixelationConfig cfg = GrayConfig(SharpenStage::Before);
  const PixelPipeline pipeline(cfg, library);
  const cv::Mat img = MakeStepImage();

  const cv::Mat out = pipeline.ProcessImage(img);
  const cv::Mat expected = Pixelator::Pixelate(Sharpener::Sharpen(img, 50), cfg, pipeline.SharedPalette());
  EXPECT_TRUE(SameImage(out, expected));

  // The undershoot at the edge is averaged into the whole left block, which
  // stays flat.
  const int left = out.at<cv::Vec3b>(0, 0)[1];
  EXPECT_TRUE(left < 100);
  EXPECT_EQ(static_cast<int>(out.at<cv::Vec3b>(7, 3)[1]), left);
  EXPECT_TRUE(out.at<cv::Vec3b>(0, 4)[1] > 150);

  const PixelPipeline after(GrayConfig(SharpenStage::After), library);
  EXPECT_FALSE(SameImage(out, after.ProcessImage(img)));
}

static void TestPresetIsTruncatedToMaxColors()
{
  const PaletteLibrary library = PaletteLibrary::WithBuiltins();
  PixelationConfig cfg;
  cfg.paletteSource = PaletteSource::Predefined;
  cfg.paletteName = "DMG";
  cfg.maxColors = 2;

  const PixelPipeline pipeline(cfg, library);
  ASSERT_TRUE(pipeline.HasSharedPalette());
  const Palette& full = library.Get("DMG");
  ASSERT_TRUE(full.size() == 8);
  ASSERT_TRUE(pipeline.SharedPalette().size() == 2);
  EXPECT_EQ(pipeline.SharedPalette()[0], full[0]);
  EXPECT_EQ(pipeline.SharedPalette()[1], full[1]);

  const cv::Mat out = pipeline.ProcessImage(MakeGradient(12, 12));
  EXPECT_TRUE(AllPixelsIn(out, pipeline.SharedPalette()));

  cfg.maxColors = kMaxPaletteSize;
  const PixelPipeline whole(cfg, library);
  EXPECT_TRUE(whole.SharedPalette() == full);
}

static void TestPresetFileIsTruncatedToMaxColors()
{
  const fs::path dir = MakeTempPath("paletteforge_presetfile");
  fs::create_directories(dir);

  const Palette strip{cv::Vec3b(250, 250, 250), cv::Vec3b(0, 0, 0), cv::Vec3b(0, 0, 200),
                      cv::Vec3b(0, 200, 0), cv::Vec3b(200, 0, 0), cv::Vec3b(90, 90, 90)};
  std::string err;
  ASSERT_TRUE(ImageLoader::SavePaletteStrip((dir / "six.png").string(), strip, err));

  PixelationConfig cfg;
  cfg.paletteSource = PaletteSource::Predefined;
  cfg.palettePath = (dir / "six.png").string();
  cfg.maxColors = 3;

  const PaletteLibrary empty;
  const PixelPipeline pipeline(cfg, empty);
  EXPECT_TRUE(pipeline.SharedPalette() == PaletteBuilder::Finalize(strip, 3));
  EXPECT_EQ(pipeline.SharedPalette().size(), static_cast<size_t>(3));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

static void TestReferencePalette()
{
  const fs::path dir = MakeTempPath("paletteforge_pipeline_ref");
  fs::create_directories(dir);

  const cv::Vec3b dark(30, 20, 10);
  const cv::Vec3b teal(180, 160, 20);
  const cv::Vec3b sand(120, 200, 230);
  cv::Mat reference(4, 4, CV_8UC3, cv::Scalar(dark[0], dark[1], dark[2]));
  reference(cv::Rect(0, 0, 2, 2)).setTo(cv::Scalar(teal[0], teal[1], teal[2]));
  reference(cv::Rect(2, 2, 2, 2)).setTo(cv::Scalar(sand[0], sand[1], sand[2]));
  std::string err;
  ASSERT_TRUE(ImageLoader::Save((dir / "ref.png").string(), reference, err));

  PixelationConfig cfg;
  cfg.paletteSource = PaletteSource::FromReference;
  cfg.palettePath = (dir / "ref.png").string();
  cfg.maxColors = 8;
  cfg.downscaleFactor = 3;

  const PaletteLibrary empty;
  const PixelPipeline pipeline(cfg, empty);
  ASSERT_TRUE(pipeline.HasSharedPalette());
  EXPECT_TRUE(pipeline.SharedPalette() == PaletteBuilder::Finalize({dark, teal, sand}, 8));

  Palette used;
  const cv::Mat out = pipeline.ProcessImage(MakeGradient(10, 9), nullptr, &used);
  EXPECT_TRUE(used == pipeline.SharedPalette());
  EXPECT_EQ(out.cols, 10);
  EXPECT_EQ(out.rows, 9);
  EXPECT_TRUE(AllPixelsIn(out, used));

  // A reference that cannot be decoded fails up front.
  cfg.palettePath = (dir / "missing.png").string();
  EXPECT_THROWS_KIND(PixelPipeline failing(cfg, empty), ErrorKind::InvalidPaletteSource);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

static void TestPaletteFromEachInput()
{
  PixelationConfig cfg;
  cfg.maxColors = 5;
  cfg.downscaleFactor = 2;

  const PaletteLibrary empty;
  const PixelPipeline pipeline(cfg, empty);
  EXPECT_FALSE(pipeline.HasSharedPalette());

  const cv::Mat img = MakeGradient(16, 16);
  const Palette p = pipeline.ResolvePalette(img);
  EXPECT_TRUE(!p.empty());
  EXPECT_TRUE(p.size() <= 5);

  Palette used;
  const cv::Mat out = pipeline.ProcessImage(img, nullptr, &used);
  EXPECT_TRUE(used == p);
  EXPECT_TRUE(AllPixelsIn(out, used));
}

static void TestPalettePathKeepsExtension()
{
  EXPECT_EQ(PixelPipeline::PalettePathFor("a.png"), std::string("a_png_palette.png"));
  EXPECT_EQ(PixelPipeline::PalettePathFor("a.JPG"), std::string("a_jpg_palette.png"));
  EXPECT_NE(PixelPipeline::PalettePathFor("a.png"), PixelPipeline::PalettePathFor("a.jpg"));
}

int main()
{
  spdlog::set_level(spdlog::level::off);

  TestSharpenAfterPixelation();
  TestSharpenBeforePixelation();
  TestPresetIsTruncatedToMaxColors();
  TestPresetFileIsTruncatedToMaxColors();
  TestReferencePalette();
  TestPaletteFromEachInput();
  TestPalettePathKeepsExtension();

  return ReportAndExit("PixelPipelineTests");
}
