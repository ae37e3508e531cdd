#include "PixelPipeline.h"

#include "ImageLoader.h"
#include "PaletteBuilder.h"
#include "PixelArtError.h"
#include "Pixelator.h"
#include "Sharpener.h"

#include <filesystem>
#include <utility>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

PixelPipeline::PixelPipeline(const PixelationConfig& config, const PaletteLibrary& library)
    : config_(config), library_(library) {
  config_.Validate();
  clusterer_ = MakeClusterer(config_.clusterMethod, config_.seed);

  switch (config_.paletteSource) {
    case PaletteSource::FromInput:
      break;
    case PaletteSource::FromReference:
      sharedPalette_ = PaletteBuilder::BuildFromFile(config_.palettePath, PaletteBuilder::Mode::FromReference,
                                                     config_.maxColors, *clusterer_);
      hasSharedPalette_ = true;
      break;
    case PaletteSource::Predefined:
      // Presets are stored brightness-sorted; truncation keeps the darkest maxColors.
      sharedPalette_ = PaletteBuilder::Finalize(config_.palettePath.empty()
                                                    ? library_.Get(config_.paletteName)
                                                    : PaletteBuilder::LoadPalette(config_.palettePath),
                                                config_.maxColors);
      hasSharedPalette_ = true;
      break;
  }

  if (hasSharedPalette_) {
    spdlog::info("Using {} palette with {} color(s)", ToString(config_.paletteSource), sharedPalette_.size());
  }
}

Palette PixelPipeline::ResolvePalette(const cv::Mat& image) const {
  if (hasSharedPalette_) return sharedPalette_;

  // Cluster the block representatives, i.e. the colors that will be mapped.
  const int blockSize = Pixelator::BlockSize(config_.downscaleFactor);
  cv::Mat blocks = Pixelator::BuildBlockColorImage(ImageLoader::ToBgrOrBgra(image), blockSize);
  return PaletteBuilder::Build(blocks, PaletteBuilder::Mode::ExtractFromInput, config_.maxColors, *clusterer_);
}

cv::Mat PixelPipeline::ProcessImage(const cv::Mat& image, const std::atomic<bool>* cancel,
                                    Palette* usedPalette) const {
  cv::Mat work = ImageLoader::ToBgrOrBgra(image);
  if (work.empty()) {
    throw PixelArtError(ErrorKind::UnsupportedFormat, "input image is empty or has an unsupported layout");
  }

  if (config_.sharpenAmount != 0 && config_.sharpenStage == SharpenStage::Before) {
    work = Sharpener::Sharpen(work, config_.sharpenAmount);
  }

  Palette palette = ResolvePalette(work);
  cv::Mat out = Pixelator::Pixelate(work, config_, palette, cancel);

  if (config_.sharpenAmount != 0 && config_.sharpenStage == SharpenStage::After) {
    out = Sharpener::Sharpen(out, config_.sharpenAmount);
  }

  if (usedPalette) *usedPalette = std::move(palette);
  return out;
}

void PixelPipeline::ProcessFile(const std::string& inputPath, const std::string& outputPath,
                                const std::atomic<bool>* cancel) const {
  if (!ImageLoader::IsSupportedImagePath(inputPath)) {
    throw PixelArtError(ErrorKind::UnsupportedFormat, "unsupported file extension: " + inputPath);
  }

  cv::Mat input;
  std::string err;
  if (!ImageLoader::Load(inputPath, input, err)) {
    throw PixelArtError(ErrorKind::UnsupportedFormat, err);
  }

  Palette used;
  cv::Mat output = ProcessImage(input, cancel, &used);

  const fs::path parent = fs::path(outputPath).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      throw PixelArtError(ErrorKind::WriteFailed, "cannot create " + parent.string() + ": " + ec.message());
    }
  }

  if (!ImageLoader::Save(outputPath, output, err)) {
    throw PixelArtError(ErrorKind::WriteFailed, err);
  }

  if (config_.savePalette) {
    const std::string palettePath = PalettePathFor(outputPath);
    if (!ImageLoader::SavePaletteStrip(palettePath, used, err)) {
      throw PixelArtError(ErrorKind::WriteFailed, err);
    }
    spdlog::debug("Palette saved: {}", palettePath);
  }

  spdlog::debug("Processed {} -> {} ({}x{}, {} colors)", inputPath, outputPath, output.cols, output.rows,
                used.size());
}

std::string PixelPipeline::PalettePathFor(const std::string& outputPath) {
  // a.png and a.jpg in one folder must not share a strip.
  const fs::path out(outputPath);
  std::string ext = ImageLoader::LowerExtension(outputPath);
  if (!ext.empty()) ext = "_" + ext.substr(1);
  return (out.parent_path() / (out.stem().string() + ext + "_palette.png")).string();
}
