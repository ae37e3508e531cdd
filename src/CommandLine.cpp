#include "CommandLine.h"

#include "PaletteLibrary.h"
#include "PixelArtError.h"

#include <cstdint>

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>

namespace {
bool ParseInt(const std::string& text, int& out) {
  if (text.empty()) return false;
  try {
    size_t used = 0;
    const long v = std::stol(text, &used, 10);
    if (used != text.size()) return false;
    if (v < -2147483647L - 1 || v > 2147483647L) return false;
    out = static_cast<int>(v);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}
} // namespace

void CommandLine::PrintUsage(std::ostream& os, const char* prog) {
  os << "Usage: " << prog << " <input> <output> [options]\n"
     << "       " << prog << " --list-presets [--palette-dir DIR]\n"
     << "\n"
     << "Turn an image, or every image under a folder, into palette-limited pixel art.\n"
     << "A folder input is processed recursively and mirrored under <output>.\n"
     << "\n"
     << "Options:\n"
     << "  --downscale N          Block size in pixels, 0/1 disables (default: 4)\n"
     << "  --mode normal|blend    Nearest color or blend of the two nearest (default: normal)\n"
     << "  --sharpen N            -100..100, negative softens, 0 disables (default: 0)\n"
     << "  --sharpen-stage S      before|after pixelation (default: after)\n"
     << "  --colors N             Palette size 1..256 (default: 32, presets: all their colors)\n"
     << "  --method M             kmeans|mediancut|octree|random (default: kmeans)\n"
     << "  --seed N               Clustering seed (default: 42)\n"
     << "  --reference PATH       Build the palette from another image\n"
     << "  --preset NAME          Use a predefined palette\n"
     << "  --preset-file PATH     Use a palette strip image (1xN PNG)\n"
     << "  --palette-dir DIR      Add palette strips from DIR to the presets\n"
     << "  --no-restore           Write the coarse grid instead of full-size blocks\n"
     << "  --save-palette         Also write <name>_<ext>_palette.png beside each output\n"
     << "  --jobs N               Worker threads for folder input (default: 1)\n"
     << "  --list-presets         Print available preset names and exit\n"
     << "  --verbose              Debug logging\n"
     << "  --help                 Show this help message\n";
}

bool CommandLine::Parse(int argc, const char* const* argv, CommandLineOptions& out, std::string& outError) {
  out = CommandLineOptions();
  outError.clear();
  PixelationConfig& config = out.config;
  bool colorsGiven = false;
  int positional = 0;

  auto needValue = [&](int& i, const std::string& flag, std::string& value) {
    if (i + 1 >= argc) {
      outError = "Missing value for " + flag;
      return false;
    }
    value = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; i++) {
    const std::string arg = argv[i];
    std::string value;
    int number = 0;

    if (arg == "--help" || arg == "-h") {
      out.showHelp = true;
    } else if (arg == "--verbose" || arg == "-v") {
      out.verbose = true;
    } else if (arg == "--list-presets") {
      out.listPresets = true;
    } else if (arg == "--no-restore") {
      config.restoreSize = false;
    } else if (arg == "--save-palette") {
      config.savePalette = true;
    } else if (arg == "--downscale" || arg == "--sharpen" || arg == "--colors" || arg == "--seed" ||
               arg == "--jobs") {
      if (!needValue(i, arg, value)) return false;
      if (!ParseInt(value, number)) {
        outError = "Invalid number for " + arg + ": " + value;
        return false;
      }
      if (arg == "--downscale") config.downscaleFactor = number;
      else if (arg == "--sharpen") config.sharpenAmount = number;
      else if (arg == "--seed") config.seed = static_cast<std::uint32_t>(number);
      else if (arg == "--jobs") config.workers = number;
      else {
        config.maxColors = number;
        colorsGiven = true;
      }
    } else if (arg == "--mode") {
      if (!needValue(i, arg, value)) return false;
      if (!ParseColorMode(value, config.colorMode)) {
        outError = "Unknown color mode: " + value;
        return false;
      }
    } else if (arg == "--method") {
      if (!needValue(i, arg, value)) return false;
      if (!ParseClusterMethod(value, config.clusterMethod)) {
        outError = "Unknown clustering method: " + value;
        return false;
      }
    } else if (arg == "--sharpen-stage") {
      if (!needValue(i, arg, value)) return false;
      if (!ParseSharpenStage(value, config.sharpenStage)) {
        outError = "Unknown sharpen stage: " + value;
        return false;
      }
    } else if (arg == "--reference") {
      if (!needValue(i, arg, config.palettePath)) return false;
      config.paletteSource = PaletteSource::FromReference;
    } else if (arg == "--preset") {
      if (!needValue(i, arg, config.paletteName)) return false;
      config.palettePath.clear();
      config.paletteSource = PaletteSource::Predefined;
    } else if (arg == "--preset-file") {
      if (!needValue(i, arg, config.palettePath)) return false;
      config.paletteSource = PaletteSource::Predefined;
    } else if (arg == "--palette-dir") {
      if (!needValue(i, arg, out.paletteDir)) return false;
    } else if (!arg.empty() && arg[0] != '-') {
      if (positional == 0) out.inputPath = arg;
      else if (positional == 1) out.outputPath = arg;
      else {
        outError = "Unexpected argument: " + arg;
        return false;
      }
      ++positional;
    } else {
      outError = "Unknown option: " + arg;
      return false;
    }
  }

  if (config.paletteSource == PaletteSource::Predefined && !colorsGiven) {
    config.maxColors = kMaxPaletteSize;
  }
  return true;
}

int CommandLine::ExitCodeFor(const BatchReport& report) {
  if (report.cancelled > 0) return kExitCancelled;
  if (report.failed > 0) return kExitPartial;
  return kExitOk;
}

int CommandLine::ExitCodeFor(const std::exception& error) {
  const PixelArtError* pixelError = dynamic_cast<const PixelArtError*>(&error);
  if (!pixelError) return kExitError;
  switch (pixelError->kind()) {
    case ErrorKind::InvalidConfig: return kExitUsage;
    case ErrorKind::Cancelled: return kExitCancelled;
    default: return kExitError;
  }
}

int CommandLine::Run(const CommandLineOptions& options, const std::atomic<bool>* cancel, std::ostream& out) {
  PaletteLibrary library = PaletteLibrary::WithBuiltins();
  try {
    if (!options.paletteDir.empty()) library.LoadDirectory(options.paletteDir);
  } catch (const PixelArtError& e) {
    spdlog::error("{}", e.what());
    return kExitUsage;
  }

  if (options.listPresets) {
    for (const std::string& name : library.Names()) {
      out << name << " (" << library.Get(name).size() << " colors)\n";
    }
    return kExitOk;
  }

  if (options.inputPath.empty() || options.outputPath.empty()) {
    spdlog::error("Input and output paths are required.");
    return kExitUsage;
  }

  try {
    return ExitCodeFor(BatchRunner::Run(options.inputPath, options.outputPath, options.config, library, cancel));
  } catch (const cv::Exception& e) {
    spdlog::error("OpenCV error: {}", e.what());
    return ExitCodeFor(e);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return ExitCodeFor(e);
  }
}
