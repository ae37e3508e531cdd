#include "BatchRunner.h"

#include "ImageLoader.h"
#include "PixelArtError.h"
#include "PixelPipeline.h"

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <thread>

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {
bool IsCancelled(const std::atomic<bool>* cancel) {
  return cancel && cancel->load(std::memory_order_relaxed);
}

// True when path is root itself or lies below it.
bool IsWithin(const fs::path& path, const fs::path& root) {
  const fs::path rel = path.lexically_relative(root);
  return !rel.empty() && *rel.begin() != "..";
}
} // namespace

std::string BatchRunner::SingleFileOutputPath(const std::string& inputFile, const std::string& outputRoot) {
  if (ImageLoader::IsSupportedImagePath(outputRoot)) return outputRoot;
  return (fs::path(outputRoot) / fs::path(inputFile).filename()).string();
}

std::vector<std::string> BatchRunner::DiscoverImages(const std::string& inputRoot, const std::string& excludeRoot) {
  std::vector<std::string> found;
  std::error_code ec;
  const fs::path root = fs::weakly_canonical(inputRoot, ec);
  const fs::path exclude = excludeRoot.empty() ? fs::path() : fs::weakly_canonical(excludeRoot, ec);
  const bool excludeInside = !exclude.empty() && exclude != root && IsWithin(exclude, root);

  auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    spdlog::warn("Cannot read directory {}: {}", inputRoot, ec.message());
    return found;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      spdlog::warn("Directory walk error under {}: {}", inputRoot, ec.message());
      break;
    }
    const fs::directory_entry& entry = *it;
    if (excludeInside && IsWithin(entry.path(), exclude)) {
      if (entry.is_directory(ec)) it.disable_recursion_pending();
      continue;
    }
    if (!entry.is_regular_file(ec)) continue;
    if (!ImageLoader::IsSupportedImagePath(entry.path().string())) {
      spdlog::debug("Skipping non-image file {}", entry.path().string());
      continue;
    }
    found.push_back(entry.path().lexically_relative(root).string());
  }

  std::sort(found.begin(), found.end());
  return found;
}

BatchReport BatchRunner::Run(const std::string& inputRoot, const std::string& outputRoot,
                             const PixelationConfig& config, const PaletteLibrary& library,
                             const std::atomic<bool>* cancel, const FileDoneCallback& onFileDone) {
  std::error_code ec;
  if (!fs::exists(inputRoot, ec)) {
    throw PixelArtError(ErrorKind::InvalidConfig, "input path does not exist: " + inputRoot);
  }

  // Builds any shared palette once, before workers start.
  const PixelPipeline pipeline(config, library);
  BatchReport report;

  if (!fs::is_directory(inputRoot, ec)) {
    const std::string outputPath = SingleFileOutputPath(inputRoot, outputRoot);
    report.discovered = 1;
    if (IsCancelled(cancel)) {
      report.cancelled = 1;
      return report;
    }
    pipeline.ProcessFile(inputRoot, outputPath, cancel);
    report.written = 1;
    spdlog::info("Saved: {}", outputPath);
    return report;
  }

  const std::vector<std::string> files = DiscoverImages(inputRoot, outputRoot);
  report.discovered = static_cast<int>(files.size());
  spdlog::info("Found {} image(s) under {}", files.size(), inputRoot);
  if (files.empty()) return report;

  std::atomic<size_t> next{0};
  std::mutex reportMutex;

  auto worker = [&]() {
    while (!IsCancelled(cancel)) {
      const size_t idx = next.fetch_add(1);
      if (idx >= files.size()) return;

      const std::string& rel = files[idx];
      const std::string inPath = (fs::path(inputRoot) / rel).string();
      const std::string outPath = (fs::path(outputRoot) / rel).string();

      std::string failure;
      bool cancelled = false;
      try {
        pipeline.ProcessFile(inPath, outPath, cancel);
      } catch (const PixelArtError& e) {
        if (e.kind() == ErrorKind::Cancelled) {
          cancelled = true;
        } else {
          failure = e.what();
        }
      } catch (const cv::Exception& e) {
        failure = std::string("OpenCV error: ") + e.what();
      } catch (const std::exception& e) {
        failure = e.what();
      }

      std::lock_guard<std::mutex> lock(reportMutex);
      if (cancelled) {
        ++report.cancelled;
      } else if (!failure.empty()) {
        ++report.failed;
        report.failures.push_back(rel + ": " + failure);
        spdlog::warn("Failed {}: {}", rel, failure);
      } else {
        ++report.written;
        spdlog::info("[{}/{}] {}", report.written + report.failed, files.size(), rel);
      }
      if (onFileDone && !cancelled) onFileDone(rel, failure.empty());
    }
  };

  const int threadCount = std::max(1, std::min(config.workers, static_cast<int>(files.size())));
  if (threadCount == 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(threadCount));
    for (int i = 0; i < threadCount; ++i) threads.emplace_back(worker);
    for (std::thread& t : threads) t.join();
  }

  // Files never started after cancellation count as cancelled too.
  report.cancelled = report.discovered - report.written - report.failed;
  std::sort(report.failures.begin(), report.failures.end());

  if (report.cancelled > 0) {
    spdlog::warn("Batch cancelled: {} written, {} failed, {} not processed", report.written, report.failed,
                 report.cancelled);
  } else {
    spdlog::info("Batch done: {} written, {} failed", report.written, report.failed);
  }
  return report;
}
