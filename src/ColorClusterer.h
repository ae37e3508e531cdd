#pragma once

#include "PixelTypes.h"

#include <opencv2/core.hpp>

#include <cstdint>
#include <memory>
#include <vector>

// ColorClusterer: reduces a set of colors to at most K representatives.
// Implementations must be deterministic for a given seed so that palettes are
// reproducible across runs. Returned centroids are rounded to integer channel
// values; their order is backend-specific (PaletteBuilder sorts afterwards).
class ColorClusterer {
public:
  virtual ~ColorClusterer() = default;

  // colors may contain duplicates (they act as weights). k >= 1.
  // If colors holds k or fewer distinct values they are returned as-is.
  virtual std::vector<cv::Vec3b> Fit(const std::vector<cv::Vec3b>& colors, int k) const = 0;
};

// K-means in RGB space (cv::kmeans, k-means++ seeding).
class KMeansClusterer : public ColorClusterer {
public:
  explicit KMeansClusterer(std::uint32_t seed) : seed_(seed) {}
  std::vector<cv::Vec3b> Fit(const std::vector<cv::Vec3b>& colors, int k) const override;

private:
  std::uint32_t seed_;
};

// Median cut: repeatedly split the box with the widest channel range at its median.
class MedianCutClusterer : public ColorClusterer {
public:
  std::vector<cv::Vec3b> Fit(const std::vector<cv::Vec3b>& colors, int k) const override;
};

// Octree: 8-level RGB octree, least-populated deepest nodes merged until <= k leaves.
class OctreeClusterer : public ColorClusterer {
public:
  std::vector<cv::Vec3b> Fit(const std::vector<cv::Vec3b>& colors, int k) const override;
};

// Random: k distinct colors picked with a seeded RNG.
class RandomClusterer : public ColorClusterer {
public:
  explicit RandomClusterer(std::uint32_t seed) : seed_(seed) {}
  std::vector<cv::Vec3b> Fit(const std::vector<cv::Vec3b>& colors, int k) const override;

private:
  std::uint32_t seed_;
};

std::unique_ptr<ColorClusterer> MakeClusterer(ClusterMethod method, std::uint32_t seed);
