#include "ColorClusterer.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <unordered_set>
#include <utility>

namespace {
inline int ClampInt(int v, int lo, int hi) { return std::max(lo, std::min(v, hi)); }

inline std::uint32_t PackColor(const cv::Vec3b& c) {
  return (static_cast<std::uint32_t>(c[0]) << 16) | (static_cast<std::uint32_t>(c[1]) << 8) | c[2];
}

inline uchar RoundChannel(double v) {
  return static_cast<uchar>(ClampInt(static_cast<int>(std::lround(v)), 0, 255));
}

// Distinct colors in first-occurrence order.
std::vector<cv::Vec3b> DistinctColors(const std::vector<cv::Vec3b>& colors) {
  std::unordered_set<std::uint32_t> seen;
  std::vector<cv::Vec3b> out;
  for (const cv::Vec3b& c : colors) {
    if (seen.insert(PackColor(c)).second) out.push_back(c);
  }
  return out;
}

cv::Vec3b MeanColor(const std::vector<cv::Vec3b>& colors) {
  std::array<std::uint64_t, 3> sum{0, 0, 0};
  for (const cv::Vec3b& c : colors) {
    sum[0] += c[0];
    sum[1] += c[1];
    sum[2] += c[2];
  }
  const double n = static_cast<double>(colors.size());
  return cv::Vec3b(RoundChannel(sum[0] / n), RoundChannel(sum[1] / n), RoundChannel(sum[2] / n));
}

// cv::kmeans draws from the calling thread's cv::theRNG(). Swap in a seeded
// generator for the duration of the call and put the caller's state back.
class ScopedRngSeed {
public:
  explicit ScopedRngSeed(std::uint64_t seed) : saved_(cv::theRNG()) { cv::theRNG() = cv::RNG(seed); }
  ~ScopedRngSeed() { cv::theRNG() = saved_; }

  ScopedRngSeed(const ScopedRngSeed&) = delete;
  ScopedRngSeed& operator=(const ScopedRngSeed&) = delete;

private:
  cv::RNG saved_;
};

// Upper bound on k-means input rows. Larger inputs are strided down.
constexpr size_t kMaxKMeansSamples = 1u << 16;
} // namespace

std::vector<cv::Vec3b> KMeansClusterer::Fit(const std::vector<cv::Vec3b>& colors, int k) const {
  std::vector<cv::Vec3b> distinct = DistinctColors(colors);
  k = std::max(1, k);
  if (static_cast<int>(distinct.size()) <= k) return distinct;

  const size_t stride = (colors.size() + kMaxKMeansSamples - 1) / kMaxKMeansSamples;
  const int total = static_cast<int>((colors.size() + stride - 1) / stride);

  cv::Mat samples(total, 3, CV_32F);
  for (int i = 0; i < total; ++i) {
    const cv::Vec3b& c = colors[static_cast<size_t>(i) * stride];
    samples.at<float>(i, 0) = static_cast<float>(c[0]);
    samples.at<float>(i, 1) = static_cast<float>(c[1]);
    samples.at<float>(i, 2) = static_cast<float>(c[2]);
  }
  k = std::min(k, total);

  cv::Mat labels;
  cv::Mat centers;
  const int attempts = 3;
  cv::TermCriteria criteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER, 30, 1.0);
  {
    ScopedRngSeed seeded(seed_);
    cv::kmeans(samples, k, labels, criteria, attempts, cv::KMEANS_PP_CENTERS, centers);
  }

  std::vector<cv::Vec3b> out;
  out.reserve(static_cast<size_t>(k));
  for (int i = 0; i < centers.rows; ++i) {
    out.emplace_back(RoundChannel(centers.at<float>(i, 0)),
                     RoundChannel(centers.at<float>(i, 1)),
                     RoundChannel(centers.at<float>(i, 2)));
  }
  return out;
}

std::vector<cv::Vec3b> MedianCutClusterer::Fit(const std::vector<cv::Vec3b>& colors, int k) const {
  std::vector<cv::Vec3b> distinct = DistinctColors(colors);
  k = std::max(1, k);
  if (static_cast<int>(distinct.size()) <= k) return distinct;

  struct Box {
    std::vector<cv::Vec3b> colors;
    int axis = 0;
    int range = 0;
  };

  auto measure = [](Box& box) {
    std::array<int, 3> lo{255, 255, 255};
    std::array<int, 3> hi{0, 0, 0};
    for (const cv::Vec3b& c : box.colors) {
      for (int ch = 0; ch < 3; ++ch) {
        lo[ch] = std::min<int>(lo[ch], c[ch]);
        hi[ch] = std::max<int>(hi[ch], c[ch]);
      }
    }
    box.axis = 0;
    box.range = hi[0] - lo[0];
    for (int ch = 1; ch < 3; ++ch) {
      if (hi[ch] - lo[ch] > box.range) {
        box.range = hi[ch] - lo[ch];
        box.axis = ch;
      }
    }
  };

  std::vector<Box> boxes(1);
  boxes[0].colors = colors;
  measure(boxes[0]);

  while (static_cast<int>(boxes.size()) < k) {
    // Split the box with the widest range; first one wins on ties.
    int target = -1;
    for (size_t i = 0; i < boxes.size(); ++i) {
      if (boxes[i].range > 0 && (target < 0 || boxes[i].range > boxes[static_cast<size_t>(target)].range)) {
        target = static_cast<int>(i);
      }
    }
    if (target < 0) break;

    Box& box = boxes[static_cast<size_t>(target)];
    const int axis = box.axis;
    std::sort(box.colors.begin(), box.colors.end(), [axis](const cv::Vec3b& a, const cv::Vec3b& b) {
      if (a[axis] != b[axis]) return a[axis] < b[axis];
      return PackColor(a) < PackColor(b);
    });

    const size_t median = box.colors.size() / 2;
    Box upper;
    upper.colors.assign(box.colors.begin() + static_cast<std::ptrdiff_t>(median), box.colors.end());
    box.colors.resize(median);
    measure(box);
    measure(upper);
    boxes.push_back(std::move(upper));
  }

  std::vector<cv::Vec3b> out;
  out.reserve(boxes.size());
  for (const Box& box : boxes) out.push_back(MeanColor(box.colors));
  return out;
}

std::vector<cv::Vec3b> OctreeClusterer::Fit(const std::vector<cv::Vec3b>& colors, int k) const {
  std::vector<cv::Vec3b> distinct = DistinctColors(colors);
  k = std::max(1, k);
  if (static_cast<int>(distinct.size()) <= k) return distinct;

  constexpr int kDepth = 8;

  struct Node {
    std::array<std::uint64_t, 3> sum{0, 0, 0};
    std::uint64_t count = 0;
    std::array<int, 8> children{-1, -1, -1, -1, -1, -1, -1, -1};
    int childCount = 0;
    bool leaf = false;
  };

  std::vector<Node> nodes(1);
  // Internal nodes per level, in creation order.
  std::array<std::vector<int>, kDepth> reducible;
  reducible[0].push_back(0);
  int leafCount = 0;

  for (const cv::Vec3b& c : colors) {
    int idx = 0;
    nodes[0].count++;
    for (int level = 0; level < kDepth; ++level) {
      const int bit = 7 - level;
      const int slot = (((c[2] >> bit) & 1) << 2) | (((c[1] >> bit) & 1) << 1) | ((c[0] >> bit) & 1);
      int child = nodes[static_cast<size_t>(idx)].children[static_cast<size_t>(slot)];
      if (child < 0) {
        child = static_cast<int>(nodes.size());
        nodes.emplace_back();
        nodes[static_cast<size_t>(idx)].children[static_cast<size_t>(slot)] = child;
        nodes[static_cast<size_t>(idx)].childCount++;
        if (level + 1 == kDepth) {
          nodes[static_cast<size_t>(child)].leaf = true;
          ++leafCount;
        } else {
          reducible[static_cast<size_t>(level + 1)].push_back(child);
        }
      }
      idx = child;
      nodes[static_cast<size_t>(idx)].count++;
    }
    Node& leaf = nodes[static_cast<size_t>(idx)];
    leaf.sum[0] += c[0];
    leaf.sum[1] += c[1];
    leaf.sum[2] += c[2];
  }

  // Counts are final once every color is inserted, so each level is ordered
  // once by population (creation order among equals) and consumed front to back.
  for (std::vector<int>& candidates : reducible) {
    std::stable_sort(candidates.begin(), candidates.end(), [&nodes](int a, int b) {
      return nodes[static_cast<size_t>(a)].count < nodes[static_cast<size_t>(b)].count;
    });
  }
  std::array<size_t, kDepth> consumed{};

  // Merge from the deepest level up, least-populated node first. Children of a
  // node on the deepest non-empty level are always leaves.
  while (leafCount > k) {
    int level = kDepth - 1;
    while (level >= 0 &&
           consumed[static_cast<size_t>(level)] >= reducible[static_cast<size_t>(level)].size()) {
      --level;
    }
    if (level < 0) break;

    size_t& next = consumed[static_cast<size_t>(level)];
    Node& node = nodes[static_cast<size_t>(reducible[static_cast<size_t>(level)][next])];
    ++next;

    for (int& child : node.children) {
      if (child < 0) continue;
      const Node& leaf = nodes[static_cast<size_t>(child)];
      node.sum[0] += leaf.sum[0];
      node.sum[1] += leaf.sum[1];
      node.sum[2] += leaf.sum[2];
      child = -1;
    }
    leafCount -= node.childCount - 1;
    node.childCount = 0;
    node.leaf = true;
  }

  std::vector<cv::Vec3b> out;
  std::vector<int> stack{0};
  while (!stack.empty()) {
    const int idx = stack.back();
    stack.pop_back();
    const Node& node = nodes[static_cast<size_t>(idx)];
    if (node.leaf) {
      const double n = static_cast<double>(node.count);
      out.emplace_back(RoundChannel(node.sum[0] / n), RoundChannel(node.sum[1] / n), RoundChannel(node.sum[2] / n));
      continue;
    }
    for (int slot = 7; slot >= 0; --slot) {
      if (node.children[static_cast<size_t>(slot)] >= 0) stack.push_back(node.children[static_cast<size_t>(slot)]);
    }
  }
  return out;
}

std::vector<cv::Vec3b> RandomClusterer::Fit(const std::vector<cv::Vec3b>& colors, int k) const {
  std::vector<cv::Vec3b> distinct = DistinctColors(colors);
  k = std::max(1, k);
  if (static_cast<int>(distinct.size()) <= k) return distinct;

  cv::RNG rng(seed_);
  for (int i = static_cast<int>(distinct.size()) - 1; i > 0; --i) {
    const int j = rng.uniform(0, i + 1);
    std::swap(distinct[static_cast<size_t>(i)], distinct[static_cast<size_t>(j)]);
  }
  distinct.resize(static_cast<size_t>(k));
  return distinct;
}

std::unique_ptr<ColorClusterer> MakeClusterer(ClusterMethod method, std::uint32_t seed) {
  switch (method) {
    case ClusterMethod::MedianCut: return std::make_unique<MedianCutClusterer>();
    case ClusterMethod::Octree: return std::make_unique<OctreeClusterer>();
    case ClusterMethod::Random: return std::make_unique<RandomClusterer>(seed);
    case ClusterMethod::KMeans: break;
  }
  return std::make_unique<KMeansClusterer>(seed);
}
