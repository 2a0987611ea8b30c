/**
 * @file progress.hpp
 * @brief Weighted six-stage progress model with monotonic output and a
 *        sliding-window ETA.
 *
 * Stage weights (sum 100):
 *   initialization 5 | validation 15 | loading 20 | merging 40 |
 *   optimizing 15 | finalizing 5
 *
 * overall = sum(weights of completed stages) + weight(stage) * local / 100,
 * clamped to 99 until Stage::kComplete, and never lower than the last value
 * reported by the same tracker.
 */

#ifndef PDFMERGE_PROGRESS_HPP_
#define PDFMERGE_PROGRESS_HPP_

#include "pdfmerge/platform.hpp"

#include <cstdint>

#include <algorithm>
#include <deque>

namespace pdfmerge {

enum class Stage : uint8_t {
  kInitialization = 0,
  kValidation,
  kLoading,
  kMerging,
  kOptimizing,
  kFinalizing,
  kComplete,
};

static constexpr uint32_t kStageCount = 6U;
static constexpr uint32_t kStageWeights[kStageCount] = {5U, 15U, 20U, 40U, 15U, 5U};

inline const char* ToString(Stage s) noexcept {
  switch (s) {
    case Stage::kInitialization: return "initialization";
    case Stage::kValidation: return "validation";
    case Stage::kLoading: return "loading";
    case Stage::kMerging: return "merging";
    case Stage::kOptimizing: return "optimizing";
    case Stage::kFinalizing: return "finalizing";
    case Stage::kComplete: return "complete";
  }
  return "unknown";
}

struct ProgressSnapshot {
  Stage stage{Stage::kInitialization};
  double stage_progress{0.0};    ///< 0..100 within the stage
  double overall_progress{0.0};  ///< 0..100, non-decreasing within a run
  uint32_t file_index{0U};
  uint32_t total_files{0U};
  uint32_t pages_processed{0U};
  uint32_t total_pages{0U};
  uint64_t bytes_processed{0U};
  uint64_t total_bytes{0U};
  uint64_t elapsed_ms{0U};
  uint64_t eta_ms{0U};  ///< 0 when unknown
};

/// Injectable monotonic clock in microseconds.
using ProgressClockFn = uint64_t (*)(void* ctx);

class ProgressTracker final {
 public:
  static constexpr uint32_t kDefaultWindow = 8U;

  explicit ProgressTracker(uint32_t window = kDefaultWindow, ProgressClockFn clock = nullptr,
                           void* clock_ctx = nullptr) noexcept
      : window_(window < 2U ? 2U : window), clock_(clock), clock_ctx_(clock_ctx) {
    start_us_ = Now();
  }

  /// Pure weighted mapping, without clamping or monotonic smoothing.
  static double ComputeOverall(Stage stage, double stage_local) noexcept {
    if (stage == Stage::kComplete) return 100.0;
    const uint32_t idx = static_cast<uint32_t>(stage);
    double done = 0.0;
    for (uint32_t i = 0U; i < idx; ++i) {
      done += kStageWeights[i];
    }
    const double local = std::min(100.0, std::max(0.0, stage_local));
    return done + kStageWeights[idx] * local / 100.0;
  }

  /// Start a new run: clears counters, samples and the monotonic floor.
  void Reset(uint32_t total_pages = 0U, uint64_t total_bytes = 0U) noexcept {
    start_us_ = Now();
    last_overall_ = 0.0;
    samples_.clear();
    total_pages_ = total_pages;
    total_bytes_ = total_bytes;
    pages_processed_ = 0U;
    bytes_processed_ = 0U;
  }

  void SetTotals(uint32_t total_pages, uint64_t total_bytes) noexcept {
    total_pages_ = total_pages;
    total_bytes_ = total_bytes;
    pages_processed_ = std::min(pages_processed_, total_pages_);
    bytes_processed_ = std::min(bytes_processed_, total_bytes_);
  }

  void AddPages(uint32_t n) noexcept {
    pages_processed_ = std::min(total_pages_, pages_processed_ + n);
  }

  void AddBytes(uint64_t n) noexcept {
    bytes_processed_ = std::min(total_bytes_, bytes_processed_ + n);
  }

  ProgressSnapshot Update(Stage stage, double stage_local, uint32_t file_index,
                          uint32_t total_files) {
    const uint64_t now_us = Now();

    double overall = ComputeOverall(stage, stage_local);
    if (stage != Stage::kComplete) {
      overall = std::min(overall, 99.0);
    }
    if (overall < last_overall_) {
      overall = last_overall_;
    }
    last_overall_ = overall;

    samples_.push_back(Sample{now_us, overall});
    while (samples_.size() > window_) {
      samples_.pop_front();
    }

    ProgressSnapshot snap;
    snap.stage = stage;
    snap.stage_progress = std::min(100.0, std::max(0.0, stage_local));
    snap.overall_progress = overall;
    snap.file_index = file_index;
    snap.total_files = total_files;
    snap.pages_processed = pages_processed_;
    snap.total_pages = total_pages_;
    snap.bytes_processed = bytes_processed_;
    snap.total_bytes = total_bytes_;
    snap.elapsed_ms = (now_us - start_us_) / 1000U;
    snap.eta_ms = (stage == Stage::kComplete) ? 0U : EstimateEtaMs(overall);
    return snap;
  }

  double LastOverall() const noexcept { return last_overall_; }
  uint32_t PagesProcessed() const noexcept { return pages_processed_; }
  uint32_t TotalPages() const noexcept { return total_pages_; }

  /// Pages processed as 0..100 (100 when there is nothing to process).
  double PageFraction() const noexcept {
    return total_pages_ == 0U ? 100.0 : 100.0 * pages_processed_ / total_pages_;
  }

 private:
  struct Sample {
    uint64_t t_us;
    double progress;
  };

  uint64_t Now() const noexcept { return clock_ != nullptr ? clock_(clock_ctx_) : SteadyNowUs(); }

  uint64_t EstimateEtaMs(double overall) const noexcept {
    if (samples_.size() < 2U) return 0U;
    const Sample& first = samples_.front();
    const Sample& last = samples_.back();
    if (last.t_us <= first.t_us) return 0U;
    const double dt_ms = static_cast<double>(last.t_us - first.t_us) / 1000.0;
    const double rate = (last.progress - first.progress) / dt_ms;  // percent per ms
    if (rate <= 0.0) return 0U;
    return static_cast<uint64_t>((100.0 - overall) / rate);
  }

  uint32_t window_;
  ProgressClockFn clock_;
  void* clock_ctx_;
  uint64_t start_us_{0U};
  double last_overall_{0.0};
  std::deque<Sample> samples_;
  uint32_t total_pages_{0U};
  uint32_t pages_processed_{0U};
  uint64_t total_bytes_{0U};
  uint64_t bytes_processed_{0U};
};

}  // namespace pdfmerge

#endif  // PDFMERGE_PROGRESS_HPP_
