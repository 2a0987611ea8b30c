/**
 * MIT License
 *
 * Copyright (c) 2024 pdfmerge contributors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file memory_governor.hpp
 * @brief Process memory sampling, threshold-triggered reclaim and a hard
 *        ceiling check.
 *
 * Design:
 * - Usage is read from /proc/self/statm (resident pages) by default; the
 *   sampler is injectable (function pointer + context).
 * - Crossing ceiling * threshold runs every registered reclaim hook (cache
 *   clears, engine cleanup) and then returns freed heap to the OS.
 * - Still above the ceiling after reclaim -> kLimitExceeded. The periodic
 *   monitor latches this in IsOverLimit() so running merges can stop at
 *   their next batch boundary.
 * - Static MonitorTick() for TimerScheduler integration.
 *
 *   pdfmerge::MemoryGovernor gov(cfg);
 *   gov.AddReclaimHook("validation-cache", &ClearCache, &validator);
 *   gov.StartMonitoring(10000);
 *   ...
 *   auto r = gov.CheckAndReclaim();
 *   if (!r.has_value()) { abort the run }
 */

#ifndef PDFMERGE_MEMORY_GOVERNOR_HPP_
#define PDFMERGE_MEMORY_GOVERNOR_HPP_

#include "pdfmerge/log.hpp"
#include "pdfmerge/platform.hpp"
#include "pdfmerge/timer.hpp"
#include "pdfmerge/vocabulary.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>

#include <atomic>
#include <mutex>
#include <vector>

#if defined(PDFMERGE_PLATFORM_LINUX)
#include <fcntl.h>
#include <unistd.h>
#endif

#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace pdfmerge {

enum class MemoryError : uint8_t {
  kLimitExceeded = 0,
  kHooksFull,
};

inline const char* ToString(MemoryError e) noexcept {
  switch (e) {
    case MemoryError::kLimitExceeded: return "MEMORY_LIMIT_EXCEEDED";
    case MemoryError::kHooksFull: return "MEMORY_HOOKS_FULL";
  }
  return "MEMORY_UNKNOWN";
}

struct MemoryGovernorConfig {
  uint64_t ceiling_bytes{4096ULL * kMiB};
  double threshold{0.75};  ///< Fraction of the ceiling that triggers reclaim.
  uint32_t monitor_interval_ms{10000U};
  bool trim_heap{true};    ///< malloc_trim(0) after hooks (glibc only).
};

struct MemoryStatus {
  uint64_t used_bytes{0U};
  uint64_t ceiling_bytes{0U};
  bool reclaimed{false};
  uint64_t used_after_bytes{0U};

  double Pressure() const noexcept {
    return ceiling_bytes == 0U ? 0.0
                               : static_cast<double>(used_after_bytes) /
                                     static_cast<double>(ceiling_bytes);
  }
};

struct MemoryGovernorStats {
  uint64_t samples{0U};
  uint64_t reclaims{0U};
  uint64_t limit_exceeded{0U};
  uint64_t last_used_bytes{0U};
  uint64_t peak_used_bytes{0U};
};

using ReclaimFn = void (*)(void* ctx);
using ReclaimHookId = uint32_t;

class MemoryGovernor final {
 public:
  static constexpr uint32_t kMaxHooks = 16U;

  explicit MemoryGovernor(const MemoryGovernorConfig& cfg = MemoryGovernorConfig{},
                          MemorySampleFn sampler = &MemoryGovernor::ReadProcessRss,
                          void* sampler_ctx = nullptr)
      : cfg_(cfg), sampler_(sampler), sampler_ctx_(sampler_ctx), timer_(1U) {}

  ~MemoryGovernor() { StopMonitoring(); }

  MemoryGovernor(const MemoryGovernor&) = delete;
  MemoryGovernor& operator=(const MemoryGovernor&) = delete;
  MemoryGovernor(MemoryGovernor&&) = delete;
  MemoryGovernor& operator=(MemoryGovernor&&) = delete;

  // ==========================================================================
  // Reclaim hooks
  // ==========================================================================

  expected<ReclaimHookId, MemoryError> AddReclaimHook(const char* name, ReclaimFn fn, void* ctx) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (hooks_.size() >= kMaxHooks) {
      return expected<ReclaimHookId, MemoryError>::error(MemoryError::kHooksFull);
    }
    const ReclaimHookId id = next_hook_id_++;
    hooks_.push_back(Hook{id, FixedString<32>(TruncateToCapacity, name), fn, ctx});
    return expected<ReclaimHookId, MemoryError>::success(id);
  }

  void RemoveReclaimHook(ReclaimHookId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto it = hooks_.begin(); it != hooks_.end(); ++it) {
      if (it->id == id) {
        hooks_.erase(it);
        return;
      }
    }
  }

  // ==========================================================================
  // Sampling and checks
  // ==========================================================================

  uint64_t Sample() {
    const uint64_t used = sampler_ != nullptr ? sampler_(sampler_ctx_) : 0U;
    std::lock_guard<std::mutex> lock(mtx_);
    ++stats_.samples;
    stats_.last_used_bytes = used;
    if (used > stats_.peak_used_bytes) stats_.peak_used_bytes = used;
    return used;
  }

  /**
   * @brief Sample; above ceiling * threshold run reclaim and sample again.
   * @return Status, or kLimitExceeded when usage is still over the ceiling.
   */
  expected<MemoryStatus, MemoryError> CheckAndReclaim() {
    MemoryStatus st;
    st.ceiling_bytes = cfg_.ceiling_bytes;
    st.used_bytes = Sample();
    st.used_after_bytes = st.used_bytes;

    const double trigger = static_cast<double>(cfg_.ceiling_bytes) * cfg_.threshold;
    if (static_cast<double>(st.used_bytes) > trigger) {
      PDFMERGE_LOG_WARN("MemGov", "usage %" PRIu64 " MiB above %.0f%% of %" PRIu64 " MiB, reclaiming",
                        st.used_bytes / kMiB, cfg_.threshold * 100.0, cfg_.ceiling_bytes / kMiB);
      Reclaim();
      st.reclaimed = true;
      st.used_after_bytes = Sample();
    }

    if (st.used_after_bytes > cfg_.ceiling_bytes) {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++stats_.limit_exceeded;
      }
      over_limit_.store(true, std::memory_order_release);
      PDFMERGE_LOG_ERROR("MemGov", "usage %" PRIu64 " MiB exceeds ceiling %" PRIu64 " MiB after reclaim",
                         st.used_after_bytes / kMiB, cfg_.ceiling_bytes / kMiB);
      return expected<MemoryStatus, MemoryError>::error(MemoryError::kLimitExceeded);
    }
    over_limit_.store(false, std::memory_order_release);
    return expected<MemoryStatus, MemoryError>::success(st);
  }

  /// Run every hook and trim the heap, regardless of usage.
  void Reclaim() {
    std::vector<Hook> hooks;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      hooks = hooks_;
      ++stats_.reclaims;
    }
    for (const auto& h : hooks) {
      PDFMERGE_LOG_DEBUG("MemGov", "reclaim hook '%s'", h.name.c_str());
      h.fn(h.ctx);
    }
#if defined(__GLIBC__)
    if (cfg_.trim_heap) {
      (void)::malloc_trim(0);
    }
#endif
  }

  /// Latched by the last check (manual or periodic).
  bool IsOverLimit() const noexcept { return over_limit_.load(std::memory_order_acquire); }

  // ==========================================================================
  // Periodic monitoring
  // ==========================================================================

  expected<void, TimerError> StartMonitoring(uint32_t interval_ms) {
    auto id = timer_.Add(interval_ms, &MemoryGovernor::MonitorTick, this);
    if (!id.has_value()) {
      return expected<void, TimerError>::error(id.get_error());
    }
    auto r = timer_.Start();
    if (!r.has_value()) {
      (void)timer_.Remove(id.value());
      return r;
    }
    PDFMERGE_LOG_INFO("MemGov", "monitoring every %u ms (ceiling %" PRIu64 " MiB, threshold %.2f)",
                      interval_ms, cfg_.ceiling_bytes / kMiB, cfg_.threshold);
    return expected<void, TimerError>::success();
  }

  expected<void, TimerError> StartMonitoring() { return StartMonitoring(cfg_.monitor_interval_ms); }

  void StopMonitoring() { timer_.Stop(); }

  bool IsMonitoring() const noexcept { return timer_.IsRunning(); }

  static void MonitorTick(void* ctx) {
    auto* self = static_cast<MemoryGovernor*>(ctx);
    (void)self->CheckAndReclaim();
  }

  MemoryGovernorStats GetStats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stats_;
  }

  const MemoryGovernorConfig& Config() const noexcept { return cfg_; }

  MemorySampleFn Sampler() const noexcept { return sampler_; }
  void* SamplerContext() const noexcept { return sampler_ctx_; }

  /**
   * @brief Resident set size of this process in bytes (0 if unavailable).
   *
   * Parses the second field of /proc/self/statm.
   */
  static uint64_t ReadProcessRss(void* /*ctx*/) {
#if defined(PDFMERGE_PLATFORM_LINUX)
    const int fd = ::open("/proc/self/statm", O_RDONLY);
    if (fd < 0) return 0U;
    char buf[128];
    const ssize_t n = ::read(fd, buf, sizeof(buf) - 1U);
    (void)::close(fd);
    if (n <= 0) return 0U;
    buf[n] = '\0';
    uint64_t total_pages = 0U;
    uint64_t resident_pages = 0U;
    if (std::sscanf(buf, "%" SCNu64 " %" SCNu64, &total_pages, &resident_pages) != 2) {
      return 0U;
    }
    const long page = ::sysconf(_SC_PAGESIZE);
    return resident_pages * static_cast<uint64_t>(page > 0 ? page : 4096);
#else
    return 0U;
#endif
  }

 private:
  struct Hook {
    ReclaimHookId id;
    FixedString<32> name;
    ReclaimFn fn;
    void* ctx;
  };

  const MemoryGovernorConfig cfg_;
  MemorySampleFn sampler_;
  void* sampler_ctx_;

  mutable std::mutex mtx_;
  std::vector<Hook> hooks_;
  ReclaimHookId next_hook_id_{1U};
  MemoryGovernorStats stats_;
  std::atomic<bool> over_limit_{false};

  TimerScheduler timer_;
};

}  // namespace pdfmerge

#endif  // PDFMERGE_MEMORY_GOVERNOR_HPP_
