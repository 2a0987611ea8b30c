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
 * @file worker_pool.hpp
 * @brief Elastic worker pool with a priority queue, health checks and
 *        memory-aware scaling.
 *
 * Architecture:
 *   Submit(fn, prio) --+-- idle worker?      --> hand task to that worker
 *                      +-- below pool size?  --> spawn worker with the task
 *                      +-- otherwise         --> priority queue (bounded)
 *
 *   TimerScheduler --> RunHealthCheck() : idle eviction, queue warning,
 *                                         scaling (cooldown-gated)
 *                  --> metrics event
 *
 * Each worker owns one OS thread. A task that throws is a worker crash: the
 * task fails with kWorkerCrashed, the worker is removed and a replacement is
 * spawned. Shutdown() rejects queued tasks, waits for in-flight tasks up to a
 * timeout and then abandons (detaches) whatever is still running.
 *
 * All pool state lives in a shared core guarded by one mutex; detached worker
 * threads hold a reference to it so abandoning them is safe for the pool.
 * Whatever their tasks point at must stay alive until WaitForWorkers() returns.
 *
 * @code
 *   pdfmerge::PoolConfig cfg;
 *   cfg.size = 4;
 *   pdfmerge::WorkerPool pool(cfg);
 *   pool.Start();
 *   auto r = pool.Submit([] { return 42; }, pdfmerge::kPriorityHigh);
 *   if (r.has_value()) {
 *     auto result = r.value().get();  // expected<int, TaskError>
 *   }
 *   pool.Shutdown();
 * @endcode
 */

#ifndef PDFMERGE_WORKER_POOL_HPP_
#define PDFMERGE_WORKER_POOL_HPP_

#include "pdfmerge/log.hpp"
#include "pdfmerge/platform.hpp"
#include "pdfmerge/timer.hpp"
#include "pdfmerge/vocabulary.hpp"

#include <cmath>
#include <cstdint>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(PDFMERGE_PLATFORM_LINUX) || defined(PDFMERGE_PLATFORM_MACOS)
#include <sys/resource.h>
#endif

namespace pdfmerge {

// ============================================================================
// Errors
// ============================================================================

/// Submission-time failures.
enum class PoolError : uint8_t {
  kQueueFull = 0,
  kShuttingDown,
};

/// Task-completion failures delivered through the task's future.
enum class TaskError : uint8_t {
  kShuttingDown = 0,
  kWorkerCrashed,
};

inline const char* ToString(PoolError e) noexcept {
  switch (e) {
    case PoolError::kQueueFull: return "QUEUE_FULL";
    case PoolError::kShuttingDown: return "POOL_SHUTTING_DOWN";
  }
  return "POOL_UNKNOWN";
}

inline const char* ToString(TaskError e) noexcept {
  switch (e) {
    case TaskError::kShuttingDown: return "POOL_SHUTTING_DOWN";
    case TaskError::kWorkerCrashed: return "WORKER_CRASHED";
  }
  return "TASK_UNKNOWN";
}

// ============================================================================
// Configuration
// ============================================================================

static constexpr int32_t kPriorityLow = 0;
static constexpr int32_t kPriorityNormal = 5;
static constexpr int32_t kPriorityHigh = 10;

static constexpr uint32_t kWorkerRecentErrors = 10U;

/// max(2, floor(cores * 0.75))
inline uint32_t DefaultPoolSize() noexcept {
  const uint32_t cores = std::thread::hardware_concurrency();
  const uint32_t by_cores = static_cast<uint32_t>(std::floor(cores * 0.75));
  return by_cores < 2U ? 2U : by_cores;
}

struct PoolConfig {
  FixedString<32> name{"merge"};
  uint32_t size{DefaultPoolSize()};
  uint32_t min_workers{2U};
  uint32_t max_queue_size{200U};
  uint32_t prewarm_workers{2U};
  uint32_t worker_idle_timeout_ms{180000U};
  uint32_t health_check_ms{10000U};
  uint32_t scale_cooldown_ms{5000U};
  uint32_t scale_down_idle_ms{30000U};
  uint32_t queue_warning_ms{60000U};
  uint32_t metrics_interval_ms{30000U};
  uint32_t shutdown_timeout_ms{30000U};

  // Memory pressure input for scaling; pressure is 0 when unset.
  uint64_t memory_ceiling_bytes{4096ULL * kMiB};
  MemorySampleFn memory_sample_fn{nullptr};
  void* memory_sample_ctx{nullptr};
};

// ============================================================================
// Metrics and events
// ============================================================================

enum class WorkerState : uint8_t {
  kSpawning = 0,
  kIdle,
  kBusy,
  kEvicted,
};

inline const char* ToString(WorkerState s) noexcept {
  switch (s) {
    case WorkerState::kSpawning: return "spawning";
    case WorkerState::kIdle: return "idle";
    case WorkerState::kBusy: return "busy";
    case WorkerState::kEvicted: return "evicted";
  }
  return "unknown";
}

struct WorkerMetrics {
  uint32_t id{0U};
  WorkerState state{WorkerState::kSpawning};
  uint64_t total_tasks{0U};
  uint64_t successful_tasks{0U};
  uint64_t failed_tasks{0U};
  uint64_t total_processing_us{0U};
  uint64_t last_used_ms{0U};
  std::vector<std::string> recent_errors;

  double AverageProcessingMs() const noexcept {
    return total_tasks == 0U ? 0.0
                             : static_cast<double>(total_processing_us) / 1000.0 /
                                   static_cast<double>(total_tasks);
  }
};

struct PoolMetrics {
  uint32_t active_workers{0U};  ///< Workers currently running a task.
  uint32_t total_workers{0U};   ///< Live workers (idle + busy + spawning).
  uint32_t queue_length{0U};
  uint64_t total_processed{0U};
  uint64_t total_failed{0U};
  uint64_t total_rejected{0U};
  uint32_t peak_active_workers{0U};
  double average_wait_ms{0.0};
  double cpu_time_ms{0.0};  ///< Process user+system CPU time.
};

enum class PoolEventType : uint8_t {
  kWorkerError = 0,
  kWorkerExit,
  kQueueWarning,
  kMetrics,
  kShutdown,
};

struct PoolEvent {
  PoolEventType type;
  uint32_t worker_id;        ///< Worker events only.
  const char* message;       ///< Valid for the duration of the callback.
  uint64_t wait_ms;          ///< Queue warning: oldest task's wait.
  const PoolMetrics* metrics;  ///< Metrics and shutdown events.
};

using PoolEventFn = void (*)(const PoolEvent& event, void* ctx);

struct PoolShutdownReport {
  uint32_t rejected_tasks{0U};
  uint32_t abandoned_workers{0U};
  bool clean{true};
};

template <typename R>
using TaskFuture = std::future<expected<R, TaskError>>;

// ============================================================================
// Internal: tasks and shared core
// ============================================================================

namespace detail {

class PoolTask {
 public:
  virtual ~PoolTask() = default;

  /// Runs the payload and fulfils the future. May throw (worker crash).
  virtual void Run() = 0;
  /// Fulfils the future with an error.
  virtual void Fail(TaskError err) = 0;

  int32_t priority{kPriorityNormal};
  uint64_t enqueue_us{0U};
};

template <typename Fn, typename R>
class TypedPoolTask final : public PoolTask {
 public:
  explicit TypedPoolTask(Fn&& fn) : fn_(std::move(fn)) {}

  TaskFuture<R> GetFuture() { return promise_.get_future(); }

  void Run() override {
    if constexpr (std::is_void<R>::value) {
      fn_();
      promise_.set_value(expected<void, TaskError>::success());
    } else {
      promise_.set_value(expected<R, TaskError>::success(fn_()));
    }
  }

  void Fail(TaskError err) override { promise_.set_value(expected<R, TaskError>::error(err)); }

 private:
  Fn fn_;
  std::promise<expected<R, TaskError>> promise_;
};

struct WorkerRecord {
  WorkerMetrics metrics;
  std::unique_ptr<PoolTask> next;
  std::condition_variable cv;
  bool exit_requested{false};
};

class PoolCore final : public std::enable_shared_from_this<PoolCore> {
 public:
  explicit PoolCore(const PoolConfig& cfg) : cfg_(cfg) {}

  PoolCore(const PoolCore&) = delete;
  PoolCore& operator=(const PoolCore&) = delete;

  void SetEventCallback(PoolEventFn fn, void* ctx) {
    std::lock_guard<std::mutex> lk(mtx_);
    event_fn_ = fn;
    event_ctx_ = ctx;
  }

  void Prewarm() {
    std::lock_guard<std::mutex> lk(mtx_);
    const uint32_t target = std::min(cfg_.prewarm_workers, cfg_.size);
    while (LiveCountLocked() < target && SpawnLocked()) {
    }
  }

  expected<void, PoolError> Enqueue(std::unique_ptr<PoolTask> task) {
    std::unique_lock<std::mutex> lk(mtx_);
    if (shutting_down_) {
      ++total_rejected_;
      return expected<void, PoolError>::error(PoolError::kShuttingDown);
    }
    if (queue_.size() >= cfg_.max_queue_size) {
      ++total_rejected_;
      PDFMERGE_LOG_WARN("Pool", "%s: queue full (%u), rejecting task", cfg_.name.c_str(),
                        cfg_.max_queue_size);
      return expected<void, PoolError>::error(PoolError::kQueueFull);
    }

    task->enqueue_us = SteadyNowUs();

    // Hand directly to an available worker.
    for (auto& kv : workers_) {
      WorkerRecord& rec = *kv.second;
      if (IsAvailableLocked(rec)) {
        RecordWaitLocked(0U);
        rec.next = std::move(task);
        rec.cv.notify_one();
        return expected<void, PoolError>::success();
      }
    }

    // Grow towards the configured size; the new worker takes the task.
    if (LiveCountLocked() < cfg_.size) {
      if (SpawnLocked()) {
        WorkerRecord& rec = *workers_.rbegin()->second;
        RecordWaitLocked(0U);
        rec.next = std::move(task);
        rec.cv.notify_one();
        return expected<void, PoolError>::success();
      }
    }

    // Stable priority insertion: before the first strictly lower priority.
    auto pos = std::find_if(queue_.begin(), queue_.end(),
                            [&task](const std::unique_ptr<PoolTask>& q) {
                              return q->priority < task->priority;
                            });
    queue_.insert(pos, std::move(task));
    return expected<void, PoolError>::success();
  }

  PoolMetrics GetMetrics() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return MetricsLocked();
  }

  std::vector<WorkerMetrics> GetWorkerMetrics() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<WorkerMetrics> out;
    out.reserve(workers_.size());
    for (const auto& kv : workers_) {
      out.push_back(kv.second->metrics);
    }
    return out;
  }

  /// Idle eviction, stuck-queue warning and (cooldown-gated) scaling.
  void RunHealthCheck() {
    std::vector<PoolEvent> events;
    uint64_t warn_wait_ms = 0U;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (shutting_down_) return;
      const uint64_t now_ms = SteadyNowMs();

      std::vector<WorkerRecord*> stale;
      uint32_t remaining = LiveCountLocked();
      for (auto& kv : workers_) {
        if (remaining <= cfg_.min_workers) break;
        WorkerRecord& rec = *kv.second;
        if (rec.metrics.state == WorkerState::kIdle && !rec.next && !rec.exit_requested &&
            now_ms - rec.metrics.last_used_ms > cfg_.worker_idle_timeout_ms) {
          stale.push_back(&rec);
          --remaining;
        }
      }
      for (WorkerRecord* rec : stale) {
        PDFMERGE_LOG_INFO("Pool", "%s: worker %u idle for %llu ms, evicting", cfg_.name.c_str(),
                          rec->metrics.id,
                          static_cast<unsigned long long>(now_ms - rec->metrics.last_used_ms));
        EvictLocked(*rec);
      }

      if (!queue_.empty()) {
        const uint64_t waited_ms = (SteadyNowUs() - queue_.front()->enqueue_us) / 1000U;
        if (waited_ms > cfg_.queue_warning_ms) {
          warn_wait_ms = waited_ms;
        }
      }

      if (now_ms - last_scale_ms_ >= cfg_.scale_cooldown_ms) {
        AdjustScaleLocked();
        last_scale_ms_ = now_ms;
      }
    }

    if (warn_wait_ms > 0U) {
      PDFMERGE_LOG_WARN("Pool", "%s: oldest queued task waiting %llu ms", cfg_.name.c_str(),
                        static_cast<unsigned long long>(warn_wait_ms));
      Emit(PoolEvent{PoolEventType::kQueueWarning, 0U, "queued task waiting too long",
                     warn_wait_ms, nullptr});
    }
  }

  /// Apply one scaling step immediately, ignoring the cooldown.
  void AdjustScale() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (shutting_down_) return;
    AdjustScaleLocked();
    last_scale_ms_ = SteadyNowMs();
  }

  void EmitMetrics() {
    PoolMetrics m = GetMetrics();
    PDFMERGE_LOG_DEBUG("Pool", "%s: workers=%u active=%u queue=%u processed=%llu", cfg_.name.c_str(),
                       m.total_workers, m.active_workers, m.queue_length,
                       static_cast<unsigned long long>(m.total_processed));
    Emit(PoolEvent{PoolEventType::kMetrics, 0U, "metrics", 0U, &m});
  }

  PoolShutdownReport Shutdown(uint32_t timeout_ms) {
    PoolShutdownReport report;
    std::deque<std::unique_ptr<PoolTask>> rejected;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (shutting_down_) return report;
      shutting_down_ = true;
      rejected.swap(queue_);
      for (auto& kv : workers_) {
        kv.second->exit_requested = true;
        kv.second->cv.notify_one();
      }
    }

    report.rejected_tasks = static_cast<uint32_t>(rejected.size());
    for (auto& task : rejected) {
      task->Fail(TaskError::kShuttingDown);
    }
    rejected.clear();

    PoolMetrics final_metrics;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      const bool drained = exit_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                                             [this] { return live_threads_ == 0U; });
      if (!drained) {
        // Remaining threads are detached; they finish their task and exit on
        // their own without touching the pool again.
        report.abandoned_workers = static_cast<uint32_t>(workers_.size());
        report.clean = false;
        for (auto& kv : workers_) {
          kv.second->metrics.state = WorkerState::kEvicted;
        }
        workers_.clear();
      }
      final_metrics = MetricsLocked();
    }

    if (report.clean) {
      PDFMERGE_LOG_INFO("Pool", "%s: shutdown complete, %u queued task(s) rejected",
                        cfg_.name.c_str(), report.rejected_tasks);
    } else {
      PDFMERGE_LOG_WARN("Pool", "%s: shutdown timed out after %u ms, %u worker(s) abandoned",
                        cfg_.name.c_str(), timeout_ms, report.abandoned_workers);
    }
    Emit(PoolEvent{PoolEventType::kShutdown, 0U, "shutdown", 0U, &final_metrics});
    SetEventCallback(nullptr, nullptr);
    return report;
  }

  bool IsShuttingDown() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return shutting_down_;
  }

  /// Block until every worker thread, abandoned ones included, has exited.
  void WaitForWorkers() {
    std::unique_lock<std::mutex> lk(mtx_);
    exit_cv_.wait(lk, [this] { return live_threads_ == 0U; });
  }

  bool WaitForWorkers(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lk(mtx_);
    return exit_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                             [this] { return live_threads_ == 0U; });
  }

  static uint32_t DesiredWorkers(const PoolConfig& cfg, uint32_t queue_length,
                                 double memory_pressure) noexcept {
    const uint32_t lo = std::min(cfg.min_workers, cfg.size);
    const uint32_t by_queue = static_cast<uint32_t>(std::ceil(queue_length * 0.75));
    const double headroom = std::max(0.0, 1.0 - memory_pressure);
    const uint32_t by_memory = static_cast<uint32_t>(std::floor(cfg.size * headroom));
    uint32_t desired = std::max(lo, std::max(by_queue, by_memory));
    desired = std::min(std::max(desired, lo), cfg.size);
    if (memory_pressure > 0.85) {
      desired = std::min(desired, std::max(1U, cfg.size / 2U));
    }
    return desired;
  }

 private:
  uint32_t LiveCountLocked() const noexcept { return static_cast<uint32_t>(workers_.size()); }

  static bool IsAvailableLocked(const WorkerRecord& rec) noexcept {
    return !rec.next && !rec.exit_requested &&
           (rec.metrics.state == WorkerState::kIdle || rec.metrics.state == WorkerState::kSpawning);
  }

  void RecordWaitLocked(uint64_t wait_us) noexcept {
    total_wait_us_ += wait_us;
    ++wait_samples_;
  }

  double MemoryPressure() const noexcept {
    if (cfg_.memory_sample_fn == nullptr || cfg_.memory_ceiling_bytes == 0U) return 0.0;
    return static_cast<double>(cfg_.memory_sample_fn(cfg_.memory_sample_ctx)) /
           static_cast<double>(cfg_.memory_ceiling_bytes);
  }

  PoolMetrics MetricsLocked() const {
    PoolMetrics m;
    for (const auto& kv : workers_) {
      if (kv.second->metrics.state == WorkerState::kBusy) ++m.active_workers;
    }
    m.total_workers = LiveCountLocked();
    m.queue_length = static_cast<uint32_t>(queue_.size());
    m.total_processed = total_processed_;
    m.total_failed = total_failed_;
    m.total_rejected = total_rejected_;
    m.peak_active_workers = peak_active_;
    m.average_wait_ms =
        wait_samples_ == 0U ? 0.0 : static_cast<double>(total_wait_us_) / 1000.0 / wait_samples_;
#if defined(PDFMERGE_PLATFORM_LINUX) || defined(PDFMERGE_PLATFORM_MACOS)
    struct rusage ru;
    if (::getrusage(RUSAGE_SELF, &ru) == 0) {
      m.cpu_time_ms = static_cast<double>(ru.ru_utime.tv_sec + ru.ru_stime.tv_sec) * 1000.0 +
                      static_cast<double>(ru.ru_utime.tv_usec + ru.ru_stime.tv_usec) / 1000.0;
    }
#endif
    return m;
  }

  bool SpawnLocked() {
    const uint32_t id = next_worker_id_++;
    auto rec = std::make_shared<WorkerRecord>();
    rec->metrics.id = id;
    rec->metrics.state = WorkerState::kSpawning;
    rec->metrics.last_used_ms = SteadyNowMs();
    try {
      std::thread(&PoolCore::WorkerLoop, shared_from_this(), rec).detach();
    } catch (const std::system_error& e) {
      PDFMERGE_LOG_ERROR("Pool", "%s: failed to spawn worker: %s", cfg_.name.c_str(), e.what());
      return false;
    }
    workers_.emplace(id, std::move(rec));
    ++live_threads_;
    PDFMERGE_LOG_DEBUG("Pool", "%s: worker %u spawned (%u live)", cfg_.name.c_str(), id,
                       LiveCountLocked());
    return true;
  }

  void EvictLocked(WorkerRecord& rec) {
    rec.exit_requested = true;
    rec.metrics.state = WorkerState::kEvicted;
    rec.cv.notify_one();
    workers_.erase(rec.metrics.id);
  }

  void AdjustScaleLocked() {
    const double pressure = MemoryPressure();
    const uint32_t desired =
        DesiredWorkers(cfg_, static_cast<uint32_t>(queue_.size()), pressure);
    const uint32_t current = LiveCountLocked();

    if (current < desired) {
      // Ramp gradually: half the deficit per cycle, at least one.
      const uint32_t deficit = desired - current;
      const uint32_t spawn = std::max(1U, deficit / 2U);
      PDFMERGE_LOG_INFO("Pool", "%s: scaling up %u -> %u (+%u, pressure %.2f)", cfg_.name.c_str(),
                        current, desired, spawn, pressure);
      for (uint32_t i = 0U; i < spawn; ++i) {
        if (!SpawnLocked()) break;
      }
    } else if (current > std::max(desired, std::min(cfg_.min_workers, cfg_.size))) {
      // The memory cap may ask for fewer than min_workers; eviction stops there.
      uint32_t surplus = current - std::max(desired, std::min(cfg_.min_workers, cfg_.size));
      const uint64_t now_ms = SteadyNowMs();
      std::vector<WorkerRecord*> victims;
      for (auto& kv : workers_) {
        if (surplus == 0U) break;
        WorkerRecord& rec = *kv.second;
        if (rec.metrics.state == WorkerState::kIdle && !rec.next && !rec.exit_requested &&
            now_ms - rec.metrics.last_used_ms > cfg_.scale_down_idle_ms) {
          victims.push_back(&rec);
          --surplus;
        }
      }
      if (!victims.empty()) {
        PDFMERGE_LOG_INFO("Pool", "%s: scaling down %u -> %u (-%zu)", cfg_.name.c_str(), current,
                          desired, victims.size());
      }
      for (WorkerRecord* rec : victims) {
        EvictLocked(*rec);
      }
    }
  }

  void Emit(const PoolEvent& ev) {
    PoolEventFn fn = nullptr;
    void* ctx = nullptr;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      fn = event_fn_;
      ctx = event_ctx_;
    }
    if (fn != nullptr) {
      fn(ev, ctx);
    }
  }

  static void NoteError(WorkerRecord& rec, const std::string& msg) {
    rec.metrics.recent_errors.push_back(msg);
    if (rec.metrics.recent_errors.size() > kWorkerRecentErrors) {
      rec.metrics.recent_errors.erase(rec.metrics.recent_errors.begin());
    }
  }

  static void WorkerLoop(std::shared_ptr<PoolCore> self, std::shared_ptr<WorkerRecord> rec) {
    self->RunWorker(*rec);
  }

  void RunWorker(WorkerRecord& rec) {
    const uint32_t id = rec.metrics.id;
    bool crashed = false;
    std::string crash_msg;

    std::unique_lock<std::mutex> lk(mtx_);
    if (rec.metrics.state == WorkerState::kSpawning) {
      rec.metrics.state = WorkerState::kIdle;
    }

    while (true) {
      if (!rec.next && !rec.exit_requested && !queue_.empty()) {
        rec.next = std::move(queue_.front());
        queue_.pop_front();
        RecordWaitLocked(SteadyNowUs() - rec.next->enqueue_us);
      }

      if (rec.next) {
        std::unique_ptr<PoolTask> task = std::move(rec.next);
        rec.metrics.state = WorkerState::kBusy;
        uint32_t active = 0U;
        for (const auto& kv : workers_) {
          if (kv.second->metrics.state == WorkerState::kBusy) ++active;
        }
        peak_active_ = std::max(peak_active_, active);
        lk.unlock();

        const uint64_t start_us = SteadyNowUs();
        try {
          task->Run();
        } catch (const std::exception& e) {
          crashed = true;
          crash_msg = e.what();
        } catch (...) {
          crashed = true;
          crash_msg = "unknown exception";
        }
        const uint64_t elapsed_us = SteadyNowUs() - start_us;
        if (crashed) {
          task->Fail(TaskError::kWorkerCrashed);
        }
        task.reset();

        lk.lock();
        rec.metrics.total_tasks++;
        rec.metrics.total_processing_us += elapsed_us;
        rec.metrics.last_used_ms = SteadyNowMs();
        ++total_processed_;
        if (crashed) {
          rec.metrics.failed_tasks++;
          ++total_failed_;
          NoteError(rec, crash_msg);
          break;
        }
        rec.metrics.successful_tasks++;
        rec.metrics.state = WorkerState::kIdle;
        continue;
      }

      if (rec.exit_requested) break;
      rec.cv.wait(lk);
    }

    // Leaving: a crash removes this worker and spawns a replacement.
    const bool was_member = workers_.erase(id) > 0U;
    rec.metrics.state = WorkerState::kEvicted;
    if (crashed && was_member && !shutting_down_ && LiveCountLocked() < cfg_.size) {
      (void)SpawnLocked();
    }
    lk.unlock();

    if (crashed) {
      PDFMERGE_LOG_ERROR("Pool", "%s: worker %u crashed: %s", cfg_.name.c_str(), id,
                         crash_msg.c_str());
      Emit(PoolEvent{PoolEventType::kWorkerError, id, crash_msg.c_str(), 0U, nullptr});
    }
    Emit(PoolEvent{PoolEventType::kWorkerExit, id, crashed ? "crashed" : "exited", 0U, nullptr});

    // Counted down after the events so a clean Shutdown() returns only once
    // no worker can call back into the subscriber.
    lk.lock();
    --live_threads_;
    exit_cv_.notify_all();
  }

  const PoolConfig cfg_;
  mutable std::mutex mtx_;
  std::condition_variable exit_cv_;

  std::map<uint32_t, std::shared_ptr<WorkerRecord>> workers_;
  std::deque<std::unique_ptr<PoolTask>> queue_;
  uint32_t next_worker_id_{1U};
  uint32_t live_threads_{0U};
  bool shutting_down_{false};

  uint64_t total_processed_{0U};
  uint64_t total_failed_{0U};
  uint64_t total_rejected_{0U};
  uint64_t total_wait_us_{0U};
  uint64_t wait_samples_{0U};
  uint32_t peak_active_{0U};
  uint64_t last_scale_ms_{0U};

  PoolEventFn event_fn_{nullptr};
  void* event_ctx_{nullptr};
};

}  // namespace detail

// ============================================================================
// WorkerPool
// ============================================================================

class WorkerPool final {
 public:
  explicit WorkerPool(const PoolConfig& cfg = PoolConfig{})
      : cfg_(cfg), core_(std::make_shared<detail::PoolCore>(cfg)), timer_(4U) {}

  ~WorkerPool() { (void)Shutdown(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  /// Must be set before Start() to observe pre-warm exits.
  void SetEventCallback(PoolEventFn fn, void* ctx = nullptr) { core_->SetEventCallback(fn, ctx); }

  /**
   * @brief Pre-warm min(prewarm_workers, size) workers and start the health
   *        check and metrics timers.
   */
  void Start() {
    if (started_) return;
    started_ = true;
    core_->Prewarm();
    if (cfg_.health_check_ms > 0U) {
      (void)timer_.Add(cfg_.health_check_ms, &WorkerPool::HealthTick, core_.get());
    }
    if (cfg_.metrics_interval_ms > 0U) {
      (void)timer_.Add(cfg_.metrics_interval_ms, &WorkerPool::MetricsTick, core_.get());
    }
    auto r = timer_.Start();
    if (!r.has_value()) {
      PDFMERGE_LOG_WARN("Pool", "%s: timer already running", cfg_.name.c_str());
    }
    PDFMERGE_LOG_INFO("Pool", "%s: started (size=%u, min=%u, max_queue=%u)", cfg_.name.c_str(),
                      cfg_.size, cfg_.min_workers, cfg_.max_queue_size);
  }

  /**
   * @brief Submit a callable. Higher priority runs first; equal priorities
   *        run in arrival order.
   *
   * @return Future of expected<R, TaskError>, or kShuttingDown / kQueueFull.
   */
  template <typename Fn, typename R = std::invoke_result_t<std::decay_t<Fn>&>>
  expected<TaskFuture<R>, PoolError> Submit(Fn&& fn, int32_t priority = kPriorityNormal) {
    using Task = detail::TypedPoolTask<std::decay_t<Fn>, R>;
    auto task = std::make_unique<Task>(std::decay_t<Fn>(std::forward<Fn>(fn)));
    task->priority = priority;
    TaskFuture<R> future = task->GetFuture();
    auto r = core_->Enqueue(std::move(task));
    if (!r.has_value()) {
      return expected<TaskFuture<R>, PoolError>::error(r.get_error());
    }
    return expected<TaskFuture<R>, PoolError>::success(std::move(future));
  }

  PoolMetrics GetMetrics() const { return core_->GetMetrics(); }

  std::vector<WorkerMetrics> GetWorkerMetrics() const { return core_->GetWorkerMetrics(); }

  /// One health-check pass (also driven by the timer).
  void RunHealthCheck() { core_->RunHealthCheck(); }

  /// One scaling step, ignoring the cooldown.
  void AdjustScale() { core_->AdjustScale(); }

  bool IsShuttingDown() const { return core_->IsShuttingDown(); }

  const PoolConfig& Config() const noexcept { return cfg_; }

  /**
   * @brief Stop accepting work, reject queued tasks, wait for in-flight
   *        tasks up to timeout_ms, then abandon the rest. Idempotent.
   */
  PoolShutdownReport Shutdown(uint32_t timeout_ms) {
    timer_.Stop();
    return core_->Shutdown(timeout_ms);
  }

  PoolShutdownReport Shutdown() { return Shutdown(cfg_.shutdown_timeout_ms); }

  /**
   * @brief Wait for worker threads, including those abandoned by a timed-out
   *        Shutdown(). Objects referenced by running tasks must outlive this.
   */
  void WaitForWorkers() { core_->WaitForWorkers(); }

  /// @return false if a worker thread is still alive after timeout_ms.
  bool WaitForWorkers(uint32_t timeout_ms) { return core_->WaitForWorkers(timeout_ms); }

  static uint32_t DesiredWorkers(const PoolConfig& cfg, uint32_t queue_length,
                                 double memory_pressure) noexcept {
    return detail::PoolCore::DesiredWorkers(cfg, queue_length, memory_pressure);
  }

 private:
  static void HealthTick(void* ctx) { static_cast<detail::PoolCore*>(ctx)->RunHealthCheck(); }
  static void MetricsTick(void* ctx) { static_cast<detail::PoolCore*>(ctx)->EmitMetrics(); }

  const PoolConfig cfg_;
  std::shared_ptr<detail::PoolCore> core_;
  TimerScheduler timer_;
  bool started_{false};
};

}  // namespace pdfmerge

#endif  // PDFMERGE_WORKER_POOL_HPP_
