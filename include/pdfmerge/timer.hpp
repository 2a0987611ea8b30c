/**
 * @file timer.hpp
 * @brief Periodic task scheduler driving health checks, metrics and memory
 *        sampling.
 *
 * One background thread fires registered callbacks at fixed intervals. The
 * slot array is sized at construction. Callbacks run outside the slot lock,
 * so a callback may Add() or Remove() tasks. Stop() wakes the thread
 * immediately instead of waiting out the current sleep.
 */

#ifndef PDFMERGE_TIMER_HPP_
#define PDFMERGE_TIMER_HPP_

#include "pdfmerge/platform.hpp"
#include "pdfmerge/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace pdfmerge {

/// Callback invoked on each period tick.
using TimerTaskFn = void (*)(void* ctx);

class TimerTaskId final {
 public:
  explicit TimerTaskId(uint32_t v = 0U) noexcept : value_(v) {}
  uint32_t value() const noexcept { return value_; }
  bool operator==(const TimerTaskId& o) const noexcept { return value_ == o.value_; }

 private:
  uint32_t value_;
};

// ============================================================================
// TimerScheduler
// ============================================================================

/**
 * @brief Fixed-capacity periodic scheduler.
 *
 * @code
 *   pdfmerge::TimerScheduler sched(4);
 *   sched.Add(10000, &HealthCheckTick, this);
 *   sched.Start();
 *   ...
 *   sched.Stop();
 * @endcode
 */
class TimerScheduler final {
 public:
  explicit TimerScheduler(uint32_t max_tasks = 8) : slots_(max_tasks) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  /**
   * @brief Register a periodic task. First fire is one period from now.
   *
   * @return Task id, or kInvalidPeriod (period 0 / null fn) or kSlotsFull.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn,
                                        void* ctx = nullptr) {
    if (period_ms == 0U || fn == nullptr) {
      return expected<TimerTaskId, TimerError>::error(TimerError::kInvalidPeriod);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (!slot.active) {
        slot.fn = fn;
        slot.ctx = ctx;
        slot.period_us = static_cast<uint64_t>(period_ms) * 1000ULL;
        slot.next_fire_us = SteadyNowUs() + slot.period_us;
        slot.id = next_id_++;
        slot.active = true;
        cv_.notify_all();
        return expected<TimerTaskId, TimerError>::success(TimerTaskId(slot.id));
      }
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active && slot.id == task_id.value()) {
        slot.active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotRunning);
  }

  expected<void, TimerError> Start() {
    bool was_running = running_.exchange(true, std::memory_order_acq_rel);
    if (was_running) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /// Blocks until the scheduler thread exits. Safe when not running.
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  uint32_t TaskCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (const auto& slot : slots_) {
      if (slot.active) ++count;
    }
    return count;
  }

 private:
  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    uint64_t period_us = 0;
    uint64_t next_fire_us = 0;
    uint32_t id = 0;
    bool active = false;
  };

  struct DueTask {
    TimerTaskFn fn;
    void* ctx;
  };

  void ScheduleLoop() {
    std::vector<DueTask> due;
    due.reserve(slots_.size());

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
      const uint64_t now = SteadyNowUs();
      uint64_t next_wake = now + 100000ULL;  // idle re-check every 100 ms

      due.clear();
      for (auto& slot : slots_) {
        if (!slot.active) continue;
        if (now >= slot.next_fire_us) {
          due.push_back(DueTask{slot.fn, slot.ctx});
          // Skip missed periods instead of firing a burst.
          while (slot.next_fire_us <= now) {
            slot.next_fire_us += slot.period_us;
          }
        }
        if (slot.next_fire_us < next_wake) {
          next_wake = slot.next_fire_us;
        }
      }

      if (!due.empty()) {
        lock.unlock();
        for (const auto& task : due) {
          task.fn(task.ctx);
        }
        lock.lock();
        continue;
      }

      const uint64_t wait_us = (next_wake > now) ? (next_wake - now) : 0U;
      cv_.wait_for(lock, std::chrono::microseconds(wait_us));
    }
  }

  std::vector<TaskSlot> slots_;
  uint32_t next_id_ = 1;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace pdfmerge

#endif  // PDFMERGE_TIMER_HPP_
