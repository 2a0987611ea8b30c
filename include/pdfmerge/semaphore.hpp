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
 * @file semaphore.hpp
 * @brief Counting semaphore and scoped permit used to cap concurrent copies.
 *
 * LightSemaphore is mutex+condvar based. SemaphorePermit acquires one unit on
 * construction (optionally with a timeout) and returns it on destruction.
 */

#ifndef PDFMERGE_SEMAPHORE_HPP_
#define PDFMERGE_SEMAPHORE_HPP_

#include "pdfmerge/platform.hpp"

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace pdfmerge {

// ============================================================================
// LightSemaphore
// ============================================================================

/**
 * @brief Counting semaphore using mutex + condition_variable.
 *
 * Usage:
 * @code
 *   pdfmerge::LightSemaphore sem(8);
 *   sem.Wait();
 *   // ... bounded section ...
 *   sem.Signal();
 * @endcode
 */
class LightSemaphore final {
 public:
  explicit LightSemaphore(uint32_t initial_count = 0) noexcept : count_(initial_count) {}

  ~LightSemaphore() = default;

  LightSemaphore(const LightSemaphore&) = delete;
  LightSemaphore& operator=(const LightSemaphore&) = delete;
  LightSemaphore(LightSemaphore&&) = delete;
  LightSemaphore& operator=(LightSemaphore&&) = delete;

  /**
   * @brief Increment the count and wake one waiting thread.
   */
  void Signal() noexcept {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      ++count_;
    }
    cv_.notify_one();
  }

  /**
   * @brief Decrement the count, blocking while it is zero.
   */
  void Wait() noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return count_ > 0U; });
    --count_;
  }

  bool TryWait() noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    if (count_ > 0U) {
      --count_;
      return true;
    }
    return false;
  }

  /**
   * @brief Timed wait.
   * @param timeout_us Maximum time to wait in microseconds.
   * @return true if the count was decremented before the timeout.
   */
  bool WaitFor(uint64_t timeout_us) noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    bool result = cv_.wait_for(lk, std::chrono::microseconds(timeout_us),
                               [this] { return count_ > 0U; });
    if (result) {
      --count_;
    }
    return result;
  }

  uint32_t Count() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return count_;
  }

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  uint32_t count_;
};

// ============================================================================
// SemaphorePermit
// ============================================================================

/**
 * @brief Scoped permit on a LightSemaphore.
 *
 * The blocking constructor always acquires. The timed constructor may fail;
 * check Acquired() before entering the bounded section.
 */
class SemaphorePermit final {
 public:
  explicit SemaphorePermit(LightSemaphore& sem) noexcept : sem_(&sem), acquired_(true) {
    sem_->Wait();
  }

  SemaphorePermit(LightSemaphore& sem, uint64_t timeout_us) noexcept
      : sem_(&sem), acquired_(sem.WaitFor(timeout_us)) {}

  /// Take over a unit the caller already holds (released on another thread).
  SemaphorePermit(LightSemaphore& sem, std::adopt_lock_t) noexcept : sem_(&sem), acquired_(true) {}

  ~SemaphorePermit() { Release(); }

  SemaphorePermit(const SemaphorePermit&) = delete;
  SemaphorePermit& operator=(const SemaphorePermit&) = delete;
  SemaphorePermit(SemaphorePermit&&) = delete;
  SemaphorePermit& operator=(SemaphorePermit&&) = delete;

  bool Acquired() const noexcept { return acquired_; }

  void Release() noexcept {
    if (acquired_) {
      acquired_ = false;
      sem_->Signal();
    }
  }

 private:
  LightSemaphore* sem_;
  bool acquired_;
};

}  // namespace pdfmerge

#endif  // PDFMERGE_SEMAPHORE_HPP_
