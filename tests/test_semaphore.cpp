/**
 * @file test_semaphore.cpp
 * @brief Catch2 tests for pdfmerge::LightSemaphore and SemaphorePermit.
 */

#include "pdfmerge/semaphore.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

// ============================================================================
// LightSemaphore tests
// ============================================================================

TEST_CASE("semaphore - LightSemaphore initial count zero TryWait fails", "[semaphore]") {
  pdfmerge::LightSemaphore sem(0);
  REQUIRE(sem.Count() == 0U);
  REQUIRE_FALSE(sem.TryWait());
  REQUIRE(sem.Count() == 0U);
}

TEST_CASE("semaphore - LightSemaphore Signal accumulates", "[semaphore]") {
  pdfmerge::LightSemaphore sem(0);
  sem.Signal();
  sem.Signal();
  REQUIRE(sem.Count() == 2U);
  sem.Wait();
  REQUIRE(sem.TryWait());
  REQUIRE_FALSE(sem.TryWait());
}

TEST_CASE("semaphore - LightSemaphore WaitFor timeout returns false", "[semaphore]") {
  pdfmerge::LightSemaphore sem(0);
  auto start = std::chrono::steady_clock::now();
  bool result = sem.WaitFor(10000);
  auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start)
                        .count();
  REQUIRE_FALSE(result);
  REQUIRE(elapsed_ms >= 5);
}

TEST_CASE("semaphore - LightSemaphore WaitFor succeeds when signaled", "[semaphore]") {
  pdfmerge::LightSemaphore sem(0);
  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    sem.Signal();
  });
  bool result = sem.WaitFor(2000000);
  producer.join();
  REQUIRE(result);
  REQUIRE(sem.Count() == 0U);
}

TEST_CASE("semaphore - LightSemaphore bounds concurrency", "[semaphore]") {
  pdfmerge::LightSemaphore sem(3);
  std::atomic<int> inside{0};
  std::atomic<int> peak{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 20; ++i) {
        pdfmerge::SemaphorePermit permit(sem);
        const int now = ++inside;
        int p = peak.load();
        while (now > p && !peak.compare_exchange_weak(p, now)) {
        }
        std::this_thread::sleep_for(std::chrono::microseconds(100));
        --inside;
      }
    });
  }
  for (auto& th : threads) th.join();
  CHECK(peak.load() <= 3);
  CHECK(sem.Count() == 3U);
}

// ============================================================================
// SemaphorePermit tests
// ============================================================================

TEST_CASE("semaphore - SemaphorePermit releases on scope exit", "[semaphore]") {
  pdfmerge::LightSemaphore sem(1);
  {
    pdfmerge::SemaphorePermit permit(sem);
    CHECK(permit.Acquired());
    CHECK(sem.Count() == 0U);
  }
  CHECK(sem.Count() == 1U);
}

TEST_CASE("semaphore - SemaphorePermit explicit Release is idempotent", "[semaphore]") {
  pdfmerge::LightSemaphore sem(1);
  {
    pdfmerge::SemaphorePermit permit(sem);
    permit.Release();
    CHECK_FALSE(permit.Acquired());
    CHECK(sem.Count() == 1U);
    permit.Release();
  }
  CHECK(sem.Count() == 1U);
}

TEST_CASE("semaphore - timed SemaphorePermit can fail", "[semaphore]") {
  pdfmerge::LightSemaphore sem(0);
  {
    pdfmerge::SemaphorePermit permit(sem, 5000U);
    CHECK_FALSE(permit.Acquired());
  }
  CHECK(sem.Count() == 0U);
}

TEST_CASE("semaphore - adopted permit is released on another thread", "[semaphore]") {
  pdfmerge::LightSemaphore sem(1);
  sem.Wait();
  REQUIRE(sem.Count() == 0U);
  std::thread worker([&] { pdfmerge::SemaphorePermit permit(sem, std::adopt_lock); });
  worker.join();
  CHECK(sem.Count() == 1U);
}
