/**
 * @file test_worker_pool.cpp
 * @brief Catch2 tests for pdfmerge::WorkerPool.
 */

#include "pdfmerge/worker_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

/// Config with the background timers off so tests drive health checks.
pdfmerge::PoolConfig QuietConfig(uint32_t size) {
  pdfmerge::PoolConfig cfg;
  cfg.name = "test";
  cfg.size = size;
  cfg.min_workers = 1U;
  cfg.prewarm_workers = 1U;
  cfg.health_check_ms = 0U;
  cfg.metrics_interval_ms = 0U;
  cfg.shutdown_timeout_ms = 2000U;
  return cfg;
}

struct EventLog {
  std::mutex mtx;
  std::vector<pdfmerge::PoolEventType> types;
  std::vector<std::string> messages;

  static void OnEvent(const pdfmerge::PoolEvent& ev, void* ctx) {
    auto* self = static_cast<EventLog*>(ctx);
    std::lock_guard<std::mutex> lk(self->mtx);
    self->types.push_back(ev.type);
    self->messages.emplace_back(ev.message != nullptr ? ev.message : "");
  }

  bool Has(pdfmerge::PoolEventType t) {
    std::lock_guard<std::mutex> lk(mtx);
    for (auto x : types) {
      if (x == t) return true;
    }
    return false;
  }
};

/// Holds a worker busy until Release().
struct Gate {
  std::atomic<bool> open{false};
  std::atomic<bool> entered{false};

  void Wait() {
    entered.store(true);
    while (!open.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  void Release() { open.store(true); }
  void AwaitEntered() {
    while (!entered.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
};

uint64_t HugeUsage(void*) { return 1000U; }

}  // namespace

// ============================================================================
// Submit
// ============================================================================

TEST_CASE("worker_pool - submit returns the task result", "[worker_pool]") {
  pdfmerge::WorkerPool pool(QuietConfig(2U));
  pool.Start();

  auto r = pool.Submit([] { return 42; });
  REQUIRE(r.has_value());
  auto out = r.value().get();
  REQUIRE(out.has_value());
  CHECK(out.value() == 42);

  std::atomic<int> hits{0};
  auto v = pool.Submit([&hits] { hits.fetch_add(1); });
  REQUIRE(v.has_value());
  CHECK(v.value().get().has_value());
  CHECK(hits.load() == 1);
}

TEST_CASE("worker_pool - metrics count processed tasks", "[worker_pool]") {
  pdfmerge::WorkerPool pool(QuietConfig(2U));
  pool.Start();

  std::vector<pdfmerge::TaskFuture<int>> futures;
  for (int i = 0; i < 5; ++i) {
    auto r = pool.Submit([i] { return i; });
    REQUIRE(r.has_value());
    futures.push_back(std::move(r.value()));
  }
  for (auto& f : futures) {
    REQUIRE(f.get().has_value());
  }

  // Counters are bumped after the future is fulfilled.
  pdfmerge::PoolMetrics m = pool.GetMetrics();
  for (int i = 0; i < 200 && m.total_processed < 5U; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    m = pool.GetMetrics();
  }
  CHECK(m.total_processed == 5U);
  CHECK(m.total_failed == 0U);
  CHECK(m.total_workers >= 1U);
  CHECK(m.total_workers <= 2U);
  CHECK(m.queue_length == 0U);

  uint64_t per_worker = 0U;
  for (const auto& w : pool.GetWorkerMetrics()) {
    per_worker += w.total_tasks;
    CHECK(w.successful_tasks == w.total_tasks);
  }
  CHECK(per_worker == 5U);
}

TEST_CASE("worker_pool - higher priority runs first, ties in arrival order", "[worker_pool]") {
  pdfmerge::WorkerPool pool(QuietConfig(1U));
  pool.Start();

  Gate gate;
  auto blocker = pool.Submit([&gate] { gate.Wait(); });
  REQUIRE(blocker.has_value());
  gate.AwaitEntered();

  std::mutex mtx;
  std::vector<std::string> order;
  auto record = [&mtx, &order](const char* tag) {
    std::lock_guard<std::mutex> lk(mtx);
    order.emplace_back(tag);
  };

  auto low = pool.Submit([&record] { record("low"); }, pdfmerge::kPriorityLow);
  auto normal = pool.Submit([&record] { record("normal"); }, pdfmerge::kPriorityNormal);
  auto high1 = pool.Submit([&record] { record("high1"); }, pdfmerge::kPriorityHigh);
  auto high2 = pool.Submit([&record] { record("high2"); }, pdfmerge::kPriorityHigh);
  REQUIRE(low.has_value());
  REQUIRE(normal.has_value());
  REQUIRE(high1.has_value());
  REQUIRE(high2.has_value());
  CHECK(pool.GetMetrics().queue_length == 4U);

  gate.Release();
  CHECK(blocker.value().get().has_value());
  CHECK(low.value().get().has_value());
  CHECK(normal.value().get().has_value());
  CHECK(high1.value().get().has_value());
  CHECK(high2.value().get().has_value());

  REQUIRE(order.size() == 4U);
  CHECK(order[0] == "high1");
  CHECK(order[1] == "high2");
  CHECK(order[2] == "normal");
  CHECK(order[3] == "low");
}

TEST_CASE("worker_pool - full queue rejects new work", "[worker_pool]") {
  pdfmerge::PoolConfig cfg = QuietConfig(1U);
  cfg.max_queue_size = 2U;
  pdfmerge::WorkerPool pool(cfg);
  pool.Start();

  Gate gate;
  auto blocker = pool.Submit([&gate] { gate.Wait(); });
  REQUIRE(blocker.has_value());
  gate.AwaitEntered();

  auto a = pool.Submit([] { return 1; });
  auto b = pool.Submit([] { return 2; });
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());

  auto c = pool.Submit([] { return 3; });
  REQUIRE_FALSE(c.has_value());
  CHECK(c.get_error() == pdfmerge::PoolError::kQueueFull);
  CHECK(pool.GetMetrics().total_rejected == 1U);

  gate.Release();
  CHECK(a.value().get().value() == 1);
  CHECK(b.value().get().value() == 2);
}

TEST_CASE("worker_pool - active workers never exceed the pool size", "[worker_pool]") {
  pdfmerge::WorkerPool pool(QuietConfig(2U));
  pool.Start();

  Gate gate;
  std::atomic<int> running{0};
  std::atomic<int> most{0};
  std::vector<pdfmerge::TaskFuture<void>> futures;
  for (int i = 0; i < 6; ++i) {
    auto r = pool.Submit([&gate, &running, &most] {
      const int now = running.fetch_add(1) + 1;
      int prev = most.load();
      while (now > prev && !most.compare_exchange_weak(prev, now)) {
      }
      gate.Wait();
      running.fetch_sub(1);
    });
    REQUIRE(r.has_value());
    futures.push_back(std::move(r.value()));
  }
  gate.AwaitEntered();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  pdfmerge::PoolMetrics m = pool.GetMetrics();
  CHECK(m.active_workers <= 2U);
  CHECK(m.total_workers <= 2U);
  CHECK(m.queue_length >= 4U);

  gate.Release();
  for (auto& f : futures) {
    CHECK(f.get().has_value());
  }
  CHECK(most.load() <= 2);
  CHECK(pool.GetMetrics().peak_active_workers <= 2U);
  CHECK(pool.GetMetrics().peak_active_workers >= 1U);
}

// ============================================================================
// Crash handling
// ============================================================================

TEST_CASE("worker_pool - a throwing task crashes its worker only", "[worker_pool]") {
  EventLog events;
  pdfmerge::WorkerPool pool(QuietConfig(1U));
  pool.SetEventCallback(&EventLog::OnEvent, &events);
  pool.Start();

  auto bad = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
  REQUIRE(bad.has_value());
  auto out = bad.value().get();
  REQUIRE_FALSE(out.has_value());
  CHECK(out.get_error() == pdfmerge::TaskError::kWorkerCrashed);

  // The replacement worker serves the next task.
  auto good = pool.Submit([] { return 7; });
  REQUIRE(good.has_value());
  CHECK(good.value().get().value() == 7);

  for (int i = 0; i < 200 && !events.Has(pdfmerge::PoolEventType::kWorkerExit); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  CHECK(events.Has(pdfmerge::PoolEventType::kWorkerError));
  CHECK(events.Has(pdfmerge::PoolEventType::kWorkerExit));
  {
    std::lock_guard<std::mutex> lk(events.mtx);
    bool saw_boom = false;
    for (const auto& m : events.messages) {
      if (m == "boom") saw_boom = true;
    }
    CHECK(saw_boom);
  }

  pdfmerge::PoolMetrics m = pool.GetMetrics();
  CHECK(m.total_failed == 1U);
  CHECK(m.total_workers == 1U);
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE("worker_pool - shutdown rejects queued tasks and waits for running ones",
          "[worker_pool]") {
  EventLog events;
  pdfmerge::WorkerPool pool(QuietConfig(1U));
  pool.SetEventCallback(&EventLog::OnEvent, &events);
  pool.Start();

  Gate gate;
  auto blocker = pool.Submit([&gate] { gate.Wait(); return 5; });
  REQUIRE(blocker.has_value());
  gate.AwaitEntered();

  auto q1 = pool.Submit([] { return 1; });
  auto q2 = pool.Submit([] { return 2; });
  REQUIRE(q1.has_value());
  REQUIRE(q2.has_value());

  std::thread releaser([&gate] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    gate.Release();
  });
  pdfmerge::PoolShutdownReport report = pool.Shutdown(2000U);
  releaser.join();

  CHECK(report.clean);
  CHECK(report.rejected_tasks == 2U);
  CHECK(report.abandoned_workers == 0U);
  CHECK(pool.IsShuttingDown());

  CHECK(blocker.value().get().value() == 5);
  auto r1 = q1.value().get();
  REQUIRE_FALSE(r1.has_value());
  CHECK(r1.get_error() == pdfmerge::TaskError::kShuttingDown);
  auto r2 = q2.value().get();
  REQUIRE_FALSE(r2.has_value());
  CHECK(r2.get_error() == pdfmerge::TaskError::kShuttingDown);

  CHECK(events.Has(pdfmerge::PoolEventType::kShutdown));

  auto late = pool.Submit([] { return 0; });
  REQUIRE_FALSE(late.has_value());
  CHECK(late.get_error() == pdfmerge::PoolError::kShuttingDown);

  // Second call is a no-op.
  pdfmerge::PoolShutdownReport again = pool.Shutdown(10U);
  CHECK(again.clean);
  CHECK(again.rejected_tasks == 0U);
}

TEST_CASE("worker_pool - shutdown timeout abandons stuck workers", "[worker_pool]") {
  pdfmerge::WorkerPool pool(QuietConfig(1U));
  pool.Start();

  Gate gate;
  auto stuck = pool.Submit([&gate] { gate.Wait(); });
  REQUIRE(stuck.has_value());
  gate.AwaitEntered();

  pdfmerge::PoolShutdownReport report = pool.Shutdown(20U);
  CHECK_FALSE(report.clean);
  CHECK(report.abandoned_workers == 1U);
  CHECK(pool.GetMetrics().total_workers == 0U);

  gate.Release();
  CHECK(stuck.value().get().has_value());
}

TEST_CASE("worker_pool - WaitForWorkers outlasts abandoned workers", "[worker_pool]") {
  pdfmerge::WorkerPool pool(QuietConfig(1U));
  pool.Start();

  Gate gate;
  std::atomic<bool> finished{false};
  auto stuck = pool.Submit([&gate, &finished] {
    gate.Wait();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    finished.store(true);
  });
  REQUIRE(stuck.has_value());
  gate.AwaitEntered();

  pdfmerge::PoolShutdownReport report = pool.Shutdown(10U);
  REQUIRE_FALSE(report.clean);
  CHECK_FALSE(pool.WaitForWorkers(10U));

  gate.Release();
  pool.WaitForWorkers();
  // The thread has left the task, so nothing it captured is touched again.
  CHECK(finished.load());
  CHECK(pool.WaitForWorkers(0U));
}

// ============================================================================
// Scaling and health
// ============================================================================

TEST_CASE("worker_pool - DesiredWorkers follows queue and memory", "[worker_pool]") {
  pdfmerge::PoolConfig cfg;
  cfg.size = 8U;
  cfg.min_workers = 2U;

  CHECK(pdfmerge::WorkerPool::DesiredWorkers(cfg, 0U, 0.0) == 8U);
  CHECK(pdfmerge::WorkerPool::DesiredWorkers(cfg, 0U, 0.5) == 4U);
  CHECK(pdfmerge::WorkerPool::DesiredWorkers(cfg, 4U, 0.8) == 3U);
  CHECK(pdfmerge::WorkerPool::DesiredWorkers(cfg, 12U, 0.5) == 8U);
  // Above 0.85 pressure the result is capped at half the pool.
  CHECK(pdfmerge::WorkerPool::DesiredWorkers(cfg, 20U, 0.9) == 4U);
  CHECK(pdfmerge::WorkerPool::DesiredWorkers(cfg, 0U, 0.9) == 2U);
  CHECK(pdfmerge::WorkerPool::DesiredWorkers(cfg, 0U, 1.5) == 2U);

  cfg.min_workers = 20U;
  CHECK(pdfmerge::WorkerPool::DesiredWorkers(cfg, 0U, 0.0) == 8U);
}

TEST_CASE("worker_pool - AdjustScale ramps up half the deficit", "[worker_pool]") {
  pdfmerge::PoolConfig cfg = QuietConfig(5U);
  pdfmerge::WorkerPool pool(cfg);
  pool.Start();
  CHECK(pool.GetMetrics().total_workers == 1U);

  // Desired 5, current 1: spawn 2.
  pool.AdjustScale();
  CHECK(pool.GetMetrics().total_workers == 3U);
  // Deficit 2: spawn 1.
  pool.AdjustScale();
  CHECK(pool.GetMetrics().total_workers == 4U);
}

TEST_CASE("worker_pool - health check evicts idle workers down to min_workers",
          "[worker_pool]") {
  pdfmerge::PoolConfig cfg = QuietConfig(4U);
  cfg.prewarm_workers = 3U;
  cfg.min_workers = 1U;
  cfg.worker_idle_timeout_ms = 1U;
  // Saturated memory keeps the scaling step at the floor.
  cfg.memory_ceiling_bytes = 100U;
  cfg.memory_sample_fn = &HugeUsage;
  pdfmerge::WorkerPool pool(cfg);
  pool.Start();
  CHECK(pool.GetMetrics().total_workers == 3U);

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  pool.RunHealthCheck();
  CHECK(pool.GetMetrics().total_workers == 1U);

  auto r = pool.Submit([] { return 1; });
  REQUIRE(r.has_value());
  CHECK(r.value().get().value() == 1);
}

TEST_CASE("worker_pool - scale-down evicts only long-idle workers", "[worker_pool]") {
  pdfmerge::PoolConfig cfg = QuietConfig(4U);
  cfg.prewarm_workers = 4U;
  cfg.min_workers = 1U;
  cfg.scale_down_idle_ms = 40U;
  // Saturated memory drives the desired count to the floor.
  cfg.memory_ceiling_bytes = 100U;
  cfg.memory_sample_fn = &HugeUsage;
  pdfmerge::WorkerPool pool(cfg);
  pool.Start();
  REQUIRE(pool.GetMetrics().total_workers == 4U);

  Gate gate;
  auto busy = pool.Submit([&gate] { gate.Wait(); });
  REQUIRE(busy.has_value());
  gate.AwaitEntered();

  // Nobody has been idle long enough yet.
  pool.AdjustScale();
  CHECK(pool.GetMetrics().total_workers == 4U);

  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  pool.AdjustScale();
  // The three idle workers go; the busy one stays.
  CHECK(pool.GetMetrics().total_workers == 1U);
  auto left = pool.GetWorkerMetrics();
  REQUIRE(left.size() == 1U);
  CHECK(left[0].state == pdfmerge::WorkerState::kBusy);

  gate.Release();
  CHECK(busy.value().get().has_value());
}

TEST_CASE("worker_pool - scale-down never goes below min_workers", "[worker_pool]") {
  pdfmerge::PoolConfig cfg = QuietConfig(4U);
  cfg.prewarm_workers = 4U;
  cfg.min_workers = 3U;
  cfg.scale_down_idle_ms = 1U;
  // Pressure above 0.85 caps the desired count at 2, under the floor.
  cfg.memory_ceiling_bytes = 100U;
  cfg.memory_sample_fn = &HugeUsage;
  pdfmerge::WorkerPool pool(cfg);
  pool.Start();
  REQUIRE(pool.GetMetrics().total_workers == 4U);

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  pool.AdjustScale();
  CHECK(pool.GetMetrics().total_workers == 3U);

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  pool.AdjustScale();
  pool.AdjustScale();
  CHECK(pool.GetMetrics().total_workers == 3U);
}

TEST_CASE("worker_pool - health check warns about a stuck queue", "[worker_pool]") {
  pdfmerge::PoolConfig cfg = QuietConfig(1U);
  cfg.queue_warning_ms = 0U;
  cfg.memory_ceiling_bytes = 100U;
  cfg.memory_sample_fn = &HugeUsage;
  EventLog events;
  pdfmerge::WorkerPool pool(cfg);
  pool.SetEventCallback(&EventLog::OnEvent, &events);
  pool.Start();

  Gate gate;
  auto blocker = pool.Submit([&gate] { gate.Wait(); });
  REQUIRE(blocker.has_value());
  gate.AwaitEntered();
  auto queued = pool.Submit([] { return 1; });
  REQUIRE(queued.has_value());

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  pool.RunHealthCheck();
  CHECK(events.Has(pdfmerge::PoolEventType::kQueueWarning));

  gate.Release();
  CHECK(queued.value().get().value() == 1);
}
