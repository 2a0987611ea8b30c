/**
 * @file test_memory_governor.cpp
 * @brief Catch2 tests for pdfmerge::MemoryGovernor.
 */

#include "pdfmerge/memory_governor.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

namespace {

/// Usage is whatever the test sets; a hook can lower it to simulate reclaim.
struct FakeUsage {
  std::atomic<uint64_t> bytes{0U};
  std::atomic<uint64_t> after_reclaim{0U};
  std::atomic<int> hook_calls{0};
};

uint64_t ReadUsage(void* ctx) { return static_cast<FakeUsage*>(ctx)->bytes.load(); }

void DropUsage(void* ctx) {
  auto* u = static_cast<FakeUsage*>(ctx);
  u->hook_calls.fetch_add(1);
  u->bytes.store(u->after_reclaim.load());
}

void CountOnly(void* ctx) { static_cast<std::atomic<int>*>(ctx)->fetch_add(1); }

pdfmerge::MemoryGovernorConfig SmallCeiling() {
  pdfmerge::MemoryGovernorConfig cfg;
  cfg.ceiling_bytes = 100U * pdfmerge::kMiB;
  cfg.threshold = 0.75;
  cfg.trim_heap = false;
  return cfg;
}

}  // namespace

// ============================================================================
// CheckAndReclaim
// ============================================================================

TEST_CASE("memory_governor - below threshold does nothing", "[memory]") {
  FakeUsage usage;
  usage.bytes = 50U * pdfmerge::kMiB;
  pdfmerge::MemoryGovernor gov(SmallCeiling(), &ReadUsage, &usage);
  REQUIRE(gov.AddReclaimHook("drop", &DropUsage, &usage).has_value());

  auto r = gov.CheckAndReclaim();
  REQUIRE(r.has_value());
  CHECK_FALSE(r.value().reclaimed);
  CHECK(r.value().used_bytes == 50U * pdfmerge::kMiB);
  CHECK(usage.hook_calls.load() == 0);
  CHECK_FALSE(gov.IsOverLimit());
  CHECK(gov.GetStats().samples == 1U);
}

TEST_CASE("memory_governor - above threshold runs hooks and resamples", "[memory]") {
  FakeUsage usage;
  usage.bytes = 90U * pdfmerge::kMiB;
  usage.after_reclaim = 40U * pdfmerge::kMiB;
  pdfmerge::MemoryGovernor gov(SmallCeiling(), &ReadUsage, &usage);
  std::atomic<int> other{0};
  REQUIRE(gov.AddReclaimHook("drop", &DropUsage, &usage).has_value());
  REQUIRE(gov.AddReclaimHook("other", &CountOnly, &other).has_value());

  auto r = gov.CheckAndReclaim();
  REQUIRE(r.has_value());
  CHECK(r.value().reclaimed);
  CHECK(r.value().used_bytes == 90U * pdfmerge::kMiB);
  CHECK(r.value().used_after_bytes == 40U * pdfmerge::kMiB);
  CHECK(r.value().Pressure() > 0.39);
  CHECK(r.value().Pressure() < 0.41);
  CHECK(usage.hook_calls.load() == 1);
  CHECK(other.load() == 1);

  auto stats = gov.GetStats();
  CHECK(stats.reclaims == 1U);
  CHECK(stats.samples == 2U);
  CHECK(stats.peak_used_bytes == 90U * pdfmerge::kMiB);
  CHECK(stats.last_used_bytes == 40U * pdfmerge::kMiB);
}

TEST_CASE("memory_governor - still over ceiling latches the limit", "[memory]") {
  FakeUsage usage;
  usage.bytes = 150U * pdfmerge::kMiB;
  usage.after_reclaim = 120U * pdfmerge::kMiB;
  pdfmerge::MemoryGovernor gov(SmallCeiling(), &ReadUsage, &usage);
  REQUIRE(gov.AddReclaimHook("drop", &DropUsage, &usage).has_value());

  auto r = gov.CheckAndReclaim();
  REQUIRE_FALSE(r.has_value());
  CHECK(r.get_error() == pdfmerge::MemoryError::kLimitExceeded);
  CHECK(gov.IsOverLimit());
  CHECK(gov.GetStats().limit_exceeded == 1U);

  // Recovers once usage drops.
  usage.bytes = 10U * pdfmerge::kMiB;
  REQUIRE(gov.CheckAndReclaim().has_value());
  CHECK_FALSE(gov.IsOverLimit());
}

TEST_CASE("memory_governor - removed hook is not called", "[memory]") {
  FakeUsage usage;
  pdfmerge::MemoryGovernor gov(SmallCeiling(), &ReadUsage, &usage);
  std::atomic<int> calls{0};
  auto id = gov.AddReclaimHook("count", &CountOnly, &calls);
  REQUIRE(id.has_value());
  gov.Reclaim();
  CHECK(calls.load() == 1);
  gov.RemoveReclaimHook(id.value());
  gov.Reclaim();
  CHECK(calls.load() == 1);
}

TEST_CASE("memory_governor - hook table is bounded", "[memory]") {
  pdfmerge::MemoryGovernor gov(SmallCeiling(), &ReadUsage, nullptr);
  std::atomic<int> calls{0};
  for (uint32_t i = 0U; i < pdfmerge::MemoryGovernor::kMaxHooks; ++i) {
    REQUIRE(gov.AddReclaimHook("h", &CountOnly, &calls).has_value());
  }
  auto full = gov.AddReclaimHook("overflow", &CountOnly, &calls);
  REQUIRE_FALSE(full.has_value());
  CHECK(full.get_error() == pdfmerge::MemoryError::kHooksFull);
}

TEST_CASE("memory_governor - default sampler reads a plausible RSS", "[memory]") {
#if defined(PDFMERGE_PLATFORM_LINUX)
  CHECK(pdfmerge::MemoryGovernor::ReadProcessRss(nullptr) > 0U);
#else
  CHECK(pdfmerge::MemoryGovernor::ReadProcessRss(nullptr) == 0U);
#endif
}

// ============================================================================
// Monitoring
// ============================================================================

TEST_CASE("memory_governor - periodic monitor latches over-limit", "[memory]") {
  FakeUsage usage;
  usage.bytes = 500U * pdfmerge::kMiB;
  usage.after_reclaim = 500U * pdfmerge::kMiB;
  pdfmerge::MemoryGovernor gov(SmallCeiling(), &ReadUsage, &usage);
  REQUIRE(gov.AddReclaimHook("drop", &DropUsage, &usage).has_value());

  REQUIRE(gov.StartMonitoring(5U).has_value());
  CHECK(gov.IsMonitoring());
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!gov.IsOverLimit() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  CHECK(gov.IsOverLimit());
  CHECK(usage.hook_calls.load() >= 1);
  gov.StopMonitoring();
  CHECK_FALSE(gov.IsMonitoring());
}
