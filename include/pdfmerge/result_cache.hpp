/**
 * @file result_cache.hpp
 * @brief Bounded in-memory cache of merged outputs with a fixed TTL.
 *
 * Keyed by BuildCacheKey(): the "name-size-lastModified-digest" tuple of every
 * input, sorted and joined with '|'. The digest is an FNV-1a 64 hash of the
 * file bytes, so equal names and sizes with different content never collide. Bounded by entry count and total bytes; the oldest entry is evicted
 * first. Expired entries are removed lazily on lookup and by Sweep(), which
 * the periodic timer (StartSweeping) drives.
 */

#ifndef PDFMERGE_RESULT_CACHE_HPP_
#define PDFMERGE_RESULT_CACHE_HPP_

#include "pdfmerge/document_model.hpp"
#include "pdfmerge/log.hpp"
#include "pdfmerge/platform.hpp"
#include "pdfmerge/timer.hpp"
#include "pdfmerge/vocabulary.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>

#include <algorithm>
#include <iterator>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pdfmerge {

struct ResultCacheConfig {
  bool enabled{true};
  uint32_t ttl_ms{300000U};
  uint32_t max_entries{50U};
  uint64_t max_bytes{512ULL * kMiB};
  uint32_t sweep_interval_ms{60000U};
};

struct CacheKeyPart {
  std::string name;
  uint64_t size{0U};
  uint64_t last_modified{0U};
  uint64_t digest{0U};
};

/// FNV-1a 64-bit hash of a whole buffer.
inline uint64_t ContentDigest(const uint8_t* data, size_t len) noexcept {
  uint64_t hash = 14695981039346656037ULL;
  for (size_t i = 0; i < len; ++i) {
    hash ^= static_cast<uint64_t>(data[i]);
    hash *= 1099511628211ULL;
  }
  return hash;
}

inline uint64_t ContentDigest(const SharedBytes& bytes) noexcept {
  return bytes ? ContentDigest(bytes->data(), bytes->size()) : 0U;
}

inline std::string DigestHex(uint64_t digest) {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016" PRIx64, digest);
  return buf;
}

inline std::string BuildCacheKey(const std::vector<CacheKeyPart>& parts) {
  std::vector<std::string> items;
  items.reserve(parts.size());
  for (const auto& p : parts) {
    items.push_back(p.name + "-" + std::to_string(p.size) + "-" + std::to_string(p.last_modified) +
                    "-" + DigestHex(p.digest));
  }
  std::sort(items.begin(), items.end());
  std::string key;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i != 0U) key.push_back('|');
    key += items[i];
  }
  return key;
}

struct CachedResult {
  SharedBytes data;
  uint32_t total_pages{0U};
  uint64_t processing_ms{0U};
  uint32_t warning_count{0U};
};

struct ResultCacheStats {
  uint64_t hits{0U};
  uint64_t misses{0U};
  uint64_t inserts{0U};
  uint64_t evictions{0U};
  uint64_t expirations{0U};
  uint32_t entries{0U};
  uint64_t bytes{0U};
};

/// Millisecond clock, injectable for tests.
using CacheClockFn = uint64_t (*)(void* ctx);

class ResultCache final {
 public:
  explicit ResultCache(const ResultCacheConfig& cfg = ResultCacheConfig{},
                       CacheClockFn clock = nullptr, void* clock_ctx = nullptr)
      : cfg_(cfg), clock_(clock), clock_ctx_(clock_ctx), timer_(1U) {}

  ~ResultCache() { StopSweeping(); }

  ResultCache(const ResultCache&) = delete;
  ResultCache& operator=(const ResultCache&) = delete;

  bool Enabled() const noexcept { return cfg_.enabled; }

  optional<CachedResult> Find(const std::string& key) {
    if (!cfg_.enabled) return optional<CachedResult>();
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      ++stats_.misses;
      return optional<CachedResult>();
    }
    if (ExpiredLocked(*it->second, Now())) {
      EraseLocked(it->second);
      ++stats_.expirations;
      ++stats_.misses;
      return optional<CachedResult>();
    }
    ++stats_.hits;
    return optional<CachedResult>(it->second->result);
  }

  /// @return false when disabled or the entry alone exceeds the byte bound.
  bool Insert(const std::string& key, const CachedResult& result) {
    if (!cfg_.enabled || cfg_.max_entries == 0U) return false;
    const uint64_t size = result.data ? result.data->size() : 0U;
    if (size > cfg_.max_bytes) {
      PDFMERGE_LOG_DEBUG("Cache", "result of %" PRIu64 " bytes too large to cache", size);
      return false;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    auto it = index_.find(key);
    if (it != index_.end()) EraseLocked(it->second);

    while (!order_.empty() &&
           (order_.size() >= cfg_.max_entries || bytes_ + size > cfg_.max_bytes)) {
      EraseLocked(order_.begin());
      ++stats_.evictions;
    }

    order_.push_back(Entry{key, result, Now(), size});
    auto pos = std::prev(order_.end());
    index_.emplace(key, pos);
    bytes_ += size;
    ++stats_.inserts;
    return true;
  }

  /// Remove expired entries. @return number removed.
  size_t Sweep() {
    std::lock_guard<std::mutex> lock(mtx_);
    const uint64_t now = Now();
    size_t removed = 0U;
    // Entries are in insertion order, so expired ones form a prefix.
    while (!order_.empty() && ExpiredLocked(order_.front(), now)) {
      EraseLocked(order_.begin());
      ++removed;
    }
    stats_.expirations += removed;
    if (removed != 0U) {
      PDFMERGE_LOG_DEBUG("Cache", "swept %zu expired result(s), %zu left", removed, order_.size());
    }
    return removed;
  }

  size_t Clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    const size_t n = order_.size();
    order_.clear();
    index_.clear();
    bytes_ = 0U;
    return n;
  }

  ResultCacheStats GetStats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    ResultCacheStats s = stats_;
    s.entries = static_cast<uint32_t>(order_.size());
    s.bytes = bytes_;
    return s;
  }

  expected<void, TimerError> StartSweeping() {
    auto id = timer_.Add(cfg_.sweep_interval_ms, &ResultCache::SweepTick, this);
    if (!id.has_value()) return expected<void, TimerError>::error(id.get_error());
    return timer_.Start();
  }

  void StopSweeping() { timer_.Stop(); }

  /// Memory governor reclaim hook.
  static void ReclaimHook(void* ctx) {
    const size_t n = static_cast<ResultCache*>(ctx)->Clear();
    PDFMERGE_LOG_INFO("Cache", "reclaim cleared %zu cached result(s)", n);
  }

  const ResultCacheConfig& Config() const noexcept { return cfg_; }

 private:
  struct Entry {
    std::string key;
    CachedResult result;
    uint64_t created_ms;
    uint64_t size;
  };
  using EntryList = std::list<Entry>;

  static void SweepTick(void* ctx) { (void)static_cast<ResultCache*>(ctx)->Sweep(); }

  uint64_t Now() const noexcept { return clock_ != nullptr ? clock_(clock_ctx_) : SteadyNowMs(); }

  bool ExpiredLocked(const Entry& e, uint64_t now) const noexcept {
    return now - e.created_ms >= cfg_.ttl_ms;
  }

  void EraseLocked(EntryList::iterator it) {
    bytes_ -= it->size;
    index_.erase(it->key);
    order_.erase(it);
  }

  const ResultCacheConfig cfg_;
  CacheClockFn clock_;
  void* clock_ctx_;

  mutable std::mutex mtx_;
  EntryList order_;
  std::unordered_map<std::string, EntryList::iterator> index_;
  uint64_t bytes_{0U};
  ResultCacheStats stats_;

  TimerScheduler timer_;
};

}  // namespace pdfmerge

#endif  // PDFMERGE_RESULT_CACHE_HPP_
