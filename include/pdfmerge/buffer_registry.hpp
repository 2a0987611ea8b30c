/**
 * @file buffer_registry.hpp
 * @brief Request-scoped buffer identities (generation-indexed arena).
 *
 * Each input buffer gets a BufferId {slot, generation}. Releasing an id bumps
 * the slot's generation, so a stale id never resolves to a recycled slot and
 * caches keyed by BufferId can be dropped explicitly at scope end.
 */

#ifndef PDFMERGE_BUFFER_REGISTRY_HPP_
#define PDFMERGE_BUFFER_REGISTRY_HPP_

#include "pdfmerge/document_model.hpp"

#include <cstdint>

#include <mutex>
#include <vector>

namespace pdfmerge {

struct BufferId {
  uint32_t slot{0U};
  uint32_t generation{0U};  ///< 0 is never issued.

  bool IsValid() const noexcept { return generation != 0U; }
  uint64_t Key() const noexcept { return (static_cast<uint64_t>(generation) << 32U) | slot; }
  bool operator==(const BufferId& o) const noexcept {
    return slot == o.slot && generation == o.generation;
  }
  bool operator!=(const BufferId& o) const noexcept { return !(*this == o); }
};

class BufferRegistry final {
 public:
  BufferRegistry() = default;

  BufferRegistry(const BufferRegistry&) = delete;
  BufferRegistry& operator=(const BufferRegistry&) = delete;

  BufferId Register(SharedBytes bytes) {
    std::lock_guard<std::mutex> lock(mtx_);
    uint32_t slot = 0U;
    if (!free_.empty()) {
      slot = free_.back();
      free_.pop_back();
    } else {
      slot = static_cast<uint32_t>(slots_.size());
      slots_.emplace_back();
    }
    Slot& s = slots_[slot];
    ++s.generation;
    if (s.generation == 0U) ++s.generation;
    s.bytes = std::move(bytes);
    s.live = true;
    return BufferId{slot, s.generation};
  }

  /// Null when the id was released or never issued.
  SharedBytes Get(BufferId id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!ResolvesLocked(id)) return nullptr;
    return slots_[id.slot].bytes;
  }

  bool Contains(BufferId id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return ResolvesLocked(id);
  }

  /// Drops the registry's reference; later Get(id) returns null.
  void Release(BufferId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!ResolvesLocked(id)) return;
    Slot& s = slots_[id.slot];
    s.bytes.reset();
    s.live = false;
    free_.push_back(id.slot);
  }

  uint32_t LiveCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<uint32_t>(slots_.size() - free_.size());
  }

 private:
  struct Slot {
    SharedBytes bytes;
    uint32_t generation{0U};
    bool live{false};
  };

  bool ResolvesLocked(BufferId id) const noexcept {
    return id.IsValid() && id.slot < slots_.size() && slots_[id.slot].live &&
           slots_[id.slot].generation == id.generation;
  }

  mutable std::mutex mtx_;
  std::vector<Slot> slots_;
  std::vector<uint32_t> free_;
};

}  // namespace pdfmerge

#endif  // PDFMERGE_BUFFER_REGISTRY_HPP_
