/**
 * @file validator.hpp
 * @brief Cheap structural PDF validation with a per-buffer result cache.
 *
 * Check order (first failure wins):
 *   1. size below min_size                 -> kTooSmall
 *   2. "%PDF-" absent from the first window -> kInvalidHeader
 *   3. "%%EOF" absent from the last window  -> remembered, not fatal
 *   4. strict load, one lenient retry       -> kLoadFailed
 *   5. zero pages                           -> kEmptyDocument
 *   6. stats extracted and cached by BufferId
 *
 * Results (valid or not) are cached so re-validating the same buffer never
 * reloads it. The cache holds no buffer reference; entries are dropped with
 * the request scope or cleared by the memory governor.
 */

#ifndef PDFMERGE_VALIDATOR_HPP_
#define PDFMERGE_VALIDATOR_HPP_

#include "pdfmerge/buffer_registry.hpp"
#include "pdfmerge/document_model.hpp"
#include "pdfmerge/log.hpp"
#include "pdfmerge/vocabulary.hpp"

#include <cstdint>
#include <cstring>

#include <algorithm>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace pdfmerge {

enum class ValidationError : uint8_t {
  kTooSmall = 0,
  kInvalidHeader,
  kLoadFailed,
  kEmptyDocument,
};

inline const char* ToString(ValidationError e) noexcept {
  switch (e) {
    case ValidationError::kTooSmall: return "FILE_TOO_SMALL";
    case ValidationError::kInvalidHeader: return "INVALID_HEADER";
    case ValidationError::kLoadFailed: return "LOAD_FAILED";
    case ValidationError::kEmptyDocument: return "EMPTY_DOCUMENT";
  }
  return "VALIDATION_UNKNOWN";
}

struct ValidationFailure {
  ValidationError code{ValidationError::kLoadFailed};
  std::string message;
};

struct PdfStats {
  uint32_t page_count{0U};
  uint64_t file_size{0U};
  bool has_xfa{false};
  bool is_encrypted{false};
  bool is_linearized{false};
  bool missing_eof{false};
  ParseMode parse_mode{ParseMode::kStrict};  ///< Mode that loaded it.
  FixedString<8> version;
};

using ValidationResult = expected<PdfStats, ValidationFailure>;

struct ValidatorConfig {
  uint32_t min_size{100U};
  uint32_t header_window{1024U};
  uint32_t trailer_window{1024U};
};

// ============================================================================
// ValidationCache
// ============================================================================

class ValidationCache final {
 public:
  bool Find(BufferId id, ValidationResult* out) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(id.Key());
    if (it == entries_.end()) return false;
    if (out != nullptr) *out = it->second;
    return true;
  }

  void Insert(BufferId id, const ValidationResult& result) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(id.Key());
    if (it != entries_.end()) {
      it->second = result;
    } else {
      entries_.emplace(id.Key(), result);
    }
  }

  void Drop(BufferId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.erase(id.Key());
  }

  /// @return number of entries removed.
  size_t Clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    const size_t n = entries_.size();
    entries_.clear();
    return n;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
  }

 private:
  mutable std::mutex mtx_;
  std::unordered_map<uint64_t, ValidationResult> entries_;
};

// ============================================================================
// Validator
// ============================================================================

class Validator final {
 public:
  explicit Validator(DocumentModel& model, const ValidatorConfig& cfg = ValidatorConfig{})
      : model_(model), cfg_(cfg) {}

  Validator(const Validator&) = delete;
  Validator& operator=(const Validator&) = delete;

  /// Validate with caching under @p id.
  ValidationResult Validate(BufferId id, const SharedBytes& bytes) {
    ValidationResult cached = ValidationResult::error(ValidationFailure{});
    if (cache_.Find(id, &cached)) {
      PDFMERGE_LOG_DEBUG("Validator", "cache hit for buffer %u/%u", id.slot, id.generation);
      return cached;
    }
    ValidationResult result = Check(bytes);
    cache_.Insert(id, result);
    return result;
  }

  /// Validate without touching the cache.
  ValidationResult Check(const SharedBytes& bytes) {
    const size_t size = bytes ? bytes->size() : 0U;
    if (size < cfg_.min_size) {
      return Fail(ValidationError::kTooSmall, "File is too small to be a valid PDF");
    }

    const uint8_t* data = bytes->data();
    const size_t head_len = std::min<size_t>(size, cfg_.header_window);
    const uint8_t* sig = FindSequence(data, head_len, "%PDF-");
    if (sig == nullptr) {
      return Fail(ValidationError::kInvalidHeader, "Invalid PDF header");
    }

    const size_t tail_len = std::min<size_t>(size, cfg_.trailer_window);
    const bool missing_eof = FindSequence(data + size - tail_len, tail_len, "%%EOF") == nullptr;
    if (missing_eof) {
      PDFMERGE_LOG_DEBUG("Validator", "no %%%%EOF marker in last %zu bytes", tail_len);
    }

    ParseMode mode = ParseMode::kStrict;
    auto doc = model_.Load(bytes, mode);
    if (!doc.has_value()) {
      PDFMERGE_LOG_DEBUG("Validator", "strict load failed (%s), retrying lenient",
                         doc.get_error().message.c_str());
      mode = ParseMode::kLenient;
      doc = model_.Load(bytes, mode);
    }
    if (!doc.has_value()) {
      std::string msg = "Failed to load PDF: " + doc.get_error().message;
      if (missing_eof) msg += " (missing %%EOF marker)";
      return Fail(ValidationError::kLoadFailed, msg);
    }

    const Document& d = *doc.value();
    if (d.PageCount() == 0U) {
      return Fail(ValidationError::kEmptyDocument, "PDF has no pages");
    }

    PdfStats stats;
    stats.page_count = d.PageCount();
    stats.file_size = size;
    stats.has_xfa = d.HasXfa();
    stats.is_encrypted = d.IsEncrypted();
    stats.is_linearized = d.IsLinearized();
    stats.missing_eof = missing_eof;
    stats.parse_mode = mode;
    std::string version = d.Version();
    if (version.empty()) version = HeaderVersion(sig, head_len - static_cast<size_t>(sig - data));
    stats.version.assign(TruncateToCapacity, version.c_str());
    return ValidationResult::success(stats);
  }

  /// Forget the cached result for one buffer (request scope end).
  void Drop(BufferId id) { cache_.Drop(id); }

  ValidationCache& Cache() noexcept { return cache_; }
  const ValidatorConfig& Config() const noexcept { return cfg_; }

 private:
  static ValidationResult Fail(ValidationError code, const std::string& msg) {
    PDFMERGE_LOG_DEBUG("Validator", "%s: %s", ToString(code), msg.c_str());
    return ValidationResult::error(ValidationFailure{code, msg});
  }

  static const uint8_t* FindSequence(const uint8_t* data, size_t len, const char* needle) noexcept {
    const size_t n = std::strlen(needle);
    if (len < n) return nullptr;
    for (size_t i = 0; i + n <= len; ++i) {
      if (std::memcmp(data + i, needle, n) == 0) return data + i;
    }
    return nullptr;
  }

  /// "%PDF-1.7" -> "1.7"
  static std::string HeaderVersion(const uint8_t* sig, size_t avail) {
    std::string out;
    for (size_t i = 5; i < avail && out.size() < 7U; ++i) {
      const char c = static_cast<char>(sig[i]);
      if ((c >= '0' && c <= '9') || c == '.') {
        out.push_back(c);
      } else {
        break;
      }
    }
    return out;
  }

  DocumentModel& model_;
  ValidatorConfig cfg_;
  ValidationCache cache_;
};

}  // namespace pdfmerge

#endif  // PDFMERGE_VALIDATOR_HPP_
