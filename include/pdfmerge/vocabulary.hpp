/**
 * @file vocabulary.hpp
 * @brief Value vocabulary shared by all pdfmerge modules.
 *
 * - expected<V, E>: value-or-error return type (void specialization included)
 * - optional<T>: nullable value without heap allocation
 * - FixedString<N>: bounded inline string for names and short labels
 * - Common error enums (ConfigError, TimerError)
 *
 * Header-only, C++17.
 */

#ifndef PDFMERGE_VOCABULARY_HPP_
#define PDFMERGE_VOCABULARY_HPP_

#include "pdfmerge/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace pdfmerge {

// ============================================================================
// Common error enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kSlotsFull,
  kNotRunning,
  kAlreadyRunning,
};

inline const char* ToString(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound: return "CONFIG_FILE_NOT_FOUND";
    case ConfigError::kParseError: return "CONFIG_PARSE_ERROR";
    case ConfigError::kFormatNotSupported: return "CONFIG_FORMAT_NOT_SUPPORTED";
    case ConfigError::kBufferFull: return "CONFIG_BUFFER_FULL";
    case ConfigError::kInvalidValue: return "CONFIG_INVALID_VALUE";
  }
  return "CONFIG_UNKNOWN";
}

inline const char* ToString(TimerError e) noexcept {
  switch (e) {
    case TimerError::kInvalidPeriod: return "TIMER_INVALID_PERIOD";
    case TimerError::kSlotsFull: return "TIMER_SLOTS_FULL";
    case TimerError::kNotRunning: return "TIMER_NOT_RUNNING";
    case TimerError::kAlreadyRunning: return "TIMER_ALREADY_RUNNING";
  }
  return "TIMER_UNKNOWN";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the success()/error() factories so the intent is
 * visible at every return site.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(kValueTag, v); }
  static expected success(V&& v) { return expected(kValueTag, std::move(v)); }
  static expected error(const E& e) { return expected(kErrorTag, e); }
  static expected error(E&& e) { return expected(kErrorTag, std::move(e)); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(other.storage_.value);
    } else {
      new (&storage_.err) E(other.storage_.err);
    }
  }

  expected(expected&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      new (&storage_.err) E(std::move(other.storage_.err));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(other.storage_.value);
      } else {
        new (&storage_.err) E(other.storage_.err);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        new (&storage_.err) E(std::move(other.storage_.err));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    PDFMERGE_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    PDFMERGE_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    PDFMERGE_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  const E& get_error() const& {
    PDFMERGE_ASSERT(!has_value_);
    return storage_.err;
  }
  E&& get_error() && {
    PDFMERGE_ASSERT(!has_value_);
    return std::move(storage_.err);
  }

  V value_or(const V& fallback) const& { return has_value_ ? storage_.value : fallback; }

 private:
  struct ValueTag {};
  struct ErrorTag {};
  static constexpr ValueTag kValueTag{};
  static constexpr ErrorTag kErrorTag{};

  template <typename U>
  expected(ValueTag, U&& v) : has_value_(true) {
    new (&storage_.value) V(std::forward<U>(v));
  }
  template <typename U>
  expected(ErrorTag, U&& e) : has_value_(false) {
    new (&storage_.err) E(std::forward<U>(e));
  }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    } else {
      storage_.err.~E();
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/**
 * @brief expected<void, E>: success carries no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() { return expected(); }
  static expected error(const E& e) { return expected(e); }
  static expected error(E&& e) { return expected(std::move(e)); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const& {
    PDFMERGE_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() : err_(), has_value_(true) {}
  explicit expected(const E& e) : err_(e), has_value_(false) {}
  explicit expected(E&& e) : err_(std::move(e)), has_value_(false) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : engaged_(false) {}
  optional(const T& v) : engaged_(true) { new (&storage_.value) T(v); }  // NOLINT
  optional(T&& v) : engaged_(true) { new (&storage_.value) T(std::move(v)); }  // NOLINT

  optional(const optional& other) : engaged_(other.engaged_) {
    if (engaged_) {
      new (&storage_.value) T(other.storage_.value);
    }
  }
  optional(optional&& other) noexcept : engaged_(other.engaged_) {
    if (engaged_) {
      new (&storage_.value) T(std::move(other.storage_.value));
    }
  }
  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      engaged_ = other.engaged_;
      if (engaged_) {
        new (&storage_.value) T(other.storage_.value);
      }
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      engaged_ = other.engaged_;
      if (engaged_) {
        new (&storage_.value) T(std::move(other.storage_.value));
      }
    }
    return *this;
  }
  ~optional() { reset(); }

  bool has_value() const noexcept { return engaged_; }
  explicit operator bool() const noexcept { return engaged_; }

  T& value() {
    PDFMERGE_ASSERT(engaged_);
    return storage_.value;
  }
  const T& value() const {
    PDFMERGE_ASSERT(engaged_);
    return storage_.value;
  }
  T value_or(const T& fallback) const { return engaged_ ? storage_.value : fallback; }

  void reset() noexcept {
    if (engaged_) {
      storage_.value.~T();
      engaged_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    T value;
  } storage_;
  bool engaged_;
};

// ============================================================================
// FixedString<N>
// ============================================================================

struct TruncateToCapacityTag {};
static constexpr TruncateToCapacityTag TruncateToCapacity{};

/**
 * @brief Inline string with a compile-time capacity, no heap allocation.
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&literal)[N]) noexcept {  // NOLINT
    static_assert(N - 1U <= Capacity, "literal exceeds FixedString capacity");
    std::memcpy(buf_, literal, N);
    size_ = N - 1U;
  }

  FixedString(TruncateToCapacityTag, const char* str) noexcept { assign(TruncateToCapacity, str); }

  void assign(TruncateToCapacityTag, const char* str) noexcept {
    size_ = 0U;
    if (str != nullptr) {
      while (size_ < Capacity && str[size_] != '\0') {
        buf_[size_] = str[size_];
        ++size_;
      }
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  bool operator==(const char* other) const noexcept {
    return other != nullptr && std::strcmp(buf_, other) == 0;
  }
  bool operator!=(const char* other) const noexcept { return !(*this == other); }

  template <uint32_t M>
  bool operator==(const FixedString<M>& other) const noexcept {
    return size_ == other.size() && std::memcmp(buf_, other.c_str(), size_) == 0;
  }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_{0U};
};

}  // namespace pdfmerge

#endif  // PDFMERGE_VOCABULARY_HPP_
