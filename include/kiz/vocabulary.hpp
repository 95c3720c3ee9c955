/**
 * @file vocabulary.hpp
 * @brief Error-code vocabulary: expected<V, E>, optional<T> and the error
 *        enums shared by every layer of the headset client.
 *
 * Errors are values. Every fallible operation returns expected<V, E> with a
 * scoped enum as E, so the code stays usable with -fno-exceptions.
 */

#ifndef KIZ_VOCABULARY_HPP_
#define KIZ_VOCABULARY_HPP_

#include "kiz/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace kiz {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kBufferFull,
  kFormatNotSupported,
  kInvalidValue,
};

/// Byte-stream level failures (open, configure, read, write).
enum class TransportError : uint8_t {
  kOpenFailed,
  kConfigFailed,
  kReadFailed,
  kWriteFailed,
  kClosed,
  kNotOpen,
  kHandshakeTimeout,
};

/// Framing failures. Both are recovered locally by resynchronising.
enum class FrameError : uint8_t {
  kFrameTooLarge,
  kBadHeader,
};

enum class EncodingError : uint8_t {
  kValueOutOfRange,
  kTypeMismatch,
  kMissingValue,
  kUnsupportedKind,
};

enum class DecodingError : uint8_t {
  kTruncated,
  kMalformed,
  kUnknownKind,
  kUnknownTarget,
  kMissingField,
  kTypeMismatch,
};

/// Failures surfaced to a caller waiting on a request.
enum class RequestError : uint8_t {
  kNotConnected,
  kSessionClosed,
  kTimedOut,
  kCancelled,
  kRejected,
  kEncodingFailed,
  kWriteFailed,
  kUnexpectedReply,
};

inline const char* ToString(TransportError e) noexcept {
  switch (e) {
    case TransportError::kOpenFailed:   return "open failed";
    case TransportError::kConfigFailed: return "config failed";
    case TransportError::kReadFailed:   return "read failed";
    case TransportError::kWriteFailed:  return "write failed";
    case TransportError::kClosed:       return "closed";
    case TransportError::kNotOpen:      return "not open";
    case TransportError::kHandshakeTimeout: return "handshake timeout";
  }
  return "?";
}

inline const char* ToString(FrameError e) noexcept {
  switch (e) {
    case FrameError::kFrameTooLarge: return "frame too large";
    case FrameError::kBadHeader:     return "bad header";
  }
  return "?";
}

inline const char* ToString(EncodingError e) noexcept {
  switch (e) {
    case EncodingError::kValueOutOfRange: return "value out of range";
    case EncodingError::kTypeMismatch:    return "type mismatch";
    case EncodingError::kMissingValue:    return "missing value";
    case EncodingError::kUnsupportedKind: return "unsupported kind";
  }
  return "?";
}

inline const char* ToString(DecodingError e) noexcept {
  switch (e) {
    case DecodingError::kTruncated:     return "truncated";
    case DecodingError::kMalformed:     return "malformed";
    case DecodingError::kUnknownKind:   return "unknown kind";
    case DecodingError::kUnknownTarget: return "unknown target";
    case DecodingError::kMissingField:  return "missing field";
    case DecodingError::kTypeMismatch:  return "type mismatch";
  }
  return "?";
}

inline const char* ToString(RequestError e) noexcept {
  switch (e) {
    case RequestError::kNotConnected:    return "not connected";
    case RequestError::kSessionClosed:   return "session closed";
    case RequestError::kTimedOut:        return "request timed out";
    case RequestError::kCancelled:       return "cancelled";
    case RequestError::kRejected:        return "rejected by device";
    case RequestError::kEncodingFailed:  return "encoding failed";
    case RequestError::kWriteFailed:     return "write failed";
    case RequestError::kUnexpectedReply: return "unexpected reply";
  }
  return "?";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error container.
 *
 * Constructed only through the named factories success() / error() so the
 * intent is explicit at every return site.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(kValueTag, v); }
  static expected success(V&& v) {
    return expected(kValueTag, static_cast<V&&>(v));
  }
  static expected error(E e) noexcept { return expected(kErrorTag, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(static_cast<V&&>(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(static_cast<V&&>(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    KIZ_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& noexcept {
    KIZ_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && noexcept {
    KIZ_ASSERT(has_value_);
    return static_cast<V&&>(storage_.value);
  }

  E get_error() const noexcept {
    KIZ_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};
  static constexpr ValueTag kValueTag{};
  static constexpr ErrorTag kErrorTag{};

  template <typename U>
  expected(ValueTag, U&& v) : has_value_(true) {
    ::new (&storage_.value) V(static_cast<U&&>(v));
  }
  expected(ErrorTag, E e) noexcept : has_value_(false) { storage_.err = e; }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    }
  }

  union Storage {
    Storage() noexcept : err() {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/// @brief Specialization for operations that only report success or failure.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return ok_; }
  explicit operator bool() const noexcept { return ok_; }

  E get_error() const noexcept {
    KIZ_ASSERT(!ok_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : ok_(ok), err_(e) {}

  bool ok_;
  E err_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_.value) T(v);
  }
  optional(T&& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_.value) T(static_cast<T&&>(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_.value) T(other.storage_.value);
  }
  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) T(static_cast<T&&>(other.storage_.value));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_.value) T(other.storage_.value);
        has_value_ = true;
      }
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_.value) T(static_cast<T&&>(other.storage_.value));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    KIZ_ASSERT(has_value_);
    return storage_.value;
  }
  const T& value() const noexcept {
    KIZ_ASSERT(has_value_);
    return storage_.value;
  }

  T value_or(const T& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      storage_.value.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept : dummy(0) {}
    ~Storage() {}
    char dummy;
    T value;
  } storage_;
  bool has_value_;
};

}  // namespace kiz

#endif  // KIZ_VOCABULARY_HPP_
