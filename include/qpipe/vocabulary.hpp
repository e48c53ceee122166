/**
 * @file vocabulary.hpp
 * @brief Error-as-value vocabulary: expected<V, E>, Fault, ScopeGuard.
 *
 * qpipe never throws. Fallible operations return expected<V, Fault>;
 * exceptions raised by user callbacks are captured at the worker
 * boundary into Fault::cause and can be rethrown by the caller.
 */

#ifndef QPIPE_VOCABULARY_HPP_
#define QPIPE_VOCABULARY_HPP_

#include "qpipe/platform.hpp"

#include <cstdint>

#include <exception>
#include <new>
#include <type_traits>
#include <utility>

namespace qpipe {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the named factories success() / error().
 * Accessing value() on an error (or get_error() on a value) is a contract
 * violation checked by QPIPE_ASSERT.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(v, ValueTag{}); }
  static expected success(V&& v) { return expected(std::move(v), ValueTag{}); }
  static expected error(const E& e) { return expected(e, ErrorTag{}); }
  static expected error(E&& e) { return expected(std::move(e), ErrorTag{}); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      ::new (&storage_.err) E(other.storage_.err);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      ::new (&storage_.err) E(std::move(other.storage_.err));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      expected tmp(other);
      Destroy();
      Construct(std::move(tmp));
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      Construct(std::move(other));
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    QPIPE_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    QPIPE_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    QPIPE_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  const E& get_error() const& {
    QPIPE_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  template <typename U>
  expected(U&& v, ValueTag) : has_value_(true) {
    ::new (&storage_.value) V(std::forward<U>(v));
  }
  template <typename U>
  expected(U&& e, ErrorTag) : has_value_(false) {
    ::new (&storage_.err) E(std::forward<U>(e));
  }

  void Construct(expected&& other) {
    has_value_ = other.has_value_;
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      ::new (&storage_.err) E(std::move(other.storage_.err));
    }
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
  static expected success() noexcept { return expected(); }
  static expected error(const E& e) { return expected(e); }
  static expected error(E&& e) { return expected(std::move(e)); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const& {
    QPIPE_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_(), has_value_(true) {}
  explicit expected(const E& e) : err_(e), has_value_(false) {}
  explicit expected(E&& e) : err_(std::move(e)), has_value_(false) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// ErrorCode / Fault
// ============================================================================

enum class ErrorCode : uint8_t {
  kNone = 0,
  kInvalidArgument,  ///< Null target/source or concurrency below 1
  kTargetClosed,     ///< Target channel completed before writing began
  kChannelClosed,    ///< Channel completed (and drained) without a fault
  kCanceled,         ///< Cancellation observed
  kFaulted,          ///< A user callback raised; see Fault::cause
};

/// @brief Short, static name for an ErrorCode (for logs).
inline const char* ErrorCodeName(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kTargetClosed:
      return "target_closed";
    case ErrorCode::kChannelClosed:
      return "channel_closed";
    case ErrorCode::kCanceled:
      return "canceled";
    case ErrorCode::kFaulted:
      return "faulted";
  }
  return "unknown";
}

/**
 * @brief Terminal error of an operation or channel.
 *
 * Copies share the same exception_ptr, so a fault propagated across
 * pipeline stages still refers to the original exception object.
 */
struct Fault {
  ErrorCode code{ErrorCode::kNone};
  std::exception_ptr cause{};
  const char* message{""};  ///< Static string, never owned.

  static Fault Make(ErrorCode c, const char* msg = "") noexcept {
    Fault f;
    f.code = c;
    f.message = (msg != nullptr) ? msg : "";
    return f;
  }

  /// @brief Wrap the in-flight exception. Call only inside a catch block.
  static Fault FromCurrentException() noexcept {
    Fault f;
    f.code = ErrorCode::kFaulted;
    f.cause = std::current_exception();
    f.message = "callback raised";
    return f;
  }

  bool IsCanceled() const noexcept { return code == ErrorCode::kCanceled; }
  bool IsClosed() const noexcept { return code == ErrorCode::kChannelClosed; }

  /// @brief Rethrow the captured exception, if any. No-op otherwise.
  void Rethrow() const {
    if (cause) {
      std::rethrow_exception(cause);
    }
  }
};

/// @brief True when both faults carry the same code and exception object.
inline bool SameFault(const Fault& a, const Fault& b) noexcept {
  return a.code == b.code && a.cause == b.cause;
}

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Run a callable when the enclosing scope exits, unless released.
 */
template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F fn) noexcept(std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept(
      std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_) {
      fn_();
    }
  }

  void release() noexcept { active_ = false; }

 private:
  F fn_;
  bool active_;
};

template <typename F>
ScopeGuard<F> MakeScopeGuard(F fn) {
  return ScopeGuard<F>(std::move(fn));
}

}  // namespace qpipe

#endif  // QPIPE_VOCABULARY_HPP_
