/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
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
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by every recycle module.
 *
 * - expected<V, E>: value-or-error result returned by all fallible APIs.
 * - optional<T>:    nullable value without heap allocation.
 *
 * Both types hold non-trivial payloads (std::string, std::any, ...) and
 * manage their lifetime with placement new over an anonymous union.
 */

#ifndef RECYCLE_VOCABULARY_HPP_
#define RECYCLE_VOCABULARY_HPP_

#include "recycle/platform.hpp"

#include <new>
#include <type_traits>
#include <utility>

namespace recycle {

namespace detail {

struct ValueTag {};
struct ErrorTag {};

}  // namespace detail

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the named factories:
 * @code
 *   auto ok  = recycle::expected<int, MyError>::success(42);
 *   auto err = recycle::expected<int, MyError>::error(MyError::kFailed);
 *   if (ok.has_value()) Use(ok.value());
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  template <typename... Args>
  static expected success(Args&&... args) {
    return expected(detail::ValueTag{}, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static expected error(Args&&... args) {
    return expected(detail::ErrorTag{}, std::forward<Args>(args)...);
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
    } else {
      ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      expected tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
      } else {
        ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    RECYCLE_ASSERT(has_value_);
    return value_;
  }
  const V& value() const& {
    RECYCLE_ASSERT(has_value_);
    return value_;
  }
  V&& value() && {
    RECYCLE_ASSERT(has_value_);
    return std::move(value_);
  }

  const E& get_error() const& {
    RECYCLE_ASSERT(!has_value_);
    return error_;
  }
  E&& get_error() && {
    RECYCLE_ASSERT(!has_value_);
    return std::move(error_);
  }

  template <typename U>
  V value_or(U&& default_value) const& {
    return has_value_ ? value_ : static_cast<V>(std::forward<U>(default_value));
  }

 private:
  template <typename... Args>
  expected(detail::ValueTag, Args&&... args) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) V(std::forward<Args>(args)...);
  }

  template <typename... Args>
  expected(detail::ErrorTag, Args&&... args) : has_value_(false) {
    ::new (static_cast<void*>(&error_)) E(std::forward<Args>(args)...);
  }

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
    } else {
      error_.~E();
    }
  }

  union {
    V value_;
    E error_;
  };
  bool has_value_;
};

// ============================================================================
// expected<void, E>
// ============================================================================

template <typename E>
class expected<void, E> final {
 public:
  static expected success() { return expected(detail::ValueTag{}); }

  template <typename... Args>
  static expected error(Args&&... args) {
    return expected(detail::ErrorTag{}, std::forward<Args>(args)...);
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (!has_value_) {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (!has_value_) {
      ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (!has_value_) {
        ::new (static_cast<void*>(&error_)) E(other.error_);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (!has_value_) {
        ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const& {
    RECYCLE_ASSERT(!has_value_);
    return error_;
  }
  E&& get_error() && {
    RECYCLE_ASSERT(!has_value_);
    return std::move(error_);
  }

 private:
  explicit expected(detail::ValueTag) : dummy_(0), has_value_(true) {}

  template <typename... Args>
  expected(detail::ErrorTag, Args&&... args) : has_value_(false) {
    ::new (static_cast<void*>(&error_)) E(std::forward<Args>(args)...);
  }

  void Destroy() noexcept {
    if (!has_value_) {
      error_.~E();
    }
  }

  union {
    char dummy_;
    E error_;
  };
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : dummy_(0), has_value_(false) {}

  optional(const T& value) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (static_cast<void*>(&value_)) T(value);
  }

  optional(T&& value) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (static_cast<void*>(&value_)) T(std::move(value));
  }

  optional(const optional& other) : dummy_(0), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) T(other.value_);
    }
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : dummy_(0), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(other.value_);
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
        ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & {
    RECYCLE_ASSERT(has_value_);
    return value_;
  }
  const T& value() const& {
    RECYCLE_ASSERT(has_value_);
    return value_;
  }
  T&& value() && {
    RECYCLE_ASSERT(has_value_);
    return std::move(value_);
  }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value_ ? value_ : static_cast<T>(std::forward<U>(default_value));
  }

  void reset() noexcept {
    if (has_value_) {
      value_.~T();
      has_value_ = false;
    }
  }

 private:
  union {
    char dummy_;
    T value_;
  };
  bool has_value_;
};

}  // namespace recycle

#endif  // RECYCLE_VOCABULARY_HPP_
