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
 * @brief Error-return vocabulary types: expected<V, E> and optional<T>.
 *
 * Header-only, no exceptions. Every fallible call in subcmd returns an
 * expected<V, E> whose E is a small enum class.
 */

#ifndef SUBCMD_VOCABULARY_HPP_
#define SUBCMD_VOCABULARY_HPP_

#include "subcmd/platform.hpp"

#include <new>
#include <type_traits>
#include <utility>

namespace subcmd {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the named factories:
 * @code
 *   auto ok = expected<size_t, StreamError>::success(12);
 *   auto bad = expected<size_t, StreamError>::error(StreamError::kShortWrite);
 *   if (!bad) { handle(bad.get_error()); }
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(ValueTag{}, v); }
  static expected success(V&& v) { return expected(ValueTag{}, std::move(v)); }
  static expected error(E e) noexcept { return expected(e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    SUBCMD_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    SUBCMD_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    SUBCMD_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  E get_error() const noexcept {
    SUBCMD_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const { return has_value_ ? storage_.value : fallback; }

 private:
  struct ValueTag {};

  template <typename U>
  expected(ValueTag, U&& v) : has_value_(true) {
    new (&storage_.value) V(std::forward<U>(v));
  }
  explicit expected(E e) noexcept : has_value_(false) { storage_.err = e; }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
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

/// @brief Specialization for operations that return nothing on success.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    SUBCMD_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

/**
 * @brief Minimal optional value (C++14-style, no std::optional dependency).
 */
template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}
  optional(const T& v) : has_value_(true) { new (&storage_.value) T(v); }  // NOLINT
  optional(T&& v) : has_value_(true) { new (&storage_.value) T(std::move(v)); }  // NOLINT

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) T(other.storage_.value);
    }
  }

  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) T(std::move(other.storage_.value));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        new (&storage_.value) T(other.storage_.value);
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        new (&storage_.value) T(std::move(other.storage_.value));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() {
    SUBCMD_ASSERT(has_value_);
    return storage_.value;
  }
  const T& value() const {
    SUBCMD_ASSERT(has_value_);
    return storage_.value;
  }

  T value_or(const T& fallback) const { return has_value_ ? storage_.value : fallback; }

  void reset() noexcept {
    if (has_value_) {
      storage_.value.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    T value;
  } storage_;
  bool has_value_;
};

}  // namespace subcmd

#endif  // SUBCMD_VOCABULARY_HPP_
