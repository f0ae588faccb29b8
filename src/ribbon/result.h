/*
 * Copyright 2024 SiFive, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You should have received a copy of LICENSE.Apache2 along with
 * this software. If not, you may obtain a copy at
 *
 *    https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace ribbon {

// Tags used to pick which half of a `result` a constructor fills in.
struct in_place_t {
  explicit in_place_t() = default;
};

class in_place_error_t {};

static constexpr uint64_t max_align(uint64_t a, uint64_t b) { return (a < b) ? b : a; }

// `result<T, E>` holds either a value or an error, never both and never
// neither. Everything ribbon hands back through it (docs, counts, small error
// structs) is copyable, so unlike a general purpose result this one only
// supports copyable payloads.
//
// Examples:
// ```
// ribbon::result<ribbon::doc, ribbon::text_error> r = ribbon::checked_text("abc");
// if (!r) std::cerr << r.error().offset;
// ribbon::doc d = *r;
// ```
template <class T, class E>
class alignas(max_align(alignof(T), alignof(E))) result {
 private:
  union {
    T value;
    E error_;
  };
  bool is_error = true;

  void destroy() {
    if (is_error) {
      error_.~E();
    } else {
      value.~T();
    }
  }

  void assign(const result& other) {
    is_error = other.is_error;
    if (is_error) {
      new (&error_) E(other.error_);
    } else {
      new (&value) T(other.value);
    }
  }

  void assign(result&& other) {
    // Moving keeps the errorness of `other`, only its payload is moved from.
    is_error = other.is_error;
    if (is_error) {
      new (&error_) E(std::move(other.error_));
    } else {
      new (&value) T(std::move(other.value));
    }
  }

 public:
  template <class... Args>
  result(in_place_t, Args&&... args) : value(std::forward<Args>(args)...), is_error(false) {}

  template <class... Args>
  result(in_place_error_t, Args&&... args) : error_(std::forward<Args>(args)...), is_error(true) {}

  result() = delete;
  result(const result& other) { assign(other); }
  result(result&& other) { assign(std::move(other)); }
  ~result() { destroy(); }

  result& operator=(const result& other) {
    if (this == &other) return *this;
    destroy();
    assign(other);
    return *this;
  }

  result& operator=(result&& other) {
    if (this == &other) return *this;
    destroy();
    assign(std::move(other));
    return *this;
  }

  explicit operator bool() const { return !is_error; }

  T& operator*() { return value; }
  const T& operator*() const { return value; }

  T* operator->() { return &value; }
  const T* operator->() const { return &value; }

  E& error() { return error_; }
  const E& error() const { return error_; }
};

// Wraps an existing value, only the error type has to be spelled out.
template <class E, class T>
result<typename std::decay<T>::type, E> result_value(T&& x) {
  return result<typename std::decay<T>::type, E>{in_place_t{}, std::forward<T>(x)};
}

// Constructs the value in place from any of its constructors.
template <class T, class E, class... Args>
result<T, E> make_result(Args&&... args) {
  return result<T, E>{in_place_t{}, std::forward<Args>(args)...};
}

// Wraps an existing error, only the value type has to be spelled out.
template <class T, class E>
result<T, typename std::decay<E>::type> result_error(E&& err) {
  return result<T, typename std::decay<E>::type>{in_place_error_t{}, std::forward<E>(err)};
}

template <class T, class E, class... Args>
result<T, E> make_error(Args&&... args) {
  return result<T, E>{in_place_error_t{}, std::forward<Args>(args)...};
}

}  // namespace ribbon
