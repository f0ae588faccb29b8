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

#include <type_traits>
#include <utility>

namespace ribbon {

// Runs `f` when it goes out of scope unless it was nullified first.
template <class F>
class defer {
 private:
  F f;
  bool armed = true;

 public:
  defer() = delete;
  defer(const defer&) = delete;
  defer(defer&& other) : f(std::move(other.f)), armed(other.armed) { other.armed = false; }
  defer(F&& f) : f(std::move(f)) {}
  defer(const F& f) : f(f) {}

  void nullify() { armed = false; }

  ~defer() {
    if (armed) f();
  }
};

template <class F>
defer<typename std::decay<F>::type> make_defer(F&& f) {
  return defer<typename std::decay<F>::type>(std::forward<F>(f));
}

}  // namespace ribbon
