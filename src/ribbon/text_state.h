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

#include <utf8proc.h>

#include <cstddef>
#include <string>

namespace ribbon {

// Folds `State::inject` over every code point of `str`. A byte that does not
// start a valid UTF-8 sequence is injected on its own with a negative code point.
template <class State>
State from_string(const std::string& str) {
  State out = State::identity();

  const utf8proc_uint8_t* iter = reinterpret_cast<const utf8proc_uint8_t*>(str.data());
  const utf8proc_uint8_t* iter_end = iter + str.size();
  while (iter < iter_end) {
    utf8proc_int32_t codepoint;
    utf8proc_ssize_t size = utf8proc_iterate(iter, iter_end - iter, &codepoint);
    if (size <= 0) {
      size = 1;
      codepoint = -1;
    }
    iter += size;

    out = out + State::inject(size, codepoint);
  }
  return out;
}

struct byte_count_state {
  size_t count = 0;

  byte_count_state() = default;
  byte_count_state(size_t count) : count(count) {}

  byte_count_state operator+(byte_count_state other) const {
    return byte_count_state{count + other.count};
  }

  bool operator==(const byte_count_state& other) const { return count == other.count; }

  static byte_count_state identity() { return byte_count_state{}; }

  static byte_count_state inject(size_t size, utf8proc_int32_t codepoint) {
    return byte_count_state{size};
  }
};

// Columns a fragment occupies: one per code point, one per malformed byte.
struct width_state {
  size_t count = 0;

  width_state() = default;
  width_state(size_t count) : count(count) {}

  width_state operator+(width_state other) const { return width_state{count + other.count}; }

  bool operator==(const width_state& other) const { return count == other.count; }

  static width_state identity() { return width_state{}; }

  static width_state inject(size_t size, utf8proc_int32_t codepoint) { return width_state{1}; }
};

struct line_break_count_state {
  size_t count = 0;

  line_break_count_state() = default;
  line_break_count_state(size_t count) : count(count) {}

  line_break_count_state operator+(line_break_count_state other) const {
    return line_break_count_state{count + other.count};
  }

  bool operator==(const line_break_count_state& other) const { return count == other.count; }

  static line_break_count_state identity() { return line_break_count_state{}; }

  static line_break_count_state inject(size_t size, utf8proc_int32_t codepoint) {
    return line_break_count_state{codepoint == '\n' || codepoint == '\r'};
  }
};

struct invalid_count_state {
  size_t count = 0;

  invalid_count_state() = default;
  invalid_count_state(size_t count) : count(count) {}

  invalid_count_state operator+(invalid_count_state other) const {
    return invalid_count_state{count + other.count};
  }

  bool operator==(const invalid_count_state& other) const { return count == other.count; }

  static invalid_count_state identity() { return invalid_count_state{}; }

  static invalid_count_state inject(size_t size, utf8proc_int32_t codepoint) {
    return invalid_count_state{codepoint < 0};
  }
};

// Everything ribbon wants to know about a text fragment, gathered in one pass.
class text_state {
 private:
  text_state(byte_count_state byte_count, width_state width,
             line_break_count_state line_break_count, invalid_count_state invalid_count)
      : byte_count_(byte_count),
        width_(width),
        line_break_count_(line_break_count),
        invalid_count_(invalid_count) {}

  byte_count_state byte_count_;
  width_state width_;
  line_break_count_state line_break_count_;
  invalid_count_state invalid_count_;

 public:
  text_state() = default;

  text_state operator+(text_state other) const {
    return text_state{byte_count_ + other.byte_count_, width_ + other.width_,
                      line_break_count_ + other.line_break_count_,
                      invalid_count_ + other.invalid_count_};
  }

  bool operator==(const text_state& other) const {
    return byte_count_ == other.byte_count_ && width_ == other.width_ &&
           line_break_count_ == other.line_break_count_ && invalid_count_ == other.invalid_count_;
  }

  static text_state identity() {
    return text_state{byte_count_state::identity(), width_state::identity(),
                      line_break_count_state::identity(), invalid_count_state::identity()};
  }

  static text_state inject(size_t size, utf8proc_int32_t codepoint) {
    return text_state{byte_count_state::inject(size, codepoint), width_state::inject(size, codepoint),
                      line_break_count_state::inject(size, codepoint),
                      invalid_count_state::inject(size, codepoint)};
  }

  size_t byte_count() const { return byte_count_.count; }
  size_t width() const { return width_.count; }
  size_t line_break_count() const { return line_break_count_.count; }
  size_t invalid_count() const { return invalid_count_.count; }
  bool has_line_break() const { return line_break_count() > 0; }
  bool is_valid_utf8() const { return invalid_count() == 0; }
};

inline size_t text_width(const std::string& str) { return from_string<text_state>(str).width(); }

}  // namespace ribbon
