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
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ribbon {

enum class layout_kind { nil, text, line };

struct layout_item {
  layout_kind kind;
  std::string str;
  // text: the fragment's width, line: the indentation after the break
  int64_t number;
};

// `layout` is a document with every choice made: a sequence of text
// fragments and line breaks that carry their final indentation. It is what
// `best` produces and what `render` turns into a string.
//
// A layout is a view into a shared, immutable run of items, so `rest()` is
// O(1) and dropping a long layout does not recurse.
//
// Examples:
// ```
// layout l = layout::text("a", layout::line(2, layout::text("b", layout::nil())));
// l.as_string() -> "a\n  b"
// ```
class layout {
 private:
  std::shared_ptr<const std::vector<layout_item>> items;
  size_t start = 0;

  layout(std::shared_ptr<const std::vector<layout_item>> items, size_t start)
      : items(std::move(items)), start(start) {}

  const layout_item& head() const { return (*items)[start]; }

  static layout cons(layout_item item, const layout& rest);

 public:
  layout() = default;

  // O(1)
  static layout nil() { return layout(); }

  // O(n), the tail is copied. Prefer `layout_builder` for long layouts.
  static layout text(std::string str, const layout& rest);
  static layout line(int64_t indent, const layout& rest);

  layout_kind kind() const;

  // text
  const std::string& str() const { return head().str; }
  int64_t width() const { return head().number; }

  // line
  int64_t indent() const { return head().number; }

  // O(1)
  layout rest() const;

  // Number of text and line items left
  size_t size() const;

  // O(n)
  std::string as_string() const;

  // O(n)
  void write(std::ostream& ostream) const;

  friend class layout_builder;
};

bool operator==(const layout& x, const layout& y);
bool operator!=(const layout& x, const layout& y);

// Debug form, e.g. `Text("a", Line(2, Nil))`
std::ostream& operator<<(std::ostream& os, const layout& x);

// Builds a layout front to back.
class layout_builder {
 private:
  std::vector<layout_item> items;

 public:
  void text(std::string str, int64_t width) {
    items.push_back(layout_item{layout_kind::text, std::move(str), width});
  }
  void text(std::string str);
  void line(int64_t indent) { items.push_back(layout_item{layout_kind::line, "", indent}); }

  void append(const layout& other);

  size_t size() const { return items.size(); }

  layout build() &&;
};

// The text a layout stands for: each line break becomes "\n" followed by
// `indent` spaces (none when the indentation is negative).
std::string render(const layout& x);

}  // namespace ribbon
