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

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ribbon {

// Stands for "no such rendering" in `first_line_state`.
static constexpr int64_t UNBOUNDED_WIDTH = std::numeric_limits<int64_t>::max();

// a + b for non-negative widths, sticking at UNBOUNDED_WIDTH
inline int64_t add_width(int64_t a, int64_t b) {
  return a > UNBOUNDED_WIDTH - b ? UNBOUNDED_WIDTH : a + b;
}

// The narrowest first line a document can produce, over every way of
// resolving its choices. Composes like the wcl doc states: sequencing is `+`
// and a choice takes the better of both sides.
struct first_line_state {
  // Fewest columns before the first line break, over renderings that break
  int64_t broken = UNBOUNDED_WIDTH;
  // Fewest columns of a rendering without any break
  int64_t unbroken = 0;

  first_line_state operator+(const first_line_state& other) const {
    return first_line_state{std::min(broken, add_width(unbroken, other.broken)),
                            add_width(unbroken, other.unbroken)};
  }

  bool operator==(const first_line_state& other) const {
    return broken == other.broken && unbroken == other.unbroken;
  }

  // Followed by something whose narrowest first line is `rest` columns wide
  int64_t before(int64_t rest) const { return std::min(broken, add_width(unbroken, rest)); }

  static first_line_state identity() { return first_line_state{}; }
  static first_line_state line() { return first_line_state{0, UNBOUNDED_WIDTH}; }
  static first_line_state text(int64_t width) { return first_line_state{UNBOUNDED_WIDTH, width}; }
  static first_line_state either(const first_line_state& x, const first_line_state& y) {
    return first_line_state{std::min(x.broken, y.broken), std::min(x.unbroken, y.unbroken)};
  }
};

enum class doc_kind {
  nil,
  append,
  nest,
  text,
  line,
  // A choice between two renderings of the same content, more horizontal one first
  alt,
};

struct doc_node;

// `doc` is an immutable description of a document that has not been laid out
// yet. It is built bottom up from `nil`, `append`, `nest`, `text`, `line` and
// `group`, and never changes afterwards, so any subtree can be shared freely
// between documents (`group` shares its argument with both of its branches).
//
// Copying a doc is O(1).
//
// Examples:
// ```
// doc d = group(text("f(").concat(nest(2, line().concat(text("x")))).concat(text(")")));
// pretty(80, d) -> "f( x)"
// pretty(3, d) -> "f(\n  x)"
// ```
class doc {
 private:
  std::shared_ptr<const doc_node> impl;

  explicit doc(std::shared_ptr<const doc_node> impl) : impl(std::move(impl)) {}

  // Both sides must flatten to the same text, which `group` and `fill`
  // guarantee by construction.
  static doc alt(doc x, doc y);

 public:
  // The empty document
  doc();

  doc_kind kind() const;

  // The accessors below are only meaningful for the kinds named above them.

  // append and alt
  const doc& left() const;
  const doc& right() const;

  // nest
  int64_t indent() const;
  const doc& body() const;

  // text
  const std::string& str() const;
  int64_t width() const;

  // O(1)
  first_line_state first_line() const;

  // True when there is no `line` and no choice anywhere inside, so that
  // flattening gives back the same document.
  bool is_flat() const;

  // O(1)
  doc concat(doc r) const;

  // Identifies the shared node, equal for copies of the same doc.
  const void* identity() const { return impl.get(); }

  friend struct doc_node;
  friend doc nil();
  friend doc append(doc x, doc y);
  friend doc nest(int64_t i, doc x);
  friend doc text(std::string s);
  friend doc line();
  friend doc group(doc x);
  friend doc fill(const std::vector<doc>& xs);
};

doc nil();
doc append(doc x, doc y);
doc nest(int64_t i, doc x);
doc text(std::string s);
doc line();

// Render `x` on one line if that fits, otherwise with its own layout.
doc group(doc x);

// Every `line` becomes a single space and every choice takes its horizontal branch.
doc flatten(const doc& x);

// Structural equality, O(n) unless both sides share their root.
bool operator==(const doc& x, const doc& y);
bool operator!=(const doc& x, const doc& y);

// Debug form, e.g. `Append(Text("a"), Line)`
std::ostream& operator<<(std::ostream& os, const doc& x);

// `doc_builder` collects fragments left to right and joins them into a
// balanced tree of appends, keeping the depth of long sequences logarithmic.
//
// Examples:
// ```
// doc_builder b;
// b.append("let");
// b.append(line());
// b.append("x");
// doc d = std::move(b).build();
// pretty(80, group(d)) -> "let x"
// ```
class doc_builder {
 private:
  std::vector<doc> docs;

  doc merge(size_t start, size_t end) const;

 public:
  void append(std::string str) { append(text(std::move(str))); }
  void append(doc other) { docs.push_back(std::move(other)); }

  void undo() {
    if (!docs.empty()) docs.pop_back();
  }

  size_t size() const { return docs.size(); }
  bool empty() const { return docs.empty(); }

  doc build() &&;
};

}  // namespace ribbon
