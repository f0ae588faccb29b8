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

#include "layout.h"

#include <sstream>

#include "text_state.h"

namespace ribbon {

layout layout::cons(layout_item item, const layout& rest) {
  auto out = std::make_shared<std::vector<layout_item>>();
  out->reserve(rest.size() + 1);
  out->push_back(std::move(item));
  for (layout l = rest; l.kind() != layout_kind::nil; l = l.rest()) {
    out->push_back(l.head());
  }
  return layout(std::move(out), 0);
}

layout layout::text(std::string str, const layout& rest) {
  int64_t width = static_cast<int64_t>(text_width(str));
  return cons(layout_item{layout_kind::text, std::move(str), width}, rest);
}

layout layout::line(int64_t indent, const layout& rest) {
  return cons(layout_item{layout_kind::line, "", indent}, rest);
}

layout_kind layout::kind() const {
  if (!items || start >= items->size()) return layout_kind::nil;
  return head().kind;
}

layout layout::rest() const {
  if (kind() == layout_kind::nil) return *this;
  return layout(items, start + 1);
}

size_t layout::size() const {
  if (!items || start >= items->size()) return 0;
  return items->size() - start;
}

void layout::write(std::ostream& ostream) const {
  for (size_t i = start; items && i < items->size(); ++i) {
    const layout_item& item = (*items)[i];
    switch (item.kind) {
      case layout_kind::nil:
        break;
      case layout_kind::text:
        ostream << item.str;
        break;
      case layout_kind::line:
        ostream << '\n';
        for (int64_t j = 0; j < item.number; ++j) ostream << ' ';
        break;
    }
  }
}

std::string layout::as_string() const {
  std::stringstream ss;
  write(ss);
  return ss.str();
}

bool operator==(const layout& x, const layout& y) {
  if (x.size() != y.size()) return false;
  for (layout a = x, b = y; a.kind() != layout_kind::nil; a = a.rest(), b = b.rest()) {
    if (a.kind() != b.kind()) return false;
    if (a.kind() == layout_kind::text && a.str() != b.str()) return false;
    if (a.kind() == layout_kind::line && a.indent() != b.indent()) return false;
  }
  return true;
}

bool operator!=(const layout& x, const layout& y) { return !(x == y); }

std::ostream& operator<<(std::ostream& os, const layout& x) {
  size_t open = 0;
  for (layout l = x; l.kind() != layout_kind::nil; l = l.rest()) {
    if (l.kind() == layout_kind::text) {
      os << "Text(\"" << l.str() << "\", ";
    } else {
      os << "Line(" << l.indent() << ", ";
    }
    ++open;
  }
  os << "Nil";
  for (size_t i = 0; i < open; ++i) os << ")";
  return os;
}

void layout_builder::text(std::string str) {
  int64_t width = static_cast<int64_t>(text_width(str));
  text(std::move(str), width);
}

void layout_builder::append(const layout& other) {
  for (layout l = other; l.kind() != layout_kind::nil; l = l.rest()) {
    items.push_back(l.head());
  }
}

layout layout_builder::build() && {
  if (items.empty()) return layout::nil();
  auto out = std::make_shared<const std::vector<layout_item>>(std::move(items));
  items = {};
  return layout(std::move(out), 0);
}

std::string render(const layout& x) { return x.as_string(); }

}  // namespace ribbon
