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

#include "doc.h"

#include <utility>
#include <vector>

#include "text_state.h"

namespace ribbon {

struct doc_node {
  doc_kind kind;
  // nest: the extra indentation, text: the fragment's width
  int64_t number = 0;
  std::string str;
  // append and alt: both halves, nest: `first` is the body. Unused halves stay
  // empty rather than nil so the shared nil node can be built.
  doc first = doc(nullptr);
  doc second = doc(nullptr);
  first_line_state line_state;
  bool flat = true;

  explicit doc_node(doc_kind kind) : kind(kind) {}
  ~doc_node();
};

// Halves nothing else refers to are torn down from a worklist, so dropping a
// long chain of appends does not recurse once per node.
doc_node::~doc_node() {
  std::vector<std::shared_ptr<const doc_node>> owned;
  auto detach = [&owned](doc& d) {
    if (d.impl && d.impl.use_count() == 1) owned.push_back(std::move(d.impl));
  };

  detach(first);
  detach(second);
  while (!owned.empty()) {
    std::shared_ptr<const doc_node> node = std::move(owned.back());
    owned.pop_back();
    doc_node& n = const_cast<doc_node&>(*node);
    detach(n.first);
    detach(n.second);
  }
}

// The leaves without a payload are shared by every document.
static const std::shared_ptr<const doc_node>& nil_node() {
  static const std::shared_ptr<const doc_node> node = std::make_shared<doc_node>(doc_kind::nil);
  return node;
}

static std::shared_ptr<const doc_node> make_line_node() {
  auto node = std::make_shared<doc_node>(doc_kind::line);
  node->line_state = first_line_state::line();
  node->flat = false;
  return node;
}

static const std::shared_ptr<const doc_node>& line_node() {
  static const std::shared_ptr<const doc_node> node = make_line_node();
  return node;
}

doc::doc() : impl(nil_node()) {}

doc_kind doc::kind() const { return impl->kind; }

const doc& doc::left() const { return impl->first; }

const doc& doc::right() const { return impl->second; }

int64_t doc::indent() const { return impl->number; }

const doc& doc::body() const { return impl->first; }

const std::string& doc::str() const { return impl->str; }

int64_t doc::width() const { return impl->number; }

first_line_state doc::first_line() const { return impl->line_state; }

bool doc::is_flat() const { return impl->flat; }

doc doc::concat(doc r) const { return append(*this, std::move(r)); }

doc doc::alt(doc x, doc y) {
  auto node = std::make_shared<doc_node>(doc_kind::alt);
  node->line_state = first_line_state::either(x.first_line(), y.first_line());
  node->flat = false;
  node->first = std::move(x);
  node->second = std::move(y);
  return doc(std::move(node));
}

doc nil() { return doc(nil_node()); }

doc append(doc x, doc y) {
  auto node = std::make_shared<doc_node>(doc_kind::append);
  node->line_state = x.first_line() + y.first_line();
  node->flat = x.is_flat() && y.is_flat();
  node->first = std::move(x);
  node->second = std::move(y);
  return doc(std::move(node));
}

doc nest(int64_t i, doc x) {
  auto node = std::make_shared<doc_node>(doc_kind::nest);
  node->number = i;
  node->line_state = x.first_line();
  node->flat = x.is_flat();
  node->first = std::move(x);
  return doc(std::move(node));
}

doc text(std::string s) {
  auto node = std::make_shared<doc_node>(doc_kind::text);
  node->number = static_cast<int64_t>(text_width(s));
  node->line_state = first_line_state::text(node->number);
  node->str = std::move(s);
  return doc(std::move(node));
}

doc line() { return doc(line_node()); }

doc group(doc x) {
  doc flat = flatten(x);
  return doc::alt(std::move(flat), std::move(x));
}

// Rebuilding runs from a worklist, lists joined with `stack` or `spread`
// nest as deep as they are long. Flat subtrees are shared, not copied.
doc flatten(const doc& x) {
  struct task {
    const doc* d;
    // The children are flattened and waiting on `done`
    bool rebuild;
  };
  std::vector<task> todo{{&x, false}};
  std::vector<doc> done;

  while (!todo.empty()) {
    task t = todo.back();
    todo.pop_back();
    const doc& d = *t.d;

    if (t.rebuild) {
      if (d.kind() == doc_kind::append) {
        doc right = std::move(done.back());
        done.pop_back();
        doc left = std::move(done.back());
        done.pop_back();
        done.push_back(append(std::move(left), std::move(right)));
      } else {
        doc body = std::move(done.back());
        done.pop_back();
        done.push_back(nest(d.indent(), std::move(body)));
      }
      continue;
    }

    if (d.is_flat()) {
      done.push_back(d);
      continue;
    }

    switch (d.kind()) {
      case doc_kind::nil:
      case doc_kind::text:
        done.push_back(d);
        break;
      case doc_kind::append:
        todo.push_back({&d, true});
        todo.push_back({&d.right(), false});
        todo.push_back({&d.left(), false});
        break;
      case doc_kind::nest:
        todo.push_back({&d, true});
        todo.push_back({&d.body(), false});
        break;
      case doc_kind::line:
        done.push_back(text(" "));
        break;
      case doc_kind::alt:
        todo.push_back({&d.left(), false});
        break;
    }
  }

  return std::move(done.back());
}

bool operator==(const doc& x, const doc& y) {
  std::vector<std::pair<const doc*, const doc*>> todo{{&x, &y}};
  while (!todo.empty()) {
    const doc& a = *todo.back().first;
    const doc& b = *todo.back().second;
    todo.pop_back();

    if (a.identity() == b.identity()) continue;
    if (a.kind() != b.kind()) return false;

    switch (a.kind()) {
      case doc_kind::nil:
      case doc_kind::line:
        break;
      case doc_kind::append:
      case doc_kind::alt:
        todo.emplace_back(&a.right(), &b.right());
        todo.emplace_back(&a.left(), &b.left());
        break;
      case doc_kind::nest:
        if (a.indent() != b.indent()) return false;
        todo.emplace_back(&a.body(), &b.body());
        break;
      case doc_kind::text:
        if (a.str() != b.str()) return false;
        break;
    }
  }
  return true;
}

bool operator!=(const doc& x, const doc& y) { return !(x == y); }

static void write_quoted(std::ostream& os, const std::string& str) {
  os << '"';
  for (char c : str) {
    switch (c) {
      case '"':
        os << "\\\"";
        break;
      case '\\':
        os << "\\\\";
        break;
      case '\n':
        os << "\\n";
        break;
      case '\t':
        os << "\\t";
        break;
      default:
        os << c;
    }
  }
  os << '"';
}

std::ostream& operator<<(std::ostream& os, const doc& x) {
  switch (x.kind()) {
    case doc_kind::nil:
      return os << "Nil";
    case doc_kind::append:
      return os << "Append(" << x.left() << ", " << x.right() << ")";
    case doc_kind::nest:
      return os << "Nest(" << x.indent() << ", " << x.body() << ")";
    case doc_kind::text:
      os << "Text(";
      write_quoted(os, x.str());
      return os << ")";
    case doc_kind::line:
      return os << "Line";
    case doc_kind::alt:
      return os << "Union(" << x.left() << ", " << x.right() << ")";
  }
  return os;
}

doc doc_builder::merge(size_t start, size_t end) const {
  if (start == end) {
    return docs[start];
  }

  size_t middle = start + (end - start) / 2;

  doc left = merge(start, middle);
  doc right = merge(middle + 1, end);

  return left.concat(right);
}

doc doc_builder::build() && {
  if (docs.empty()) return nil();
  doc out = merge(0, docs.size() - 1);
  docs = {};
  return out;
}

}  // namespace ribbon
