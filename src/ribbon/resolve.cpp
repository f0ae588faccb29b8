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

#include "resolve.h"

#include <algorithm>
#include <limits>
#include <vector>

namespace ribbon {

namespace {

// One pending piece of the document and the indentation in effect for it.
struct frame {
  int64_t indent;
  const doc* d;
  // Narrowest first line this piece and everything below it on the worklist
  // can still produce
  int64_t first_line;
};

}  // namespace

// width - column, saturating instead of wrapping
static int64_t room_left(int64_t width, int64_t column) {
  int64_t room;
  if (__builtin_sub_overflow(width, column, &room)) {
    return column > 0 ? std::numeric_limits<int64_t>::min() : std::numeric_limits<int64_t>::max();
  }
  return room;
}

// A line break puts the column at the indentation, which renders as no
// spaces when it is negative.
static int64_t column_after_break(int64_t indent) { return std::max<int64_t>(indent, 0); }

static void push(std::vector<frame>& worklist, int64_t indent, const doc& d) {
  int64_t below = worklist.empty() ? 0 : worklist.back().first_line;
  worklist.push_back({indent, &d, d.first_line().before(below)});
}

// The worklist is a stack: its back is the next piece to resolve.
//
// A choice takes its horizontal side when the first line of that side plus
// the rest of the worklist fits. Choices met further along that line are
// themselves resolved greedily, and the line fits exactly when some way of
// resolving them fits: if a nested horizontal side fits so does the whole
// line, otherwise the nested vertical side is what the line ends with. So
// the test reduces to the narrowest first line over every resolution, which
// each node and each frame carry, and every step is O(1).
static layout be(int64_t width, int64_t column, std::vector<frame> worklist) {
  layout_builder out;
  while (!worklist.empty()) {
    frame f = worklist.back();
    worklist.pop_back();
    const doc& d = *f.d;
    switch (d.kind()) {
      case doc_kind::nil:
        break;
      case doc_kind::append:
        push(worklist, f.indent, d.right());
        push(worklist, f.indent, d.left());
        break;
      case doc_kind::nest:
        push(worklist, f.indent + d.indent(), d.body());
        break;
      case doc_kind::text:
        out.text(d.str(), d.width());
        column += d.width();
        break;
      case doc_kind::line:
        out.line(f.indent);
        column = column_after_break(f.indent);
        break;
      case doc_kind::alt: {
        int64_t below = worklist.empty() ? 0 : worklist.back().first_line;
        int64_t room = room_left(width, column);
        bool horizontal = room >= 0 && d.left().first_line().before(below) <= room;
        push(worklist, f.indent, horizontal ? d.left() : d.right());
        break;
      }
    }
  }
  return std::move(out).build();
}

layout best(int64_t width, int64_t column, const doc& x) {
  std::vector<frame> worklist;
  push(worklist, 0, x);
  return be(width, column, std::move(worklist));
}

bool fits(int64_t room, const layout& x) {
  for (layout l = x;; l = l.rest()) {
    if (room < 0) return false;
    switch (l.kind()) {
      case layout_kind::nil:
        return true;
      case layout_kind::text:
        room -= l.width();
        break;
      case layout_kind::line:
        return true;
    }
  }
}

layout better(int64_t width, int64_t column, layout x, layout y) {
  return fits(room_left(width, column), x) ? x : y;
}

std::string pretty(int64_t width, const doc& x) { return render(best(width, 0, x)); }

}  // namespace ribbon
