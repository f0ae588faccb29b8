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

#include <string>
#include <utility>
#include <vector>

#include "doc.h"

namespace ribbon {

// How far `bracket` indents its body when it breaks.
static constexpr int64_t BRACKET_INDENT = 2;

// x <> text(" ") <> y
doc space(doc x, doc y);

// x <> line() <> y
doc newline(doc x, doc y);

// A space if `y` starts on the current line, otherwise a line break.
doc space_newline(doc x, doc y);

// Right fold of a binary joiner: f(d0, f(d1, ... f(dn-1, dn))).
// An empty list gives nil(), a single document is returned unchanged.
template <class F>
doc fold_doc(F&& f, const std::vector<doc>& xs) {
  if (xs.empty()) return nil();

  doc out = xs.back();
  for (size_t i = xs.size() - 1; i-- > 0;) {
    out = f(xs[i], std::move(out));
  }
  return out;
}

doc spread(const std::vector<doc>& xs);
doc stack(const std::vector<doc>& xs);

// group(text(l) <> nest(2, line() <> x) <> line() <> text(r))
doc bracket(std::string l, doc x, std::string r);

// Splits `s` on single spaces and lets every gap be either a space or a line
// break, whichever keeps the next word on the line.
doc fill_words(const std::string& s);

// Like `fill_words` over whole documents. At each gap either the left
// document is flattened and the rest filled on the same line, or the left
// document keeps its own layout and the rest starts on a new line.
doc fill(const std::vector<doc>& xs);

}  // namespace ribbon
