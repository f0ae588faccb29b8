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

#include "combinators.h"

namespace ribbon {

doc space(doc x, doc y) { return x.concat(text(" ").concat(std::move(y))); }

doc newline(doc x, doc y) { return x.concat(line().concat(std::move(y))); }

doc space_newline(doc x, doc y) { return x.concat(group(line()).concat(std::move(y))); }

doc spread(const std::vector<doc>& xs) { return fold_doc(space, xs); }

doc stack(const std::vector<doc>& xs) { return fold_doc(newline, xs); }

doc bracket(std::string l, doc x, std::string r) {
  doc body = nest(BRACKET_INDENT, line().concat(std::move(x)));
  return group(text(std::move(l)).concat(body.concat(line().concat(text(std::move(r))))));
}

doc fill_words(const std::string& s) {
  std::vector<doc> words;
  size_t start = 0;
  while (true) {
    size_t end = s.find(' ', start);
    if (end == std::string::npos) {
      words.push_back(text(s.substr(start)));
      break;
    }
    words.push_back(text(s.substr(start, end - start)));
    start = end + 1;
  }
  return fold_doc(space_newline, words);
}

// Filling xs[i..] comes in two flavours, with xs[i] as given (`plain`) or
// with xs[i] flattened (`flat`). Both only depend on the two flavours for
// xs[i+1..], so building them from the back shares every tail and keeps the
// document linear in the number of pieces.
doc fill(const std::vector<doc>& xs) {
  if (xs.empty()) return nil();

  doc plain = xs.back();
  doc flat = flatten(xs.back());
  for (size_t i = xs.size() - 1; i-- > 0;) {
    doc head_flat = flatten(xs[i]);
    doc same_line = space(head_flat, flat);
    doc next_plain = doc::alt(same_line, newline(xs[i], plain));
    doc next_flat = doc::alt(same_line, newline(head_flat, plain));
    plain = std::move(next_plain);
    flat = std::move(next_flat);
  }
  return plain;
}

}  // namespace ribbon
