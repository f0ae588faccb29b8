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

#include <ribbon/ribbon.h>

#include <string>
#include <vector>

#include "unit.h"

using namespace ribbon;

static std::vector<doc> texts(const std::vector<std::string>& strs) {
  std::vector<doc> out;
  for (const std::string& s : strs) out.push_back(text(s));
  return out;
}

TEST(combinators_joiners) {
  EXPECT_EQUAL(append(text("a"), append(text(" "), text("b"))), space(text("a"), text("b")));
  EXPECT_EQUAL(append(text("a"), append(line(), text("b"))), newline(text("a"), text("b")));
  EXPECT_EQUAL(append(text("a"), append(group(line()), text("b"))),
               space_newline(text("a"), text("b")));

  EXPECT_EQUAL("a b", pretty(80, space_newline(text("a"), text("b"))));
  EXPECT_EQUAL("a\nb", pretty(2, space_newline(text("a"), text("b"))));
  EXPECT_EQUAL("a\nb", pretty(80, newline(text("a"), text("b"))));
  EXPECT_EQUAL("a b", pretty(0, space(text("a"), text("b"))));
}

TEST(combinators_fold_doc) {
  EXPECT_EQUAL(nil(), fold_doc(space, {}));
  EXPECT_EQUAL(text("a"), fold_doc(space, texts({"a"})));

  auto joined = fold_doc([](doc x, doc y) { return append(x, append(text("+"), y)); },
                         texts({"a", "b", "c"}));
  EXPECT_EQUAL(append(text("a"), append(text("+"), append(text("b"), append(text("+"), text("c"))))),
               joined);
}

TEST(combinators_spread_stack) {
  EXPECT_EQUAL("a b c", pretty(2, spread(texts({"a", "b", "c"}))));
  EXPECT_EQUAL("a\nb\nc", pretty(80, stack(texts({"a", "b", "c"}))));
  EXPECT_EQUAL("", pretty(80, stack({})));
  EXPECT_EQUAL("x", pretty(80, spread(texts({"x"}))));
}

TEST(combinators_bracket) {
  doc body = append(text("x"), append(text(","), append(line(), text("y"))));
  EXPECT_EQUAL("[ x, y ]", pretty(80, bracket("[", body, "]")));
  EXPECT_EQUAL("[\n  x,\n  y\n]", pretty(3, bracket("[", body, "]")));
  EXPECT_EQUAL("{  }", pretty(80, bracket("{", nil(), "}")));
}

TEST(combinators_bracket_flattens_body) {
  doc statements = bracket("{", stack(texts({"x;", "y;"})), "}");
  EXPECT_EQUAL("{ x; y; }", pretty(12, statements));
  EXPECT_EQUAL("{\n  x;\n  y;\n}", pretty(5, statements));
}

TEST(combinators_bracket_around_fill) {
  doc call = text("call").concat(bracket("(", fill_words("aa bb cc dd ee ff"), ")"));
  EXPECT_EQUAL("call( aa bb cc dd ee ff )", pretty(80, call));
  EXPECT_EQUAL("call(\n  aa bb cc\n  dd ee ff\n)", pretty(12, call));
}

TEST(combinators_fill_words) {
  doc d = fill_words("the quick brown fox");
  EXPECT_EQUAL("the quick\nbrown fox", pretty(10, d));
  EXPECT_EQUAL("the quick brown fox", pretty(80, d));
  EXPECT_EQUAL("the\nquick\nbrown\nfox", pretty(1, d));
}

TEST(combinators_fill_words_edges) {
  EXPECT_EQUAL("", pretty(80, fill_words("")));
  EXPECT_EQUAL("aaaaaaaaaa\nb", pretty(5, fill_words("aaaaaaaaaa b")));
  // Runs of spaces leave empty words behind.
  EXPECT_EQUAL("a  b", pretty(10, fill_words("a  b")));
  EXPECT_EQUAL("a\n\nb", pretty(1, fill_words("a  b")));
}

TEST(combinators_fill) {
  doc d = fill(texts({"a", "bb", "ccc"}));
  EXPECT_EQUAL("a bb\nccc", pretty(6, d));
  EXPECT_EQUAL("a bb ccc", pretty(80, d));
  EXPECT_EQUAL("a\nbb\nccc", pretty(1, d));

  doc two = fill(texts({"aa", "bb", "cc"}));
  EXPECT_EQUAL("aa bb\ncc", pretty(5, two));

  EXPECT_EQUAL(nil(), fill({}));
  EXPECT_EQUAL(text("solo"), fill(texts({"solo"})));
}

TEST(combinators_fill_flattens_pieces) {
  doc lines = append(text("x"), append(line(), text("y")));
  doc d = fill({lines, text("z")});
  EXPECT_EQUAL("x y z", pretty(80, d));
  EXPECT_EQUAL("x y z", pretty(5, d));
  EXPECT_EQUAL("x\ny\nz", pretty(3, d));

  doc grouped = fill({text("a"), group(append(text("b"), append(line(), text("c")))), text("d")});
  EXPECT_EQUAL("a b c d", pretty(80, grouped));
  EXPECT_EQUAL("a b c\nd", pretty(5, grouped));
  EXPECT_EQUAL("a\nb c\nd", pretty(3, grouped));

  doc nested = fill({text("a"), nest(2, append(text("b"), append(line(), text("c")))), text("d")});
  EXPECT_EQUAL("a\nb\n  c\nd", pretty(4, nested));
}

TEST(combinators_fill_is_linear) {
  // Every piece adds one word and one space, the choices share their tails.
  std::vector<doc> words;
  for (int i = 0; i < 1000; ++i) words.push_back(text("w"));
  doc filled = fill(words);
  auto checked = validate(filled);
  ASSERT_TRUE((bool)checked);
  EXPECT_EQUAL(size_t(1000 + 999), *checked);

  std::string row = "w w w w w";
  std::string expected = row;
  for (int i = 1; i < 200; ++i) expected += "\n" + row;
  EXPECT_EQUAL(expected, pretty(9, filled));
}
