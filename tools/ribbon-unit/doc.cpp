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

#include <ribbon/combinators.h>
#include <ribbon/doc.h>
#include <ribbon/resolve.h>
#include <ribbon/text_state.h>

#include <sstream>

#include "unit.h"

using namespace ribbon;

static std::string debug(const doc& d) {
  std::stringstream ss;
  ss << d;
  return ss.str();
}

TEST(doc_kinds) {
  EXPECT_TRUE(nil().kind() == doc_kind::nil);
  EXPECT_TRUE(doc().kind() == doc_kind::nil);
  EXPECT_TRUE(line().kind() == doc_kind::line);
  EXPECT_TRUE(append(text("a"), text("b")).kind() == doc_kind::append);
  EXPECT_TRUE(group(line()).kind() == doc_kind::alt);

  doc n = nest(4, text("x"));
  ASSERT_TRUE(n.kind() == doc_kind::nest);
  EXPECT_EQUAL(int64_t(4), n.indent());
  EXPECT_EQUAL(text("x"), n.body());

  doc t = text("hello");
  ASSERT_TRUE(t.kind() == doc_kind::text);
  EXPECT_EQUAL("hello", t.str());
  EXPECT_EQUAL(int64_t(5), t.width());
}

TEST(doc_concat) {
  doc d = text("a").concat(line());
  ASSERT_TRUE(d.kind() == doc_kind::append);
  EXPECT_EQUAL(text("a"), d.left());
  EXPECT_EQUAL(line(), d.right());
}

TEST(doc_text_width_counts_characters) {
  EXPECT_EQUAL(int64_t(5), text("héllo").width());
  EXPECT_EQUAL(int64_t(0), text("").width());
  EXPECT_EQUAL(int64_t(3), text("a\xffz").width());
  EXPECT_EQUAL(size_t(3), text_width("日本語"));
}

TEST(doc_text_state) {
  text_state state = from_string<text_state>("a\nb\xff");
  EXPECT_EQUAL(size_t(4), state.byte_count());
  EXPECT_EQUAL(size_t(4), state.width());
  EXPECT_EQUAL(size_t(1), state.line_break_count());
  EXPECT_EQUAL(size_t(1), state.invalid_count());
  EXPECT_TRUE(state.has_line_break());
  EXPECT_FALSE(state.is_valid_utf8());

  EXPECT_TRUE(from_string<text_state>("") == text_state::identity());
  EXPECT_TRUE(from_string<text_state>("ab") ==
              from_string<text_state>("a") + from_string<text_state>("b"));
}

TEST(doc_group_shares_argument) {
  doc x = text("a").concat(line()).concat(text("b"));
  doc g = group(x);
  ASSERT_TRUE(g.kind() == doc_kind::alt);
  EXPECT_TRUE(g.right().identity() == x.identity());
  EXPECT_EQUAL(flatten(x), g.left());
}

TEST(doc_flatten_rules) {
  EXPECT_EQUAL(nil(), flatten(nil()));
  EXPECT_EQUAL(text("abc"), flatten(text("abc")));
  EXPECT_EQUAL(text(" "), flatten(line()));
  EXPECT_EQUAL(append(text("a"), text(" ")), flatten(append(text("a"), line())));
  EXPECT_EQUAL(nest(2, text(" ")), flatten(nest(2, line())));

  // A choice flattens to its horizontal side, which is already flat and shared.
  doc choice = group(text("a").concat(line()).concat(text("b")));
  EXPECT_TRUE(flatten(choice).identity() == choice.left().identity());
}

TEST(doc_is_flat) {
  EXPECT_TRUE(nil().is_flat());
  EXPECT_TRUE(text("a").is_flat());
  EXPECT_TRUE(nest(2, append(text("a"), text("b"))).is_flat());
  EXPECT_FALSE(line().is_flat());
  EXPECT_FALSE(append(text("a"), nest(1, line())).is_flat());
  EXPECT_FALSE(group(text("a")).is_flat());

  doc flat = append(text("a"), nest(4, text("b")));
  EXPECT_TRUE(flatten(flat).identity() == flat.identity());
}

TEST(doc_first_line) {
  EXPECT_TRUE(nil().first_line() == first_line_state::identity());
  EXPECT_TRUE(text("abc").first_line() == first_line_state::text(3));
  EXPECT_TRUE(line().first_line() == first_line_state::line());

  // "ab" then a break, or "ab cd" on one line
  doc d = text("ab").concat(line()).concat(text("cd"));
  EXPECT_TRUE(d.first_line() == (first_line_state{2, UNBOUNDED_WIDTH}));
  EXPECT_TRUE(group(d).first_line() == (first_line_state{2, 5}));
  EXPECT_TRUE(nest(7, d).first_line() == d.first_line());

  EXPECT_EQUAL(int64_t(2), group(d).first_line().before(100));
  EXPECT_EQUAL(int64_t(1), text("x").first_line().before(0));
  EXPECT_EQUAL(UNBOUNDED_WIDTH, text("x").first_line().before(UNBOUNDED_WIDTH));
  EXPECT_EQUAL(UNBOUNDED_WIDTH, add_width(UNBOUNDED_WIDTH - 1, 5));
}

TEST(doc_long_lists) {
  std::vector<doc> words;
  for (int i = 0; i < 100000; ++i) words.push_back(text("w"));
  doc d = stack(words);

  doc flat = flatten(d);
  EXPECT_TRUE(flat.is_flat());
  EXPECT_EQUAL(int64_t(2 * 100000 - 1), flat.first_line().unbroken);
  EXPECT_TRUE(flatten(group(d)) == flat);
  EXPECT_TRUE(stack(words) == d);
  EXPECT_TRUE(spread(words) == flat);
}

TEST(doc_flatten_idempotent) {
  std::vector<doc> docs = {
      nil(),
      line(),
      group(text("a").concat(nest(2, line().concat(text("b"))))),
      group(group(line()).concat(text("x")).concat(line())),
      nest(3, text("f(").concat(group(nest(2, line().concat(text("y")))))),
  };

  for (const auto& d : docs) {
    EXPECT_EQUAL(flatten(d), flatten(flatten(d))) << debug(d);
  }
}

TEST(doc_flatten_of_group) {
  std::vector<doc> docs = {
      text("a").concat(line()).concat(text("b")),
      nest(2, line().concat(group(line().concat(text("c"))))),
      group(line()),
  };

  for (const auto& d : docs) {
    EXPECT_EQUAL(flatten(d), flatten(group(d))) << debug(d);
  }
}

TEST(doc_equality) {
  EXPECT_TRUE(text("a") == text("a"));
  EXPECT_TRUE(text("a") != text("b"));
  EXPECT_TRUE(nest(1, line()) != nest(2, line()));
  EXPECT_TRUE(append(text("a"), nil()) != text("a"));
  EXPECT_TRUE(group(line()) == group(line()));
  EXPECT_TRUE(append(append(text("a"), text("b")), text("c")) !=
              append(text("a"), append(text("b"), text("c"))));
}

TEST(doc_debug_print) {
  EXPECT_EQUAL("Nil", debug(nil()));
  EXPECT_EQUAL("Append(Text(\"a\"), Line)", debug(text("a").concat(line())));
  EXPECT_EQUAL("Nest(2, Text(\"x\\\"y\"))", debug(nest(2, text("x\"y"))));
  EXPECT_EQUAL("Union(Text(\" \"), Line)", debug(group(line())));
}

TEST(doc_builder_basic) {
  doc_builder builder;
  builder.append("Hello");
  builder.append(line());
  builder.append("World");
  builder.append("!");

  {
    doc_builder other;
    other.append("My name is");
    other.append(" Ribbon");
    builder.append(line());
    builder.append(std::move(other).build());
  }

  EXPECT_EQUAL(size_t(6), builder.size());
  doc d = std::move(builder).build();
  EXPECT_EQUAL("Hello\nWorld!\nMy name is Ribbon", pretty(80, d));
  EXPECT_EQUAL("Hello World! My name is Ribbon", pretty(80, group(d)));
}

TEST(doc_builder_empty) {
  doc_builder builder;
  EXPECT_TRUE(builder.empty());
  EXPECT_EQUAL(nil(), std::move(builder).build());
}

TEST(doc_builder_undo) {
  doc_builder builder;
  builder.append("Hello");
  builder.append(" ");
  builder.append("World");
  builder.append("!");

  builder.undo();
  builder.undo();

  doc d = std::move(builder).build();
  EXPECT_EQUAL("Hello ", pretty(80, d));
}

TEST(doc_builder_large) {
  doc_builder builder;
  for (int i = 0; i < 100000; i++) {
    builder.append("a");
  }

  doc d = std::move(builder).build();
  ASSERT_EQUAL(size_t(100000), pretty(80, d).size());
}
