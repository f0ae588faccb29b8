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

#include <algorithm>
#include <chrono>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "unit.h"

using namespace ribbon;

static doc seq(std::vector<doc> xs) {
  doc_builder builder;
  for (doc& x : xs) builder.append(std::move(x));
  return std::move(builder).build();
}

struct tree {
  std::string name;
  std::vector<tree> children;
};

static tree example_tree() {
  return tree{"aaa",
              {tree{"bbbbb", {tree{"ccc", {}}, tree{"dd", {}}}}, tree{"eee", {}},
               tree{"ffff", {tree{"gg", {}}, tree{"hhh", {}}, tree{"ii", {}}}}}};
}

// Children hang off the parent's name, each level aligned under its bracket.
static doc show_tree(const tree& t);

static doc show_trees(const std::vector<tree>& ts, size_t i) {
  if (i + 1 == ts.size()) return show_tree(ts[i]);
  return seq({show_tree(ts[i]), text(","), line(), show_trees(ts, i + 1)});
}

static doc show_tree(const tree& t) {
  doc out = text(t.name);
  if (!t.children.empty()) {
    doc children = seq({text("["), nest(1, show_trees(t.children, 0)), text("]")});
    out = out.concat(nest(static_cast<int64_t>(t.name.size()), std::move(children)));
  }
  return group(std::move(out));
}

// Children go on their own lines inside a `bracket`.
static doc show_tree_bracketed(const tree& t);

static doc show_trees_bracketed(const std::vector<tree>& ts, size_t i) {
  if (i + 1 == ts.size()) return show_tree_bracketed(ts[i]);
  return seq({show_tree_bracketed(ts[i]), text(","), line(), show_trees_bracketed(ts, i + 1)});
}

static doc show_tree_bracketed(const tree& t) {
  if (t.children.empty()) return text(t.name);
  return text(t.name).concat(bracket("[", show_trees_bracketed(t.children, 0), "]"));
}

static doc a_line_b() { return seq({text("a"), line(), text("b")}); }

static size_t count_breaks(const std::string& s) { return std::count(s.begin(), s.end(), '\n'); }

static std::vector<std::string> split_lines(const std::string& s) {
  std::vector<std::string> lines;
  size_t start = 0;
  for (size_t end; (end = s.find('\n', start)) != std::string::npos; start = end + 1) {
    lines.push_back(s.substr(start, end - start));
  }
  lines.push_back(s.substr(start));
  return lines;
}

// Resolves both branches of every choice in full before comparing them.
// Exponential, only usable on small documents.
static layout resolve_eagerly(int64_t width, int64_t column,
                              std::vector<std::pair<int64_t, doc>> worklist) {
  if (worklist.empty()) return layout::nil();

  int64_t indent = worklist.front().first;
  doc d = worklist.front().second;
  worklist.erase(worklist.begin());

  switch (d.kind()) {
    case doc_kind::nil:
      return resolve_eagerly(width, column, std::move(worklist));
    case doc_kind::append:
      worklist.insert(worklist.begin(), std::make_pair(indent, d.right()));
      worklist.insert(worklist.begin(), std::make_pair(indent, d.left()));
      return resolve_eagerly(width, column, std::move(worklist));
    case doc_kind::nest:
      worklist.insert(worklist.begin(), std::make_pair(indent + d.indent(), d.body()));
      return resolve_eagerly(width, column, std::move(worklist));
    case doc_kind::text:
      return layout::text(d.str(), resolve_eagerly(width, column + d.width(), std::move(worklist)));
    case doc_kind::line:
      return layout::line(indent, resolve_eagerly(width, std::max<int64_t>(indent, 0),
                                                  std::move(worklist)));
    case doc_kind::alt: {
      auto horizontal = worklist;
      horizontal.insert(horizontal.begin(), std::make_pair(indent, d.left()));
      worklist.insert(worklist.begin(), std::make_pair(indent, d.right()));
      return better(width, column, resolve_eagerly(width, column, std::move(horizontal)),
                    resolve_eagerly(width, column, std::move(worklist)));
    }
  }
  return layout::nil();
}

TEST(pretty_hard_line_always_breaks) {
  EXPECT_EQUAL("a\nb", pretty(5, a_line_b()));
  EXPECT_EQUAL("a\nb", pretty(80, a_line_b()));
}

TEST(pretty_group_exact_fit) {
  EXPECT_EQUAL("a b", pretty(3, group(a_line_b())));
  EXPECT_EQUAL("a\nb", pretty(2, group(a_line_b())));
}

TEST(pretty_nest_indents_breaks) {
  EXPECT_EQUAL("a", pretty(80, nest(2, text("a"))));
  EXPECT_EQUAL("a\n  b", pretty(80, text("a").concat(nest(2, line().concat(text("b"))))));
  doc twice = seq({text("a"), nest(2, seq({line(), text("b"), nest(3, line().concat(text("c")))}))});
  EXPECT_EQUAL("a\n  b\n     c", pretty(80, twice));
  EXPECT_EQUAL("a\nb", pretty(80, nest(-4, a_line_b())));
}

TEST(pretty_extreme_widths) {
  EXPECT_EQUAL("a\nb", pretty(0, group(a_line_b())));
  EXPECT_EQUAL("a\nb", pretty(-5, group(a_line_b())));
  EXPECT_EQUAL("abc", pretty(0, text("abc")));
  EXPECT_EQUAL("", pretty(-5, group(nil())));
  EXPECT_EQUAL("a b", pretty(std::numeric_limits<int64_t>::max(), group(a_line_b())));
  EXPECT_EQUAL("a\nb", pretty(std::numeric_limits<int64_t>::min(), group(a_line_b())));
}

TEST(pretty_empty) {
  EXPECT_EQUAL("", pretty(80, nil()));
  EXPECT_EQUAL("", pretty(80, append(nil(), nil())));
  EXPECT_EQUAL("", pretty(0, nest(3, nil())));
}

TEST(best_starting_column) {
  layout broken = layout::text("a", layout::line(0, layout::text("b", layout::nil())));
  EXPECT_EQUAL(broken, best(10, 8, group(a_line_b())));
  EXPECT_EQUAL("a b", render(best(10, 7, group(a_line_b()))));
  EXPECT_EQUAL("a b", render(best(10, -100, group(a_line_b()))));
}

TEST(best_choice_sees_following_text) {
  // The group itself fits, but not together with what follows it on the line.
  doc d = group(a_line_b()).concat(text("cd"));
  EXPECT_EQUAL("a bcd", pretty(5, d));
  EXPECT_EQUAL("a\nbcd", pretty(4, d));

  doc e = seq({group(a_line_b()), line(), text("cdefgh")});
  EXPECT_EQUAL("a b\ncdefgh", pretty(3, e));
}

TEST(pretty_counts_characters) {
  doc d = group(seq({text("héé"), line(), text("日本")}));
  EXPECT_EQUAL("héé 日本", pretty(6, d));
  EXPECT_EQUAL("héé\n日本", pretty(5, d));
}

TEST(law_nil_identity) {
  std::vector<doc> docs = {a_line_b(), group(a_line_b()), show_tree(example_tree()),
                           fill_words("one two three four")};
  for (const doc& x : docs) {
    for (int64_t width : {0, 3, 10, 30, 80}) {
      std::string expected = pretty(width, x);
      EXPECT_EQUAL(expected, pretty(width, append(nil(), x)));
      EXPECT_EQUAL(expected, pretty(width, append(x, nil())));
    }
  }
}

TEST(law_append_associative) {
  doc x = group(seq({text("alpha"), line(), text("beta")}));
  doc y = nest(2, line().concat(text("gamma")));
  doc z = group(seq({text("delta"), line(), show_tree(example_tree())}));
  for (int64_t width = 0; width <= 60; ++width) {
    EXPECT_EQUAL(pretty(width, append(append(x, y), z)), pretty(width, append(x, append(y, z)))) << "width " << width;
  }
}

TEST(law_nest) {
  doc x = seq({text("a"), line(), group(seq({text("b"), line(), text("c")}))});
  for (int64_t width : {1, 3, 80}) {
    EXPECT_EQUAL(pretty(width, nest(5, x)), pretty(width, nest(2, nest(3, x))));
    EXPECT_EQUAL(pretty(width, nest(0, x)), pretty(width, x));
    EXPECT_EQUAL(pretty(width, append(nest(4, text("a")), nest(4, x))),
                 pretty(width, nest(4, append(text("a"), x))));
  }
}

TEST(tree_aligned) {
  doc d = show_tree(example_tree());
  EXPECT_EQUAL("aaa[bbbbb[ccc, dd], eee, ffff[gg, hhh, ii]]", pretty(80, d));
  EXPECT_EQUAL("aaa[bbbbb[ccc, dd],\n    eee,\n    ffff[gg, hhh, ii]]", pretty(30, d));
  EXPECT_EQUAL(
      "aaa[bbbbb[ccc,\n"
      "          dd],\n"
      "    eee,\n"
      "    ffff[gg,\n"
      "         hhh,\n"
      "         ii]]",
      pretty(10, d));
}

TEST(tree_bracketed) {
  doc d = show_tree_bracketed(example_tree());
  EXPECT_EQUAL("aaa[ bbbbb[ ccc, dd ], eee, ffff[ gg, hhh, ii ] ]", pretty(80, d));
  EXPECT_EQUAL("aaa[\n  bbbbb[ ccc, dd ],\n  eee,\n  ffff[ gg, hhh, ii ]\n]", pretty(30, d));
  EXPECT_EQUAL(
      "aaa[\n"
      "  bbbbb[\n"
      "    ccc,\n"
      "    dd\n"
      "  ],\n"
      "  eee,\n"
      "  ffff[\n"
      "    gg,\n"
      "    hhh,\n"
      "    ii\n"
      "  ]\n"
      "]",
      pretty(10, d));
}

TEST(resolution_matches_eager_definition) {
  std::vector<doc> docs = {
      show_tree(example_tree()),
      show_tree_bracketed(example_tree()),
      fill({text("a"), text("bb"), text("ccc"), text("dddd")}),
      fill({a_line_b(), group(seq({text("cc"), line(), text("d")})), text("eee")}),
      group(text("x").concat(nest(2, seq({line(), group(a_line_b()), line(), text("yy")})))).concat(text("z")),
  };
  for (const doc& x : docs) {
    for (int64_t width = 0; width <= 40; ++width) {
      layout expected = resolve_eagerly(width, 0, {std::make_pair(int64_t(0), x)});
      EXPECT_EQUAL(expected, best(width, 0, x)) << "width " << width << " for " << x;
    }
  }
}

TEST(wider_never_breaks_more) {
  std::vector<doc> docs = {
      show_tree(example_tree()),
      show_tree_bracketed(example_tree()),
      fill_words("the quick brown fox jumps over the lazy dog"),
      fill({text("a"), text("bb"), text("ccc"), text("dddd"), text("e"), text("ff")}),
  };
  for (const doc& x : docs) {
    size_t previous = count_breaks(pretty(1, x));
    for (int64_t width = 2; width <= 60; ++width) {
      size_t breaks = count_breaks(pretty(width, x));
      EXPECT_TRUE(breaks <= previous) << "width " << width << " for " << x;
      previous = breaks;
    }
  }
}

TEST(lines_stay_within_width) {
  doc x = fill_words("a pretty printer never splits a word like incomprehensibilities in two");
  for (int64_t width = 1; width <= 40; ++width) {
    for (const std::string& l : split_lines(pretty(width, x))) {
      bool single_word = l.find(' ') == std::string::npos;
      EXPECT_TRUE(static_cast<int64_t>(text_width(l)) <= width || single_word)
          << "width " << width << " line '" << l << "'";
    }
  }
}

TEST(deep_left_nested_append) {
  doc d = nil();
  for (int i = 0; i < 10000; ++i) {
    d = append(d, text("a"));
  }
  std::string out = pretty(80, d);
  EXPECT_EQUAL(size_t(10000), out.size());
  EXPECT_EQUAL(size_t(0), count_breaks(out));
}

TEST(deep_right_nested_lines) {
  doc d = text("end");
  for (int i = 0; i < 5000; ++i) {
    d = append(text("x"), append(line(), d));
  }
  std::string out = pretty(80, d);
  EXPECT_EQUAL(size_t(5000), count_breaks(out));
}

TEST(deep_nested_groups) {
  doc d = text("x");
  for (int i = 0; i < 200; ++i) {
    d = group(seq({text("("), nest(1, line().concat(d)), line(), text(")")}));
  }
  std::string wide = pretty(std::numeric_limits<int64_t>::max(), d);
  EXPECT_EQUAL(size_t(0), count_breaks(wide));
  EXPECT_EQUAL(size_t(200 * 4 + 1), wide.size());

  std::string narrow = pretty(80, d);
  EXPECT_TRUE(count_breaks(narrow) > 0);
}

TEST(long_fill) {
  std::vector<doc> words;
  for (int i = 0; i < 5000; ++i) {
    words.push_back(text(std::to_string(i)));
  }
  std::string out = pretty(80, fill(words));
  for (const std::string& l : split_lines(out)) {
    EXPECT_TRUE(l.size() <= 80) << "line '" << l << "'";
  }
  EXPECT_TRUE(count_breaks(out) > 200);
}

// Each choice is decided from the cached first line widths, so a run of
// choices on one line costs no more than the run itself.
static std::chrono::steady_clock::duration time_pretty(int64_t width, const doc& d,
                                                       std::string* out) {
  auto start = std::chrono::steady_clock::now();
  *out = pretty(width, d);
  return std::chrono::steady_clock::now() - start;
}

TEST(many_groups_on_one_line) {
  doc_builder builder;
  for (int i = 0; i < 1000; ++i) {
    builder.append(group(text("x").concat(line())));
  }
  doc d = std::move(builder).build();

  std::string out;
  auto elapsed = time_pretty(80, d, &out);
  EXPECT_TRUE(elapsed < std::chrono::seconds(5));

  // 39 groups stay flat and the 40th breaks, which leaves the last line open.
  std::string row = "x";
  for (int i = 1; i < 40; ++i) row += " x";
  std::string expected = row;
  for (int i = 1; i < 25; ++i) expected += "\n" + row;
  expected += " ";
  EXPECT_EQUAL(expected, out);
}

TEST(many_groups_unbounded_width) {
  std::vector<doc> pairs;
  for (int i = 0; i < 2000; ++i) pairs.push_back(group(a_line_b()));

  std::string out;
  auto elapsed = time_pretty(std::numeric_limits<int64_t>::max(), spread(pairs), &out);
  EXPECT_TRUE(elapsed < std::chrono::seconds(5));
  EXPECT_EQUAL(size_t(0), count_breaks(out));
  EXPECT_EQUAL(size_t(2000 * 3 + 1999), out.size());
}

TEST(group_of_long_stack) {
  std::vector<doc> words(100000, text("w"));
  doc d = group(stack(words));

  std::string narrow;
  auto elapsed = time_pretty(80, d, &narrow);
  EXPECT_TRUE(elapsed < std::chrono::seconds(5));
  EXPECT_EQUAL(size_t(99999), count_breaks(narrow));
  EXPECT_EQUAL(size_t(2 * 100000 - 1), narrow.size());

  std::string wide;
  elapsed = time_pretty(std::numeric_limits<int64_t>::max(), d, &wide);
  EXPECT_TRUE(elapsed < std::chrono::seconds(5));
  EXPECT_EQUAL(size_t(0), count_breaks(wide));
  EXPECT_EQUAL(size_t(2 * 100000 - 1), wide.size());
}
