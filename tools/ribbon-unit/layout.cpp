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

#include <ribbon/layout.h>
#include <ribbon/resolve.h>

#include <limits>
#include <sstream>

#include "unit.h"

using namespace ribbon;

static layout sample() {
  return layout::text("a", layout::line(2, layout::text("b", layout::nil())));
}

TEST(layout_cons) {
  layout l = sample();
  ASSERT_TRUE(l.kind() == layout_kind::text);
  EXPECT_EQUAL("a", l.str());
  EXPECT_EQUAL(int64_t(1), l.width());
  EXPECT_EQUAL(size_t(3), l.size());

  layout r = l.rest();
  ASSERT_TRUE(r.kind() == layout_kind::line);
  EXPECT_EQUAL(int64_t(2), r.indent());
  EXPECT_TRUE(r.rest().rest().kind() == layout_kind::nil);
  EXPECT_TRUE(r.rest().rest().rest().kind() == layout_kind::nil);
  EXPECT_EQUAL(size_t(0), layout::nil().size());
}

TEST(layout_render) {
  EXPECT_EQUAL("", render(layout::nil()));
  EXPECT_EQUAL("a\n  b", render(sample()));
  EXPECT_EQUAL("a\n  b", sample().as_string());
  EXPECT_EQUAL("\n", render(layout::line(0, layout::nil())));
  EXPECT_EQUAL("x\ny", render(layout::text("x", layout::line(-3, layout::text("y", layout::nil())))));

  std::stringstream ss;
  sample().write(ss);
  EXPECT_EQUAL("a\n  b", ss.str());
}

TEST(layout_builder_matches_cons) {
  layout_builder builder;
  builder.text("a");
  builder.line(2);
  builder.text("b");
  EXPECT_EQUAL(size_t(3), builder.size());
  EXPECT_EQUAL(sample(), std::move(builder).build());

  layout_builder joined;
  joined.text("<");
  joined.append(sample());
  joined.text(">");
  EXPECT_EQUAL("<a\n  b>", render(std::move(joined).build()));
}

TEST(layout_equality) {
  EXPECT_TRUE(layout::nil() == layout::nil());
  EXPECT_TRUE(sample() == sample());
  EXPECT_TRUE(sample().rest() == layout::line(2, layout::text("b", layout::nil())));
  EXPECT_TRUE(sample() != layout::text("a", layout::line(4, layout::text("b", layout::nil()))));
  EXPECT_TRUE(sample() != layout::text("a", layout::nil()));
}

TEST(layout_debug_print) {
  std::stringstream ss;
  ss << sample();
  EXPECT_EQUAL("Text(\"a\", Line(2, Text(\"b\", Nil)))", ss.str());
}

TEST(fits_stops_at_first_line) {
  EXPECT_TRUE(fits(0, layout::nil()));
  EXPECT_TRUE(fits(3, layout::text("abc", layout::nil())));
  EXPECT_FALSE(fits(2, layout::text("abc", layout::nil())));
  EXPECT_TRUE(fits(0, layout::line(0, layout::text("abc", layout::nil()))));
  EXPECT_TRUE(fits(2, layout::text("ab", layout::line(0, layout::text("zzzzzz", layout::nil())))));
  EXPECT_FALSE(fits(1, layout::text("ab", layout::line(0, layout::nil()))));
}

TEST(fits_negative_room) {
  EXPECT_FALSE(fits(-1, layout::nil()));
  EXPECT_FALSE(fits(-1, layout::line(0, layout::nil())));
  EXPECT_FALSE(fits(std::numeric_limits<int64_t>::min(), layout::nil()));
  EXPECT_TRUE(fits(std::numeric_limits<int64_t>::max(), sample()));
}

TEST(fits_counts_characters) {
  EXPECT_TRUE(fits(5, layout::text("héllo", layout::nil())));
  EXPECT_FALSE(fits(4, layout::text("héllo", layout::nil())));
}

TEST(better_picks_first_when_it_fits) {
  layout x = layout::text("ab", layout::nil());
  layout y = layout::line(0, layout::nil());
  EXPECT_EQUAL(x, better(5, 3, x, y));
  EXPECT_EQUAL(y, better(5, 4, x, y));
  EXPECT_EQUAL(y, better(5, 6, layout::nil(), y));
  EXPECT_EQUAL(x, better(std::numeric_limits<int64_t>::max(), -10, x, y));
  EXPECT_EQUAL(y, better(std::numeric_limits<int64_t>::min(), 10, x, y));
}
