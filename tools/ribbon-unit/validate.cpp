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
#include <ribbon/resolve.h>
#include <ribbon/validate.h>

#include "unit.h"

using namespace ribbon;

TEST(checked_text_accepts_single_lines) {
  auto plain = checked_text("hello");
  ASSERT_TRUE((bool)plain);
  EXPECT_EQUAL(text("hello"), *plain);

  auto accented = checked_text("héllo wörld");
  ASSERT_TRUE((bool)accented);
  EXPECT_EQUAL(int64_t(11), accented->width());

  auto empty = checked_text("");
  ASSERT_TRUE((bool)empty);
  EXPECT_EQUAL("", pretty(80, *empty));
}

TEST(checked_text_rejects_line_breaks) {
  auto newline = checked_text("a\nb");
  ASSERT_FALSE((bool)newline);
  EXPECT_TRUE(newline.error().kind == text_error_kind::line_break);
  EXPECT_EQUAL(size_t(1), newline.error().offset);

  auto carriage = checked_text("ab\r");
  ASSERT_FALSE((bool)carriage);
  EXPECT_TRUE(carriage.error().kind == text_error_kind::line_break);
  EXPECT_EQUAL(size_t(2), carriage.error().offset);
}

TEST(checked_text_rejects_bad_utf8) {
  auto stray = checked_text("\xff");
  ASSERT_FALSE((bool)stray);
  EXPECT_TRUE(stray.error().kind == text_error_kind::invalid_utf8);
  EXPECT_EQUAL(size_t(0), stray.error().offset);

  auto truncated = checked_text("é\xc3");
  ASSERT_FALSE((bool)truncated);
  EXPECT_TRUE(truncated.error().kind == text_error_kind::invalid_utf8);
  EXPECT_EQUAL(size_t(2), truncated.error().offset);

  // Whichever problem comes first is reported.
  auto both = checked_text("x\xffy\n");
  ASSERT_FALSE((bool)both);
  EXPECT_TRUE(both.error().kind == text_error_kind::invalid_utf8);
  EXPECT_EQUAL(size_t(1), both.error().offset);
}

TEST(validate_counts_fragments) {
  auto two = validate(append(text("a"), append(line(), text("b"))));
  ASSERT_TRUE((bool)two);
  EXPECT_EQUAL(size_t(2), *two);

  auto empty = validate(nest(4, line()));
  ASSERT_TRUE((bool)empty);
  EXPECT_EQUAL(size_t(0), *empty);
}

TEST(validate_counts_shared_fragments_once) {
  doc w = text("w");
  auto shared = validate(append(w, append(w, w)));
  ASSERT_TRUE((bool)shared);
  EXPECT_EQUAL(size_t(1), *shared);

  // Both groups flatten to the same " " node.
  auto nested = validate(group(group(line())));
  ASSERT_TRUE((bool)nested);
  EXPECT_EQUAL(size_t(1), *nested);
}

TEST(validate_reports_line_break) {
  auto broken = validate(nest(2, text("a\nb")));
  ASSERT_FALSE((bool)broken);
  EXPECT_EQUAL(size_t(0), broken.error().index);
  EXPECT_TRUE(broken.error().error.kind == text_error_kind::line_break);
  EXPECT_EQUAL(size_t(1), broken.error().error.offset);
  EXPECT_EQUAL("a\nb", broken.error().str);
}

TEST(validate_reports_bad_utf8) {
  doc d = append(text("ok"), group(append(text("x"), append(line(), text("\xff")))));
  auto bad = validate(d);
  ASSERT_FALSE((bool)bad);
  EXPECT_EQUAL(size_t(3), bad.error().index);
  EXPECT_TRUE(bad.error().error.kind == text_error_kind::invalid_utf8);
  EXPECT_EQUAL(size_t(0), bad.error().error.offset);
  EXPECT_EQUAL("\xff", bad.error().str);
}
