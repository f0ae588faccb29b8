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

#include <ribbon/result.h>
#include <ribbon/validate.h>

#include <string>

#include "unit.h"

using namespace ribbon;

TEST(result_value) {
  result<int64_t, text_error> value = result_value<text_error>(int64_t(10));
  ASSERT_TRUE((bool)value);
  EXPECT_EQUAL(int64_t(10), *value);
}

TEST(result_error) {
  result<int64_t, text_error> err =
      result_error<int64_t>(text_error{text_error_kind::line_break, 3});
  ASSERT_FALSE((bool)err);
  EXPECT_TRUE(err.error().kind == text_error_kind::line_break);
  EXPECT_EQUAL(size_t(3), err.error().offset);
}

TEST(result_in_place) {
  auto str = make_result<std::string, text_error>(3, 'x');
  ASSERT_TRUE((bool)str);
  EXPECT_EQUAL("xxx", *str);
  EXPECT_EQUAL(size_t(3), str->size());

  auto invalid = make_error<size_t, invalid_text>(
      invalid_text{4, text_error{text_error_kind::invalid_utf8, 1}, "a\xff"});
  ASSERT_FALSE((bool)invalid);
  EXPECT_EQUAL(size_t(4), invalid.error().index);
  EXPECT_EQUAL(size_t(1), invalid.error().error.offset);
  EXPECT_EQUAL("a\xff", invalid.error().str);
}

TEST(result_copy_and_assign) {
  result<std::string, int> value = result_value<int>(std::string("doc"));
  result<std::string, int> copy(value);
  ASSERT_TRUE((bool)value);
  ASSERT_TRUE((bool)copy);
  EXPECT_EQUAL("doc", *value);
  EXPECT_EQUAL("doc", *copy);

  result<std::string, int> err = result_error<std::string>(7);
  copy = err;
  ASSERT_FALSE((bool)copy);
  EXPECT_EQUAL(7, copy.error());

  copy = value;
  ASSERT_TRUE((bool)copy);
  EXPECT_EQUAL("doc", *copy);
}

TEST(result_move) {
  result<std::string, int> value = result_value<int>(std::string("moved"));
  result<std::string, int> moved(std::move(value));
  // Moving keeps the state of the source, only its payload is taken.
  EXPECT_TRUE((bool)value);
  ASSERT_TRUE((bool)moved);
  EXPECT_EQUAL("moved", *moved);

  result<std::string, std::string> err = result_error<std::string>(std::string("bad"));
  result<std::string, std::string> moved_err(std::move(err));
  EXPECT_FALSE((bool)err);
  ASSERT_FALSE((bool)moved_err);
  EXPECT_EQUAL("bad", moved_err.error());
}
