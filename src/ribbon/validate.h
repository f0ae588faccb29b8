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

#include <cstddef>
#include <string>

#include "doc.h"
#include "result.h"

namespace ribbon {

enum class text_error_kind { line_break, invalid_utf8 };

struct text_error {
  text_error_kind kind;
  // Byte offset of the offending character
  size_t offset;
};

// `text(s)` after checking that `s` is well formed UTF-8 without line breaks.
result<doc, text_error> checked_text(std::string s);

// The first text fragment found that `checked_text` would have refused.
struct invalid_text {
  // Position of the fragment in a left to right walk, counting each shared
  // fragment once
  size_t index;
  text_error error;
  std::string str;
};

// Walks every text fragment in `x` and checks that it is well formed UTF-8
// without line breaks. `text` does not check, and a fragment with a line
// break throws off every width the engine computes after it. This is a
// debugging aid, the engine never calls it.
// Returns the number of distinct fragments checked.
result<size_t, invalid_text> validate(const doc& x);

}  // namespace ribbon
