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

#include <cstdint>
#include <string>

#include "doc.h"
#include "layout.h"

namespace ribbon {

// Lays out `x` for lines of at most `width` columns, starting at column
// `column`. Every choice is made greedily: the horizontal branch is taken when
// its first line fits in the room left, otherwise the vertical one.
//
// A text fragment wider than `width` is never split; it simply overflows.
layout best(int64_t width, int64_t column, const doc& x);

// True when `x` can be emitted up to its first line break without using more
// than `room` columns. Negative room never fits.
bool fits(int64_t room, const layout& x);

// `x` if it fits in what is left of a `width` wide line after `column`, else `y`.
layout better(int64_t width, int64_t column, layout x, layout y);

// render(best(width, 0, x))
std::string pretty(int64_t width, const doc& x);

}  // namespace ribbon
