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

#include "validate.h"

#include <unordered_set>
#include <vector>

#include "text_state.h"
#include "tracing.h"

namespace ribbon {

static size_t find_problem(const std::string& s, text_error_kind* kind) {
  const utf8proc_uint8_t* begin = reinterpret_cast<const utf8proc_uint8_t*>(s.data());
  const utf8proc_uint8_t* iter = begin;
  const utf8proc_uint8_t* end = begin + s.size();
  while (iter < end) {
    utf8proc_int32_t codepoint;
    utf8proc_ssize_t size = utf8proc_iterate(iter, end - iter, &codepoint);
    if (size <= 0) {
      *kind = text_error_kind::invalid_utf8;
      return iter - begin;
    }
    if (codepoint == '\n' || codepoint == '\r') {
      *kind = text_error_kind::line_break;
      return iter - begin;
    }
    iter += size;
  }
  return s.size();
}

static bool well_formed(const std::string& s, text_error* err) {
  text_state state = from_string<text_state>(s);
  if (state.has_line_break() || !state.is_valid_utf8()) {
    err->offset = find_problem(s, &err->kind);
    return false;
  }
  return true;
}

result<doc, text_error> checked_text(std::string s) {
  text_error err{};
  if (!well_formed(s, &err)) return result_error<doc>(err);
  return result_value<text_error>(text(std::move(s)));
}

result<size_t, invalid_text> validate(const doc& x) {
  // Shared subtrees are checked once, `group` and `fill` share heavily.
  std::unordered_set<const void*> seen;
  std::vector<const doc*> todo{&x};
  size_t checked = 0;

  while (!todo.empty()) {
    const doc* d = todo.back();
    todo.pop_back();
    if (!seen.insert(d->identity()).second) continue;

    switch (d->kind()) {
      case doc_kind::nil:
      case doc_kind::line:
        break;
      case doc_kind::nest:
        todo.push_back(&d->body());
        break;
      case doc_kind::append:
      case doc_kind::alt:
        todo.push_back(&d->right());
        todo.push_back(&d->left());
        break;
      case doc_kind::text: {
        text_error err{};
        if (!well_formed(d->str(), &err)) {
          const char* what =
              err.kind == text_error_kind::line_break ? "a line break" : "malformed UTF-8";
          log::warning("text fragment %zu has %s at byte %zu", checked, what, err.offset)(
              {{"fragment", d->str()}});
          return make_error<size_t, invalid_text>(invalid_text{checked, err, d->str()});
        }
        ++checked;
        break;
      }
    }
  }

  return result_value<invalid_text>(checked);
}

}  // namespace ribbon
