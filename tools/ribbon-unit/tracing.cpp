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

#include <ribbon/tracing.h>
#include <ribbon/validate.h>

#include <sstream>
#include <string>
#include <vector>

#include "unit.h"

using namespace ribbon;

static std::vector<log::Event>& captured() {
  static std::vector<log::Event> events;
  return events;
}

// The runner already has a subscriber writing to its log file, so this one is
// added next to it and keeps only warnings and events tagged for these tests.
class CaptureSubscriber : public log::Subscriber {
 public:
  void receive(const log::Event& e) override {
    const std::string* level = e.get(log::LOG_LEVEL);
    if ((level && *level == log::LOG_LEVEL_WARNING) || e.get("tracing-test")) {
      captured().push_back(e);
    }
  }
};

static void capture_warnings() {
  static bool installed = false;
  if (installed) return;
  installed = true;
  log::subscribe(std::make_unique<CaptureSubscriber>());
}

TEST(tracing_event_fields) {
  log::Event e = log::warning("fragment %d of %s", 3, "fill");
  ASSERT_TRUE(e.get(log::LOG_MESSAGE) != nullptr);
  EXPECT_EQUAL("fragment 3 of fill", *e.get(log::LOG_MESSAGE));
  ASSERT_TRUE(e.get(log::LOG_LEVEL) != nullptr);
  EXPECT_EQUAL("warning", *e.get(log::LOG_LEVEL));
  EXPECT_TRUE(e.get(log::LOG_PID) != nullptr);
  EXPECT_TRUE(e.get(log::LOG_TIME) != nullptr);
  EXPECT_TRUE(e.get("missing") == nullptr);
}

TEST(tracing_delivery) {
  capture_warnings();
  size_t before = captured().size();

  log::info("not for the capture")();
  EXPECT_EQUAL(before, captured().size());

  log::info("tagged")({{"tracing-test", "yes"}});
  ASSERT_EQUAL(before + 1, captured().size());
  EXPECT_EQUAL("tagged", *captured().back().get(log::LOG_MESSAGE));
  EXPECT_EQUAL("yes", *captured().back().get("tracing-test"));
}

TEST(tracing_validate_warns) {
  capture_warnings();
  size_t before = captured().size();

  auto ok = validate(group(line()));
  ASSERT_TRUE((bool)ok);
  EXPECT_EQUAL(before, captured().size());

  auto bad = validate(text("bad\nline"));
  ASSERT_FALSE((bool)bad);
  ASSERT_EQUAL(before + 1, captured().size());
  const std::string* message = captured().back().get(log::LOG_MESSAGE);
  ASSERT_TRUE(message != nullptr);
  EXPECT_EQUAL("text fragment 0 has a line break at byte 3", *message);
  const std::string* fragment = captured().back().get("fragment");
  ASSERT_TRUE(fragment != nullptr);
  EXPECT_EQUAL("bad\nline", *fragment);
}

TEST(tracing_format_subscriber) {
  std::stringstream formatted;
  log::FormatSubscriber format_sub(formatted.rdbuf());
  format_sub.receive(log::event().level(log::LOG_LEVEL_WARNING).message("%d", 42));
  EXPECT_EQUAL("[level=warning] 42\n", formatted.str());
}
