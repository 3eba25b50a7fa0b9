/* Unit tests for logging.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>

#include <wanem/exceptions.hpp>
#include <wanem/log.hpp>

using namespace wanem;

// cppcheck-suppress unknownMacro
TestSuite(log, .description = "Logging");

Test(log, level) {
  auto &log = Log::getInstance();

  log.setLevel("debug");
  cr_assert_eq(log.getLevel(), Log::Level::debug);
  cr_assert_str_eq(log.getLevelName().c_str(), "debug");

  auto logger = Log::get("unit:level");
  cr_assert_eq(logger->level(), Log::Level::debug);

  cr_assert_throw(log.setLevel("verbose"), RuntimeError);

  log.setLevel("info");
  cr_assert_eq(logger->level(), Log::Level::info);
}

Test(log, expressions) {
  auto &log = Log::getInstance();

  auto before = Log::get("kernel:if:eth0");

  json_t *json = json_loads(R"({
    "level": "warning",
    "expressions": [ { "name": "kernel:*", "level": "trace" } ]
  })",
                            0, nullptr);
  cr_assert_not_null(json);

  log.parse(json);

  auto after = Log::get("kernel:nl");
  auto other = Log::get("router");

  cr_assert_eq(before->level(), Log::Level::trace);
  cr_assert_eq(after->level(), Log::Level::trace);
  cr_assert_eq(other->level(), Log::Level::warn);

  json_decref(json);
}

Test(log, invalid) {
  auto &log = Log::getInstance();

  json_t *json = json_loads(R"({ "colors": true })", 0, nullptr);
  cr_assert_not_null(json);

  cr_assert_throw(log.parse(json), ConfigError);

  json_decref(json);
}
