/* Unit tests for the interface registry.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>

#include <wanem/interface.hpp>
#include <wanem/router/exceptions.hpp>

using namespace wanem;
using namespace wanem::router;

// cppcheck-suppress unknownMacro
TestSuite(registry, .description = "Interface registry");

Test(registry, order) {
  InterfaceRegistry reg;

  auto a = reg.add("eth0", "client");
  auto b = reg.add("eth1", "server");

  cr_assert_eq(a.index, 0);
  cr_assert_eq(b.index, 1);

  cr_assert_eq(reg.size(), 2);
  cr_assert_str_eq(reg.list()[0].name.c_str(), "eth0");
  cr_assert_str_eq(reg.list()[1].name.c_str(), "eth1");
  cr_assert_str_eq(reg.list()[1].role.c_str(), "server");
}

Test(registry, duplicate) {
  InterfaceRegistry reg;

  reg.add("eth0");

  cr_assert_throw(reg.add("eth0", "other"), DuplicateInterfaceError);

  cr_assert_eq(reg.size(), 1);
  cr_assert_str_eq(reg.list()[0].role.c_str(), "");
}

Test(registry, invalid_names) {
  InterfaceRegistry reg;

  cr_assert_throw(reg.add(""), ConfigError);
  cr_assert_throw(reg.add("a-name-which-is-too-long"), ConfigError);
  cr_assert_throw(reg.add("eth0:1"), ConfigError);
  cr_assert_throw(reg.add("eth 0"), ConfigError);

  cr_assert(reg.empty());

  // Longest valid name
  cr_assert_no_throw(reg.add("abcdefghijklmno"), std::exception);
}

Test(registry, lookup) {
  InterfaceRegistry reg;

  reg.add("eth0");
  reg.add("eth1");

  auto pi = reg.lookup("eth1");
  cr_assert(pi.has_value());
  cr_assert_eq(pi->index, 1);

  cr_assert_not(reg.lookup("eth2").has_value());
}

Test(registry, parse) {
  InterfaceRegistry reg;

  json_t *json = json_loads(
      R"([ { "name": "eth0", "role": "wan-a-facing" }, "eth1" ])", 0, nullptr);
  cr_assert_not_null(json);

  reg.parse(json);

  cr_assert_eq(reg.size(), 2);
  cr_assert_str_eq(reg.list()[0].role.c_str(), "wan-a-facing");
  cr_assert_str_eq(reg.list()[1].name.c_str(), "eth1");

  json_decref(json);
}

Test(registry, parse_invalid) {
  InterfaceRegistry reg;

  json_t *json = json_loads(R"([ { "name": "eth0", "mtu": 1500 } ])", 0, nullptr);
  cr_assert_not_null(json);

  cr_assert_throw(reg.parse(json), ConfigError);

  json_decref(json);

  json = json_loads(R"({ "name": "eth0" })", 0, nullptr);
  cr_assert_throw(reg.parse(json), ConfigError);

  json_decref(json);
}

Test(registry, target_names) {
  InterfaceRegistry reg;

  reg.setTargetPrefix("ifb");

  // Would be the virtual target of itself
  cr_assert_throw(reg.add("ifb0"), ConfigError);
  cr_assert(reg.empty());

  reg.add("ifb1");

  // ifb1 is the virtual target of the second interface
  cr_assert_throw(reg.add("eth0"), ConfigError);
  cr_assert_eq(reg.size(), 1);

  InterfaceRegistry other;

  other.setTargetPrefix("ifb");
  other.add("eth0");
  other.add("eth1");

  // ifb0 is already the virtual target of eth0
  cr_assert_throw(other.add("ifb0"), ConfigError);
  cr_assert_eq(other.size(), 2);
}

Test(registry, target_prefix) {
  InterfaceRegistry reg;

  reg.add("eth0");
  reg.add("shp0");

  cr_assert_throw(reg.setTargetPrefix("shp"), ConfigError);

  // Previous prefix is still unchecked
  cr_assert_no_throw(reg.add("shp2"), std::exception);

  cr_assert_no_throw(reg.setTargetPrefix("ifb"), std::exception);
  cr_assert_throw(reg.add("ifb0"), ConfigError);
}

Test(registry, parse_unchanged) {
  InterfaceRegistry reg;

  reg.add("eth0");

  json_t *json = json_loads(R"([ "eth1", "eth2", "eth1" ])", 0, nullptr);
  cr_assert_not_null(json);

  cr_assert_throw(reg.parse(json), DuplicateInterfaceError);

  cr_assert_eq(reg.size(), 1);
  cr_assert_not(reg.lookup("eth1").has_value());

  json_decref(json);
}

Test(registry, non_ascii_names) {
  InterfaceRegistry reg;

  cr_assert_no_throw(reg.add("\xc3\xa9th0"), std::exception);
  cr_assert_throw(reg.add("\xc3\xa9th 0"), ConfigError);
}
