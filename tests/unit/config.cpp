/* Unit tests for config features.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>
#include <cstdio>
#include <cstdlib>

#include <wanem/config_class.hpp>
#include <wanem/router/exceptions.hpp>

using namespace wanem;
using namespace wanem::router;

// cppcheck-suppress syntaxError
Test(config, env) {
  const char *cfg_f = "{ \"interfaces\": [ \"${MY_IF_NAME}\" ] }\n";

  std::FILE *f = std::tmpfile();
  std::fputs(cfg_f, f);
  std::rewind(f);

  auto c = Config();

  char env[] = "MY_IF_NAME=enp1s0";
  putenv(env);

  auto *r = c.load(f);
  cr_assert_not_null(r);

  auto *j = json_array_get(json_object_get(r, "interfaces"), 0);
  cr_assert_not_null(j);

  cr_assert(json_is_string(j));
  cr_assert_str_eq("enp1s0", json_string_value(j));

  json_decref(r);
  std::fclose(f);
}

Test(config, unresolved_env) {
  const char *cfg_f = "{ \"status_file\": \"${WANEM_UNSET_VARIABLE}\" }\n";

  std::FILE *f = std::tmpfile();
  std::fputs(cfg_f, f);
  std::rewind(f);

  unsetenv("WANEM_UNSET_VARIABLE");

  auto c = Config();

  cr_assert_throw(c.load(f), RuntimeError);

  std::fclose(f);
}

Test(config, env_default) {
  const char *cfg_f = "{ \"virtual_prefix\": \"${WANEM_UNSET_PREFIX:-shp}\", "
                      "\"status_file\": \"/run/${WANEM_UNSET_DIR:-}x\" }\n";

  std::FILE *f = std::tmpfile();
  std::fputs(cfg_f, f);
  std::rewind(f);

  unsetenv("WANEM_UNSET_PREFIX");
  unsetenv("WANEM_UNSET_DIR");

  auto c = Config();

  auto *r = c.load(f);
  cr_assert_not_null(r);

  cr_assert_str_eq(json_string_value(json_object_get(r, "virtual_prefix")),
                   "shp");
  cr_assert_str_eq(json_string_value(json_object_get(r, "status_file")),
                   "/run/x");

  json_decref(r);
  std::fclose(f);
}

Test(config, syntax_error) {
  const char *cfg_f = "{ \"interfaces\": [ \"eth0\" }\n";

  std::FILE *f = std::tmpfile();
  std::fputs(cfg_f, f);
  std::rewind(f);

  auto c = Config();

  cr_assert_throw(c.load(f), JanssonParseError);

  std::fclose(f);
}

Test(config, file) {
  char fn[] = "/tmp/wanem.unit-test.XXXXXX";
  int fd = mkstemp(fn);
  cr_assert_geq(fd, 0);

  std::FILE *f = fdopen(fd, "w");
  std::fputs("{ \"interfaces\": [ \"eth0\", \"eth1\" ], \"parallel\": true }",
             f);
  std::fclose(f);

  Config c(fn);
  cr_assert_not_null(c.root);
  cr_assert_str_eq(c.getUri().c_str(), fn);
  cr_assert_eq(json_array_size(json_object_get(c.root, "interfaces")), 2);
  cr_assert(json_is_true(json_object_get(c.root, "parallel")));

  std::remove(fn);

  cr_assert_throw(Config("/nonexistent/wanem.json"), SystemError);
}
