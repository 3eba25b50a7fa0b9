/* Unit tests for utilities.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>

#include <cstdio>
#include <unistd.h>

#include <wanem/utils.hpp>

using namespace wanem;

// cppcheck-suppress unknownMacro
TestSuite(utils, .description = "Utilities");

Test(utils, tokenize) {
  auto tokens = utils::tokenize("nf_nat 45056 3 nft_chain_nat", " ");

  cr_assert_eq(tokens.size(), 4);
  cr_assert_str_eq(tokens[0].c_str(), "nf_nat");
  cr_assert_str_eq(tokens[3].c_str(), "nft_chain_nat");

  tokens = utils::tokenize("", " ");
  cr_assert(tokens.empty());
}

Test(utils, fnv1a) {
  // Reference values of the 32 bit FNV-1a hash
  cr_assert_eq(utils::fnv1a(""), 0x811c9dc5u);
  cr_assert_eq(utils::fnv1a("a"), 0xe40c292cu);
  cr_assert_eq(utils::fnv1a("foobar"), 0xbf9cf968u);

  cr_assert_neq(utils::fnv1a("eth0"), utils::fnv1a("eth1"));
}

Test(utils, files) {
  char fn[] = "/tmp/wanem.unit-test.XXXXXX";
  int fd = mkstemp(fn);
  cr_assert_geq(fd, 0);
  close(fd);

  utils::write_to_file("1\n", fn);
  cr_assert_str_eq(utils::read_from_file(fn).c_str(), "1\n");

  std::remove(fn);

  cr_assert_throw(utils::read_from_file(fn), SystemError);
  cr_assert_throw(utils::write_to_file("1\n", "/nonexistent/dir/file"),
                  SystemError);
}
