/* Unit tests for kernel functions.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>

#include <sys/socket.h>

#include <wanem/exceptions.hpp>
#include <wanem/kernel/kernel.hpp>

using namespace wanem::kernel;

// cppcheck-suppress unknownMacro
TestSuite(kernel, .description = "Kernel features");

#ifdef __linux__
Test(kernel, module) {
  int ret;

  ret = isModuleLoaded("does_not_exist");
  cr_assert_neq(ret, 0);
}

// Requires a kernel which has been built with IPv4 support
Test(kernel, forwarding) {
  int ret;

  ret = getIpForwarding(AF_INET);
  cr_assert(ret == 0 || ret == 1);
}

Test(kernel, forwarding_family) {
  cr_assert_throw(getIpForwarding(AF_UNIX), wanem::RuntimeError);
}
#endif
