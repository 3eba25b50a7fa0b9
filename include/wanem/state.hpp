/* Provisioning states of managed interfaces.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace wanem {
namespace router {

// unconfigured -> virtual-target-ready -> redirect-installed -> active
enum class InterfaceState {
  UNCONFIGURED = 0,
  VIRTUAL_TARGET_READY = 1,
  REDIRECT_INSTALLED = 2,
  ACTIVE = 3,
  FAILED = 4
};

enum class ErrorKind {
  NONE = 0,
  DUPLICATE_INTERFACE,
  VIRTUAL_TARGET_CREATION,
  CAPTURE_POINT_CONFLICT,
  RULE_INSTALLATION,
  TEARDOWN,
  INTERNAL
};

// Convert state enum to human readable string.
std::string stateToString(InterfaceState s);

std::string errorKindToString(ErrorKind k);

} // namespace router
} // namespace wanem
