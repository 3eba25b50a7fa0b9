/* Provisioning states of managed interfaces.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <wanem/state.hpp>

using namespace wanem::router;

std::string wanem::router::stateToString(InterfaceState s) {
  switch (s) {
  case InterfaceState::UNCONFIGURED:
    return "unconfigured";

  case InterfaceState::VIRTUAL_TARGET_READY:
    return "virtual-target-ready";

  case InterfaceState::REDIRECT_INSTALLED:
    return "redirect-installed";

  case InterfaceState::ACTIVE:
    return "active";

  case InterfaceState::FAILED:
    return "failed";

  default:
    return "";
  }
}

std::string wanem::router::errorKindToString(ErrorKind k) {
  switch (k) {
  case ErrorKind::NONE:
    return "";

  case ErrorKind::DUPLICATE_INTERFACE:
    return "DuplicateInterfaceError";

  case ErrorKind::VIRTUAL_TARGET_CREATION:
    return "VirtualTargetCreationError";

  case ErrorKind::CAPTURE_POINT_CONFLICT:
    return "CapturePointExistsWithConflictingConfigError";

  case ErrorKind::RULE_INSTALLATION:
    return "RuleInstallationError";

  case ErrorKind::TEARDOWN:
    return "TeardownError";

  case ErrorKind::INTERNAL:
    return "InternalError";

  default:
    return "";
  }
}
