/* Netlink related functions.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <netlink/netlink.h>
#include <netlink/route/link.h>

#include <wanem/kernel/facility.hpp>

namespace wanem {
namespace kernel {
namespace nl {

class NetlinkError : public FacilityError {

public:
  // @param err A negative libnl error code (-NLE_*)
  template <typename... Args>
  NetlinkError(int err, const std::string &what, Args &&...args)
      : FacilityError(toErrno(err), "{}: {}",
                      fmt::format(what, std::forward<Args>(args)...),
                      nl_geterror(err)) {}

  // Map a negative libnl error code to a negative errno value.
  static int toErrno(int err);
};

// Get or create global netlink socket.
struct nl_sock *init();

// Close and free global netlink socket.
void shutdown();

} // namespace nl
} // namespace kernel
} // namespace wanem
