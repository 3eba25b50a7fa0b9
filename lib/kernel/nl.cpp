/* Netlink related functions.
 *
 * wanem-router uses libnl3 to talk to the Linux kernel to manage links
 * and traffic control objects.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cerrno>

#include <netlink/errno.h>

#include <wanem/exceptions.hpp>
#include <wanem/kernel/nl.hpp>
#include <wanem/log.hpp>

// Singleton for global netlink socket
static struct nl_sock *sock = nullptr;

using namespace wanem;
using namespace wanem::kernel;

int nl::NetlinkError::toErrno(int err) {
  switch (-err) {
  case NLE_SUCCESS:
    return 0;

  case NLE_OBJ_NOTFOUND:
    return -ENOENT;

  case NLE_NODEV:
    return -ENODEV;

  case NLE_EXIST:
    return -EEXIST;

  case NLE_NOMEM:
    return -ENOMEM;

  case NLE_INVAL:
  case NLE_MISSING_ATTR:
  case NLE_PARSE_ERR:
    return -EINVAL;

  case NLE_RANGE:
    return -ERANGE;

  case NLE_OPNOTSUPP:
  case NLE_MSGTYPE_NOSUPPORT:
    return -EOPNOTSUPP;

  case NLE_PERM:
  case NLE_NOACCESS:
    return -EPERM;

  case NLE_BUSY:
    return -EBUSY;

  case NLE_AGAIN:
  case NLE_INTR:
  case NLE_DUMP_INTR:
    return -EAGAIN;

  default:
    return -EIO;
  }
}

struct nl_sock *nl::init() {
  int ret;

  if (!sock) {
    // Create connection to netlink
    sock = nl_socket_alloc();
    if (!sock)
      throw MemoryAllocationError();

    ret = nl_connect(sock, NETLINK_ROUTE);
    if (ret) {
      nl_socket_free(sock);
      sock = nullptr;

      throw NetlinkError(ret, "Failed to connect to kernel");
    }

    auto logger = Log::get("kernel:nl");
    logger->debug("Connected to kernel via netlink");
  }

  return sock;
}

void nl::shutdown() {
  if (!sock)
    return;

  nl_close(sock);
  nl_socket_free(sock);

  sock = nullptr;
}
