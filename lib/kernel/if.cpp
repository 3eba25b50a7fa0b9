/* Interface related functions.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <netlink/errno.h>
#include <netlink/route/link.h>

#include <linux/if.h>

#include <wanem/exceptions.hpp>
#include <wanem/kernel/if.hpp>
#include <wanem/kernel/nl.hpp>

using namespace wanem;
using namespace wanem::kernel;

Interface::Interface(struct rtnl_link *link) : nl_link(link) {
  logger = Log::get(fmt::format("kernel:if:{}", getName()));
}

Interface::~Interface() {
  if (nl_link)
    rtnl_link_put(nl_link);
}

std::unique_ptr<Interface> Interface::lookup(const std::string &name) {
  int ret;
  struct nl_sock *sock = nl::init();
  struct rtnl_link *link = nullptr;

  ret = rtnl_link_get_kernel(sock, 0, name.c_str(), &link);
  if (ret == -NLE_OBJ_NOTFOUND || ret == -NLE_NODEV)
    return nullptr;
  else if (ret)
    throw nl::NetlinkError(ret, "Failed to get link '{}'", name);

  return std::make_unique<Interface>(link);
}

int Interface::create(const std::string &name, const std::string &kind) {
  int ret;
  struct nl_sock *sock = nl::init();
  struct rtnl_link *link = rtnl_link_alloc();
  if (!link)
    throw MemoryAllocationError();

  rtnl_link_set_name(link, name.c_str());

  ret = rtnl_link_set_type(link, kind.c_str());
  if (!ret)
    ret = rtnl_link_add(sock, link, NLM_F_CREATE | NLM_F_EXCL);

  rtnl_link_put(link);

  auto logger = Log::get("kernel:if");
  if (!ret)
    logger->debug("Created {} link '{}'", kind, name);

  return ret;
}

int Interface::setUp(bool up) {
  int ret;
  struct nl_sock *sock = nl::init();
  struct rtnl_link *change = rtnl_link_alloc();
  if (!change)
    throw MemoryAllocationError();

  if (up)
    rtnl_link_set_flags(change, IFF_UP);
  else
    rtnl_link_unset_flags(change, IFF_UP);

  ret = rtnl_link_change(sock, nl_link, change, 0);

  rtnl_link_put(change);

  if (!ret)
    logger->debug("Set link {}", up ? "up" : "down");

  return ret;
}

int Interface::remove() {
  struct nl_sock *sock = nl::init();

  int ret = rtnl_link_delete(sock, nl_link);
  if (!ret)
    logger->debug("Deleted link");

  return ret;
}

std::string Interface::getName() const {
  auto str = rtnl_link_get_name(nl_link);

  return str ? std::string(str) : std::string();
}

std::string Interface::getKind() const {
  auto str = rtnl_link_get_type(nl_link);

  return str ? std::string(str) : std::string();
}

int Interface::getIndex() const { return rtnl_link_get_ifindex(nl_link); }

bool Interface::isUp() const { return rtnl_link_get_flags(nl_link) & IFF_UP; }
