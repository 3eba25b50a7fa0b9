/* Traffic control (tc): setup ingress redirection.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <netlink/route/act/mirred.h>
#include <netlink/route/action.h>
#include <netlink/route/cls/u32.h>

#include <linux/if_ether.h>
#include <linux/pkt_cls.h>
#include <linux/tc_act/tc_mirred.h>

#include <wanem/exceptions.hpp>
#include <wanem/kernel/if.hpp>
#include <wanem/kernel/kernel.hpp>
#include <wanem/kernel/nl.hpp>
#include <wanem/kernel/tc.hpp>
#include <wanem/log.hpp>

using namespace wanem;
using namespace wanem::kernel;

int wanem::kernel::tc::ingress(Interface *i, struct rtnl_qdisc **qd) {
  int ret;
  struct nl_sock *sock = nl::init();
  struct rtnl_qdisc *q = rtnl_qdisc_alloc();
  if (!q)
    throw MemoryAllocationError();

  ret = kernel::loadModule("sch_ingress");
  if (ret) {
    auto logger = Log::get("kernel");
    logger->warn("Failed to load kernel module: sch_ingress ({})", ret);
  }

  rtnl_tc_set_link(TC_CAST(q), i->nl_link);
  rtnl_tc_set_parent(TC_CAST(q), TC_H_INGRESS);
  rtnl_tc_set_handle(TC_CAST(q), INGRESS_HANDLE);
  rtnl_tc_set_kind(TC_CAST(q), "ingress");

  ret = rtnl_qdisc_add(sock, q, NLM_F_CREATE | NLM_F_EXCL);

  *qd = q;

  auto logger = Log::get("kernel");
  if (!ret)
    logger->debug("Added ingress qdisc to interface '{}'", i->getName());

  return ret;
}

int wanem::kernel::tc::getIngress(Interface *i, struct rtnl_qdisc **qd) {
  int ret;
  struct nl_sock *sock = nl::init();
  struct nl_cache *cache;

  ret = rtnl_qdisc_alloc_cache(sock, &cache);
  if (ret)
    return ret;

  *qd = rtnl_qdisc_get_by_parent(cache, i->getIndex(), TC_H_INGRESS);

  nl_cache_free(cache);

  return 0;
}

int wanem::kernel::tc::removeIngress(Interface *i) {
  int ret;
  struct nl_sock *sock = nl::init();
  struct rtnl_qdisc *q = rtnl_qdisc_alloc();
  if (!q)
    throw MemoryAllocationError();

  rtnl_tc_set_link(TC_CAST(q), i->nl_link);
  rtnl_tc_set_parent(TC_CAST(q), TC_H_INGRESS);
  rtnl_tc_set_handle(TC_CAST(q), INGRESS_HANDLE);
  rtnl_tc_set_kind(TC_CAST(q), "ingress");

  // This also deletes all filters attached to the qdisc
  ret = rtnl_qdisc_delete(sock, q);

  rtnl_qdisc_put(q);

  return ret;
}

int wanem::kernel::tc::redirect(Interface *i, struct rtnl_cls **cls,
                                uint16_t prio, uint32_t node,
                                Interface *target) {
  int ret;
  struct nl_sock *sock = nl::init();
  struct rtnl_cls *c = rtnl_cls_alloc();
  struct rtnl_act *act = rtnl_act_alloc();
  if (!c || !act)
    throw MemoryAllocationError();

  for (auto *module : {"cls_u32", "act_mirred"}) {
    ret = kernel::loadModule(module);
    if (ret) {
      auto logger = Log::get("kernel");
      logger->warn("Failed to load kernel module: {} ({})", module, ret);
    }
  }

  rtnl_tc_set_link(TC_CAST(c), i->nl_link);
  rtnl_tc_set_parent(TC_CAST(c), INGRESS_HANDLE);
  rtnl_tc_set_kind(TC_CAST(c), "u32");

  rtnl_cls_set_prio(c, prio);
  rtnl_cls_set_protocol(c, ETH_P_ALL);

  rtnl_u32_set_handle(c, U32_DEFAULT_HTID, 0, node);

  // Match all: 'match u32 0 0'
  ret = rtnl_u32_add_key_uint32(c, 0, 0, 0, 0);
  if (ret)
    goto out;

  ret = rtnl_u32_set_cls_terminal(c);
  if (ret)
    goto out;

  // Steal the packet from the ingress path and put it onto the egress path of the target
  rtnl_tc_set_kind(TC_CAST(act), "mirred");
  rtnl_mirred_set_action(act, TCA_EGRESS_REDIR);
  rtnl_mirred_set_policy(act, TC_ACT_STOLEN);
  rtnl_mirred_set_ifindex(act, target->getIndex());

  ret = rtnl_u32_add_action(c, act);
  if (ret)
    goto out;

  ret = rtnl_cls_add(sock, c, NLM_F_CREATE | NLM_F_EXCL);
  if (!ret) {
    auto logger = Log::get("kernel");
    logger->debug("Added u32 redirect classifier with prio {} from interface "
                  "'{}' to '{}'",
                  prio, i->getName(), target->getName());
  }

out:
  rtnl_act_put(act);

  *cls = c;

  return ret;
}

int wanem::kernel::tc::getFilters(Interface *i, struct nl_cache **cache) {
  struct nl_sock *sock = nl::init();

  return rtnl_cls_alloc_cache(sock, i->getIndex(), INGRESS_HANDLE, cache);
}

int wanem::kernel::tc::removeFilter(Interface *i, uint16_t prio,
                                    tc_hdl_t handle) {
  int ret;
  struct nl_sock *sock = nl::init();
  struct rtnl_cls *c = rtnl_cls_alloc();
  if (!c)
    throw MemoryAllocationError();

  rtnl_tc_set_link(TC_CAST(c), i->nl_link);
  rtnl_tc_set_parent(TC_CAST(c), INGRESS_HANDLE);
  rtnl_tc_set_kind(TC_CAST(c), "u32");

  rtnl_tc_set_handle(TC_CAST(c), handle);

  rtnl_cls_set_prio(c, prio);
  rtnl_cls_set_protocol(c, ETH_P_ALL);

  ret = rtnl_cls_delete(sock, c, 0);

  rtnl_cls_put(c);

  return ret;
}
