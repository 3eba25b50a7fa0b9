/* Network facility backed by the Linux kernel.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <netlink/errno.h>
#include <netlink/route/act/mirred.h>
#include <netlink/route/action.h>
#include <netlink/route/cls/u32.h>

#include <linux/pkt_cls.h>
#include <linux/tc_act/tc_mirred.h>

#include <wanem/kernel/kernel.hpp>
#include <wanem/kernel/netlink_facility.hpp>
#include <wanem/kernel/nl.hpp>
#include <wanem/kernel/tc.hpp>

using namespace wanem;
using namespace wanem::kernel;

static RuleInfo parseRule(struct rtnl_cls *cls) {
  RuleInfo rule;

  rule.id.prio = rtnl_cls_get_prio(cls);
  rule.id.handle = rtnl_tc_get_handle(TC_CAST(cls));
  rule.protocol = rtnl_cls_get_protocol(cls);
  rule.matchAll = false;
  rule.redirectIfindex = 0;

  auto *kind = rtnl_tc_get_kind(TC_CAST(cls));
  rule.kind = kind ? kind : "";

  if (rule.kind != "u32")
    return rule;

  uint32_t val, mask;
  int off, offmask;

  // A single key which matches any value
  if (rtnl_u32_get_key(cls, 0, &val, &mask, &off, &offmask) == 0)
    rule.matchAll = mask == 0 &&
                    rtnl_u32_get_key(cls, 1, &val, &mask, &off, &offmask) != 0;

  struct rtnl_act *act = rtnl_u32_get_action(cls);
  if (act) {
    auto *act_kind = rtnl_tc_get_kind(TC_CAST(act));

    if (act_kind && std::string(act_kind) == "mirred" &&
        rtnl_mirred_get_action(act) == TCA_EGRESS_REDIR &&
        rtnl_mirred_get_policy(act) == TC_ACT_STOLEN)
      rule.redirectIfindex = rtnl_mirred_get_ifindex(act);
  }

  return rule;
}

NetlinkFacility::NetlinkFacility() : logger(Log::get("kernel:nl")) {
  std::lock_guard<std::mutex> guard(mutex);

  nl::init();
}

NetlinkFacility::~NetlinkFacility() {
  std::lock_guard<std::mutex> guard(mutex);

  nl::shutdown();
}

std::unique_ptr<Interface> NetlinkFacility::require(const std::string &name) {
  auto i = Interface::lookup(name);
  if (!i)
    throw FacilityError(-ENODEV, "No such interface: {}", name);

  return i;
}

std::optional<LinkInfo> NetlinkFacility::getLink(const std::string &name) {
  std::lock_guard<std::mutex> guard(mutex);

  auto i = Interface::lookup(name);
  if (!i)
    return std::nullopt;

  return LinkInfo{i->getName(), i->getKind(), i->getIndex(), i->isUp()};
}

void NetlinkFacility::addLink(const std::string &name,
                              const std::string &kind) {
  std::lock_guard<std::mutex> guard(mutex);

  int ret = kernel::loadModule(kind.c_str());
  if (ret)
    logger->warn("Failed to load kernel module: {} ({})", kind, ret);

  ret = Interface::create(name, kind);
  if (ret == -NLE_EXIST) {
    // Loading the ifb module creates some devices on its own
    auto i = Interface::lookup(name);
    if (i && i->getKind() == kind) {
      logger->debug("Link '{}' has been created by the kernel module", name);
      return;
    }
  }

  if (ret)
    throw nl::NetlinkError(ret, "Failed to create {} link '{}'", kind, name);
}

void NetlinkFacility::setLinkUp(const std::string &name, bool up) {
  std::lock_guard<std::mutex> guard(mutex);

  auto i = require(name);

  int ret = i->setUp(up);
  if (ret)
    throw nl::NetlinkError(ret, "Failed to set link '{}' {}", name,
                           up ? "up" : "down");
}

void NetlinkFacility::deleteLink(const std::string &name) {
  std::lock_guard<std::mutex> guard(mutex);

  auto i = require(name);

  int ret = i->remove();
  if (ret)
    throw nl::NetlinkError(ret, "Failed to delete link '{}'", name);
}

std::optional<CapturePointInfo>
NetlinkFacility::getCapturePoint(const std::string &dev) {
  std::lock_guard<std::mutex> guard(mutex);

  auto i = require(dev);

  struct rtnl_qdisc *qd = nullptr;
  int ret = tc::getIngress(i.get(), &qd);
  if (ret)
    throw nl::NetlinkError(ret, "Failed to get qdiscs of '{}'", dev);

  if (!qd)
    return std::nullopt;

  auto *kind = rtnl_tc_get_kind(TC_CAST(qd));

  CapturePointInfo cp{kind ? kind : "", rtnl_tc_get_handle(TC_CAST(qd)),
                      rtnl_tc_get_parent(TC_CAST(qd))};

  rtnl_qdisc_put(qd);

  return cp;
}

void NetlinkFacility::addCapturePoint(const std::string &dev) {
  std::lock_guard<std::mutex> guard(mutex);

  auto i = require(dev);

  struct rtnl_qdisc *qd = nullptr;
  int ret = tc::ingress(i.get(), &qd);

  rtnl_qdisc_put(qd);

  if (ret)
    throw nl::NetlinkError(ret, "Failed to add ingress qdisc to '{}'", dev);
}

void NetlinkFacility::deleteCapturePoint(const std::string &dev) {
  std::lock_guard<std::mutex> guard(mutex);

  auto i = require(dev);

  int ret = tc::removeIngress(i.get());
  if (ret)
    throw nl::NetlinkError(ret, "Failed to remove ingress qdisc from '{}'",
                           dev);
}

std::vector<RuleInfo> NetlinkFacility::getRules(const std::string &dev) {
  std::lock_guard<std::mutex> guard(mutex);

  auto i = require(dev);

  struct nl_cache *cache;
  int ret = tc::getFilters(i.get(), &cache);
  if (ret)
    throw nl::NetlinkError(ret, "Failed to get ingress filters of '{}'", dev);

  std::vector<RuleInfo> rules;
  for (struct nl_object *obj = nl_cache_get_first(cache); obj;
       obj = nl_cache_get_next(obj)) {
    auto rule = parseRule((struct rtnl_cls *)obj);

    // Skip the hash tables which u32 creates implicitly
    if (rule.kind == "u32" && TC_U32_NODE(rule.id.handle) == 0)
      continue;

    rules.push_back(rule);
  }

  nl_cache_free(cache);

  return rules;
}

void NetlinkFacility::addRedirectRule(const std::string &dev, const RuleId &id,
                                      const std::string &target) {
  std::lock_guard<std::mutex> guard(mutex);

  if (TC_U32_USERHTID(id.handle) != tc::U32_DEFAULT_HTID ||
      TC_U32_NODE(id.handle) == 0)
    throw FacilityError(-EINVAL, "Invalid u32 filter handle: {:#x}",
                        id.handle);

  auto i = require(dev);
  auto t = require(target);

  struct rtnl_cls *cls = nullptr;
  int ret =
      tc::redirect(i.get(), &cls, id.prio, TC_U32_NODE(id.handle), t.get());

  rtnl_cls_put(cls);

  if (ret)
    throw nl::NetlinkError(ret, "Failed to add redirect filter to '{}'", dev);
}

void NetlinkFacility::deleteRule(const std::string &dev, const RuleId &id) {
  std::lock_guard<std::mutex> guard(mutex);

  auto i = require(dev);

  int ret = tc::removeFilter(i.get(), id.prio, id.handle);
  if (ret)
    throw nl::NetlinkError(ret, "Failed to remove filter {:x} from '{}'",
                           id.handle, dev);
}

bool NetlinkFacility::getForwarding(int family) {
  try {
    return kernel::getIpForwarding(family);
  } catch (const SystemError &e) {
    throw FacilityError(-e.code().value(), "{}", e.what());
  }
}

void NetlinkFacility::setForwarding(bool enable, int family) {
  try {
    kernel::setIpForwarding(enable, family);
  } catch (const SystemError &e) {
    throw FacilityError(-e.code().value(), "{}", e.what());
  }
}
