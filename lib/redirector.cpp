/* Installation of ingress redirect rules.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <wanem/kernel/tc.hpp>
#include <wanem/redirector.hpp>
#include <wanem/router/exceptions.hpp>
#include <wanem/utils.hpp>

using namespace wanem;
using namespace wanem::router;
using namespace wanem::kernel;

RedirectionInstaller::RedirectionInstaller(NetworkFacility &f, uint16_t p)
    : logger(Log::get("redirector")), facility(f), prio(p) {}

RuleId RedirectionInstaller::getRuleId(const PhysicalInterface &pi) const {
  // u32 node ids have 12 bits, 0 is reserved for the hash table itself
  uint32_t node = utils::fnv1a(pi.name);
  node = ((node >> 12) ^ node) & 0xfff;
  if (node == 0)
    node = 1;

  return RuleId{prio, (tc::U32_DEFAULT_HTID << 20) | node};
}

RedirectionStatus
RedirectionInstaller::check(const PhysicalInterface &pi,
                            const CapturePointInfo &cp,
                            const std::vector<RuleInfo> &rules, int target,
                            std::string &reason) const {
  if (cp.kind != "ingress" || cp.handle != tc::INGRESS_HANDLE) {
    reason = fmt::format("{} has a {} qdisc with handle {:x}: on its ingress",
                         pi.name, cp.kind, cp.handle >> 16);
    return RedirectionStatus::CONFLICT;
  }

  auto id = getRuleId(pi);
  const RuleInfo *ours = nullptr;

  for (auto &rule : rules) {
    if (rule.id != id) {
      reason = fmt::format("{} has a foreign {} filter with prio {} and "
                           "handle {:x}",
                           pi.name, rule.kind, rule.id.prio, rule.id.handle);
      return RedirectionStatus::CONFLICT;
    }

    if (ours) {
      reason = fmt::format("{} has multiple redirect rules", pi.name);
      return RedirectionStatus::CONFLICT;
    }

    ours = &rule;
  }

  if (!ours) {
    reason = fmt::format("{} has an ingress qdisc without a redirect rule",
                         pi.name);
    return RedirectionStatus::CONFLICT;
  }

  if (!ours->matchAll || ours->redirectIfindex != target) {
    reason = fmt::format("Redirect rule of {} does not redirect all traffic "
                         "to interface #{}",
                         pi.name, target);
    return RedirectionStatus::CONFLICT;
  }

  return RedirectionStatus::INSTALLED;
}

void RedirectionInstaller::install(const PhysicalInterface &pi,
                                   const VirtualTarget &vt) {
  auto lock = locks.lock(pi.name);

  if (!vt.up)
    throw RuleInstallationError(pi.name, "Virtual target {} is not up",
                                vt.name);

  if (vt.owner != pi.name)
    throw RuleInstallationError(pi.name, "Virtual target {} belongs to {}",
                                vt.name, vt.owner);

  auto id = getRuleId(pi);

  try {
    auto target = facility.getLink(vt.name);
    if (!target || !target->up)
      throw RuleInstallationError(pi.name, "Virtual target {} is not up",
                                  vt.name);

    auto cp = facility.getCapturePoint(pi.name);
    if (cp) {
      auto rules = facility.getRules(pi.name);

      std::string reason;
      auto status = check(pi, *cp, rules, target->ifindex, reason);
      if (status == RedirectionStatus::INSTALLED) {
        logger->debug("Redirect from {} to {} is already installed", pi.name,
                      vt.name);
        return;
      }

      // Our own rule towards a different target is not a foreign capture point
      auto it = std::find_if(rules.begin(), rules.end(),
                             [&id](auto &r) { return r.id == id; });
      if (rules.size() == 1 && it != rules.end() &&
          cp->kind == "ingress" && cp->handle == tc::INGRESS_HANDLE)
        throw RuleInstallationError(pi.name, "{}", reason);

      throw CapturePointExistsWithConflictingConfigError(pi.name, "{}",
                                                         reason);
    }

    facility.addCapturePoint(pi.name);

    logger->debug("Attached capture point to {}", pi.name);

    try {
      facility.addRedirectRule(pi.name, id, vt.name);

      // Do not trust a partially applied rule
      auto rules = facility.getRules(pi.name);
      auto cpNew = facility.getCapturePoint(pi.name);

      std::string reason;
      if (!cpNew || check(pi, *cpNew, rules, target->ifindex, reason) !=
                        RedirectionStatus::INSTALLED)
        throw FacilityError(-EPROTO, "Rule has not been applied as requested: {}",
                            reason);
    } catch (const FacilityError &) {
      try {
        facility.deleteCapturePoint(pi.name);
      } catch (const FacilityError &f) {
        logger->error("Failed to remove capture point of {} again: {}",
                      pi.name, f.what());
      }

      throw;
    }
  } catch (const FacilityError &e) {
    throw RuleInstallationError(pi.name,
                                "Failed to redirect {} to {}: {}", pi.name,
                                vt.name, e.what());
  }

  logger->info("Redirected ingress of {} to {}", pi.name, vt.name);
}

RedirectionStatus RedirectionInstaller::inspect(const PhysicalInterface &pi,
                                                const VirtualTarget &vt) {
  auto target = facility.getLink(vt.name);
  auto cp = facility.getCapturePoint(pi.name);
  if (!cp)
    return RedirectionStatus::ABSENT;

  if (!target)
    return RedirectionStatus::CONFLICT;

  std::string reason;
  return check(pi, *cp, facility.getRules(pi.name), target->ifindex, reason);
}

bool RedirectionInstaller::remove(const PhysicalInterface &pi) {
  auto lock = locks.lock(pi.name);
  auto id = getRuleId(pi);
  bool removed = false;

  try {
    auto cp = facility.getCapturePoint(pi.name);
    if (!cp)
      return false;

    if (cp->kind != "ingress" || cp->handle != tc::INGRESS_HANDLE) {
      logger->warn("Leaving foreign {} qdisc of {} in place", cp->kind,
                   pi.name);
      return false;
    }

    bool foreign = false;
    for (auto &rule : facility.getRules(pi.name)) {
      if (rule.id != id)
        foreign = true;
      else if (!removed) {
        facility.deleteRule(pi.name, id);
        removed = true;
      }
    }

    if (foreign) {
      logger->warn("Leaving capture point of {} in place as it carries "
                   "foreign rules",
                   pi.name);
      return removed;
    }

    facility.deleteCapturePoint(pi.name);
    removed = true;
  } catch (const FacilityError &e) {
    if (e.isNotFound())
      return removed;

    throw TeardownError(pi.name, "Failed to remove redirect of {}: {}", pi.name,
                        e.what());
  }

  logger->info("Removed redirect of {}", pi.name);

  return removed;
}
