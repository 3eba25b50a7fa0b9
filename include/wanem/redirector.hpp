/* Installation of ingress redirect rules.
 *
 * For each physical interface an ingress capture point is attached and
 * a single match-all rule redirects every captured packet to the egress
 * path of the virtual target of the interface.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <wanem/config.hpp>
#include <wanem/interface.hpp>
#include <wanem/kernel/facility.hpp>
#include <wanem/keyed_mutex.hpp>
#include <wanem/log.hpp>
#include <wanem/provisioner.hpp>

namespace wanem {
namespace router {

enum class RedirectionStatus {
  ABSENT,    // No capture point at all
  INSTALLED, // Our capture point with exactly our rule
  CONFLICT   // Anything else
};

class RedirectionInstaller {

protected:
  Logger logger;

  kernel::NetworkFacility &facility;

  uint16_t prio;

  KeyedMutex<std::string> locks;

  RedirectionStatus check(const PhysicalInterface &pi,
                          const kernel::CapturePointInfo &cp,
                          const std::vector<kernel::RuleInfo> &rules,
                          int target, std::string &reason) const;

public:
  RedirectionInstaller(kernel::NetworkFacility &f,
                       uint16_t prio = DEFAULT_REDIRECT_PRIO);

  /* The identifier of the rule which we install for an interface.
   *
   * It is stable across runs so that existing rules can be recognized.
   */
  kernel::RuleId getRuleId(const PhysicalInterface &pi) const;

  /* Attach the capture point and redirect all its traffic to vt.
   *
   * Does not touch the host if the redirect is already in place.
   * A capture point created by this call is removed again if the rule
   * can not be installed.
   *
   * @throws CapturePointExistsWithConflictingConfigError
   * @throws RuleInstallationError
   */
  void install(const PhysicalInterface &pi, const VirtualTarget &vt);

  RedirectionStatus inspect(const PhysicalInterface &pi,
                            const VirtualTarget &vt);

  /* Remove our rule and our capture point.
   *
   * Configuration which has not been installed by us is left untouched.
   *
   * @return false if there was nothing to remove.
   * @throws TeardownError
   */
  bool remove(const PhysicalInterface &pi);
};

} // namespace router
} // namespace wanem
