/* Router state controller.
 *
 * Drives every registered interface through its provisioning states:
 *
 *   unconfigured -> virtual-target-ready -> redirect-installed -> active
 *
 * A failure of one interface never aborts the provisioning of another.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <jansson.h>

#include <wanem/interface.hpp>
#include <wanem/kernel/facility.hpp>
#include <wanem/log.hpp>
#include <wanem/provisioner.hpp>
#include <wanem/redirector.hpp>
#include <wanem/state.hpp>

namespace wanem {
namespace router {

struct InterfaceStatus {
  PhysicalInterface interface;
  InterfaceState state = InterfaceState::UNCONFIGURED;

  std::string virtualTarget; // Empty unless provisioned
  ErrorKind error = ErrorKind::NONE;
  std::string reason;

  json_t *toJson() const;
};

class Router {

protected:
  Logger logger;

  kernel::NetworkFacility &facility;

  InterfaceRegistry registry;
  VirtualTargetProvisioner provisioner;
  RedirectionInstaller installer;

  mutable std::mutex mutex; // Guards states
  std::map<std::string, InterfaceStatus> states;

  bool parallel;

  bool forwarding;     // Enable IP forwarding during apply()
  bool forwardingIpv6; // Also for IPv6

  // Values found before the first apply(), restored by teardown()
  std::map<int, bool> savedForwarding;

  void setState(const PhysicalInterface &pi, InterfaceState st,
                const std::string &vt = "");
  void setFailed(const PhysicalInterface &pi, ErrorKind kind,
                 const std::string &reason);

  // Run the state machine of a single interface.
  void provision(const PhysicalInterface &pi);
  void unprovision(const PhysicalInterface &pi);

  void enableForwarding();
  void restoreForwarding();

public:
  Router(kernel::NetworkFacility &f);

  /* Parse router configuration.
   *
   * @param json A libjansson object which contains the configuration.
   * @throws ConfigError
   * @throws DuplicateInterfaceError
   */
  void parse(json_t *json);

  // Register an additional physical interface.
  PhysicalInterface addInterface(const std::string &name,
                                 const std::string &role = "");

  std::vector<InterfaceStatus> apply();

  std::vector<InterfaceStatus> teardown();

  /* Derive states from what is currently configured on the host.
   *
   * If forwarding is enabled in the configuration and an earlier run left
   * interfaces configured, the following teardown() disables forwarding.
   */
  std::vector<InterfaceStatus> discover();

  // Status of all interfaces in registration order.
  std::vector<InterfaceStatus> getStatus() const;

  std::optional<InterfaceStatus> getStatus(const std::string &name) const;

  // Pairs of physical interface and virtual target of active interfaces.
  std::vector<std::pair<std::string, std::string>> getShapingTargets() const;

  // True if all interfaces are active.
  bool isActive() const;

  json_t *toJson() const;

  /* Change the prefix of virtual target names.
   *
   * @throws ConfigError if a registered interface would become a virtual target.
   */
  void setPrefix(const std::string &prefix);

  void setParallel(bool p) { parallel = p; }

  void setForwarding(bool enable, bool ipv6 = false) {
    forwarding = enable;
    forwardingIpv6 = ipv6;
  }

  const InterfaceRegistry &getRegistry() const { return registry; }

  VirtualTargetProvisioner &getProvisioner() { return provisioner; }

  RedirectionInstaller &getInstaller() { return installer; }

  Logger getLogger() { return logger; }
};

} // namespace router
} // namespace wanem
