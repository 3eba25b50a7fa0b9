/* Provisioning of virtual shaping targets (IFB devices).
 *
 * Each physical interface gets a dedicated IFB device. Its name is
 * derived from a common prefix and the registration index of the
 * physical interface, e.g. eth0 -> ifb0, eth1 -> ifb1.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include <wanem/config.hpp>
#include <wanem/interface.hpp>
#include <wanem/kernel/facility.hpp>
#include <wanem/keyed_mutex.hpp>
#include <wanem/log.hpp>

namespace wanem {
namespace router {

struct VirtualTarget {
  std::string name;
  bool up;
  std::string owner; // Name of the physical interface
};

class VirtualTargetProvisioner {

protected:
  Logger logger;

  kernel::NetworkFacility &facility;

  std::string prefix;

  // Interfaces which must never be used as virtual targets
  const InterfaceRegistry *registry;

  KeyedMutex<std::string> locks;

  bool isManaged(const std::string &name) const;

public:
  static constexpr const char *KIND = "ifb";

  VirtualTargetProvisioner(kernel::NetworkFacility &f,
                           const std::string &prefix = DEFAULT_VIRTUAL_PREFIX);

  void setPrefix(const std::string &p);

  const std::string &getPrefix() const { return prefix; }

  void setRegistry(const InterfaceRegistry *r) { registry = r; }

  std::string getName(const PhysicalInterface &pi) const;

  /* Make sure the virtual target of an interface exists and is up.
   *
   * Creates the device if it is missing and brings it up if it is down.
   * Does not touch the host if both is already the case.
   *
   * @throws VirtualTargetCreationError
   */
  VirtualTarget ensure(const PhysicalInterface &pi);

  // Current state of the virtual target, if it exists and is an IFB device.
  std::optional<VirtualTarget> inspect(const PhysicalInterface &pi);

  /* Delete the virtual target of an interface.
   *
   * @return false if there was nothing to delete.
   * @throws TeardownError
   */
  bool remove(const PhysicalInterface &pi);
};

} // namespace router
} // namespace wanem
