/* Provisioning of virtual shaping targets (IFB devices).
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <linux/if.h>

#include <wanem/provisioner.hpp>
#include <wanem/router/exceptions.hpp>

using namespace wanem;
using namespace wanem::router;

VirtualTargetProvisioner::VirtualTargetProvisioner(kernel::NetworkFacility &f,
                                                   const std::string &p)
    : logger(Log::get("provisioner")), facility(f), registry(nullptr) {
  setPrefix(p);
}

void VirtualTargetProvisioner::setPrefix(const std::string &p) {
  // Leave room for at least three digits
  if (p.empty() || p.size() + 3 >= IFNAMSIZ)
    throw ConfigError(nullptr, "virtual_prefix",
                      "Invalid prefix for virtual targets: '{}'", p);

  prefix = p;
}

std::string VirtualTargetProvisioner::getName(const PhysicalInterface &pi) const {
  return InterfaceRegistry::getTargetName(pi, prefix);
}

bool VirtualTargetProvisioner::isManaged(const std::string &name) const {
  return registry && registry->lookup(name).has_value();
}

VirtualTarget VirtualTargetProvisioner::ensure(const PhysicalInterface &pi) {
  auto lock = locks.lock(pi.name);
  auto name = getName(pi);

  if (name.size() >= IFNAMSIZ)
    throw VirtualTargetCreationError(pi.name,
                                     "Name of virtual target is too long: {}",
                                     name);

  if (name == pi.name)
    throw VirtualTargetCreationError(
        pi.name, "Virtual target would replace its own interface: {}", name);

  if (isManaged(name))
    throw VirtualTargetCreationError(
        pi.name, "Virtual target {} is a registered interface", name);

  try {
    auto link = facility.getLink(name);
    if (!link) {
      logger->info("Creating virtual target {} for {}", name, pi.name);

      facility.addLink(name, KIND);
      facility.setLinkUp(name, true);
    } else if (link->kind != KIND) {
      throw VirtualTargetCreationError(
          pi.name, "Link {} exists but is of type '{}' instead of '{}'", name,
          link->kind.empty() ? "device" : link->kind, KIND);
    } else if (!link->up) {
      logger->info("Bringing up virtual target {} for {}", name, pi.name);

      facility.setLinkUp(name, true);
    } else
      logger->debug("Virtual target {} for {} is already up", name, pi.name);
  } catch (const kernel::FacilityError &e) {
    throw VirtualTargetCreationError(
        pi.name, "Failed to provision virtual target {}: {}", name, e.what());
  }

  return VirtualTarget{name, true, pi.name};
}

std::optional<VirtualTarget>
VirtualTargetProvisioner::inspect(const PhysicalInterface &pi) {
  auto name = getName(pi);
  if (name == pi.name || isManaged(name))
    return std::nullopt;

  auto link = facility.getLink(name);
  if (!link || link->kind != KIND)
    return std::nullopt;

  return VirtualTarget{name, link->up, pi.name};
}

bool VirtualTargetProvisioner::remove(const PhysicalInterface &pi) {
  auto lock = locks.lock(pi.name);
  auto name = getName(pi);

  if (name == pi.name || isManaged(name)) {
    logger->warn("Not removing link {}: it is a registered interface", name);
    return false;
  }

  try {
    auto link = facility.getLink(name);
    if (!link)
      return false;

    if (link->kind != KIND) {
      logger->warn("Not removing link {}: it is not a virtual target", name);
      return false;
    }

    facility.deleteLink(name);
  } catch (const kernel::FacilityError &e) {
    if (e.isNotFound())
      return false;

    throw TeardownError(pi.name, "Failed to remove virtual target {}: {}", name,
                        e.what());
  }

  logger->info("Removed virtual target {} of {}", name, pi.name);

  return true;
}
