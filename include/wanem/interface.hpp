/* Registry of physical interfaces managed by the router.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <jansson.h>

#include <wanem/log.hpp>

namespace wanem {
namespace router {

struct PhysicalInterface {
  std::string name; // Kernel name, e.g. "eth0"
  std::string role; // Free-form label, e.g. "client" or "server"

  // Position in registration order. Used to derive the virtual target name.
  unsigned index = 0;
};

class InterfaceRegistry {

protected:
  Logger logger;

  std::vector<PhysicalInterface> interfaces;

  // Prefix of the virtual target names. Empty if unchecked.
  std::string targetPrefix;

public:
  InterfaceRegistry();

  /* Add an interface to the registry.
   *
   * @param name The kernel name of the interface.
   * @param role An optional label.
   * @return A copy of the registered entry including its index.
   * @throws DuplicateInterfaceError if the name has been registered before.
   * @throws ConfigError if the name is not a valid interface name or
   *         collides with the virtual target name of any interface.
   */
  PhysicalInterface add(const std::string &name, const std::string &role = "");

  /* Register all interfaces from a JSON array.
   *
   * The registry is left unchanged if any entry is rejected.
   */
  void parse(json_t *json);

  /* Reject interfaces whose names are used for virtual targets.
   *
   * @throws ConfigError if a registered interface already collides.
   */
  void setTargetPrefix(const std::string &prefix);

  static std::string getTargetName(const PhysicalInterface &pi,
                                   const std::string &prefix);

  // All interfaces in registration order.
  const std::vector<PhysicalInterface> &list() const { return interfaces; }

  std::optional<PhysicalInterface> lookup(const std::string &name) const;

  size_t size() const { return interfaces.size(); }

  bool empty() const { return interfaces.empty(); }
};

} // namespace router
} // namespace wanem
