/* Registry of physical interfaces managed by the router.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cctype>
#include <utility>

#include <linux/if.h>

#include <wanem/exceptions.hpp>
#include <wanem/interface.hpp>
#include <wanem/router/exceptions.hpp>

using namespace wanem;
using namespace wanem::router;

static bool isValidName(const std::string &name) {
  if (name.empty() || name.size() >= IFNAMSIZ)
    return false;

  if (name == "." || name == "..")
    return false;

  for (char c : name) {
    if (c == '/' || c == ':' || isspace(static_cast<unsigned char>(c)))
      return false;
  }

  return true;
}

InterfaceRegistry::InterfaceRegistry() : logger(Log::get("registry")) {}

PhysicalInterface InterfaceRegistry::add(const std::string &name,
                                         const std::string &role) {
  if (!isValidName(name))
    throw ConfigError(nullptr, "interfaces",
                      "Invalid interface name: '{}'", name);

  if (lookup(name))
    throw DuplicateInterfaceError(name);

  PhysicalInterface pi{name, role, (unsigned)interfaces.size()};

  if (!targetPrefix.empty()) {
    auto target = getTargetName(pi, targetPrefix);

    if (target == name)
      throw ConfigError(nullptr, "interfaces",
                        "Interface {} would be its own virtual target", name);

    if (lookup(target))
      throw ConfigError(nullptr, "interfaces",
                        "Virtual target {} of {} is a registered interface",
                        target, name);

    for (auto &other : interfaces) {
      if (getTargetName(other, targetPrefix) == name)
        throw ConfigError(nullptr, "interfaces",
                          "Interface {} is the virtual target of {}", name,
                          other.name);
    }
  }

  interfaces.push_back(pi);

  logger->debug("Registered interface {} with role '{}' as #{}", name, role,
                pi.index);

  return pi;
}

void InterfaceRegistry::parse(json_t *json) {
  if (!json_is_array(json))
    throw ConfigError(json, "interfaces",
                      "Setting 'interfaces' must be a list");

  size_t idx;
  json_t *json_if;

  // Entries are only taken over if all of them are valid
  auto staged = *this;

  json_array_foreach(json, idx, json_if) {
    const char *name = nullptr;
    const char *role = nullptr;

    // Short form: just the name
    if (json_is_string(json_if)) {
      staged.add(json_string_value(json_if));
      continue;
    }

    json_error_t err;
    int ret = json_unpack_ex(json_if, &err, JSON_STRICT, "{ s: s, s?: s }",
                             "name", &name, "role", &role);
    if (ret)
      throw ConfigError(json_if, err, "interfaces",
                        "Failed to parse interface #{}", idx);

    staged.add(name, role ? role : "");
  }

  interfaces = std::move(staged.interfaces);
}

void InterfaceRegistry::setTargetPrefix(const std::string &prefix) {
  if (!prefix.empty()) {
    for (auto &pi : interfaces) {
      auto target = getTargetName(pi, prefix);

      if (lookup(target))
        throw ConfigError(nullptr, "virtual_prefix",
                          "Virtual target {} of {} is a registered interface",
                          target, pi.name);
    }
  }

  targetPrefix = prefix;
}

std::string InterfaceRegistry::getTargetName(const PhysicalInterface &pi,
                                             const std::string &prefix) {
  return prefix + std::to_string(pi.index);
}

std::optional<PhysicalInterface>
InterfaceRegistry::lookup(const std::string &name) const {
  for (auto &pi : interfaces) {
    if (pi.name == name)
      return pi;
  }

  return std::nullopt;
}
