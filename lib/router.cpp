/* Router state controller.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <exception>
#include <thread>

#include <sys/socket.h>

#include <wanem/exceptions.hpp>
#include <wanem/router.hpp>
#include <wanem/router/exceptions.hpp>

using namespace wanem;
using namespace wanem::router;

json_t *InterfaceStatus::toJson() const {
  json_t *json = json_pack("{ s: s, s: s, s: s, s: i }", "name",
                           interface.name.c_str(), "role",
                           interface.role.c_str(), "state",
                           stateToString(state).c_str(), "index",
                           interface.index);

  json_object_set_new(json, "virtual_target",
                      virtualTarget.empty()
                          ? json_null()
                          : json_string(virtualTarget.c_str()));

  if (error != ErrorKind::NONE)
    json_object_set_new(json, "error",
                        json_pack("{ s: s, s: s }", "type",
                                  errorKindToString(error).c_str(), "reason",
                                  reason.c_str()));

  return json;
}

Router::Router(kernel::NetworkFacility &f)
    : logger(Log::get("router")), facility(f), provisioner(f), installer(f),
      parallel(false), forwarding(false), forwardingIpv6(false) {
  provisioner.setRegistry(&registry);
  registry.setTargetPrefix(provisioner.getPrefix());
}

void Router::setPrefix(const std::string &prefix) {
  auto old = provisioner.getPrefix();

  provisioner.setPrefix(prefix);

  try {
    registry.setTargetPrefix(prefix);
  } catch (const ConfigError &) {
    provisioner.setPrefix(old);
    throw;
  }
}

void Router::parse(json_t *json) {
  int ret;
  json_error_t err;
  json_t *json_interfaces = nullptr;
  json_t *json_forwarding = nullptr;
  const char *prefix = nullptr;
  int par = parallel;

  ret = json_unpack_ex(json, &err, 0, "{ s: o, s?: s, s?: b, s?: o }",
                       "interfaces", &json_interfaces, "virtual_prefix",
                       &prefix, "parallel", &par, "forwarding",
                       &json_forwarding);
  if (ret)
    throw ConfigError(json, err, "router",
                      "Failed to parse router configuration");

  if (prefix)
    setPrefix(prefix);

  parallel = par;

  if (json_is_boolean(json_forwarding))
    forwarding = json_is_true(json_forwarding);
  else if (json_forwarding) {
    int en = forwarding;
    int v6 = forwardingIpv6;

    ret = json_unpack_ex(json_forwarding, &err, JSON_STRICT, "{ s?: b, s?: b }",
                         "enabled", &en, "ipv6", &v6);
    if (ret)
      throw ConfigError(json_forwarding, err, "forwarding",
                        "Failed to parse forwarding settings");

    forwarding = en;
    forwardingIpv6 = v6;
  }

  registry.parse(json_interfaces);

  for (auto &pi : registry.list())
    setState(pi, InterfaceState::UNCONFIGURED);
}

PhysicalInterface Router::addInterface(const std::string &name,
                                       const std::string &role) {
  auto pi = registry.add(name, role);

  setState(pi, InterfaceState::UNCONFIGURED);

  return pi;
}

void Router::setState(const PhysicalInterface &pi, InterfaceState st,
                      const std::string &vt) {
  std::lock_guard<std::mutex> guard(mutex);

  auto &s = states[pi.name];

  if (st != InterfaceState::UNCONFIGURED)
    logger->debug("{}: {} -> {}", pi.name, stateToString(s.state),
                  stateToString(st));

  s.interface = pi;
  s.state = st;
  s.virtualTarget = vt;
  s.error = ErrorKind::NONE;
  s.reason.clear();
}

void Router::setFailed(const PhysicalInterface &pi, ErrorKind kind,
                       const std::string &reason) {
  std::lock_guard<std::mutex> guard(mutex);

  auto &s = states[pi.name];

  s.interface = pi;
  s.state = InterfaceState::FAILED;
  s.error = kind;
  s.reason = reason;
}

void Router::provision(const PhysicalInterface &pi) {
  try {
    auto vt = provisioner.ensure(pi);
    setState(pi, InterfaceState::VIRTUAL_TARGET_READY, vt.name);

    installer.install(pi, vt);
    setState(pi, InterfaceState::REDIRECT_INSTALLED, vt.name);

    try {
      auto cur = provisioner.inspect(pi);
      if (!cur || !cur->up)
        throw VirtualTargetCreationError(pi.name,
                                         "Virtual target {} disappeared",
                                         vt.name);

      if (installer.inspect(pi, vt) != RedirectionStatus::INSTALLED)
        throw RuleInstallationError(pi.name,
                                    "Redirect of {} has been altered", pi.name);
    } catch (const kernel::FacilityError &e) {
      throw RuleInstallationError(pi.name, "Failed to verify redirect: {}",
                                  e.what());
    }

    setState(pi, InterfaceState::ACTIVE, vt.name);
  } catch (const RouterError &e) {
    logger->error("Failed to provision {}: {}", pi.name, e.what());

    setFailed(pi, e.getKind(), e.what());
  }
}

void Router::unprovision(const PhysicalInterface &pi) {
  auto vt = provisioner.getName(pi);

  try {
    installer.remove(pi);
    setState(pi, InterfaceState::VIRTUAL_TARGET_READY, vt);

    provisioner.remove(pi);
    setState(pi, InterfaceState::UNCONFIGURED);
  } catch (const RouterError &e) {
    logger->error("Failed to tear down {}: {}", pi.name, e.what());

    setFailed(pi, e.getKind(), e.what());
  }
}

std::vector<InterfaceStatus> Router::apply() {
  auto &interfaces = registry.list();

  if (interfaces.empty())
    logger->warn("No interfaces configured");

  if (forwarding)
    enableForwarding();

  if (parallel && interfaces.size() > 1) {
    std::vector<std::thread> threads;
    std::vector<std::exception_ptr> errors(interfaces.size());

    for (size_t i = 0; i < interfaces.size(); i++)
      threads.emplace_back([this, &interfaces, &errors, i]() {
        try {
          provision(interfaces[i]);
        } catch (...) {
          errors[i] = std::current_exception();
        }
      });

    for (auto &t : threads)
      t.join();

    for (auto &e : errors) {
      if (e)
        std::rethrow_exception(e);
    }
  } else {
    for (auto &pi : interfaces)
      provision(pi);
  }

  auto status = getStatus();

  size_t failed = 0;
  for (auto &s : status) {
    if (s.state == InterfaceState::FAILED)
      failed++;
  }

  if (failed)
    logger->warn("Provisioned {} of {} interfaces", status.size() - failed,
                 status.size());
  else
    logger->info("Provisioned {} interfaces", status.size());

  return status;
}

std::vector<InterfaceStatus> Router::teardown() {
  auto &interfaces = registry.list();

  // Reverse order of provisioning
  for (auto it = interfaces.rbegin(); it != interfaces.rend(); ++it) {
    auto st = getStatus(it->name);
    if (st && st->state == InterfaceState::UNCONFIGURED)
      continue;

    unprovision(*it);
  }

  restoreForwarding();

  return getStatus();
}

std::vector<InterfaceStatus> Router::discover() {
  for (auto &pi : registry.list()) {
    try {
      auto vt = provisioner.inspect(pi);
      auto red = installer.inspect(
          pi, vt ? *vt : VirtualTarget{provisioner.getName(pi), false, pi.name});

      if (!vt) {
        if (red == RedirectionStatus::ABSENT)
          setState(pi, InterfaceState::UNCONFIGURED);
        else
          setFailed(pi, ErrorKind::VIRTUAL_TARGET_CREATION,
                    fmt::format("{} has a capture point but no virtual target",
                                pi.name));
      } else if (red == RedirectionStatus::INSTALLED && vt->up)
        setState(pi, InterfaceState::ACTIVE, vt->name);
      else
        setState(pi, InterfaceState::VIRTUAL_TARGET_READY, vt->name);
    } catch (const kernel::FacilityError &e) {
      logger->error("Failed to inspect {}: {}", pi.name, e.what());

      setFailed(pi, ErrorKind::INTERNAL, e.what());
    }
  }

  // The value found before an earlier run enabled forwarding is unknown.
  // Teardown disables it again if that run left anything behind.
  if (forwarding && savedForwarding.empty()) {
    bool found = false;
    for (auto &s : getStatus()) {
      if (s.state != InterfaceState::UNCONFIGURED)
        found = true;
    }

    if (found) {
      savedForwarding[AF_INET] = false;
      if (forwardingIpv6)
        savedForwarding[AF_INET6] = false;
    }
  }

  return getStatus();
}

std::vector<InterfaceStatus> Router::getStatus() const {
  std::lock_guard<std::mutex> guard(mutex);

  std::vector<InterfaceStatus> status;

  for (auto &pi : registry.list()) {
    auto it = states.find(pi.name);
    if (it != states.end())
      status.push_back(it->second);
    else
      status.push_back(InterfaceStatus{pi, InterfaceState::UNCONFIGURED, "",
                                       ErrorKind::NONE, ""});
  }

  return status;
}

std::optional<InterfaceStatus>
Router::getStatus(const std::string &name) const {
  std::lock_guard<std::mutex> guard(mutex);

  auto it = states.find(name);
  if (it == states.end())
    return std::nullopt;

  return it->second;
}

std::vector<std::pair<std::string, std::string>>
Router::getShapingTargets() const {
  std::vector<std::pair<std::string, std::string>> targets;

  for (auto &s : getStatus()) {
    if (s.state == InterfaceState::ACTIVE)
      targets.emplace_back(s.interface.name, s.virtualTarget);
  }

  return targets;
}

bool Router::isActive() const {
  auto status = getStatus();

  if (status.empty())
    return false;

  for (auto &s : status) {
    if (s.state != InterfaceState::ACTIVE)
      return false;
  }

  return true;
}

json_t *Router::toJson() const {
  json_t *json_interfaces = json_array();

  for (auto &s : getStatus())
    json_array_append_new(json_interfaces, s.toJson());

  return json_pack("{ s: o, s: b }", "interfaces", json_interfaces, "active",
                   isActive());
}

void Router::enableForwarding() {
  std::vector<int> families = {AF_INET};
  if (forwardingIpv6)
    families.push_back(AF_INET6);

  for (auto family : families) {
    try {
      bool enabled = facility.getForwarding(family);

      if (savedForwarding.find(family) == savedForwarding.end())
        savedForwarding[family] = enabled;

      if (!enabled)
        facility.setForwarding(true, family);
    } catch (const kernel::FacilityError &e) {
      throw RuntimeError("Failed to enable IP forwarding: {}", e.what());
    }
  }
}

void Router::restoreForwarding() {
  for (auto &p : savedForwarding) {
    try {
      if (facility.getForwarding(p.first) != p.second)
        facility.setForwarding(p.second, p.first);
    } catch (const kernel::FacilityError &e) {
      logger->error("Failed to restore IP forwarding: {}", e.what());
    }
  }

  savedForwarding.clear();
}
