/* Abstract access to host networking state.
 *
 * Everything the router mutates on the host goes through this
 * capability set: links, ingress capture points, redirect rules and
 * the IP forwarding switch. The netlink implementation talks to the
 * kernel; tests inject an in-memory implementation.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cerrno>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <sys/socket.h>

#include <wanem/exceptions.hpp>

namespace wanem {
namespace kernel {

typedef uint32_t tc_hdl_t;

struct LinkInfo {
  std::string name;
  std::string kind; // Link type, e.g. "ifb". Empty for physical devices.
  int ifindex;
  bool up;
};

struct CapturePointInfo {
  std::string kind; // Qdisc kind, e.g. "ingress" or "clsact".
  tc_hdl_t handle;
  tc_hdl_t parent;
};

// Identifies a classifier attached below a capture point.
struct RuleId {
  uint16_t prio;
  tc_hdl_t handle;

  bool operator==(const RuleId &other) const {
    return prio == other.prio && handle == other.handle;
  }

  bool operator!=(const RuleId &other) const { return !(*this == other); }
};

struct RuleInfo {
  RuleId id;
  std::string kind; // Classifier kind, e.g. "u32".
  uint16_t protocol;
  bool matchAll;
  int redirectIfindex; // Target of a mirred egress redirect, 0 if none.
};

// Failure of a facility call. The code is a negative errno value.
class FacilityError : public RuntimeError {

protected:
  int code;

public:
  template <typename... Args>
  FacilityError(int c, const std::string &what, Args &&...args)
      : RuntimeError(what, std::forward<Args>(args)...), code(c) {}

  int getCode() const { return code; }

  bool isNotFound() const { return code == -ENOENT || code == -ENODEV; }
};

class NetworkFacility {

public:
  virtual ~NetworkFacility() {}

  // Returns nothing if no link with this name exists.
  virtual std::optional<LinkInfo> getLink(const std::string &name) = 0;

  virtual void addLink(const std::string &name, const std::string &kind) = 0;

  virtual void setLinkUp(const std::string &name, bool up) = 0;

  virtual void deleteLink(const std::string &name) = 0;

  // Returns the qdisc attached to the ingress hook of a device, if any.
  virtual std::optional<CapturePointInfo>
  getCapturePoint(const std::string &dev) = 0;

  virtual void addCapturePoint(const std::string &dev) = 0;

  virtual void deleteCapturePoint(const std::string &dev) = 0;

  // Lists all classifiers attached below the ingress capture point.
  virtual std::vector<RuleInfo> getRules(const std::string &dev) = 0;

  virtual void addRedirectRule(const std::string &dev, const RuleId &id,
                               const std::string &target) = 0;

  virtual void deleteRule(const std::string &dev, const RuleId &id) = 0;

  virtual bool getForwarding(int family = AF_INET) = 0;

  virtual void setForwarding(bool enable, int family = AF_INET) = 0;
};

} // namespace kernel
} // namespace wanem
