/* In-memory network facility for unit tests.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <wanem/kernel/facility.hpp>

namespace wanem {
namespace test {

class FakeFacility : public kernel::NetworkFacility {

protected:
  mutable std::mutex mutex;

  int nextIndex;

  struct Device {
    kernel::LinkInfo link;
    bool hasCapturePoint;
    kernel::CapturePointInfo capturePoint;
    std::vector<kernel::RuleInfo> rules;
  };

  std::map<std::string, Device> devices;
  std::map<int, bool> forwarding;

  Device &require(const std::string &name);

  void mutated() { mutations++; }

public:
  // Number of calls which changed the state.
  unsigned mutations;

  // Calls to addLink() with these names fail.
  std::set<std::string> failLinks;

  // Calls to addRedirectRule() for these devices fail.
  std::set<std::string> failRules;

  FakeFacility();

  // Add a physical device as it would be present on boot.
  void addDevice(const std::string &name);

  // Attach configuration which has not been created by the router.
  void addForeignCapturePoint(const std::string &dev,
                              const std::string &kind = "clsact");
  void addForeignRule(const std::string &dev, const kernel::RuleId &id);

  size_t countRules(const std::string &dev) const;

  bool hasLink(const std::string &name) const;

  std::optional<kernel::LinkInfo> getLink(const std::string &name) override;

  void addLink(const std::string &name, const std::string &kind) override;

  void setLinkUp(const std::string &name, bool up) override;

  void deleteLink(const std::string &name) override;

  std::optional<kernel::CapturePointInfo>
  getCapturePoint(const std::string &dev) override;

  void addCapturePoint(const std::string &dev) override;

  void deleteCapturePoint(const std::string &dev) override;

  std::vector<kernel::RuleInfo> getRules(const std::string &dev) override;

  void addRedirectRule(const std::string &dev, const kernel::RuleId &id,
                       const std::string &target) override;

  void deleteRule(const std::string &dev, const kernel::RuleId &id) override;

  bool getForwarding(int family) override;

  void setForwarding(bool enable, int family) override;
};

} // namespace test
} // namespace wanem
