/* Network facility backed by the Linux kernel.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>

#include <wanem/kernel/facility.hpp>
#include <wanem/kernel/if.hpp>
#include <wanem/log.hpp>

namespace wanem {
namespace kernel {

class NetlinkFacility : public NetworkFacility {

protected:
  Logger logger;

  // libnl sockets must not be used concurrently.
  std::mutex mutex;

  // Like Interface::lookup() but throws if the link does not exist.
  std::unique_ptr<Interface> require(const std::string &name);

public:
  NetlinkFacility();
  virtual ~NetlinkFacility();

  std::optional<LinkInfo> getLink(const std::string &name) override;

  void addLink(const std::string &name, const std::string &kind) override;

  void setLinkUp(const std::string &name, bool up) override;

  void deleteLink(const std::string &name) override;

  std::optional<CapturePointInfo>
  getCapturePoint(const std::string &dev) override;

  void addCapturePoint(const std::string &dev) override;

  void deleteCapturePoint(const std::string &dev) override;

  std::vector<RuleInfo> getRules(const std::string &dev) override;

  void addRedirectRule(const std::string &dev, const RuleId &id,
                       const std::string &target) override;

  void deleteRule(const std::string &dev, const RuleId &id) override;

  bool getForwarding(int family) override;

  void setForwarding(bool enable, int family) override;
};

} // namespace kernel
} // namespace wanem
