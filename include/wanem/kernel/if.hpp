/* Interface related functions.
 *
 * These functions are used to manage a network interface.
 * Most of them make use of Linux-specific APIs.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <wanem/log.hpp>

// Forward declarations
struct rtnl_link;

namespace wanem {
namespace kernel {

// Interface data structure
class Interface {

public:
  struct rtnl_link *nl_link; // libnl3: Handle of interface.

protected:
  Logger logger;

public:
  // Takes ownership of the reference to link.
  explicit Interface(struct rtnl_link *link);
  ~Interface();

  Interface(const Interface &) = delete;
  Interface &operator=(const Interface &) = delete;

  /* Find an interface by its name.
   *
   * Queries the kernel directly so that the result is never stale.
   *
   * @return The interface or nullptr if no such interface exists.
   * @throws NetlinkError on any other failure.
   */
  static std::unique_ptr<Interface> lookup(const std::string &name);

  /* Create a new virtual link.
   *
   * @param name The name of the new link.
   * @param kind The link type, e.g. "ifb".
   * @retval 0 Success. Everything went well.
   * @retval <0 Error. A negative libnl error code.
   */
  static int create(const std::string &name, const std::string &kind);

  /* Change the administrative state of the interface.
   *
   * @retval 0 Success. Everything went well.
   * @retval <0 Error. A negative libnl error code.
   */
  int setUp(bool up);

  /* Delete the interface from the kernel.
   *
   * @retval 0 Success. Everything went well.
   * @retval <0 Error. A negative libnl error code.
   */
  int remove();

  std::string getName() const;

  // Link type or an empty string for physical devices.
  std::string getKind() const;

  int getIndex() const;

  bool isUp() const;
};

} // namespace kernel
} // namespace wanem
