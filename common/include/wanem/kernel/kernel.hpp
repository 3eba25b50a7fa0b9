/* Linux kernel related functions.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sys/socket.h>

namespace wanem {
namespace kernel {

/* Checks if a kernel module is loaded
 *
 * Modules which are built into the kernel are reported as loaded, too.
 *
 * @param module the name of the module
 * @retval 0 Module is loaded.
 * @reval <>0 Module is not loaded.
 */
int isModuleLoaded(const char *module);

// Load kernel module via modprobe
int loadModule(const char *module);

/* Get the state of IP forwarding for an address family.
 *
 * @param family Either AF_INET or AF_INET6
 * @retval 1 Forwarding is enabled.
 * @retval 0 Forwarding is disabled.
 */
int getIpForwarding(int family = AF_INET);

// Enable or disable IP forwarding for an address family.
void setIpForwarding(bool enable, int family = AF_INET);

} // namespace kernel
} // namespace wanem
