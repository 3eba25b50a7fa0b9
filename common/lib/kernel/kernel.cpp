/* Linux kernel related functions.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <fmt/core.h>

#include <wanem/config.hpp>
#include <wanem/exceptions.hpp>
#include <wanem/kernel/kernel.hpp>
#include <wanem/log.hpp>
#include <wanem/utils.hpp>

using namespace wanem;

static const char *forwardingPath(int family) {
  switch (family) {
  case AF_INET:
    return PROCFS_PATH "/sys/net/ipv4/ip_forward";

  case AF_INET6:
    return PROCFS_PATH "/sys/net/ipv6/conf/all/forwarding";

  default:
    throw RuntimeError("Unsupported address family: {}", family);
  }
}

int wanem::kernel::loadModule(const char *module) {
  int ret;

  ret = isModuleLoaded(module);
  if (!ret) {
    auto logger = Log::get("kernel");
    logger->debug("Kernel module {} already loaded...", module);
    return 0;
  }

  pid_t pid = fork();
  switch (pid) {
  case -1: // Error
    return -1;

  case 0: // Child
    execlp("modprobe", "modprobe", module, (char *)0);
    exit(EXIT_FAILURE); // exec() never returns

  default:
    waitpid(pid, &ret, 0);

    return isModuleLoaded(module);
  }
}

int wanem::kernel::isModuleLoaded(const char *module) {
  FILE *f;
  int ret = -1;
  char *line = nullptr;
  size_t len = 0;

  // Built-in modules do not show up in /proc/modules
  struct stat st;
  auto path = fmt::format(SYSFS_PATH "/module/{}", module);
  if (stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
    return 0;

  f = fopen(PROCFS_PATH "/modules", "r");
  if (!f)
    return -1;

  while (getline(&line, &len, f) >= 0) {
    auto tokens = utils::tokenize(line, " ");
    if (!tokens.empty() && tokens[0] == module) {
      ret = 0;
      break;
    }
  }

  free(line);
  fclose(f);

  return ret;
}

int wanem::kernel::getIpForwarding(int family) {
  auto value = utils::read_from_file(forwardingPath(family));

  return value.size() > 0 && value[0] == '1' ? 1 : 0;
}

void wanem::kernel::setIpForwarding(bool enable, int family) {
  utils::write_to_file(enable ? "1\n" : "0\n", forwardingPath(family));

  auto logger = Log::get("kernel");
  logger->info("{} IPv{} forwarding", enable ? "Enabled" : "Disabled",
               family == AF_INET6 ? 6 : 4);
}
