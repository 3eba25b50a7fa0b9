/* Common entry point for all command line tools.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <cstdlib>
#include <list>
#include <string>

#include <signal.h>

#include <wanem/config.hpp>
#include <wanem/exceptions.hpp>
#include <wanem/log.hpp>
#include <wanem/utils.hpp>

namespace wanem {

class Tool {

protected:
  Logger logger;

  int argc;
  char **argv;

  std::string name;

  // Number of the last signal which has been delivered to handler(), or 0.
  std::atomic<int> lastSignal;

  static Tool *current_tool;

  static void staticHandler(int signal, siginfo_t *sinfo, void *ctx);

  virtual void handler(int signal, siginfo_t *sinfo, void *ctx);

  std::list<int> handlerSignals;

  static void printCopyright();

  static void printVersion();

  /* Suspend the calling thread until SIGINT or SIGTERM arrives.
   *
   * @return The number of the signal.
   */
  int waitForTermination();

public:
  Tool(int ac, char *av[], const std::string &name,
       const std::list<int> &sigs = {});

  virtual ~Tool() { current_tool = nullptr; }

  virtual int main() { return EXIT_SUCCESS; }

  virtual void usage() {}

  virtual void parse() {}

  // Returns the exit code of the process.
  virtual int run();
};

} // namespace wanem
