/* Common entry point for all command line tools.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <clocale>
#include <cstring>
#include <iostream>

#include <fmt/color.h>

#include <wanem/tool.hpp>

using namespace wanem;

Tool *Tool::current_tool = nullptr;

void Tool::staticHandler(int signal, siginfo_t *sinfo, void *ctx) {
  if (current_tool)
    current_tool->handler(signal, sinfo, ctx);
}

void Tool::handler(int signal, siginfo_t *, void *) {
  logger->info("Received {} signal. Terminating...", strsignal(signal));

  lastSignal = signal;
}

void Tool::printCopyright() {
  fmt::print("{} {} (built on {} {})\n", PROJECT_NAME,
             fmt::styled(PROJECT_VERSION, fmt::fg(fmt::terminal_color::blue)),
             fmt::styled(__DATE__, fmt::fg(fmt::terminal_color::magenta)),
             fmt::styled(__TIME__, fmt::fg(fmt::terminal_color::magenta)));
  fmt::print(" Copyright 2024 The wanem-router Authors\n");
}

void Tool::printVersion() { std::cout << PROJECT_VERSION << std::endl; }

Tool::Tool(int ac, char *av[], const std::string &nme,
           const std::list<int> &sigs)
    : argc(ac), argv(av), name(nme), lastSignal(0), handlerSignals(sigs) {
  current_tool = this;

  logger = Log::get(name);
}

int Tool::waitForTermination() {
  sigset_t mask, old;

  sigemptyset(&mask);
  sigaddset(&mask, SIGINT);
  sigaddset(&mask, SIGTERM);

  // Only deliverable while suspended
  if (sigprocmask(SIG_BLOCK, &mask, &old))
    throw SystemError("Failed to block signals");

  while (lastSignal != SIGINT && lastSignal != SIGTERM)
    sigsuspend(&old);

  if (sigprocmask(SIG_SETMASK, &old, nullptr))
    throw SystemError("Failed to restore signal mask");

  return lastSignal;
}

int Tool::run() {
  try {
    int ret;

    std::setlocale(LC_ALL, "en_US.UTF-8");

    ret = utils::signalsInit(staticHandler, handlerSignals);
    if (ret)
      throw SystemError("Failed to initialize signal subsystem");

    // Parse command line arguments
    parse();

    logger->info("This is {} {} (built on {}, {})", PROJECT_NAME,
                 fmt::styled(PROJECT_VERSION, fmt::emphasis::bold |
                                                  fmt::fg(fmt::terminal_color::yellow)),
                 __DATE__, __TIME__);

    ret = main();

    logger->info("Goodbye!");

    return ret;
  } catch (const ConfigError &e) {
    logger->error("Invalid configuration: {}", e.what());

    return EXIT_FAILURE;
  } catch (const std::runtime_error &e) {
    logger->error("{}", e.what());

    return EXIT_FAILURE;
  }
}
