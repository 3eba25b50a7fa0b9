/* Main routine of the ingress shaping router.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <iostream>
#include <list>

#include <fmt/color.h>
#include <fmt/format.h>

#include <unistd.h>

#include <wanem/config_class.hpp>
#include <wanem/exceptions.hpp>
#include <wanem/kernel/netlink_facility.hpp>
#include <wanem/log.hpp>
#include <wanem/router.hpp>
#include <wanem/tool.hpp>
#include <wanem/utils.hpp>

using namespace wanem;
using namespace wanem::router;

namespace wanem {
namespace router {
namespace tools {

class RouterTool : public Tool {

public:
  RouterTool(int argc, char *argv[])
      : Tool(argc, argv, "tool"), oneshot(false), teardownOnly(false),
        printStatus(false), teardownOnExit(false) {}

protected:
  std::string uri;
  std::string statusFile;

  bool oneshot;
  bool teardownOnly;
  bool printStatus;
  bool teardownOnExit;

  void usage() {
    std::cout
        << "Usage: wanem-router [OPTIONS] CONFIG" << std::endl
        << "  OPTIONS is one or more of the following options:" << std::endl
        << "    -h      show this usage information" << std::endl
        << "    -d LVL  set logging level, e.g. 'info' or 'info,kernel:*=debug'"
        << std::endl
        << "    -V      show the version of the tool" << std::endl
        << "    -o      apply the configuration and exit" << std::endl
        << "    -t      tear down the configuration and exit" << std::endl
        << "            (also disables IP forwarding if enabled in CONFIG)"
        << std::endl
        << "    -s      print the state of all interfaces in JSON format"
        << std::endl
        << std::endl
        << "  CONFIG is the path to a configuration file or '-' for stdin"
        << std::endl
        << std::endl;

    printCopyright();
  }

  void parse() {
    // Parse optional command line arguments
    int c;
    while ((c = getopt(argc, argv, "hVd:ots")) != -1) {
      switch (c) {
      case 'V':
        printVersion();
        exit(EXIT_SUCCESS);

      case 'd':
        Log::getInstance().setLevel(optarg);
        break;

      case 'o':
        oneshot = true;
        break;

      case 't':
        teardownOnly = true;
        break;

      case 's':
        printStatus = true;
        break;

      case 'h':
      case '?':
        usage();
        exit(c == '?' ? EXIT_FAILURE : EXIT_SUCCESS);
      }

      continue;
    }

    if (argc != optind + 1) {
      usage();
      exit(EXIT_FAILURE);
    }

    uri = argv[optind];
  }

  void parseTool(json_t *json) {
    int ret;
    json_error_t err;
    json_t *json_logging = nullptr;
    const char *status_file = nullptr;
    int tde = teardownOnExit;

    ret = json_unpack_ex(json, &err, 0, "{ s?: o, s?: s, s?: b }", "logging",
                         &json_logging, "status_file", &status_file,
                         "teardown_on_exit", &tde);
    if (ret)
      throw ConfigError(json, err, "", "Failed to parse configuration");

    if (json_logging)
      Log::getInstance().parse(json_logging);

    if (status_file)
      statusFile = status_file;

    teardownOnExit = tde;
  }

  void report(Router &r) {
    for (auto &s : r.getStatus()) {
      if (s.state == InterfaceState::FAILED)
        logger->error("{:<10} {:<12} {}: {}", s.interface.name,
                      stateToString(s.state), errorKindToString(s.error),
                      s.reason);
      else
        logger->info("{:<10} {:<12} {}", s.interface.name,
                     stateToString(s.state), s.virtualTarget);
    }

    auto *json = r.toJson();

    if (printStatus) {
      json_dumpf(json, stdout, JSON_INDENT(4));
      std::cout << std::endl;
    }

    if (!statusFile.empty()) {
      char *str = json_dumps(json, JSON_INDENT(4));
      if (!str) {
        json_decref(json);
        throw MemoryAllocationError();
      }

      std::string data(str);
      free(str);

      try {
        auto path = std::filesystem::path(statusFile);
        if (path.has_parent_path())
          std::filesystem::create_directories(path.parent_path());

        utils::write_to_file(data + "\n", path);
      } catch (const std::exception &e) {
        logger->error("Failed to write status file {}: {}", statusFile,
                      e.what());
      }
    }

    json_decref(json);
  }

  int main() {
    Config cfg(uri);

    parseTool(cfg.root);

    if (!utils::isNetAdmin())
      logger->warn("Missing CAP_NET_ADMIN capability. Provisioning will "
                   "most likely fail");

    kernel::NetlinkFacility facility;
    Router r(facility);

    r.parse(cfg.root);

    if (teardownOnly) {
      r.discover();
      r.teardown();

      report(r);

      for (auto &s : r.getStatus()) {
        if (s.state != InterfaceState::UNCONFIGURED)
          return EXIT_FAILURE;
      }

      return EXIT_SUCCESS;
    }

    r.apply();

    report(r);

    if (!r.isActive()) {
      logger->error("Not all interfaces are active");

      if (teardownOnExit)
        r.teardown();

      return EXIT_FAILURE;
    }

    std::list<std::string> pairs;
    for (auto &p : r.getShapingTargets())
      pairs.push_back(fmt::format("{}<->{}", p.first, p.second));

    logger->info("wanem-router ready: {}",
                 fmt::styled(fmt::format("{}", fmt::join(pairs.begin(),
                                                         pairs.end(), " and ")),
                             fmt::fg(fmt::terminal_color::green)));

    if (oneshot)
      return EXIT_SUCCESS;

    waitForTermination();

    if (teardownOnExit) {
      r.teardown();

      report(r);
    }

    return EXIT_SUCCESS;
  }
};

} // namespace tools
} // namespace router
} // namespace wanem

int main(int argc, char *argv[]) {
  wanem::router::tools::RouterTool t(argc, argv);

  return t.run();
}
