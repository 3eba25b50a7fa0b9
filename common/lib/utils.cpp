/* Utilities.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include <linux/capability.h>

#include <wanem/config.hpp>
#include <wanem/exceptions.hpp>
#include <wanem/log.hpp>
#include <wanem/utils.hpp>

namespace wanem {
namespace utils {

std::vector<std::string> tokenize(std::string s, const std::string &delimiter) {
  std::vector<std::string> tokens;

  size_t lastPos = 0;
  size_t curentPos;

  while ((curentPos = s.find(delimiter, lastPos)) != std::string::npos) {
    const size_t tokenLength = curentPos - lastPos;
    tokens.push_back(s.substr(lastPos, tokenLength));

    // Advance in string
    lastPos = curentPos + delimiter.length();
  }

  // Check if there's a last token behind the last delimiter.
  if (lastPos != s.length()) {
    const size_t lastTokenLength = s.length() - lastPos;
    tokens.push_back(s.substr(lastPos, lastTokenLength));
  }

  return tokens;
}

// Setup exit handler
int signalsInit(void (*cb)(int signal, siginfo_t *sinfo, void *ctx),
                std::list<int> cbSignals,
                std::list<int> ignoreSignals) {
  int ret;

  Logger logger = Log::get("signals");

  logger->debug("Initialize subsystem");

  struct sigaction sa_cb;
  sa_cb.sa_flags = SA_SIGINFO | SA_NODEFER;
  sa_cb.sa_sigaction = cb;

  struct sigaction sa_ign;
  sa_ign.sa_flags = 0;
  sa_ign.sa_handler = SIG_IGN;

  sigemptyset(&sa_cb.sa_mask);
  sigemptyset(&sa_ign.sa_mask);

  cbSignals.insert(cbSignals.begin(), {SIGINT, SIGTERM});
  cbSignals.sort();
  cbSignals.unique();

  for (auto signal : cbSignals) {
    ret = sigaction(signal, &sa_cb, nullptr);
    if (ret)
      return ret;
  }

  for (auto signal : ignoreSignals) {
    ret = sigaction(signal, &sa_ign, nullptr);
    if (ret)
      return ret;
  }

  return 0;
}

uint32_t fnv1a(const std::string &str) {
  uint32_t hash = 2166136261u;

  for (unsigned char c : str) {
    hash ^= c;
    hash *= 16777619u;
  }

  return hash;
}

bool isNetAdmin() {
  std::ifstream status(PROCFS_PATH "/self/status");
  if (!status.is_open())
    return false;

  std::string line;
  while (std::getline(status, line)) {
    if (line.rfind("CapEff:", 0) != 0)
      continue;

    auto caps = std::stoull(line.substr(7), nullptr, 16);

    return caps & (1ULL << CAP_NET_ADMIN);
  }

  return false;
}

void write_to_file(std::string data, const std::filesystem::path file) {
  Log::get("utils")->debug("{} > {}", data, file.string());
  std::ofstream outputFile(file.string());

  if (outputFile.is_open()) {
    outputFile << data;
    outputFile.close();

    if (outputFile.fail())
      throw SystemError("Failed to write to {}", file.string());
  } else
    throw SystemError("Cannot open output file {}", file.string());
}

std::string read_from_file(const std::filesystem::path file) {
  std::ifstream inputFile(file.string());
  if (!inputFile.is_open())
    throw SystemError("Cannot open input file {}", file.string());

  std::stringstream ss;
  ss << inputFile.rdbuf();

  return ss.str();
}

} // namespace utils
} // namespace wanem
