/* Utilities.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <list>
#include <string>
#include <vector>

#include <signal.h>

namespace wanem {
namespace utils {

std::vector<std::string> tokenize(std::string s, const std::string &delimiter);

/* Install cb as handler for SIGINT, SIGTERM and cbSignals.
 *
 * SIGCHLD must not be ignored here: modprobe is reaped with waitpid().
 */
int signalsInit(void (*cb)(int signal, siginfo_t *sinfo, void *ctx),
                std::list<int> cbSignals = {},
                std::list<int> ignoreSignals = {SIGPIPE});

// 32 bit FNV-1a hash of a string.
uint32_t fnv1a(const std::string &str);

// Check if process is running with the CAP_NET_ADMIN capability.
bool isNetAdmin();

void write_to_file(std::string data, const std::filesystem::path file);

std::string read_from_file(const std::filesystem::path file);

} // namespace utils
} // namespace wanem
