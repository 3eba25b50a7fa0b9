/* Configuration file parsing.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdio>
#include <string>

#include <jansson.h>

#include <wanem/log.hpp>

namespace wanem {
namespace router {

/* A JSON configuration document.
 *
 * Strings may reference environment variables as ${NAME} or, with a
 * fallback value, as ${NAME:-default}.
 */
class Config {

protected:
  Logger logger;

  std::string uri;

  json_t *decode(FILE *f);

  // Substitute all variable references in a string.
  std::string substitute(const std::string &text) const;

  // Substitute variable references in all strings of a JSON tree in place.
  void expandEnvVars(json_t *json);

public:
  json_t *root;

  Config();
  Config(const std::string &u);

  ~Config();

  Config(const Config &) = delete;
  Config &operator=(const Config &) = delete;

  // Load from a stream. The caller owns the returned reference.
  json_t *load(std::FILE *f, bool resolveEnvVars = true);

  // Load from a local file or from stdin if u is "-".
  json_t *load(const std::string &u, bool resolveEnvVars = true);

  const std::string &getUri() const { return uri; }
};

} // namespace router
} // namespace wanem
