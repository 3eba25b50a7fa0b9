/* Configuration file parsing.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <regex>

#include <wanem/config_class.hpp>
#include <wanem/exceptions.hpp>
#include <wanem/router/exceptions.hpp>

using namespace wanem;
using namespace wanem::router;

Config::Config() : logger(Log::get("config")), root(nullptr) {}

Config::Config(const std::string &u) : Config() { root = load(u); }

Config::~Config() { json_decref(root); }

json_t *Config::load(std::FILE *f, bool resolveEnvVars) {
  json_t *json = decode(f);

  if (resolveEnvVars) {
    try {
      expandEnvVars(json);
    } catch (const RuntimeError &) {
      json_decref(json);
      throw;
    }
  }

  return json;
}

json_t *Config::load(const std::string &u, bool resolveEnvVars) {
  FILE *f;

  uri = u;

  if (u == "-") {
    logger->info("Reading configuration from standard input");

    return load(stdin, resolveEnvVars);
  }

  logger->info("Reading configuration from local file: {}", u);

  f = fopen(u.c_str(), "r");
  if (!f)
    throw SystemError("Failed to open configuration from: {}", u);

  json_t *json;
  try {
    json = load(f, resolveEnvVars);
  } catch (const std::runtime_error &) {
    fclose(f);
    throw;
  }

  fclose(f);

  return json;
}

json_t *Config::decode(FILE *f) {
  json_error_t err;

  json_t *json = json_loadf(f, 0, &err);
  if (json == nullptr)
    throw JanssonParseError(err);

  return json;
}

std::string Config::substitute(const std::string &text) const {
  static const std::regex env_re{R"--(\$\{([A-Za-z_][A-Za-z0-9_]*)(:-([^}]*))?\})--"};

  std::string result;
  auto begin = text.cbegin();

  std::smatch match;
  while (std::regex_search(begin, text.cend(), match, env_re)) {
    auto var_name = match[1].str();
    char *var_value = std::getenv(var_name.c_str());

    result.append(begin, match[0].first);

    if (var_value)
      result += var_value;
    else if (match[2].matched)
      result += match[3].str();
    else
      throw RuntimeError("Unresolved environment variable: {}", var_name);

    logger->debug("Replaced env var {} in \"{}\"", var_name, text);

    begin = match[0].second;
  }

  result.append(begin, text.cend());

  return result;
}

void Config::expandEnvVars(json_t *json) {
  const char *key;
  size_t index;
  json_t *val;

  switch (json_typeof(json)) {
  case JSON_STRING:
    json_string_set(json, substitute(json_string_value(json)).c_str());
    break;

  case JSON_OBJECT:
    json_object_foreach(json, key, val) expandEnvVars(val);
    break;

  case JSON_ARRAY:
    json_array_foreach(json, index, val) expandEnvVars(val);
    break;

  default:
    break;
  }
}
