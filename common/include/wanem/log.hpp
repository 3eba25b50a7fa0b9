/* Logging.
 *
 * All components obtain named loggers from a single Log instance. Levels
 * can be overridden per logger with glob expressions, e.g. "kernel:*".
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <list>
#include <memory>
#include <mutex>
#include <string>

#include <jansson.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/spdlog.h>

namespace wanem {

using Logger = std::shared_ptr<spdlog::logger>;

class Log {

public:
  using Level = spdlog::level::level_enum;
  using DistSink = std::shared_ptr<spdlog::sinks::dist_sink_mt>;
  using Formatter = std::shared_ptr<spdlog::pattern_formatter>;

  struct Expression {
    std::string pattern; // fnmatch(3) pattern of logger names
    Level level;

    bool matches(const std::string &name) const;
  };

  static Level parseLevel(const std::string &lvl);

protected:
  DistSink sinks;
  Formatter formatter;

  Level level;

  std::string pattern; // Logging format.
  std::string prefix;  // Prefix each line with this string.

  std::list<Expression> expressions;

  std::mutex mutex;

  // Level of a logger after applying all matching expressions.
  Level levelOf(const std::string &name) const;

  void apply();

public:
  Log(Level level = Level::info);

  static Log &getInstance() {
    // Never destroyed so that loggers stay usable in static destructors
    static auto log = new Log();
    return *log;
  };

  static Logger get(const std::string &name) {
    return getInstance().getNewLogger(name);
  }

  Logger getNewLogger(const std::string &name);

  /* Parse the "logging" section of the configuration.
   *
   * { "level": "info", "file": "/var/log/wanem.log", "syslog": false,
   *   "pattern": "%v", "expressions": [ { "name": "kernel:*", "level": "debug" } ] }
   */
  void parse(json_t *json);

  void setFormatter(const std::string &pattern, const std::string &pfx = "");

  void setLevel(Level lvl);

  /* Either a plain level or a comma separated list of expressions.
   *
   * Example: "info,redirector=debug,kernel:*=trace"
   */
  void setLevel(const std::string &lvl);

  void addExpression(const std::string &pattern, Level lvl);

  Level getLevel() const { return level; }
  std::string getLevelName() const;

  void addSink(std::shared_ptr<spdlog::sinks::sink> sink);
};

} // namespace wanem
