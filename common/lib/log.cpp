/* Logging routines.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fnmatch.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

#include <wanem/exceptions.hpp>
#include <wanem/log.hpp>
#include <wanem/utils.hpp>

using namespace wanem;

bool Log::Expression::matches(const std::string &name) const {
  int flags = 0;
#ifdef FNM_EXTMATCH
  // GNU specific extension
  flags |= FNM_EXTMATCH;
#endif

  return fnmatch(pattern.c_str(), name.c_str(), flags) == 0;
}

Log::Level Log::parseLevel(const std::string &lvl) {
  auto l = spdlog::level::from_str(lvl);
  if (l == Level::off && lvl != "off")
    throw RuntimeError("Invalid log level: {}", lvl);

  return l;
}

Log::Log(Level lvl) : level(lvl), pattern("%H:%M:%S %^%l%$ %n: %v") {
  char *p = getenv("WANEM_LOG_PREFIX");
  if (p)
    prefix = p;

  sinks = std::make_shared<DistSink::element_type>();

  setFormatter(pattern, prefix);

  addSink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
}

Log::Level Log::levelOf(const std::string &name) const {
  Level lvl = level;

  // Later expressions take precedence
  for (auto &expr : expressions) {
    if (expr.matches(name))
      lvl = expr.level;
  }

  return lvl;
}

void Log::apply() {
  spdlog::apply_all(
      [this](Logger logger) { logger->set_level(levelOf(logger->name())); });
}

Logger Log::getNewLogger(const std::string &name) {
  std::lock_guard<std::mutex> guard(mutex);

  Logger logger = spdlog::get(name);
  if (!logger) {
    logger = std::make_shared<Logger::element_type>(name, sinks);

    logger->set_level(levelOf(name));

    spdlog::register_logger(logger);
  }

  return logger;
}

void Log::parse(json_t *json) {
  const char *lvl = nullptr;
  const char *path = nullptr;
  const char *pat = nullptr;

  int syslog = 0;
  int ret;

  json_error_t err;
  json_t *json_expressions = nullptr;

  ret = json_unpack_ex(json, &err, JSON_STRICT,
                       "{ s?: s, s?: s, s?: o, s?: b, s?: s }", "level", &lvl,
                       "file", &path, "expressions", &json_expressions,
                       "syslog", &syslog, "pattern", &pat);
  if (ret)
    throw ConfigError(json, err, "logging");

  if (pat)
    setFormatter(pat, prefix);

  if (path)
    addSink(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path));

  if (syslog)
    addSink(std::make_shared<spdlog::sinks::syslog_sink_mt>(
        "wanem-router", LOG_PID, LOG_DAEMON, true));

  if (json_expressions) {
    if (!json_is_array(json_expressions))
      throw ConfigError(json_expressions, "logging.expressions",
                        "The 'expressions' setting must be a list of objects.");

    size_t i;
    json_t *json_expression;
    json_array_foreach(json_expressions, i, json_expression) {
      const char *nme;
      const char *l;

      ret = json_unpack_ex(json_expression, &err, JSON_STRICT,
                           "{ s: s, s: s }", "name", &nme, "level", &l);
      if (ret)
        throw ConfigError(json_expression, err, "logging.expressions");

      expressions.push_back(Expression{nme, parseLevel(l)});
    }
  }

  if (lvl)
    setLevel(parseLevel(lvl));
  else
    apply();
}

void Log::setFormatter(const std::string &pat, const std::string &pfx) {
  pattern = pat;
  prefix = pfx;

  formatter = std::make_shared<spdlog::pattern_formatter>(
      prefix + pattern, spdlog::pattern_time_type::utc);

  sinks->set_formatter(formatter->clone());
}

void Log::setLevel(Level lvl) {
  level = lvl;

  apply();
}

void Log::setLevel(const std::string &lvl) {
  for (auto &token : utils::tokenize(lvl, ",")) {
    auto pos = token.find('=');
    if (pos == std::string::npos)
      setLevel(parseLevel(token));
    else
      addExpression(token.substr(0, pos), parseLevel(token.substr(pos + 1)));
  }
}

void Log::addExpression(const std::string &pat, Level lvl) {
  expressions.push_back(Expression{pat, lvl});

  apply();
}

std::string Log::getLevelName() const {
  auto sv = spdlog::level::to_string_view(level);

  return std::string(sv.data(), sv.size());
}

void Log::addSink(std::shared_ptr<spdlog::sinks::sink> sink) {
  sink->set_formatter(formatter->clone());

  sinks->add_sink(sink);
}
