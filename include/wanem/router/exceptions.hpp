/* Router exceptions.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <jansson.h>

#include <wanem/exceptions.hpp>
#include <wanem/state.hpp>

namespace wanem {
namespace router {

class ParseError : public RuntimeError {

protected:
  std::string text;
  std::string file;
  int line;
  int column;

public:
  ParseError(const std::string &t, const std::string &f, int l, int c = 0)
      : RuntimeError("Failed to parse configuration: {} in {}:{}", t, f, l),
        text(t), file(f), line(l), column(c) {}
};

class JanssonParseError : public ParseError {

protected:
  json_error_t error;

public:
  JanssonParseError(json_error_t e)
      : ParseError(e.text, e.source, e.line, e.column), error(e) {}
};

// Base class of all errors which are bound to a single interface.
class RouterError : public RuntimeError {

protected:
  std::string interface;

public:
  template <typename... Args>
  RouterError(const std::string &i, const std::string &what, Args &&...args)
      : RuntimeError(what, std::forward<Args>(args)...), interface(i) {}

  const std::string &getInterface() const { return interface; }

  virtual ErrorKind getKind() const = 0;
};

class DuplicateInterfaceError : public RouterError {

public:
  DuplicateInterfaceError(const std::string &i)
      : RouterError(i, "Interface '{}' is already registered", i) {}

  ErrorKind getKind() const override { return ErrorKind::DUPLICATE_INTERFACE; }
};

class VirtualTargetCreationError : public RouterError {

public:
  template <typename... Args>
  VirtualTargetCreationError(const std::string &i, const std::string &what,
                             Args &&...args)
      : RouterError(i, what, std::forward<Args>(args)...) {}

  ErrorKind getKind() const override {
    return ErrorKind::VIRTUAL_TARGET_CREATION;
  }
};

class CapturePointExistsWithConflictingConfigError : public RouterError {

public:
  template <typename... Args>
  CapturePointExistsWithConflictingConfigError(const std::string &i,
                                               const std::string &what,
                                               Args &&...args)
      : RouterError(i, what, std::forward<Args>(args)...) {}

  ErrorKind getKind() const override {
    return ErrorKind::CAPTURE_POINT_CONFLICT;
  }
};

class RuleInstallationError : public RouterError {

public:
  template <typename... Args>
  RuleInstallationError(const std::string &i, const std::string &what,
                        Args &&...args)
      : RouterError(i, what, std::forward<Args>(args)...) {}

  ErrorKind getKind() const override { return ErrorKind::RULE_INSTALLATION; }
};

class TeardownError : public RouterError {

public:
  template <typename... Args>
  TeardownError(const std::string &i, const std::string &what, Args &&...args)
      : RouterError(i, what, std::forward<Args>(args)...) {}

  ErrorKind getKind() const override { return ErrorKind::TEARDOWN; }
};

} // namespace router
} // namespace wanem
