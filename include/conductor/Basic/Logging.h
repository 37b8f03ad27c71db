//===- Logging.h ------------------------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2025 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef CONDUCTOR_BASIC_LOGGING_H
#define CONDUCTOR_BASIC_LOGGING_H

#include "conductor/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <atomic>
#include <mutex>

namespace conductor {
namespace basic {

enum class LogLevel {
  Error = 0,
  Warning = 1,
  Info = 2,
  Debug = 3,
  Trace = 4
};

StringRef getLogLevelName(LogLevel level);

/// Parse a level name ("error", "warning", "info", "debug", "trace").
Optional<LogLevel> parseLogLevel(StringRef name);

/// Diagnostic sink shared by the core components.
///
/// Components receive a Logger from their owner; there is no process-wide
/// logger. Messages above the configured level are dropped before they are
/// formatted.
class Logger {
  std::atomic<LogLevel> level;

public:
  explicit Logger(LogLevel level = LogLevel::Info) : level(level) {}
  virtual ~Logger();

  LogLevel getLevel() const { return level.load(); }
  void setLevel(LogLevel value) { level.store(value); }

  bool isEnabled(LogLevel messageLevel) const {
    return static_cast<int>(messageLevel) <= static_cast<int>(getLevel());
  }

  /// Log \p message on behalf of \p component.
  ///
  /// This method is thread safe.
  void log(LogLevel messageLevel, StringRef component, const Twine& message);

  void error(StringRef component, const Twine& message) {
    log(LogLevel::Error, component, message);
  }
  void warning(StringRef component, const Twine& message) {
    log(LogLevel::Warning, component, message);
  }
  void info(StringRef component, const Twine& message) {
    log(LogLevel::Info, component, message);
  }
  void debug(StringRef component, const Twine& message) {
    log(LogLevel::Debug, component, message);
  }

protected:
  /// Emit an already filtered and rendered message.
  virtual void write(LogLevel messageLevel, StringRef component,
                     StringRef message) = 0;
};

/// Logger which discards all output.
class NullLogger : public Logger {
public:
  NullLogger() : Logger(LogLevel::Error) {}
  ~NullLogger();

protected:
  void write(LogLevel, StringRef, StringRef) override;
};

/// Logger writing one line per message to a stream:
///
///   [2025-11-01T10:05:00.000000+00:00] info: agents: agent 'a1' is ready
class StreamLogger : public Logger {
  raw_ostream& os;
  std::mutex outputMutex;

public:
  /// Create a logger writing to \p os (which must outlive the logger).
  StreamLogger(raw_ostream& os, LogLevel level = LogLevel::Info)
      : Logger(level), os(os) {}
  ~StreamLogger();

protected:
  void write(LogLevel messageLevel, StringRef component,
             StringRef message) override;
};

/// Get a shared logger that discards all output, for components constructed
/// without one.
Logger& getNullLogger();

}
}

#endif
