//===-- Logging.cpp -------------------------------------------------------===//
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

#include "conductor/Basic/Logging.h"

#include "conductor/Basic/Timestamp.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/raw_ostream.h"

using namespace conductor;
using namespace conductor::basic;

StringRef basic::getLogLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Error: return "error";
  case LogLevel::Warning: return "warning";
  case LogLevel::Info: return "info";
  case LogLevel::Debug: return "debug";
  case LogLevel::Trace: return "trace";
  }
  return "unknown";
}

Optional<LogLevel> basic::parseLogLevel(StringRef name) {
  return llvm::StringSwitch<Optional<LogLevel>>(name.lower())
      .Case("error", LogLevel::Error)
      .Cases("warning", "warn", LogLevel::Warning)
      .Case("info", LogLevel::Info)
      .Case("debug", LogLevel::Debug)
      .Case("trace", LogLevel::Trace)
      .Default(None);
}

Logger::~Logger() {}

void Logger::log(LogLevel messageLevel, StringRef component,
                 const Twine& message) {
  if (!isEnabled(messageLevel))
    return;

  SmallString<256> rendered;
  write(messageLevel, component, message.toStringRef(rendered));
}

NullLogger::~NullLogger() {}

void NullLogger::write(LogLevel, StringRef, StringRef) {}

StreamLogger::~StreamLogger() {}

void StreamLogger::write(LogLevel messageLevel, StringRef component,
                         StringRef message) {
  std::string timestamp = formatTimestamp(currentTimestamp());

  std::lock_guard<std::mutex> guard(outputMutex);
  os << "[" << timestamp << "] " << getLogLevelName(messageLevel) << ": ";
  if (!component.empty())
    os << component << ": ";
  os << message << "\n";
  os.flush();
}

Logger& basic::getNullLogger() {
  static NullLogger logger;
  return logger;
}
