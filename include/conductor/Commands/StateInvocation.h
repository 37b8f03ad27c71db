//===- StateInvocation.h ----------------------------------------*- C++ -*-===//
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

#ifndef CONDUCTOR_COMMANDS_STATEINVOCATION_H
#define CONDUCTOR_COMMANDS_STATEINVOCATION_H

#include "conductor/Basic/LLVM.h"
#include "conductor/Basic/Logging.h"
#include "conductor/Basic/Timestamp.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/Support/JSON.h"

#include <string>
#include <vector>

namespace llvm {
class SourceMgr;
}

namespace conductor {
namespace commands {

/// The options of the project state subtool.
class StateInvocation {
public:
  /// Whether the command usage should be printed.
  bool showUsage = false;

  /// Whether the command version should be printed.
  bool showVersion = false;

  /// The path of the project state database.
  std::string dbPath = "conductor.db";

  /// The actor recorded on the changes made, if any.
  Optional<std::string> actor;

  /// Whether reads may be served from the state cache.
  bool enableCache = true;

  /// The minimum level of the diagnostics to show.
  basic::LogLevel logLevel = basic::LogLevel::Warning;

  /// The rollback selectors.
  Optional<std::string> transactionID;
  Optional<std::string> snapshotID;
  Optional<basic::Timestamp> restoreAt;

  /// The last update time a change expects to find, if any.
  Optional<basic::Timestamp> expectedLastUpdated;

  /// The result recorded with a completed task, if any.
  Optional<json::Object> resultMetadata;

  /// The positional arguments.
  std::vector<std::string> positionalArgs;

  /// Whether there were any parsing errors.
  bool hadErrors = false;

public:
  /// Get the appropriate "usage" text to use for the built in arguments.
  static void getUsage(int optionWidth, raw_ostream& os);

  /// Parse the invocation parameters from the given arguments.
  ///
  /// \param sourceMgr The source manager to use for diagnostics.
  void parse(ArrayRef<std::string> args, llvm::SourceMgr& sourceMgr);
};

}
}

#endif
