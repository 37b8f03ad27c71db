//===-- StateCommand.cpp --------------------------------------------------===//
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

#include "conductor/Commands/Commands.h"

#include "conductor/Basic/Errors.h"
#include "conductor/Basic/Logging.h"
#include "conductor/Basic/Version.h"
#include "conductor/Commands/StateInvocation.h"
#include "conductor/State/ProjectStateCoding.h"
#include "conductor/State/ProjectStateDB.h"
#include "conductor/State/ProjectStateManager.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include <cassert>
#include <cstdio>
#include <functional>

using namespace conductor;
using namespace conductor::basic;
using namespace conductor::commands;
using namespace conductor::state;

namespace {

static const char* const LogComponent = "state";

static int stateUsage(int exitCode) {
  int optionWidth = 25;
  fprintf(stderr, "Usage: %s state [options] <action> <project> [<args>]\n",
          getProgramName());
  fprintf(stderr, "\nOptions:\n");
  fflush(stderr);
  StateInvocation::getUsage(optionWidth, llvm::errs());
  llvm::errs().flush();
  fprintf(stderr, "\nActions:\n");
  const struct {
    const char* action;
    const char* helpText;
  } actions[] = {
    { "init <project> [<task>...]", "create a project with pending tasks" },
    { "show <project>", "print the project state" },
    { "progress <project>", "print the project progress" },
    { "set-phase <project> <phase>", "change the project phase" },
    { "set-status <project> <status>", "change the project status" },
    { "complete <project> <task> [<agent>]", "record a completed task" },
    { "snapshot <project> [<notes>]", "save a snapshot of the project" },
    { "rollback <project>", "restore an earlier project state" },
    { "history <project>", "print the transaction log of the project" },
    { "snapshots <project>", "print the snapshots of the project" },
  };
  for (const auto& entry: actions) {
    fprintf(stderr, "  %-*s %s\n", optionWidth + 12, entry.action,
            entry.helpText);
  }
  return exitCode;
}

/// Print a JSON document on the standard output.
static void printJSON(json::Value value) {
  llvm::outs() << llvm::formatv("{0:2}", value) << "\n";
  llvm::outs().flush();
}

/// Report a failed operation, returning the exit status to use.
static int reportError(Logger& logger, llvm::Error err) {
  logger.error(LogComponent, llvm::toString(std::move(err)));
  return 1;
}

template <typename T>
static int printResult(Logger& logger, llvm::Expected<T> valueOrErr,
                       std::function<json::Value(const T&)> encode) {
  if (!valueOrErr)
    return reportError(logger, valueOrErr.takeError());
  printJSON(encode(*valueOrErr));
  return 0;
}

static json::Value encodeState(const ProjectState& state) {
  return encodeProjectState(state);
}

/// The number of positional arguments each action accepts, beyond its name.
struct ActionArity {
  unsigned minArgs;
  unsigned maxArgs;
};

static bool getActionArity(StringRef action, ActionArity& arity_out) {
  const unsigned unbounded = ~0U;
  auto arity = llvm::StringSwitch<Optional<ActionArity>>(action)
    .Case("init", ActionArity{1, unbounded})
    .Cases("show", "progress", "history", "snapshots", "rollback",
           ActionArity{1, 1})
    .Cases("set-phase", "set-status", ActionArity{2, 2})
    .Case("complete", ActionArity{2, 3})
    .Case("snapshot", ActionArity{1, 2})
    .Default(None);
  if (!arity)
    return false;
  arity_out = *arity;
  return true;
}

static int executeAction(const StateInvocation& invocation,
                         ProjectStateManager& manager, Logger& logger) {
  const std::string& action = invocation.positionalArgs[0];
  const std::string& projectID = invocation.positionalArgs[1];
  auto operand = [&](unsigned index) -> const std::string& {
    return invocation.positionalArgs[index + 2];
  };
  unsigned numOperands = invocation.positionalArgs.size() - 2;

  if (action == "init") {
    std::vector<std::string> pendingTasks(invocation.positionalArgs.begin() + 2,
                                          invocation.positionalArgs.end());
    return printResult<ProjectState>(
        logger, manager.initializeProject(projectID, "initialization",
                                          pendingTasks, json::Object(),
                                          invocation.actor),
        encodeState);
  }

  if (action == "show") {
    return printResult<ProjectState>(
        logger, manager.getState(projectID, invocation.enableCache),
        encodeState);
  }

  if (action == "progress") {
    return printResult<ProjectProgress>(
        logger, manager.getProgress(projectID),
        [](const ProjectProgress& progress) -> json::Value {
          return encodeProgress(progress);
        });
  }

  if (action == "set-phase" || action == "set-status") {
    StateUpdate update;
    update.actor = invocation.actor;
    update.expectedLastUpdated = invocation.expectedLastUpdated;
    if (action == "set-phase") {
      update.phase = operand(0);
    } else {
      update.status = parseProjectStatus(operand(0));
      if (!update.status) {
        fprintf(stderr, "error: %s: invalid status '%s'\n", getProgramName(),
                operand(0).c_str());
        return 1;
      }
    }
    return printResult<ProjectState>(
        logger, manager.updateState(projectID, update), encodeState);
  }

  if (action == "complete") {
    TaskCompletion completion;
    completion.taskID = operand(0);
    if (numOperands > 1)
      completion.agentID = operand(1);
    completion.resultMetadata = invocation.resultMetadata;
    completion.actor = invocation.actor;
    return printResult<ProjectState>(
        logger, manager.recordTaskCompletion(projectID, completion),
        encodeState);
  }

  if (action == "snapshot") {
    Optional<std::string> notes;
    if (numOperands > 0)
      notes = operand(0);
    return printResult<std::string>(
        logger, manager.createSnapshot(projectID, invocation.actor, notes),
        [](const std::string& id) -> json::Value {
          return json::Object{{"snapshot_id", id}};
        });
  }

  if (action == "rollback") {
    RollbackTarget target;
    target.transactionID = invocation.transactionID;
    target.snapshotID = invocation.snapshotID;
    target.restoreAt = invocation.restoreAt;
    target.actor = invocation.actor;
    return printResult<ProjectState>(
        logger, manager.rollbackState(projectID, target), encodeState);
  }

  if (action == "history") {
    return printResult<std::vector<TransactionRecord>>(
        logger, manager.getTransactions(projectID),
        [](const std::vector<TransactionRecord>& records) -> json::Value {
          json::Array result;
          for (const auto& record: records)
            result.push_back(encodeTransaction(record));
          return std::move(result);
        });
  }

  assert(action == "snapshots" && "unexpected action");
  return printResult<std::vector<SnapshotRecord>>(
      logger, manager.getSnapshots(projectID),
      [](const std::vector<SnapshotRecord>& records) -> json::Value {
        json::Array result;
        for (const auto& record: records)
          result.push_back(encodeSnapshot(record));
        return std::move(result);
      });
}

}

int commands::executeStateCommand(const std::vector<std::string> &args) {
  // The source manager to use for diagnostics.
  llvm::SourceMgr sourceMgr;

  // Create the invocation, taking the default log level from the environment.
  StateInvocation invocation{};
  if (auto level = llvm::sys::Process::GetEnv("CONDUCTOR_LOG_LEVEL")) {
    if (auto parsed = parseLogLevel(*level))
      invocation.logLevel = *parsed;
  }
  invocation.parse(args, sourceMgr);

  // Handle invocation actions.
  if (invocation.showUsage) {
    return stateUsage(0);
  } else if (invocation.showVersion) {
    printf("%s\n", getConductorFullVersion().c_str());
    return 0;
  } else if (invocation.hadErrors) {
    return stateUsage(1);
  }

  ActionArity arity;
  if (invocation.positionalArgs.empty()) {
    fprintf(stderr, "error: %s: missing action\n\n", getProgramName());
    return stateUsage(1);
  }
  const std::string& action = invocation.positionalArgs[0];
  if (!getActionArity(action, arity)) {
    fprintf(stderr, "error: %s: invalid action: '%s'\n\n", getProgramName(),
            action.c_str());
    return stateUsage(1);
  }
  unsigned numArgs = invocation.positionalArgs.size() - 1;
  if (numArgs < arity.minArgs || numArgs > arity.maxArgs) {
    fprintf(stderr, "error: %s: invalid number of arguments\n\n",
            getProgramName());
    return stateUsage(1);
  }

  StreamLogger logger(llvm::errs(), invocation.logLevel);

  // Load database
  std::string error;
  std::unique_ptr<ProjectStateDB> db =
    createSQLiteProjectStateDB(invocation.dbPath, &error);
  if (!db) {
    logger.error(LogComponent, "failed to load project state database: " +
                 error);
    return 1;
  }

  ProjectStateManager::Options options;
  options.enableCache = invocation.enableCache;
  ProjectStateManager manager(std::move(db), options, &logger);

  return executeAction(invocation, manager, logger);
}
