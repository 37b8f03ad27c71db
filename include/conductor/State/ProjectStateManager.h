//===- ProjectStateManager.h ------------------------------------*- C++ -*-===//
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

#ifndef CONDUCTOR_STATE_PROJECTSTATEMANAGER_H
#define CONDUCTOR_STATE_PROJECTSTATEMANAGER_H

#include "conductor/Basic/LLVM.h"
#include "conductor/State/ProjectState.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <memory>
#include <string>
#include <vector>

namespace conductor {
namespace basic {
  class Logger;
}

namespace state {

class ProjectStateDB;

/// Durable, cached record of per-project progress.
///
/// Every change runs in a single storage transaction which updates the project
/// row and appends a TransactionRecord holding the changed fields and the
/// complete prior row, so that any change can be undone with
/// \see rollbackState().
///
/// Reads are served from an in-process cache. Writes invalidate the cached
/// entry instead of updating it. The cache is private to this manager: another
/// manager (or process) writing the same store does not invalidate it, and a
/// cached read may be stale until this manager writes the project or the read
/// bypasses the cache. Writers detect stale views through
/// StateUpdate::expectedLastUpdated.
///
/// All methods are thread safe.
class ProjectStateManager {
  void* impl;

  ProjectStateManager(const ProjectStateManager&) = delete;
  ProjectStateManager& operator=(const ProjectStateManager&) = delete;

public:
  struct Options {
    /// Whether reads may be served from the in-process cache.
    bool enableCache;

    Options() : enableCache(true) {}
  };

  /// Create a manager over \p db, which it takes ownership of.
  ProjectStateManager(std::unique_ptr<ProjectStateDB> db,
                      Options options = Options(),
                      basic::Logger* logger = nullptr);
  ~ProjectStateManager();

  /// Create the state of a new, active project.
  ///
  /// Creation is not a change of state and appends no transaction record.
  /// Fails with a ValidationError if the project already exists.
  llvm::Expected<ProjectState>
  initializeProject(StringRef projectID,
                    StringRef phase = "initialization",
                    ArrayRef<std::string> pendingTasks = {},
                    const json::Object& metadata = {},
                    Optional<std::string> actor = None);

  /// Get the current state of a project.
  ///
  /// \param useCache If false, the state is read from storage (and the cache
  /// refreshed).
  llvm::Expected<ProjectState> getState(StringRef projectID,
                                        bool useCache = true);

  /// Apply the fields set in \p update.
  ///
  /// Metadata entries are merged over the current metadata; the pending task
  /// list is replaced. An update setting no fields writes nothing and returns
  /// the current state. Fails with a ConflictError, without writing, if
  /// StateUpdate::expectedLastUpdated does not match the stored state.
  llvm::Expected<ProjectState> updateState(StringRef projectID,
                                           const StateUpdate& update);

  /// Record that a task finished.
  ///
  /// Moves the task from the pending to the completed list (at most once),
  /// files the result and owning agent under the "task_results" and
  /// "task_owners" metadata entries, and clears the active task and agent.
  llvm::Expected<ProjectState>
  recordTaskCompletion(StringRef projectID, const TaskCompletion& completion);

  llvm::Expected<ProjectProgress> getProgress(StringRef projectID);

  /// Restore an earlier state of a project.
  ///
  /// The rollback is itself recorded as a "rollback_state" transaction, and so
  /// can be undone in turn. Fails with a RollbackError, without writing, if the
  /// target is ambiguous or cannot be resolved.
  llvm::Expected<ProjectState> rollbackState(StringRef projectID,
                                             const RollbackTarget& target);

  /// Save the current state of a project.
  ///
  /// \returns The identifier of the new snapshot.
  llvm::Expected<std::string> createSnapshot(StringRef projectID,
                                             Optional<std::string> takenBy = None,
                                             Optional<std::string> notes = None);

  /// Get the transaction log of a project, oldest first.
  llvm::Expected<std::vector<TransactionRecord>>
  getTransactions(StringRef projectID);

  /// Get the snapshots of a project, oldest first.
  llvm::Expected<std::vector<SnapshotRecord>> getSnapshots(StringRef projectID);
};

}
}

#endif
