//===- ProjectState.h -------------------------------------------*- C++ -*-===//
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

#ifndef CONDUCTOR_STATE_PROJECTSTATE_H
#define CONDUCTOR_STATE_PROJECTSTATE_H

#include "conductor/Basic/LLVM.h"
#include "conductor/Basic/Timestamp.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <string>
#include <vector>

namespace conductor {
namespace state {

enum class ProjectStatus {
  Active,
  Paused,
  Completed,
  Failed
};

StringRef getProjectStatusName(ProjectStatus status);
Optional<ProjectStatus> parseProjectStatus(StringRef name);

/// The durable record of a project's progress.
struct ProjectState {
  std::string projectID;
  std::string currentPhase;
  Optional<std::string> activeTaskID;
  Optional<std::string> activeAgentID;

  /// The completed task identifiers, in completion order.
  std::vector<std::string> completedTasks;

  std::vector<std::string> pendingTasks;

  /// Arbitrary caller data, merged key by key on update.
  json::Object metadata;

  ProjectStatus status = ProjectStatus::Active;

  /// A human readable description of the last change.
  Optional<std::string> lastAction;

  basic::Timestamp createdAt;
  basic::Timestamp lastUpdated;
};

bool operator==(const ProjectState& lhs, const ProjectState& rhs);
inline bool operator!=(const ProjectState& lhs, const ProjectState& rhs) {
  return !(lhs == rhs);
}

/// An append-only audit record of one change to a project.
struct TransactionRecord {
  std::string id;
  std::string projectID;
  basic::Timestamp occurredAt;

  /// The operation which made the change, e.g. "update_state".
  std::string changeType;

  /// The fields written by the change.
  json::Object payload;

  Optional<std::string> actor;

  /// The complete project row as it was before the change.
  Optional<json::Object> previousState;
};

/// A full point in time copy of a project's state.
struct SnapshotRecord {
  std::string id;
  std::string projectID;
  basic::Timestamp snapshotAt;
  json::Object state;
  Optional<std::string> takenBy;
  Optional<std::string> notes;
};

struct ProjectProgress {
  std::string projectID;
  uint64_t completedTasks = 0;
  uint64_t pendingTasks = 0;
  uint64_t totalTasks = 0;

  /// The completed fraction of all known tasks, or 0 with no tasks.
  double completionRatio = 0.0;

  ProjectStatus status = ProjectStatus::Active;
  basic::Timestamp lastUpdated;
};

/// A targeted change to a project; only the fields which are set are written.
struct StateUpdate {
  Optional<std::string> phase;
  Optional<std::string> activeTaskID;
  Optional<std::string> activeAgentID;

  /// Entries to merge into the project metadata.
  Optional<json::Object> metadata;

  /// The new pending task list, replacing the current one.
  Optional<std::vector<std::string>> pendingTasks;

  Optional<ProjectStatus> status;
  Optional<std::string> lastAction;

  /// If set, the update is rejected unless the project was last updated at
  /// exactly this time.
  Optional<basic::Timestamp> expectedLastUpdated;

  Optional<std::string> actor;

  /// Whether the update writes no fields at all.
  bool hasNoChanges() const {
    return !phase && !activeTaskID && !activeAgentID && !metadata &&
      !pendingTasks && !status && !lastAction;
  }
};

/// The outcome of a task, as recorded against its project.
struct TaskCompletion {
  std::string taskID;
  Optional<std::string> agentID;

  /// Stored as "task_results"[taskID] in the project metadata.
  Optional<json::Object> resultMetadata;

  Optional<std::string> actor;
};

/// Selects the state a rollback restores. Exactly one of the transaction,
/// snapshot, or time selectors must be given.
struct RollbackTarget {
  /// Restore the state from before this transaction.
  Optional<std::string> transactionID;

  /// Restore the state saved in this snapshot.
  Optional<std::string> snapshotID;

  /// Restore the state from before the last transaction at or before this
  /// time.
  Optional<basic::Timestamp> restoreAt;

  Optional<std::string> actor;

  static RollbackTarget toTransaction(StringRef id) {
    RollbackTarget target;
    target.transactionID = id.str();
    return target;
  }
  static RollbackTarget toSnapshot(StringRef id) {
    RollbackTarget target;
    target.snapshotID = id.str();
    return target;
  }
  static RollbackTarget toTime(basic::Timestamp time) {
    RollbackTarget target;
    target.restoreAt = time;
    return target;
  }
};

}
}

#endif
