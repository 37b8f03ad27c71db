//===-- ProjectStateManager.cpp -------------------------------------------===//
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

#include "conductor/State/ProjectStateManager.h"

#include "conductor/Basic/Errors.h"
#include "conductor/Basic/Identifiers.h"
#include "conductor/Basic/Logging.h"
#include "conductor/State/ProjectStateCoding.h"
#include "conductor/State/ProjectStateDB.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/Twine.h"

#include <algorithm>
#include <mutex>

using namespace conductor;
using namespace conductor::basic;
using namespace conductor::state;

namespace {

static const char* const LogComponent = "project-state";

/// Get the time to stamp a new change with, which is strictly after the
/// previous change to the same project.
static Timestamp nextChangeTimestamp(Timestamp previous) {
  Timestamp now = currentTimestamp();
  if (now <= previous)
    now = previous + std::chrono::microseconds(1);
  return now;
}

static json::Value encodeOptional(const Optional<std::string>& value) {
  if (!value.hasValue())
    return nullptr;
  return *value;
}

/// Counts the restore selectors which are set to a usable value.
static unsigned countRollbackSelectors(const RollbackTarget& target) {
  unsigned count = 0;
  if (target.transactionID.hasValue() && !target.transactionID->empty())
    ++count;
  if (target.snapshotID.hasValue() && !target.snapshotID->empty())
    ++count;
  if (target.restoreAt.hasValue())
    ++count;
  return count;
}

class ProjectStateManagerImpl;

/// A storage transaction, rolled back unless committed.
class WriteTransaction {
  ProjectStateManagerImpl& manager;
  bool isOpen = false;

public:
  explicit WriteTransaction(ProjectStateManagerImpl& manager)
      : manager(manager) {}
  ~WriteTransaction();

  llvm::Error begin();
  llvm::Error commit();
};

class ProjectStateManagerImpl {
  friend class WriteTransaction;

  std::unique_ptr<ProjectStateDB> db;
  ProjectStateManager::Options options;
  Logger& logger;

  /// The mutex serializing all access to storage. Storage transactions span
  /// several calls, so they are serialized here rather than by the store.
  std::mutex storageMutex;

  /// The mutex protecting the cache. When both are held, storageMutex is
  /// acquired first.
  std::mutex cacheMutex;

  llvm::StringMap<ProjectState> cache;

  llvm::Error makePersistenceError(StringRef operation,
                                   const std::string& message) {
    logger.error(LogComponent, "unable to " + operation + ": " + message);
    return llvm::make_error<PersistenceError>(
        "unable to " + operation + ": " + message);
  }

  static llvm::Error makeNotFoundError(StringRef projectID) {
    return llvm::make_error<NotFoundError>(
        "no state found for project '" + projectID + "'");
  }

  void invalidateCache(StringRef projectID) {
    std::lock_guard<std::mutex> guard(cacheMutex);
    cache.erase(projectID);
  }

  /// Read a project from storage; storageMutex must be held.
  llvm::Expected<ProjectState> loadProject(StringRef projectID) {
    ProjectState state;
    std::string error;
    if (!db->lookupProject(projectID, &state, &error)) {
      if (!error.empty())
        return makePersistenceError("read project state", error);
      return makeNotFoundError(projectID);
    }
    return std::move(state);
  }

  /// Write a changed project row and its transaction record; storageMutex must
  /// be held, inside a storage transaction.
  llvm::Error writeChange(const ProjectState& previous,
                          const ProjectState& updated, StringRef changeType,
                          json::Object payload,
                          const Optional<std::string>& actor) {
    std::string error;
    if (!db->updateProject(updated, &error))
      return makePersistenceError("update project state", error);

    TransactionRecord record;
    record.id = generateIdentifier();
    record.projectID = updated.projectID;
    record.occurredAt = updated.lastUpdated;
    record.changeType = changeType.str();
    record.payload = std::move(payload);
    record.actor = actor;
    record.previousState = encodeProjectState(previous);
    if (!db->insertTransaction(record, &error))
      return makePersistenceError("record transaction", error);

    return llvm::Error::success();
  }

  /// Resolve the prior state a rollback restores; storageMutex must be held.
  llvm::Expected<json::Object> resolveRollbackTarget(
      StringRef projectID, const RollbackTarget& target) {
    std::string error;

    if (target.transactionID.hasValue() && !target.transactionID->empty()) {
      TransactionRecord record;
      if (!db->lookupTransaction(projectID, *target.transactionID, &record,
                                 &error)) {
        if (!error.empty())
          return makePersistenceError("read transaction", error);
        return llvm::make_error<RollbackError>(
            CoreErrorCode::RollbackTargetNotFound,
            "transaction '" + *target.transactionID + "' not found");
      }
      if (!record.previousState.hasValue() || record.previousState->empty()) {
        return llvm::make_error<RollbackError>(
            CoreErrorCode::MissingPreviousState,
            "transaction '" + *target.transactionID +
            "' does not contain previous state");
      }
      return std::move(*record.previousState);
    }

    if (target.snapshotID.hasValue() && !target.snapshotID->empty()) {
      SnapshotRecord record;
      if (!db->lookupSnapshot(projectID, *target.snapshotID, &record,
                              &error)) {
        if (!error.empty())
          return makePersistenceError("read snapshot", error);
        return llvm::make_error<RollbackError>(
            CoreErrorCode::RollbackTargetNotFound,
            "snapshot '" + *target.snapshotID + "' not found");
      }
      if (record.state.empty()) {
        return llvm::make_error<RollbackError>(
            CoreErrorCode::MissingPreviousState,
            "snapshot '" + *target.snapshotID + "' does not contain state");
      }
      return std::move(record.state);
    }

    TransactionRecord latest;
    if (!db->findTransactionBefore(projectID, *target.restoreAt, &latest,
                                   &error)) {
      if (!error.empty())
        return makePersistenceError("read transactions", error);
      return llvm::make_error<RollbackError>(
          CoreErrorCode::NoTransactionBefore,
          "no transaction available before " +
          formatTimestamp(*target.restoreAt));
    }
    if (!latest.previousState.hasValue() || latest.previousState->empty()) {
      return llvm::make_error<RollbackError>(
          CoreErrorCode::MissingPreviousState,
          "transaction '" + latest.id + "' does not contain previous state");
    }
    return std::move(*latest.previousState);
  }

public:
  ProjectStateManagerImpl(std::unique_ptr<ProjectStateDB> db,
                          ProjectStateManager::Options options,
                          Logger* logger)
      : db(std::move(db)), options(options),
        logger(logger ? *logger : getNullLogger()) {}

  llvm::Expected<ProjectState>
  initializeProject(StringRef projectID, StringRef phase,
                    ArrayRef<std::string> pendingTasks,
                    const json::Object& metadata,
                    const Optional<std::string>& actor) {
    if (projectID.empty()) {
      return llvm::make_error<ValidationError>(
          CoreErrorCode::InvalidArgument, "project id cannot be empty");
    }
    if (phase.empty()) {
      return llvm::make_error<ValidationError>(
          CoreErrorCode::InvalidArgument, "project phase cannot be empty");
    }

    std::lock_guard<std::mutex> guard(storageMutex);
    WriteTransaction transaction(*this);
    if (auto err = transaction.begin())
      return std::move(err);

    ProjectState existing;
    std::string error;
    if (db->lookupProject(projectID, &existing, &error)) {
      return llvm::make_error<ValidationError>(
          CoreErrorCode::DuplicateProject,
          "project '" + projectID + "' already exists");
    }
    if (!error.empty())
      return makePersistenceError("read project state", error);

    ProjectState state;
    state.projectID = projectID.str();
    state.currentPhase = phase.str();
    state.pendingTasks = pendingTasks.vec();
    state.metadata = metadata;
    state.status = ProjectStatus::Active;
    state.createdAt = currentTimestamp();
    state.lastUpdated = state.createdAt;
    if (!db->insertProject(state, &error))
      return makePersistenceError("create project state", error);

    if (auto err = transaction.commit())
      return std::move(err);

    invalidateCache(projectID);
    logger.info(LogComponent, "initialized project '" + projectID +
                "' in phase '" + phase + "'" +
                (actor.hasValue() ? " for " + *actor : std::string()));
    return std::move(state);
  }

  llvm::Expected<ProjectState> getState(StringRef projectID, bool useCache) {
    if (useCache && options.enableCache) {
      std::lock_guard<std::mutex> guard(cacheMutex);
      auto it = cache.find(projectID);
      if (it != cache.end())
        return it->second;
    }

    // The cache is filled while storage is locked, so a concurrent write can
    // not invalidate the entry before it is stored.
    std::lock_guard<std::mutex> guard(storageMutex);
    auto stateOrErr = loadProject(projectID);
    if (!stateOrErr)
      return stateOrErr.takeError();

    if (options.enableCache) {
      std::lock_guard<std::mutex> cacheGuard(cacheMutex);
      cache[projectID] = *stateOrErr;
    }
    return stateOrErr;
  }

  llvm::Expected<ProjectState> updateState(StringRef projectID,
                                           const StateUpdate& update) {
    std::lock_guard<std::mutex> guard(storageMutex);
    WriteTransaction transaction(*this);
    if (auto err = transaction.begin())
      return std::move(err);

    auto currentOrErr = loadProject(projectID);
    if (!currentOrErr)
      return currentOrErr.takeError();
    const ProjectState& current = *currentOrErr;

    if (update.expectedLastUpdated.hasValue() &&
        *update.expectedLastUpdated != current.lastUpdated) {
      logger.warning(LogComponent, "rejected stale update of project '" +
                     projectID + "'");
      return llvm::make_error<ConflictError>(
          "project '" + projectID + "' was updated at " +
          formatTimestamp(current.lastUpdated) + ", expected " +
          formatTimestamp(*update.expectedLastUpdated));
    }

    if (update.hasNoChanges())
      return std::move(*currentOrErr);

    ProjectState updated = current;
    json::Object payload;
    if (update.phase.hasValue()) {
      updated.currentPhase = *update.phase;
      payload["current_phase"] = *update.phase;
    }
    if (update.activeTaskID.hasValue()) {
      updated.activeTaskID = update.activeTaskID;
      payload["active_task_id"] = *update.activeTaskID;
    }
    if (update.activeAgentID.hasValue()) {
      updated.activeAgentID = update.activeAgentID;
      payload["active_agent_id"] = *update.activeAgentID;
    }
    if (update.status.hasValue()) {
      updated.status = *update.status;
      payload["status"] = getProjectStatusName(*update.status).str();
    }
    if (update.lastAction.hasValue()) {
      updated.lastAction = update.lastAction;
      payload["last_action"] = *update.lastAction;
    }
    if (update.metadata.hasValue()) {
      for (const auto& entry: *update.metadata)
        updated.metadata[entry.first] = entry.second;
      payload["metadata"] = json::Object(updated.metadata);
    }
    if (update.pendingTasks.hasValue()) {
      for (const auto& task: *update.pendingTasks) {
        if (llvm::is_contained(current.completedTasks, task)) {
          return llvm::make_error<ValidationError>(
              CoreErrorCode::InvalidArgument,
              "task '" + task + "' is already completed");
        }
      }
      updated.pendingTasks = *update.pendingTasks;
      payload["pending_tasks"] = encodeTaskList(updated.pendingTasks);
    }
    updated.lastUpdated = nextChangeTimestamp(current.lastUpdated);

    if (auto err = writeChange(current, updated, "update_state",
                               std::move(payload), update.actor))
      return std::move(err);
    if (auto err = transaction.commit())
      return std::move(err);

    invalidateCache(projectID);
    logger.info(LogComponent, "updated project '" + projectID + "'");
    return std::move(updated);
  }

  llvm::Expected<ProjectState>
  recordTaskCompletion(StringRef projectID, const TaskCompletion& completion) {
    if (completion.taskID.empty()) {
      return llvm::make_error<ValidationError>(
          CoreErrorCode::MissingTaskID, "completed task must have an id");
    }
    const std::string& taskID = completion.taskID;

    std::lock_guard<std::mutex> guard(storageMutex);
    WriteTransaction transaction(*this);
    if (auto err = transaction.begin())
      return std::move(err);

    auto currentOrErr = loadProject(projectID);
    if (!currentOrErr)
      return currentOrErr.takeError();
    const ProjectState& current = *currentOrErr;

    ProjectState updated = current;
    auto& pending = updated.pendingTasks;
    pending.erase(std::remove(pending.begin(), pending.end(), taskID),
                  pending.end());
    if (!llvm::is_contained(updated.completedTasks, taskID))
      updated.completedTasks.push_back(taskID);

    if (completion.resultMetadata.hasValue() &&
        !completion.resultMetadata->empty()) {
      json::Value& results = updated.metadata["task_results"];
      if (!results.getAsObject())
        results = json::Object();
      (*results.getAsObject())[taskID] =
        json::Object(*completion.resultMetadata);
    }
    if (completion.agentID.hasValue() && !completion.agentID->empty()) {
      json::Value& owners = updated.metadata["task_owners"];
      if (!owners.getAsObject())
        owners = json::Object();
      (*owners.getAsObject())[taskID] = *completion.agentID;
    }

    updated.activeTaskID = None;
    updated.activeAgentID = None;
    updated.lastAction = "Completed task " + taskID;
    updated.lastUpdated = nextChangeTimestamp(current.lastUpdated);

    json::Object payload{
      {"active_task_id", nullptr},
      {"active_agent_id", nullptr},
      {"completed_tasks", encodeTaskList(updated.completedTasks)},
      {"pending_tasks", encodeTaskList(updated.pendingTasks)},
      {"metadata", json::Object(updated.metadata)},
      {"last_action", *updated.lastAction},
    };
    if (auto err = writeChange(current, updated, "record_task_completion",
                               std::move(payload), completion.actor))
      return std::move(err);
    if (auto err = transaction.commit())
      return std::move(err);

    invalidateCache(projectID);
    logger.info(LogComponent, "project '" + projectID + "' completed task '" +
                taskID + "'");
    return std::move(updated);
  }

  llvm::Expected<ProjectState> rollbackState(StringRef projectID,
                                             const RollbackTarget& target) {
    if (countRollbackSelectors(target) != 1) {
      return llvm::make_error<RollbackError>(
          CoreErrorCode::InvalidRollbackSelector,
          "provide exactly one restore target");
    }

    std::lock_guard<std::mutex> guard(storageMutex);
    WriteTransaction transaction(*this);
    if (auto err = transaction.begin())
      return std::move(err);

    auto currentOrErr = loadProject(projectID);
    if (!currentOrErr)
      return currentOrErr.takeError();
    const ProjectState& current = *currentOrErr;

    auto documentOrErr = resolveRollbackTarget(projectID, target);
    if (!documentOrErr)
      return documentOrErr.takeError();

    ProjectState restored = current;
    std::string error;
    if (!applyStateDocument(*documentOrErr, restored, &error)) {
      return llvm::make_error<RollbackError>(
          CoreErrorCode::RollbackTargetNotFound,
          "unable to restore state of project '" + projectID + "': " + error);
    }
    restored.lastUpdated = nextChangeTimestamp(current.lastUpdated);

    json::Object payload{
      {"transaction_id", encodeOptional(target.transactionID)},
      {"snapshot_id", encodeOptional(target.snapshotID)},
      {"restore_at", target.restoreAt.hasValue() ?
        json::Value(formatTimestamp(*target.restoreAt)) : json::Value(nullptr)},
    };
    if (auto err = writeChange(current, restored, "rollback_state",
                               std::move(payload), target.actor))
      return std::move(err);
    if (auto err = transaction.commit())
      return std::move(err);

    invalidateCache(projectID);
    logger.info(LogComponent, "rolled back project '" + projectID + "'");
    return std::move(restored);
  }

  llvm::Expected<std::string> createSnapshot(StringRef projectID,
                                             const Optional<std::string>& takenBy,
                                             const Optional<std::string>& notes) {
    std::lock_guard<std::mutex> guard(storageMutex);
    WriteTransaction transaction(*this);
    if (auto err = transaction.begin())
      return std::move(err);

    auto currentOrErr = loadProject(projectID);
    if (!currentOrErr)
      return currentOrErr.takeError();

    SnapshotRecord record;
    record.id = generateIdentifier();
    record.projectID = projectID.str();
    record.snapshotAt = currentTimestamp();
    record.state = encodeProjectState(*currentOrErr);
    record.takenBy = takenBy;
    record.notes = notes;

    std::string error;
    if (!db->insertSnapshot(record, &error))
      return makePersistenceError("create snapshot", error);
    if (auto err = transaction.commit())
      return std::move(err);

    logger.info(LogComponent, "saved snapshot '" + record.id +
                "' of project '" + projectID + "'");
    return record.id;
  }

  llvm::Expected<std::vector<TransactionRecord>>
  getTransactions(StringRef projectID) {
    std::lock_guard<std::mutex> guard(storageMutex);
    auto stateOrErr = loadProject(projectID);
    if (!stateOrErr)
      return stateOrErr.takeError();

    std::vector<TransactionRecord> records;
    std::string error;
    if (!db->getTransactions(projectID, records, &error))
      return makePersistenceError("read transactions", error);
    return std::move(records);
  }

  llvm::Expected<std::vector<SnapshotRecord>>
  getSnapshots(StringRef projectID) {
    std::lock_guard<std::mutex> guard(storageMutex);
    auto stateOrErr = loadProject(projectID);
    if (!stateOrErr)
      return stateOrErr.takeError();

    std::vector<SnapshotRecord> records;
    std::string error;
    if (!db->getSnapshots(projectID, records, &error))
      return makePersistenceError("read snapshots", error);
    return std::move(records);
  }
};

WriteTransaction::~WriteTransaction() {
  if (!isOpen)
    return;

  std::string error;
  if (!manager.db->rollbackTransaction(&error)) {
    manager.logger.error(LogComponent,
                         "unable to roll back storage transaction: " + error);
  }
}

llvm::Error WriteTransaction::begin() {
  std::string error;
  if (!manager.db->beginTransaction(&error))
    return manager.makePersistenceError("begin storage transaction", error);
  isOpen = true;
  return llvm::Error::success();
}

llvm::Error WriteTransaction::commit() {
  std::string error;
  if (!manager.db->commitTransaction(&error))
    return manager.makePersistenceError("commit storage transaction", error);
  isOpen = false;
  return llvm::Error::success();
}

}

#pragma mark - ProjectStateManager

ProjectStateManager::ProjectStateManager(std::unique_ptr<ProjectStateDB> db,
                                         Options options, Logger* logger)
    : impl(new ProjectStateManagerImpl(std::move(db), options, logger)) {}

ProjectStateManager::~ProjectStateManager() {
  delete static_cast<ProjectStateManagerImpl*>(impl);
}

llvm::Expected<ProjectState>
ProjectStateManager::initializeProject(StringRef projectID, StringRef phase,
                                       ArrayRef<std::string> pendingTasks,
                                       const json::Object& metadata,
                                       Optional<std::string> actor) {
  return static_cast<ProjectStateManagerImpl*>(impl)->initializeProject(
      projectID, phase, pendingTasks, metadata, actor);
}

llvm::Expected<ProjectState>
ProjectStateManager::getState(StringRef projectID, bool useCache) {
  return static_cast<ProjectStateManagerImpl*>(impl)->getState(projectID,
                                                               useCache);
}

llvm::Expected<ProjectState>
ProjectStateManager::updateState(StringRef projectID,
                                 const StateUpdate& update) {
  return static_cast<ProjectStateManagerImpl*>(impl)->updateState(projectID,
                                                                  update);
}

llvm::Expected<ProjectState>
ProjectStateManager::recordTaskCompletion(StringRef projectID,
                                          const TaskCompletion& completion) {
  return static_cast<ProjectStateManagerImpl*>(impl)->recordTaskCompletion(
      projectID, completion);
}

llvm::Expected<ProjectProgress>
ProjectStateManager::getProgress(StringRef projectID) {
  auto stateOrErr = getState(projectID);
  if (!stateOrErr)
    return stateOrErr.takeError();

  ProjectProgress progress;
  progress.projectID = projectID.str();
  progress.completedTasks = stateOrErr->completedTasks.size();
  progress.pendingTasks = stateOrErr->pendingTasks.size();
  progress.totalTasks = progress.completedTasks + progress.pendingTasks;
  if (progress.totalTasks != 0) {
    progress.completionRatio =
      double(progress.completedTasks) / double(progress.totalTasks);
  }
  progress.status = stateOrErr->status;
  progress.lastUpdated = stateOrErr->lastUpdated;
  return progress;
}

llvm::Expected<ProjectState>
ProjectStateManager::rollbackState(StringRef projectID,
                                   const RollbackTarget& target) {
  return static_cast<ProjectStateManagerImpl*>(impl)->rollbackState(projectID,
                                                                    target);
}

llvm::Expected<std::string>
ProjectStateManager::createSnapshot(StringRef projectID,
                                    Optional<std::string> takenBy,
                                    Optional<std::string> notes) {
  return static_cast<ProjectStateManagerImpl*>(impl)->createSnapshot(
      projectID, takenBy, notes);
}

llvm::Expected<std::vector<TransactionRecord>>
ProjectStateManager::getTransactions(StringRef projectID) {
  return static_cast<ProjectStateManagerImpl*>(impl)->getTransactions(
      projectID);
}

llvm::Expected<std::vector<SnapshotRecord>>
ProjectStateManager::getSnapshots(StringRef projectID) {
  return static_cast<ProjectStateManagerImpl*>(impl)->getSnapshots(projectID);
}
