//===-- ProjectStateCoding.cpp --------------------------------------------===//
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

#include "conductor/State/ProjectStateCoding.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/raw_ostream.h"

using namespace conductor;
using namespace conductor::basic;
using namespace conductor::state;

StringRef state::getProjectStatusName(ProjectStatus status) {
  switch (status) {
  case ProjectStatus::Active: return "active";
  case ProjectStatus::Paused: return "paused";
  case ProjectStatus::Completed: return "completed";
  case ProjectStatus::Failed: return "failed";
  }
  return "unknown";
}

Optional<ProjectStatus> state::parseProjectStatus(StringRef name) {
  return llvm::StringSwitch<Optional<ProjectStatus>>(name)
      .Case("active", ProjectStatus::Active)
      .Case("paused", ProjectStatus::Paused)
      .Case("completed", ProjectStatus::Completed)
      .Case("failed", ProjectStatus::Failed)
      .Default(None);
}

bool state::operator==(const ProjectState& lhs, const ProjectState& rhs) {
  return lhs.projectID == rhs.projectID &&
    lhs.currentPhase == rhs.currentPhase &&
    lhs.activeTaskID == rhs.activeTaskID &&
    lhs.activeAgentID == rhs.activeAgentID &&
    lhs.completedTasks == rhs.completedTasks &&
    lhs.pendingTasks == rhs.pendingTasks &&
    lhs.metadata == rhs.metadata &&
    lhs.status == rhs.status &&
    lhs.lastAction == rhs.lastAction &&
    lhs.createdAt == rhs.createdAt &&
    lhs.lastUpdated == rhs.lastUpdated;
}

std::string state::serializeJSON(const json::Value& value) {
  std::string result;
  llvm::raw_string_ostream os(result);
  os << value;
  return os.str();
}

json::Array state::encodeTaskList(ArrayRef<std::string> tasks) {
  json::Array result;
  for (const auto& task: tasks)
    result.push_back(task);
  return result;
}

static std::vector<std::string> decodeTaskArray(const json::Array& array) {
  std::vector<std::string> result;
  for (const auto& element: array) {
    if (auto task = element.getAsString())
      result.push_back(task->str());
  }
  return result;
}

std::vector<std::string> state::decodeTaskList(StringRef text) {
  auto value = json::parse(text);
  if (!value) {
    llvm::consumeError(value.takeError());
    return {};
  }
  if (const json::Array* array = value->getAsArray())
    return decodeTaskArray(*array);
  return {};
}

std::vector<std::string> state::decodeTaskList(const json::Value* value) {
  if (!value)
    return {};
  if (const json::Array* array = value->getAsArray())
    return decodeTaskArray(*array);
  if (auto text = value->getAsString())
    return decodeTaskList(*text);
  return {};
}

json::Object state::decodeObject(StringRef text) {
  auto value = json::parse(text);
  if (!value) {
    llvm::consumeError(value.takeError());
    return {};
  }
  if (json::Object* object = value->getAsObject())
    return std::move(*object);
  return {};
}

json::Object state::decodeObject(const json::Value* value) {
  if (!value)
    return {};
  if (const json::Object* object = value->getAsObject())
    return *object;
  if (auto text = value->getAsString())
    return decodeObject(*text);
  return {};
}

static json::Value encodeOptional(const Optional<std::string>& value) {
  if (!value.hasValue())
    return nullptr;
  return *value;
}

json::Object state::encodeProjectState(const ProjectState& state) {
  return json::Object{
    {"project_id", state.projectID},
    {"current_phase", state.currentPhase},
    {"active_task_id", encodeOptional(state.activeTaskID)},
    {"active_agent_id", encodeOptional(state.activeAgentID)},
    {"completed_tasks", encodeTaskList(state.completedTasks)},
    {"pending_tasks", encodeTaskList(state.pendingTasks)},
    {"metadata", json::Object(state.metadata)},
    {"status", getProjectStatusName(state.status).str()},
    {"last_action", encodeOptional(state.lastAction)},
    {"created_at", formatTimestamp(state.createdAt)},
    {"last_updated", formatTimestamp(state.lastUpdated)},
  };
}

/// Read an optional string field; null and absent fields are None.
static bool decodeOptionalString(const json::Object& document, StringRef key,
                                 Optional<std::string>& value_out,
                                 std::string* error_out) {
  const json::Value* value = document.get(key);
  if (!value || value->getAsNull()) {
    value_out = None;
    return true;
  }
  if (auto string = value->getAsString()) {
    value_out = string->str();
    return true;
  }
  *error_out = ("field '" + key + "' is not a string").str();
  return false;
}

bool state::applyStateDocument(const json::Object& document,
                               ProjectState& state, std::string* error_out) {
  auto phase = document.getString("current_phase");
  if (!phase) {
    *error_out = "state has no current phase";
    return false;
  }

  ProjectStatus status = ProjectStatus::Active;
  if (const json::Value* value = document.get("status")) {
    auto name = value->getAsString();
    Optional<ProjectStatus> parsed;
    if (name)
      parsed = parseProjectStatus(*name);
    if (!parsed) {
      *error_out = "state has an invalid status";
      return false;
    }
    status = *parsed;
  }

  Optional<std::string> activeTaskID, activeAgentID, lastAction;
  if (!decodeOptionalString(document, "active_task_id", activeTaskID,
                            error_out) ||
      !decodeOptionalString(document, "active_agent_id", activeAgentID,
                            error_out) ||
      !decodeOptionalString(document, "last_action", lastAction, error_out))
    return false;

  state.currentPhase = phase->str();
  state.activeTaskID = std::move(activeTaskID);
  state.activeAgentID = std::move(activeAgentID);
  state.completedTasks = decodeTaskList(document.get("completed_tasks"));
  state.pendingTasks = decodeTaskList(document.get("pending_tasks"));
  state.metadata = decodeObject(document.get("metadata"));
  state.status = status;
  state.lastAction = std::move(lastAction);
  return true;
}

json::Object state::encodeTransaction(const TransactionRecord& record) {
  json::Value previousState = nullptr;
  if (record.previousState.hasValue())
    previousState = json::Object(*record.previousState);

  return json::Object{
    {"id", record.id},
    {"project_id", record.projectID},
    {"occurred_at", formatTimestamp(record.occurredAt)},
    {"change_type", record.changeType},
    {"payload", json::Object(record.payload)},
    {"actor", encodeOptional(record.actor)},
    {"previous_state", std::move(previousState)},
  };
}

json::Object state::encodeSnapshot(const SnapshotRecord& record) {
  return json::Object{
    {"id", record.id},
    {"project_id", record.projectID},
    {"snapshot_at", formatTimestamp(record.snapshotAt)},
    {"state", json::Object(record.state)},
    {"taken_by", encodeOptional(record.takenBy)},
    {"notes", encodeOptional(record.notes)},
  };
}

json::Object state::encodeProgress(const ProjectProgress& progress) {
  return json::Object{
    {"project_id", progress.projectID},
    {"completed_tasks", static_cast<int64_t>(progress.completedTasks)},
    {"pending_tasks", static_cast<int64_t>(progress.pendingTasks)},
    {"total_tasks", static_cast<int64_t>(progress.totalTasks)},
    {"completion_ratio", progress.completionRatio},
    {"status", getProjectStatusName(progress.status).str()},
    {"last_updated", formatTimestamp(progress.lastUpdated)},
  };
}
