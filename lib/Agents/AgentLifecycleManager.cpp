//===-- AgentLifecycleManager.cpp -----------------------------------------===//
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

#include "conductor/Agents/AgentLifecycleManager.h"

#include "conductor/Basic/Errors.h"
#include "conductor/Basic/Logging.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/Twine.h"

#include <exception>
#include <initializer_list>
#include <mutex>

using namespace conductor;
using namespace conductor::agents;
using namespace conductor::basic;

StringRef agents::getAgentStateName(AgentState state) {
  switch (state) {
  case AgentState::Initializing: return "initializing";
  case AgentState::Ready: return "ready";
  case AgentState::Active: return "active";
  case AgentState::Paused: return "paused";
  case AgentState::Stopped: return "stopped";
  case AgentState::CleanedUp: return "cleaned_up";
  }
  return "unknown";
}

static json::Array toJSONArray(const std::set<std::string>& values) {
  json::Array result;
  for (const auto& value: values)
    result.push_back(value);
  return result;
}

static json::Value toJSONValue(const Optional<std::string>& value) {
  if (!value.hasValue())
    return nullptr;
  return *value;
}

json::Object AgentResources::toJSON() const {
  return json::Object{
    {"memory_mb", memoryMB},
    {"open_file_handles", toJSONArray(openFileHandles)},
    {"database_connections", toJSONArray(databaseConnections)},
  };
}

AgentLifecycleDelegate::~AgentLifecycleDelegate() {}

namespace {

static const char* const LogComponent = "agents";

struct AgentRecord {
  std::string agentID;
  AgentState state = AgentState::Initializing;
  AgentResources resources;
  json::Object metadata;
  Optional<std::string> pauseReason;
  Optional<std::string> pauseGateID;
  Timestamp lastTransitionAt = currentTimestamp();
  Optional<std::string> lastKnownTaskID;
  bool initializationFailed = false;

  void transitionTo(AgentState newState) {
    state = newState;
    lastTransitionAt = currentTimestamp();
  }

  void mergeMetadata(const json::Object& values) {
    for (const auto& entry: values)
      metadata[entry.first] = entry.second;
  }
};

class AgentLifecycleManagerImpl {
  Logger& logger;

  /// The mutex serializing all operations. It is reentrant so the delegate
  /// may query the manager while being notified.
  mutable std::recursive_mutex managerMutex;

  AgentLifecycleDelegate* delegate;

  llvm::StringMap<AgentRecord> records;

  typedef std::lock_guard<std::recursive_mutex> Guard;

  llvm::Expected<AgentRecord*> lookupRecord(StringRef agentID) {
    auto it = records.find(agentID);
    if (it == records.end()) {
      return llvm::make_error<LifecycleError>(
          CoreErrorCode::UnknownAgent,
          "agent '" + agentID + "' is not registered");
    }
    return &it->second;
  }

  static llvm::Error makeTransitionError(const AgentRecord& record,
                                         StringRef operation) {
    return llvm::make_error<LifecycleError>(
        CoreErrorCode::InvalidTransition,
        "agent '" + record.agentID + "' cannot " + operation +
        " from state " + getAgentStateName(record.state));
  }

  static bool isOneOf(AgentState state,
                      std::initializer_list<AgentState> candidates) {
    for (auto candidate: candidates) {
      if (state == candidate)
        return true;
    }
    return false;
  }

  /// Deliver a notification to the delegate, if any.
  void notify(StringRef agentID, AgentState state, json::Object payload) {
    if (!delegate)
      return;

    try {
      if (auto err = delegate->agentStateChanged(agentID, state, payload)) {
        logger.error(LogComponent, "state change observer failed for agent '" +
                     agentID + "': " + llvm::toString(std::move(err)));
      }
    } catch (const std::exception& e) {
      logger.error(LogComponent, "state change observer threw for agent '" +
                   agentID + "': " + e.what());
    }
  }

  /// Leave the agent in INITIALIZING, accepting only a retried start.
  void markInitializationFailed(StringRef agentID) {
    Guard guard(managerMutex);
    records[agentID].initializationFailed = true;
    logger.error(LogComponent,
                 "initializer failed for agent '" + agentID + "'");
  }

  void logTransition(const AgentRecord& record) {
    logger.info(LogComponent, "agent '" + record.agentID + "' is now " +
                getAgentStateName(record.state));
  }

public:
  AgentLifecycleManagerImpl(AgentLifecycleDelegate* delegate, Logger* logger)
      : logger(logger ? *logger : getNullLogger()), delegate(delegate) {}

  void setDelegate(AgentLifecycleDelegate* value) {
    Guard guard(managerMutex);
    delegate = value;
  }

  llvm::Expected<AgentState>
  startAgent(StringRef agentID,
             const AgentLifecycleManager::Initializer& initializer,
             const json::Object& metadata) {
    if (agentID.empty()) {
      return llvm::make_error<ValidationError>(
          CoreErrorCode::InvalidArgument, "agent id cannot be empty");
    }

    {
      Guard guard(managerMutex);
      auto it = records.find(agentID);
      if (it != records.end()) {
        AgentRecord& record = it->second;
        bool retrying = record.state == AgentState::Initializing &&
          record.initializationFailed;
        if (!retrying && !isOneOf(record.state, {AgentState::Stopped,
                                                 AgentState::CleanedUp}))
          return makeTransitionError(record, "start");
      } else {
        it = records.try_emplace(agentID).first;
        it->second.agentID = agentID.str();
      }

      AgentRecord& record = it->second;
      record.initializationFailed = false;
      record.mergeMetadata(metadata);
      record.transitionTo(AgentState::Initializing);
      logTransition(record);
      notify(agentID, AgentState::Initializing,
             json::Object{{"metadata", json::Object(metadata)}});
    }

    if (initializer) {
      try {
        if (auto err = initializer()) {
          markInitializationFailed(agentID);
          return std::move(err);
        }
      } catch (...) {
        markInitializationFailed(agentID);
        throw;
      }
    }

    Guard guard(managerMutex);
    AgentRecord& record = records[agentID];
    record.transitionTo(AgentState::Ready);
    logTransition(record);
    notify(agentID, AgentState::Ready,
           json::Object{{"metadata", json::Object(metadata)}});
    return record.state;
  }

  llvm::Expected<AgentState> resumeAgent(StringRef agentID,
                                         const json::Object& metadata) {
    Guard guard(managerMutex);
    auto recordOrErr = lookupRecord(agentID);
    if (!recordOrErr)
      return recordOrErr.takeError();
    AgentRecord& record = **recordOrErr;

    if (!isOneOf(record.state, {AgentState::Ready, AgentState::Paused}))
      return makeTransitionError(record, "resume");

    record.pauseReason = None;
    record.pauseGateID = None;

    record.mergeMetadata(metadata);
    if (const json::Value* taskID = metadata.get("task_id")) {
      if (auto value = taskID->getAsString())
        record.lastKnownTaskID = value->str();
      else if (taskID->getAsNull())
        record.lastKnownTaskID = None;
    }

    record.transitionTo(AgentState::Active);
    logTransition(record);
    notify(agentID, AgentState::Active, json::Object{
      {"metadata", json::Object(metadata)},
      {"task_id", toJSONValue(record.lastKnownTaskID)},
    });
    return record.state;
  }

  llvm::Expected<AgentState> pauseAgent(StringRef agentID, StringRef reason,
                                        Optional<std::string> gateID) {
    Guard guard(managerMutex);
    auto recordOrErr = lookupRecord(agentID);
    if (!recordOrErr)
      return recordOrErr.takeError();
    AgentRecord& record = **recordOrErr;

    if (record.state != AgentState::Active)
      return makeTransitionError(record, "pause");

    record.pauseReason = reason.str();
    record.pauseGateID = std::move(gateID);
    record.transitionTo(AgentState::Paused);
    logTransition(record);
    notify(agentID, AgentState::Paused, json::Object{
      {"pause_reason", reason.str()},
      {"gate_id", toJSONValue(record.pauseGateID)},
    });
    return record.state;
  }

  llvm::Expected<AgentState> stopAgent(StringRef agentID,
                                       Optional<std::string> reason) {
    Guard guard(managerMutex);
    auto recordOrErr = lookupRecord(agentID);
    if (!recordOrErr)
      return recordOrErr.takeError();
    AgentRecord& record = **recordOrErr;

    if (!isOneOf(record.state, {AgentState::Ready, AgentState::Active,
                                AgentState::Paused}))
      return makeTransitionError(record, "stop");

    record.metadata["stop_reason"] = toJSONValue(reason);
    record.lastKnownTaskID = None;
    record.transitionTo(AgentState::Stopped);
    logTransition(record);
    notify(agentID, AgentState::Stopped, json::Object{
      {"stop_reason", reason.hasValue() ? *reason : std::string()},
    });
    return record.state;
  }

  llvm::Expected<AgentState> cleanupAgent(StringRef agentID) {
    Guard guard(managerMutex);
    auto recordOrErr = lookupRecord(agentID);
    if (!recordOrErr)
      return recordOrErr.takeError();
    AgentRecord& record = **recordOrErr;

    if (record.state != AgentState::Stopped)
      return makeTransitionError(record, "cleanup");

    record.resources.reset();
    record.metadata.erase("stop_reason");
    record.transitionTo(AgentState::CleanedUp);
    logTransition(record);
    notify(agentID, AgentState::CleanedUp, json::Object{});
    return record.state;
  }

  llvm::Error attachGate(StringRef agentID, StringRef gateID) {
    Guard guard(managerMutex);
    auto recordOrErr = lookupRecord(agentID);
    if (!recordOrErr)
      return recordOrErr.takeError();
    AgentRecord& record = **recordOrErr;

    if (record.state != AgentState::Paused) {
      return llvm::make_error<LifecycleError>(
          CoreErrorCode::InvalidTransition,
          "agent '" + agentID + "' cannot attach a gate from state " +
          getAgentStateName(record.state));
    }

    record.pauseGateID = gateID.str();
    logger.info(LogComponent, "agent '" + agentID + "' is waiting on gate '" +
                gateID + "'");
    notify(agentID, AgentState::Paused, json::Object{
      {"pause_reason", toJSONValue(record.pauseReason)},
      {"gate_id", gateID.str()},
    });
    return llvm::Error::success();
  }

  llvm::Expected<AgentResources>
  updateResourceUsage(StringRef agentID, const ResourceUsageUpdate& update) {
    Guard guard(managerMutex);
    auto recordOrErr = lookupRecord(agentID);
    if (!recordOrErr)
      return recordOrErr.takeError();
    AgentRecord& record = **recordOrErr;

    if (update.memoryMB.hasValue())
      record.resources.memoryMB = *update.memoryMB;
    if (update.openFileHandles.hasValue())
      record.resources.openFileHandles = *update.openFileHandles;
    if (update.databaseConnections.hasValue())
      record.resources.databaseConnections = *update.databaseConnections;

    logger.debug(LogComponent, "updated resources of agent '" + agentID + "'");
    notify(agentID, record.state,
           json::Object{{"resources", record.resources.toJSON()}});
    return record.resources;
  }

  llvm::Expected<AgentLifecycleSnapshot> getAgentStatus(StringRef agentID) {
    Guard guard(managerMutex);
    auto recordOrErr = lookupRecord(agentID);
    if (!recordOrErr)
      return recordOrErr.takeError();
    const AgentRecord& record = **recordOrErr;

    AgentLifecycleSnapshot snapshot;
    snapshot.agentID = record.agentID;
    snapshot.state = record.state;
    snapshot.resources = record.resources;
    snapshot.metadata = record.metadata;
    snapshot.pauseReason = record.pauseReason;
    snapshot.pauseGateID = record.pauseGateID;
    snapshot.lastTransitionAt = record.lastTransitionAt;
    snapshot.lastKnownTaskID = record.lastKnownTaskID;
    snapshot.initializationFailed = record.initializationFailed;
    return std::move(snapshot);
  }
};

}

#pragma mark - AgentLifecycleManager

AgentLifecycleManager::AgentLifecycleManager(AgentLifecycleDelegate* delegate,
                                             Logger* logger)
    : impl(new AgentLifecycleManagerImpl(delegate, logger)) {}

AgentLifecycleManager::~AgentLifecycleManager() {
  delete static_cast<AgentLifecycleManagerImpl*>(impl);
}

void AgentLifecycleManager::setDelegate(AgentLifecycleDelegate* delegate) {
  static_cast<AgentLifecycleManagerImpl*>(impl)->setDelegate(delegate);
}

llvm::Expected<AgentState>
AgentLifecycleManager::startAgent(StringRef agentID, Initializer initializer,
                                  const json::Object& metadata) {
  return static_cast<AgentLifecycleManagerImpl*>(impl)->startAgent(
      agentID, initializer, metadata);
}

llvm::Expected<AgentState>
AgentLifecycleManager::registerAgent(StringRef agentID,
                                     const json::Object& metadata) {
  return startAgent(agentID, nullptr, metadata);
}

llvm::Expected<AgentState>
AgentLifecycleManager::resumeAgent(StringRef agentID,
                                   const json::Object& metadata) {
  return static_cast<AgentLifecycleManagerImpl*>(impl)->resumeAgent(
      agentID, metadata);
}

llvm::Expected<AgentState>
AgentLifecycleManager::pauseAgent(StringRef agentID, StringRef reason,
                                  Optional<std::string> gateID) {
  return static_cast<AgentLifecycleManagerImpl*>(impl)->pauseAgent(
      agentID, reason, std::move(gateID));
}

llvm::Expected<AgentState>
AgentLifecycleManager::stopAgent(StringRef agentID,
                                 Optional<std::string> reason) {
  return static_cast<AgentLifecycleManagerImpl*>(impl)->stopAgent(
      agentID, std::move(reason));
}

llvm::Expected<AgentState>
AgentLifecycleManager::cleanupAgent(StringRef agentID) {
  return static_cast<AgentLifecycleManagerImpl*>(impl)->cleanupAgent(agentID);
}

llvm::Error AgentLifecycleManager::attachGate(StringRef agentID,
                                              StringRef gateID) {
  return static_cast<AgentLifecycleManagerImpl*>(impl)->attachGate(agentID,
                                                                   gateID);
}

llvm::Expected<AgentResources>
AgentLifecycleManager::updateResourceUsage(StringRef agentID,
                                           const ResourceUsageUpdate& update) {
  return static_cast<AgentLifecycleManagerImpl*>(impl)->updateResourceUsage(
      agentID, update);
}

llvm::Expected<AgentLifecycleSnapshot>
AgentLifecycleManager::getAgentStatus(StringRef agentID) const {
  return static_cast<AgentLifecycleManagerImpl*>(impl)->getAgentStatus(agentID);
}
