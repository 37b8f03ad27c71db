//===- AgentLifecycleManager.h ----------------------------------*- C++ -*-===//
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

#ifndef CONDUCTOR_AGENTS_AGENTLIFECYCLEMANAGER_H
#define CONDUCTOR_AGENTS_AGENTLIFECYCLEMANAGER_H

#include "conductor/Basic/LLVM.h"
#include "conductor/Basic/Timestamp.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <functional>
#include <set>
#include <string>

namespace conductor {
namespace basic {
  class Logger;
}

namespace agents {

/// The operational state of an agent instance.
///
/// Legal transitions:
///
///   start:   (unregistered), Stopped, CleanedUp -> Initializing -> Ready
///   resume:  Ready, Paused -> Active
///   pause:   Active -> Paused
///   stop:    Ready, Active, Paused -> Stopped
///   cleanup: Stopped -> CleanedUp
enum class AgentState {
  Initializing,
  Ready,
  Active,
  Paused,
  Stopped,
  CleanedUp
};

StringRef getAgentStateName(AgentState state);

/// The resources tracked for an agent instance.
struct AgentResources {
  double memoryMB = 0.0;
  std::set<std::string> openFileHandles;
  std::set<std::string> databaseConnections;

  void reset() {
    memoryMB = 0.0;
    openFileHandles.clear();
    databaseConnections.clear();
  }

  json::Object toJSON() const;
};

/// A point in time copy of an agent's lifecycle record.
///
/// Snapshots share no state with the manager.
struct AgentLifecycleSnapshot {
  std::string agentID;
  AgentState state;
  AgentResources resources;
  json::Object metadata;
  Optional<std::string> pauseReason;

  /// The external approval gate the agent is waiting on, if any.
  Optional<std::string> pauseGateID;

  basic::Timestamp lastTransitionAt;
  Optional<std::string> lastKnownTaskID;

  /// Whether the last initializer run for the agent failed.
  bool initializationFailed = false;
};

/// Resource fields to overwrite; unset fields are left alone.
struct ResourceUsageUpdate {
  Optional<double> memoryMB;
  Optional<std::set<std::string>> openFileHandles;
  Optional<std::set<std::string>> databaseConnections;
};

/// Observer of agent state changes.
///
/// Notifications are delivered synchronously while the manager lock is held;
/// the delegate may call back into the manager. Failures reported by the
/// delegate are logged and otherwise ignored.
class AgentLifecycleDelegate {
public:
  virtual ~AgentLifecycleDelegate();

  /// Called after every transition and resource update.
  ///
  /// \param payload Event specific details, e.g. "pause_reason" and "gate_id"
  /// for a pause.
  virtual llvm::Error agentStateChanged(StringRef agentID, AgentState state,
                                        const json::Object& payload) = 0;
};

/// State machine tracking the lifecycle and resource usage of each agent.
///
/// All operations are thread safe, and serialized by a single reentrant lock.
/// Illegal transitions fail with a LifecycleError naming the current state,
/// and leave the record unchanged.
class AgentLifecycleManager {
  void* impl;

  AgentLifecycleManager(const AgentLifecycleManager&) = delete;
  AgentLifecycleManager& operator=(const AgentLifecycleManager&) = delete;

public:
  typedef std::function<llvm::Error()> Initializer;

  explicit AgentLifecycleManager(AgentLifecycleDelegate* delegate = nullptr,
                                 basic::Logger* logger = nullptr);
  ~AgentLifecycleManager();

  /// Install or replace (with null, remove) the notification observer.
  void setDelegate(AgentLifecycleDelegate* delegate);

  /// Start an agent and bring it to Ready.
  ///
  /// The agent is registered on first use. The \p initializer, if any, runs
  /// without the manager lock held while the agent is Initializing; if it
  /// fails the error is returned, the agent stays Initializing and only a new
  /// start is accepted for it.
  ///
  /// \param metadata Merged into the agent's metadata.
  llvm::Expected<AgentState> startAgent(StringRef agentID,
                                        Initializer initializer = nullptr,
                                        const json::Object& metadata = {});

  /// Start an agent without an initializer.
  llvm::Expected<AgentState> registerAgent(StringRef agentID,
                                           const json::Object& metadata = {});

  /// Move a Ready or Paused agent to Active, clearing any pause details.
  ///
  /// A "task_id" entry in \p metadata becomes the agent's last known task.
  llvm::Expected<AgentState> resumeAgent(StringRef agentID,
                                         const json::Object& metadata = {});

  llvm::Expected<AgentState> pauseAgent(StringRef agentID, StringRef reason,
                                        Optional<std::string> gateID = None);

  /// Stop an agent and forget its active task.
  ///
  /// The reason is kept in the "stop_reason" metadata entry until cleanup.
  llvm::Expected<AgentState> stopAgent(StringRef agentID,
                                       Optional<std::string> reason = None);

  /// Release the resources tracked for a Stopped agent.
  llvm::Expected<AgentState> cleanupAgent(StringRef agentID);

  /// Associate an approval gate with a Paused agent.
  llvm::Error attachGate(StringRef agentID, StringRef gateID);

  /// Overwrite the tracked resources of an agent, in any state.
  llvm::Expected<AgentResources>
  updateResourceUsage(StringRef agentID, const ResourceUsageUpdate& update);

  llvm::Expected<AgentLifecycleSnapshot> getAgentStatus(StringRef agentID) const;
};

}
}

#endif
