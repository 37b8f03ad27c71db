//===- unittests/Agents/AgentLifecycleManagerTest.cpp ---------------------===//
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

#include "../TestSupport/ErrorMatchers.h"

#include "llvm/Support/raw_ostream.h"

#include "gtest/gtest.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace conductor;
using namespace conductor::agents;

namespace {

/// A delegate which records every notification it receives.
class RecordingDelegate : public AgentLifecycleDelegate {
public:
  struct Event {
    std::string agentID;
    AgentState state;
    json::Object payload;
  };
  std::vector<Event> events;

  llvm::Error agentStateChanged(StringRef agentID, AgentState state,
                                const json::Object& payload) override {
    events.push_back(Event{agentID.str(), state, payload});
    return llvm::Error::success();
  }

  std::vector<AgentState> states() const {
    std::vector<AgentState> result;
    for (const auto& event: events)
      result.push_back(event.state);
    return result;
  }
};

/// A delegate which fails every notification.
class FailingDelegate : public AgentLifecycleDelegate {
public:
  bool shouldThrow;
  int calls = 0;

  explicit FailingDelegate(bool shouldThrow) : shouldThrow(shouldThrow) {}

  llvm::Error agentStateChanged(StringRef, AgentState,
                                const json::Object&) override {
    ++calls;
    if (shouldThrow)
      throw std::runtime_error("observer exploded");
    return llvm::make_error<llvm::StringError>(
        "observer failed", llvm::inconvertibleErrorCode());
  }
};

AgentState expectState(llvm::Expected<AgentState> result) {
  if (!result) {
    ADD_FAILURE() << "unexpected error: "
                  << llvm::toString(result.takeError());
    return AgentState::Initializing;
  }
  return *result;
}

AgentLifecycleSnapshot expectStatus(const AgentLifecycleManager& manager,
                                    StringRef agentID) {
  auto status = manager.getAgentStatus(agentID);
  if (!status) {
    ADD_FAILURE() << "unexpected error: "
                  << llvm::toString(status.takeError());
    return AgentLifecycleSnapshot();
  }
  return std::move(*status);
}

/// Bring a new agent to \p target along the shortest path.
void driveTo(AgentLifecycleManager& manager, StringRef agentID,
             AgentState target) {
  expectState(manager.registerAgent(agentID));
  if (target == AgentState::Ready)
    return;
  if (target == AgentState::Stopped || target == AgentState::CleanedUp) {
    expectState(manager.stopAgent(agentID));
    if (target == AgentState::CleanedUp)
      expectState(manager.cleanupAgent(agentID));
    return;
  }
  expectState(manager.resumeAgent(agentID));
  if (target == AgentState::Paused)
    expectState(manager.pauseAgent(agentID, "waiting"));
}

TEST(AgentLifecycleManagerTest, fullLifecycle) {
  RecordingDelegate delegate;
  AgentLifecycleManager manager(&delegate);

  EXPECT_EQ(AgentState::Ready, expectState(manager.startAgent("A1")));
  EXPECT_EQ(AgentState::Active, expectState(manager.resumeAgent(
      "A1", json::Object{{"task_id", "task-7"}})));
  EXPECT_EQ("task-7", expectStatus(manager, "A1").lastKnownTaskID.getValue());

  EXPECT_EQ(AgentState::Paused, expectState(manager.pauseAgent(
      "A1", "needs approval", std::string("gate-42"))));
  auto paused = expectStatus(manager, "A1");
  EXPECT_EQ("needs approval", paused.pauseReason.getValue());
  EXPECT_EQ("gate-42", paused.pauseGateID.getValue());

  ResourceUsageUpdate update;
  update.memoryMB = 512.0;
  update.openFileHandles = std::set<std::string>{"/tmp/log"};
  update.databaseConnections = std::set<std::string>{"main"};
  auto resources = manager.updateResourceUsage("A1", update);
  ASSERT_TRUE(bool(resources));
  EXPECT_EQ(512.0, resources->memoryMB);

  EXPECT_EQ(AgentState::Active, expectState(manager.resumeAgent("A1")));
  auto resumed = expectStatus(manager, "A1");
  EXPECT_FALSE(resumed.pauseReason.hasValue());
  EXPECT_FALSE(resumed.pauseGateID.hasValue());
  EXPECT_EQ("task-7", resumed.lastKnownTaskID.getValue());

  EXPECT_EQ(AgentState::Stopped, expectState(manager.stopAgent(
      "A1", std::string("shutdown"))));
  auto stopped = expectStatus(manager, "A1");
  EXPECT_FALSE(stopped.lastKnownTaskID.hasValue());
  ASSERT_TRUE(stopped.metadata.getString("stop_reason").hasValue());
  EXPECT_EQ("shutdown", *stopped.metadata.getString("stop_reason"));
  EXPECT_EQ(512.0, stopped.resources.memoryMB);

  EXPECT_EQ(AgentState::CleanedUp, expectState(manager.cleanupAgent("A1")));
  auto cleaned = expectStatus(manager, "A1");
  EXPECT_EQ(0.0, cleaned.resources.memoryMB);
  EXPECT_TRUE(cleaned.resources.openFileHandles.empty());
  EXPECT_TRUE(cleaned.resources.databaseConnections.empty());
  EXPECT_EQ(nullptr, cleaned.metadata.get("stop_reason"));

  std::vector<AgentState> expected{
    AgentState::Initializing, AgentState::Ready, AgentState::Active,
    AgentState::Paused, AgentState::Paused, AgentState::Active,
    AgentState::Stopped, AgentState::CleanedUp};
  EXPECT_EQ(expected, delegate.states());

  // Check the payloads of the pause and stop notifications.
  const json::Object& pausePayload = delegate.events[3].payload;
  EXPECT_EQ("needs approval", *pausePayload.getString("pause_reason"));
  EXPECT_EQ("gate-42", *pausePayload.getString("gate_id"));
  const json::Object& resourcePayload = delegate.events[4].payload;
  ASSERT_NE(nullptr, resourcePayload.getObject("resources"));
  EXPECT_EQ(512.0, *resourcePayload.getObject("resources")->getNumber(
      "memory_mb"));
  const json::Object& stopPayload = delegate.events[6].payload;
  EXPECT_EQ("shutdown", *stopPayload.getString("stop_reason"));
  EXPECT_TRUE(delegate.events[7].payload.empty());
}

TEST(AgentLifecycleManagerTest, transitionTable) {
  enum Operation { Start, Resume, Pause, Stop, Cleanup };
  const AgentState allStates[] = {
    AgentState::Ready, AgentState::Active, AgentState::Paused,
    AgentState::Stopped, AgentState::CleanedUp};

  auto isAllowed = [](AgentState from, Operation op) {
    switch (op) {
    case Start:
      return from == AgentState::Stopped || from == AgentState::CleanedUp;
    case Resume:
      return from == AgentState::Ready || from == AgentState::Paused;
    case Pause:
      return from == AgentState::Active;
    case Stop:
      return from == AgentState::Ready || from == AgentState::Active ||
        from == AgentState::Paused;
    case Cleanup:
      return from == AgentState::Stopped;
    }
    return false;
  };

  for (auto from: allStates) {
    for (auto op: {Start, Resume, Pause, Stop, Cleanup}) {
      AgentLifecycleManager manager;
      driveTo(manager, "agent", from);
      ASSERT_EQ(from, expectStatus(manager, "agent").state);

      auto apply = [&]() -> llvm::Expected<AgentState> {
        switch (op) {
        case Start: return manager.startAgent("agent");
        case Resume: return manager.resumeAgent("agent");
        case Pause: return manager.pauseAgent("agent", "reason");
        case Stop: return manager.stopAgent("agent");
        case Cleanup: break;
        }
        return manager.cleanupAgent("agent");
      };
      auto result = apply();

      SCOPED_TRACE("from " + getAgentStateName(from).str() + " op " +
                   std::to_string(op));
      if (isAllowed(from, op)) {
        EXPECT_TRUE(bool(result));
        if (!result)
          llvm::consumeError(result.takeError());
      } else {
        EXPECT_EQ(CoreErrorCode::InvalidTransition, errorCodeOf(result));
        EXPECT_EQ(from, expectStatus(manager, "agent").state);
      }
    }
  }
}

TEST(AgentLifecycleManagerTest, unknownAgent) {
  AgentLifecycleManager manager;

  auto resumed = manager.resumeAgent("ghost");
  EXPECT_TRUE(failsWith<LifecycleError>(resumed));
  auto paused = manager.pauseAgent("ghost", "reason");
  EXPECT_EQ(CoreErrorCode::UnknownAgent, errorCodeOf(paused));
  auto stopped = manager.stopAgent("ghost");
  EXPECT_EQ(CoreErrorCode::UnknownAgent, errorCodeOf(stopped));
  auto cleaned = manager.cleanupAgent("ghost");
  EXPECT_EQ(CoreErrorCode::UnknownAgent, errorCodeOf(cleaned));
  auto status = manager.getAgentStatus("ghost");
  EXPECT_EQ(CoreErrorCode::UnknownAgent, errorCodeOf(status));
  auto resources = manager.updateResourceUsage("ghost", ResourceUsageUpdate());
  EXPECT_EQ(CoreErrorCode::UnknownAgent, errorCodeOf(resources));
  EXPECT_EQ(CoreErrorCode::UnknownAgent,
            takeCoreErrorCode(manager.attachGate("ghost", "gate")));

  auto empty = manager.startAgent("");
  EXPECT_TRUE(failsWith<ValidationError>(empty));
}

TEST(AgentLifecycleManagerTest, attachGateRequiresPause) {
  RecordingDelegate delegate;
  AgentLifecycleManager manager(&delegate);
  driveTo(manager, "A2", AgentState::Active);

  EXPECT_EQ(CoreErrorCode::InvalidTransition,
            takeCoreErrorCode(manager.attachGate("A2", "gate-1")));
  EXPECT_FALSE(expectStatus(manager, "A2").pauseGateID.hasValue());

  expectState(manager.pauseAgent("A2", "review"));
  EXPECT_FALSE(bool(manager.attachGate("A2", "gate-1")));
  auto status = expectStatus(manager, "A2");
  EXPECT_EQ(AgentState::Paused, status.state);
  EXPECT_EQ("gate-1", status.pauseGateID.getValue());
  EXPECT_EQ("review", status.pauseReason.getValue());

  const json::Object& payload = delegate.events.back().payload;
  EXPECT_EQ("gate-1", *payload.getString("gate_id"));
  EXPECT_EQ("review", *payload.getString("pause_reason"));
}

TEST(AgentLifecycleManagerTest, statusIsASnapshot) {
  AgentLifecycleManager manager;
  expectState(manager.registerAgent("A3", json::Object{{"role", "planner"}}));

  auto before = expectStatus(manager, "A3");
  before.metadata["role"] = "mutated";
  before.resources.memoryMB = 99.0;

  ResourceUsageUpdate update;
  update.memoryMB = 1.5;
  ASSERT_TRUE(bool(manager.updateResourceUsage("A3", update)));

  auto after = expectStatus(manager, "A3");
  EXPECT_EQ("planner", *after.metadata.getString("role"));
  EXPECT_EQ(1.5, after.resources.memoryMB);
  EXPECT_EQ(99.0, before.resources.memoryMB);
}

TEST(AgentLifecycleManagerTest, resourceUpdateKeepsUnsetFields) {
  AgentLifecycleManager manager;
  driveTo(manager, "A4", AgentState::Stopped);

  ResourceUsageUpdate first;
  first.memoryMB = 64.0;
  first.openFileHandles = std::set<std::string>{"a", "b"};
  ASSERT_TRUE(bool(manager.updateResourceUsage("A4", first)));

  ResourceUsageUpdate second;
  second.databaseConnections = std::set<std::string>{"db"};
  auto resources = manager.updateResourceUsage("A4", second);
  ASSERT_TRUE(bool(resources));
  EXPECT_EQ(64.0, resources->memoryMB);
  EXPECT_EQ(2u, resources->openFileHandles.size());
  EXPECT_EQ(1u, resources->databaseConnections.size());

  // Updating resources is not a transition.
  EXPECT_EQ(AgentState::Stopped, expectStatus(manager, "A4").state);
}

TEST(AgentLifecycleManagerTest, delegateFailuresAreIsolated) {
  for (bool shouldThrow: {false, true}) {
    std::string output;
    llvm::raw_string_ostream os(output);
    basic::StreamLogger logger(os, basic::LogLevel::Error);

    FailingDelegate delegate(shouldThrow);
    AgentLifecycleManager manager(&delegate, &logger);

    EXPECT_EQ(AgentState::Ready, expectState(manager.startAgent("A5")));
    EXPECT_EQ(AgentState::Active, expectState(manager.resumeAgent("A5")));
    EXPECT_EQ(AgentState::Stopped, expectState(manager.stopAgent("A5")));
    EXPECT_EQ(4, delegate.calls);
    EXPECT_EQ(AgentState::Stopped, expectStatus(manager, "A5").state);

    os.flush();
    EXPECT_NE(std::string::npos, output.find(
        shouldThrow ? "observer exploded" : "observer failed"));

    // Removing the delegate stops notifications.
    manager.setDelegate(nullptr);
    expectState(manager.cleanupAgent("A5"));
    EXPECT_EQ(4, delegate.calls);
  }
}

TEST(AgentLifecycleManagerTest, failedInitializerCanBeRetried) {
  RecordingDelegate delegate;
  AgentLifecycleManager manager(&delegate);

  int attempts = 0;
  auto result = manager.startAgent("A6", [&]() -> llvm::Error {
    ++attempts;
    return llvm::make_error<llvm::StringError>(
        "model unavailable", llvm::inconvertibleErrorCode());
  });
  ASSERT_FALSE(bool(result));
  EXPECT_EQ("model unavailable", llvm::toString(result.takeError()));
  EXPECT_EQ(1, attempts);

  auto failed = expectStatus(manager, "A6");
  EXPECT_EQ(AgentState::Initializing, failed.state);
  EXPECT_TRUE(failed.initializationFailed);

  // The agent can not be used until it starts.
  auto resumed = manager.resumeAgent("A6");
  EXPECT_EQ(CoreErrorCode::InvalidTransition, errorCodeOf(resumed));

  EXPECT_EQ(AgentState::Ready, expectState(manager.startAgent(
      "A6", [&]() -> llvm::Error {
        ++attempts;
        return llvm::Error::success();
      })));
  EXPECT_EQ(2, attempts);
  EXPECT_FALSE(expectStatus(manager, "A6").initializationFailed);

  std::vector<AgentState> expected{
    AgentState::Initializing, AgentState::Initializing, AgentState::Ready};
  EXPECT_EQ(expected, delegate.states());
}

TEST(AgentLifecycleManagerTest, throwingInitializerCanBeRetried) {
  AgentLifecycleManager manager;

  EXPECT_THROW((void)manager.startAgent("A8", []() -> llvm::Error {
    throw std::runtime_error("initializer crashed");
  }), std::runtime_error);

  auto failed = expectStatus(manager, "A8");
  EXPECT_EQ(AgentState::Initializing, failed.state);
  EXPECT_TRUE(failed.initializationFailed);

  auto stopped = manager.stopAgent("A8");
  EXPECT_EQ(CoreErrorCode::InvalidTransition, errorCodeOf(stopped));

  EXPECT_EQ(AgentState::Ready, expectState(manager.startAgent(
      "A8", []() -> llvm::Error { return llvm::Error::success(); })));
  EXPECT_EQ(AgentState::Stopped, expectState(manager.stopAgent("A8")));
}

TEST(AgentLifecycleManagerTest, restartAfterStop) {
  AgentLifecycleManager manager;
  driveTo(manager, "A7", AgentState::Stopped);
  EXPECT_EQ(AgentState::Ready, expectState(manager.startAgent(
      "A7", nullptr, json::Object{{"attempt", 2}})));
  auto status = expectStatus(manager, "A7");
  EXPECT_EQ(2, *status.metadata.getInteger("attempt"));

  // A Ready agent can not be started again.
  auto again = manager.startAgent("A7");
  EXPECT_EQ(CoreErrorCode::InvalidTransition, errorCodeOf(again));
}

TEST(AgentLifecycleManagerTest, agentsAreIndependent) {
  AgentLifecycleManager manager;
  driveTo(manager, "left", AgentState::Paused);
  driveTo(manager, "right", AgentState::Ready);

  expectState(manager.stopAgent("right", std::string("done")));
  EXPECT_EQ(AgentState::Paused, expectStatus(manager, "left").state);
  EXPECT_EQ(AgentState::Stopped, expectStatus(manager, "right").state);
}

}
