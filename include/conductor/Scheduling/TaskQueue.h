//===- TaskQueue.h ----------------------------------------------*- C++ -*-===//
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

#ifndef CONDUCTOR_SCHEDULING_TASKQUEUE_H
#define CONDUCTOR_SCHEDULING_TASKQUEUE_H

#include "conductor/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace conductor {
namespace basic {
  class Logger;
}

namespace scheduling {

enum class TaskStatus {
  Pending,
  Assigned,
  InProgress,
  Completed,
  Failed,
  Blocked
};

StringRef getTaskStatusName(TaskStatus status);

/// A unit of work waiting to be picked up by an agent.
struct Task {
  typedef std::chrono::steady_clock::time_point ClockTime;

  std::string taskID;
  std::string taskType;

  /// The agent specialization expected to handle the task.
  std::string agentType;

  /// The scheduling priority, larger values are more urgent.
  ///
  /// While the task is queued it is written by TaskQueue::prioritizeTask, so
  /// holders of the task may read it concurrently.
  std::atomic<int64_t> priority;

  json::Object payload;

  /// Creation time, used to order tasks of equal priority.
  ClockTime createdAt;

  TaskStatus status = TaskStatus::Pending;
  Optional<std::string> assignedAgentID;
  Optional<json::Object> result;

  Task(std::string taskID, std::string taskType, std::string agentType,
       int64_t priority = 0, json::Object payload = {})
      : taskID(std::move(taskID)), taskType(std::move(taskType)),
        agentType(std::move(agentType)), priority(priority),
        payload(std::move(payload)), createdAt(std::chrono::steady_clock::now())
  {}
};

/// Thread safe priority queue of pending tasks.
///
/// Tasks are ordered by descending priority, then by ascending creation time,
/// then by the order in which they were enqueued. Task identifiers are unique
/// among the resident tasks.
///
/// Changing the priority of a queued task or removing one rebuilds the heap,
/// which is linear in the number of queued tasks.
class TaskQueue {
  void* impl;

  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

public:
  explicit TaskQueue(basic::Logger* logger = nullptr);
  ~TaskQueue();

  /// Add \p task to the queue.
  ///
  /// Fails with a ValidationError if the task is null, has an empty
  /// identifier, has a negative priority, or shares its identifier with a
  /// queued task. The queue is unchanged on failure.
  llvm::Error enqueue(std::shared_ptr<Task> task);

  /// Remove and return the most urgent task, or null if the queue is empty.
  std::shared_ptr<Task> dequeue();

  /// Return the task the next dequeue would produce, without removing it.
  std::shared_ptr<Task> peek() const;

  /// Change the priority of a queued task.
  ///
  /// \returns True if the task was found, or false if it is not queued. Fails
  /// with a ValidationError if \p newPriority is negative.
  llvm::Expected<bool> prioritizeTask(StringRef taskID, int64_t newPriority);

  /// Cancel a queued task.
  ///
  /// \returns True if the task was removed.
  bool removeTask(StringRef taskID);

  /// Look up a queued task without removing it.
  std::shared_ptr<Task> getTaskByID(StringRef taskID) const;

  /// Get all of the queued tasks, in dequeue order.
  std::vector<std::shared_ptr<Task>> getAllTasks() const;

  size_t getPendingCount() const;

  bool isEmpty() const;

  /// Drop all queued tasks.
  void clear();
};

}
}

#endif
