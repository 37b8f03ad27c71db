//===-- TaskQueue.cpp -----------------------------------------------------===//
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

#include "conductor/Scheduling/TaskQueue.h"

#include "conductor/Basic/Errors.h"
#include "conductor/Basic/Logging.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/Twine.h"

#include <algorithm>
#include <mutex>

using namespace conductor;
using namespace conductor::basic;
using namespace conductor::scheduling;

StringRef scheduling::getTaskStatusName(TaskStatus status) {
  switch (status) {
  case TaskStatus::Pending: return "pending";
  case TaskStatus::Assigned: return "assigned";
  case TaskStatus::InProgress: return "in_progress";
  case TaskStatus::Completed: return "completed";
  case TaskStatus::Failed: return "failed";
  case TaskStatus::Blocked: return "blocked";
  }
  return "unknown";
}

namespace {

static const char* const LogComponent = "task-queue";

struct QueueEntry {
  /// The priority the entry is ordered by.
  int64_t priority;

  Task::ClockTime createdAt;

  /// The order in which the task was enqueued.
  uint64_t sequence;

  std::shared_ptr<Task> task;
};

/// Orders entries so that the most urgent one is at the front of the heap.
struct QueueEntryLess {
  bool operator()(const QueueEntry& lhs, const QueueEntry& rhs) const {
    if (lhs.priority != rhs.priority)
      return lhs.priority < rhs.priority;
    if (lhs.createdAt != rhs.createdAt)
      return lhs.createdAt > rhs.createdAt;
    return lhs.sequence > rhs.sequence;
  }
};

class TaskQueueImpl {
  Logger& logger;

  /// The mutex which protects all queue state.
  mutable std::mutex queueMutex;

  /// The queued entries, maintained as a heap under QueueEntryLess.
  std::vector<QueueEntry> heap;

  /// The queued tasks, by identifier.
  llvm::StringMap<std::shared_ptr<Task>> tasksByID;

  uint64_t nextSequence = 0;

  void rebuildHeap() {
    std::make_heap(heap.begin(), heap.end(), QueueEntryLess());
  }

public:
  explicit TaskQueueImpl(Logger* logger)
      : logger(logger ? *logger : getNullLogger()) {}

  llvm::Error enqueue(std::shared_ptr<Task> task) {
    if (!task) {
      return llvm::make_error<ValidationError>(
          CoreErrorCode::NullTask, "task cannot be null");
    }
    if (task->taskID.empty()) {
      return llvm::make_error<ValidationError>(
          CoreErrorCode::MissingTaskID, "task must have a valid task id");
    }
    int64_t priority = task->priority.load();
    if (priority < 0) {
      return llvm::make_error<ValidationError>(
          CoreErrorCode::NegativePriority,
          "task '" + task->taskID + "' has a negative priority");
    }

    std::lock_guard<std::mutex> guard(queueMutex);
    if (tasksByID.count(task->taskID)) {
      return llvm::make_error<ValidationError>(
          CoreErrorCode::DuplicateTaskID,
          "task with id '" + task->taskID + "' is already queued");
    }

    tasksByID[task->taskID] = task;
    heap.push_back(
        QueueEntry{priority, task->createdAt, nextSequence++, task});
    std::push_heap(heap.begin(), heap.end(), QueueEntryLess());

    logger.debug(LogComponent, "enqueued task '" + task->taskID +
                 "' with priority " + Twine(priority));
    return llvm::Error::success();
  }

  std::shared_ptr<Task> dequeue() {
    std::lock_guard<std::mutex> guard(queueMutex);
    if (heap.empty())
      return nullptr;

    std::pop_heap(heap.begin(), heap.end(), QueueEntryLess());
    std::shared_ptr<Task> task = std::move(heap.back().task);
    heap.pop_back();
    tasksByID.erase(task->taskID);

    logger.debug(LogComponent, "dequeued task '" + task->taskID + "'");
    return task;
  }

  std::shared_ptr<Task> peek() const {
    std::lock_guard<std::mutex> guard(queueMutex);
    if (heap.empty())
      return nullptr;
    return heap.front().task;
  }

  llvm::Expected<bool> prioritizeTask(StringRef taskID, int64_t newPriority) {
    if (newPriority < 0) {
      return llvm::make_error<ValidationError>(
          CoreErrorCode::NegativePriority, "priority cannot be negative");
    }

    std::lock_guard<std::mutex> guard(queueMutex);
    auto it = tasksByID.find(taskID);
    if (it == tasksByID.end())
      return false;

    it->second->priority.store(newPriority);
    for (auto& entry: heap) {
      if (entry.task == it->second)
        entry.priority = newPriority;
    }
    rebuildHeap();

    logger.debug(LogComponent, "changed priority of task '" + taskID +
                 "' to " + Twine(newPriority));
    return true;
  }

  bool removeTask(StringRef taskID) {
    std::lock_guard<std::mutex> guard(queueMutex);
    auto it = tasksByID.find(taskID);
    if (it == tasksByID.end())
      return false;

    std::shared_ptr<Task> task = it->second;
    tasksByID.erase(it);
    heap.erase(std::remove_if(heap.begin(), heap.end(),
                              [&](const QueueEntry& entry) {
                                return entry.task == task;
                              }),
               heap.end());
    rebuildHeap();

    logger.debug(LogComponent, "cancelled task '" + taskID + "'");
    return true;
  }

  std::shared_ptr<Task> getTaskByID(StringRef taskID) const {
    std::lock_guard<std::mutex> guard(queueMutex);
    auto it = tasksByID.find(taskID);
    if (it == tasksByID.end())
      return nullptr;
    return it->second;
  }

  std::vector<std::shared_ptr<Task>> getAllTasks() const {
    std::vector<QueueEntry> ordered;
    {
      std::lock_guard<std::mutex> guard(queueMutex);
      ordered = heap;
    }

    // Most urgent first.
    QueueEntryLess less;
    std::sort(ordered.begin(), ordered.end(),
              [&](const QueueEntry& lhs, const QueueEntry& rhs) {
                return less(rhs, lhs);
              });

    std::vector<std::shared_ptr<Task>> result;
    result.reserve(ordered.size());
    for (auto& entry: ordered)
      result.push_back(entry.task);
    return result;
  }

  size_t getPendingCount() const {
    std::lock_guard<std::mutex> guard(queueMutex);
    return heap.size();
  }

  void clear() {
    std::lock_guard<std::mutex> guard(queueMutex);
    heap.clear();
    tasksByID.clear();
    logger.debug(LogComponent, "cleared queue");
  }
};

}

#pragma mark - TaskQueue

TaskQueue::TaskQueue(Logger* logger) : impl(new TaskQueueImpl(logger)) {}

TaskQueue::~TaskQueue() {
  delete static_cast<TaskQueueImpl*>(impl);
}

llvm::Error TaskQueue::enqueue(std::shared_ptr<Task> task) {
  return static_cast<TaskQueueImpl*>(impl)->enqueue(std::move(task));
}

std::shared_ptr<Task> TaskQueue::dequeue() {
  return static_cast<TaskQueueImpl*>(impl)->dequeue();
}

std::shared_ptr<Task> TaskQueue::peek() const {
  return static_cast<TaskQueueImpl*>(impl)->peek();
}

llvm::Expected<bool> TaskQueue::prioritizeTask(StringRef taskID,
                                               int64_t newPriority) {
  return static_cast<TaskQueueImpl*>(impl)->prioritizeTask(taskID,
                                                           newPriority);
}

bool TaskQueue::removeTask(StringRef taskID) {
  return static_cast<TaskQueueImpl*>(impl)->removeTask(taskID);
}

std::shared_ptr<Task> TaskQueue::getTaskByID(StringRef taskID) const {
  return static_cast<TaskQueueImpl*>(impl)->getTaskByID(taskID);
}

std::vector<std::shared_ptr<Task>> TaskQueue::getAllTasks() const {
  return static_cast<TaskQueueImpl*>(impl)->getAllTasks();
}

size_t TaskQueue::getPendingCount() const {
  return static_cast<TaskQueueImpl*>(impl)->getPendingCount();
}

bool TaskQueue::isEmpty() const {
  return getPendingCount() == 0;
}

void TaskQueue::clear() {
  static_cast<TaskQueueImpl*>(impl)->clear();
}
