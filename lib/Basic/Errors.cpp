//===-- Errors.cpp --------------------------------------------------------===//
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

#include "conductor/Basic/Errors.h"

#include "llvm/Support/raw_ostream.h"

using namespace conductor;

char CoreError::ID = 0;
char ValidationError::ID = 0;
char LifecycleError::ID = 0;
char NotFoundError::ID = 0;
char ConflictError::ID = 0;
char PersistenceError::ID = 0;
char RollbackError::ID = 0;

namespace {

class CoreErrorCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "conductor"; }

  std::string message(int value) const override {
    switch (static_cast<CoreErrorCode>(value)) {
    case CoreErrorCode::NullTask:
      return "task is null";
    case CoreErrorCode::MissingTaskID:
      return "task has no identifier";
    case CoreErrorCode::DuplicateTaskID:
      return "task identifier is already queued";
    case CoreErrorCode::NegativePriority:
      return "priority is negative";
    case CoreErrorCode::InvalidArgument:
      return "invalid argument";
    case CoreErrorCode::DuplicateProject:
      return "project already exists";
    case CoreErrorCode::InvalidTransition:
      return "invalid lifecycle transition";
    case CoreErrorCode::UnknownAgent:
      return "agent is not registered";
    case CoreErrorCode::ProjectNotFound:
      return "project not found";
    case CoreErrorCode::StaleState:
      return "project state was updated by another writer";
    case CoreErrorCode::StorageFailure:
      return "project state could not be persisted";
    case CoreErrorCode::InvalidRollbackSelector:
      return "exactly one rollback target must be provided";
    case CoreErrorCode::RollbackTargetNotFound:
      return "rollback target not found";
    case CoreErrorCode::MissingPreviousState:
      return "transaction does not contain previous state";
    case CoreErrorCode::NoTransactionBefore:
      return "no transaction available before the requested time";
    case CoreErrorCode::Unknown:
      break;
    }
    return "unknown error";
  }
};

}

const std::error_category& conductor::coreErrorCategory() {
  static CoreErrorCategory category;
  return category;
}

std::error_code conductor::make_error_code(CoreErrorCode code) {
  return std::error_code(static_cast<int>(code), coreErrorCategory());
}

void CoreError::log(raw_ostream& os) const {
  os << message;
}

std::error_code CoreError::convertToErrorCode() const {
  return make_error_code(code);
}

CoreErrorCode conductor::takeCoreErrorCode(llvm::Error err) {
  CoreErrorCode code = CoreErrorCode::Unknown;
  llvm::handleAllErrors(std::move(err),
                        [&](const CoreError& e) { code = e.getCode(); },
                        [](const llvm::ErrorInfoBase&) {});
  return code;
}
