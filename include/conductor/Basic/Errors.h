//===- Errors.h -------------------------------------------------*- C++ -*-===//
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

#ifndef CONDUCTOR_BASIC_ERRORS_H
#define CONDUCTOR_BASIC_ERRORS_H

#include "conductor/Basic/LLVM.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <system_error>

namespace conductor {

/// Error codes reported by the orchestration core.
///
/// The numeric ranges group the codes by the error class that carries them.
enum class CoreErrorCode: int {
  // 100 - Validation Errors
  NullTask = 100,
  MissingTaskID = 101,
  DuplicateTaskID = 102,
  NegativePriority = 103,
  InvalidArgument = 104,
  DuplicateProject = 105,

  // 200 - Lifecycle Errors
  InvalidTransition = 200,
  UnknownAgent = 201,

  // 300 - Lookup Errors
  ProjectNotFound = 300,

  // 400 - Concurrency Errors
  StaleState = 400,

  // 500 - Storage Errors
  StorageFailure = 500,

  // 600 - Rollback Errors
  InvalidRollbackSelector = 600,
  RollbackTargetNotFound = 601,
  MissingPreviousState = 602,
  NoTransactionBefore = 603,

  // Unknown
  Unknown = 0
};

/// The std::error_category for \see CoreErrorCode.
const std::error_category& coreErrorCategory();

std::error_code make_error_code(CoreErrorCode code);

/// Base of every error produced by the orchestration core.
///
/// Subclasses exist only so callers can dispatch on the failure class with
/// llvm::handleErrors() or Error::isA<T>().
class CoreError : public llvm::ErrorInfo<CoreError> {
  CoreErrorCode code;
  std::string message;

public:
  static char ID;

  CoreError(CoreErrorCode code, const Twine& message)
      : code(code), message(message.str()) {}

  CoreErrorCode getCode() const { return code; }
  const std::string& getMessage() const { return message; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

/// Bad input from the caller: fail fast, never retried.
class ValidationError : public llvm::ErrorInfo<ValidationError, CoreError> {
public:
  static char ID;
  ValidationError(CoreErrorCode code, const Twine& message)
      : ErrorInfo(code, message) {}
};

/// Illegal agent state transition, or an unregistered agent.
class LifecycleError : public llvm::ErrorInfo<LifecycleError, CoreError> {
public:
  static char ID;
  LifecycleError(CoreErrorCode code, const Twine& message)
      : ErrorInfo(code, message) {}
};

/// A project row does not exist.
class NotFoundError : public llvm::ErrorInfo<NotFoundError, CoreError> {
public:
  static char ID;
  explicit NotFoundError(const Twine& message)
      : ErrorInfo(CoreErrorCode::ProjectNotFound, message) {}
};

/// The caller's view of a project is stale; re-read and retry.
class ConflictError : public llvm::ErrorInfo<ConflictError, CoreError> {
public:
  static char ID;
  explicit ConflictError(const Twine& message)
      : ErrorInfo(CoreErrorCode::StaleState, message) {}
};

/// The storage layer failed to read or write project state.
class PersistenceError : public llvm::ErrorInfo<PersistenceError, CoreError> {
public:
  static char ID;
  explicit PersistenceError(const Twine& message)
      : ErrorInfo(CoreErrorCode::StorageFailure, message) {}
};

/// A rollback request could not be resolved or applied.
class RollbackError : public llvm::ErrorInfo<RollbackError, CoreError> {
public:
  static char ID;
  RollbackError(CoreErrorCode code, const Twine& message)
      : ErrorInfo(code, message) {}
};

/// Consume \p err and return the code it carried.
///
/// \returns CoreErrorCode::Unknown for success values and for errors which are
/// not CoreErrors.
CoreErrorCode takeCoreErrorCode(llvm::Error err);

}

namespace std {
template <> struct is_error_code_enum<conductor::CoreErrorCode> : true_type {};
}

#endif
