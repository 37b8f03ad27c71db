//===- ProjectStateDB.h -----------------------------------------*- C++ -*-===//
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

#ifndef CONDUCTOR_STATE_PROJECTSTATEDB_H
#define CONDUCTOR_STATE_PROJECTSTATEDB_H

#include "conductor/Basic/LLVM.h"
#include "conductor/State/ProjectState.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>
#include <vector>

namespace conductor {
namespace state {

/// Durable storage for project state, its transaction log, and its snapshots.
///
/// Methods report failure by returning false (or, for lookups, by setting
/// \p error_out) with a diagnostic in \p error_out. Individual calls are
/// thread safe; a client grouping calls into one atomic unit brackets them
/// with \see beginTransaction() and \see commitTransaction() and is
/// responsible for serializing its own transactions.
class ProjectStateDB {
public:
  virtual ~ProjectStateDB();

  /// Start a write transaction.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool beginTransaction(std::string* error_out) = 0;

  /// Make the writes of the current transaction durable.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool commitTransaction(std::string* error_out) = 0;

  /// Discard the writes of the current transaction, if one is still open.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool rollbackTransaction(std::string* error_out) = 0;

  /// Look up the current state of a project.
  ///
  /// \param state_out [out] The state, if found.
  /// \param error_out [out] Error string if an error occurred.
  /// \returns True if the project exists.
  virtual bool lookupProject(StringRef projectID, ProjectState* state_out,
                             std::string* error_out) = 0;

  /// Create the row for a new project.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool insertProject(const ProjectState& state,
                             std::string* error_out) = 0;

  /// Overwrite every stored field of an existing project.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool updateProject(const ProjectState& state,
                             std::string* error_out) = 0;

  /// Append a record to a project's transaction log.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool insertTransaction(const TransactionRecord& record,
                                 std::string* error_out) = 0;

  /// Look up one transaction of a project.
  ///
  /// \param record_out [out] The transaction, if found.
  /// \param error_out [out] Error string if an error occurred.
  /// \returns True if the transaction exists.
  virtual bool lookupTransaction(StringRef projectID, StringRef transactionID,
                                 TransactionRecord* record_out,
                                 std::string* error_out) = 0;

  /// Find the latest transaction of a project which occurred at or before
  /// \p time. Of transactions with the same time, the last written is found.
  ///
  /// \param record_out [out] The transaction, if found.
  /// \param error_out [out] Error string if an error occurred.
  /// \returns True if such a transaction exists.
  virtual bool findTransactionBefore(StringRef projectID, basic::Timestamp time,
                                     TransactionRecord* record_out,
                                     std::string* error_out) = 0;

  /// Get the transaction log of a project, in the order it was written.
  ///
  /// \param records_out [out] The records will be appended to this vector.
  /// \param error_out [out] Error string if return value is false.
  virtual bool getTransactions(StringRef projectID,
                               std::vector<TransactionRecord>& records_out,
                               std::string* error_out) = 0;

  /// Store a new snapshot.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool insertSnapshot(const SnapshotRecord& record,
                              std::string* error_out) = 0;

  /// Look up one snapshot of a project.
  ///
  /// \param record_out [out] The snapshot, if found.
  /// \param error_out [out] Error string if an error occurred.
  /// \returns True if the snapshot exists.
  virtual bool lookupSnapshot(StringRef projectID, StringRef snapshotID,
                              SnapshotRecord* record_out,
                              std::string* error_out) = 0;

  /// Get the snapshots of a project, oldest first.
  ///
  /// \param records_out [out] The records will be appended to this vector.
  /// \param error_out [out] Error string if return value is false.
  virtual bool getSnapshots(StringRef projectID,
                            std::vector<SnapshotRecord>& records_out,
                            std::string* error_out) = 0;
};

/// Create a ProjectStateDB backed by a SQLite3 database.
///
/// The database is created if it does not exist. A database written with a
/// different schema version is never modified; opening it fails.
///
/// \param path The database file, or ":memory:" for a private in-memory store.
/// \param error_out [out] Error string if the return value is null.
std::unique_ptr<ProjectStateDB> createSQLiteProjectStateDB(
    StringRef path, std::string* error_out);

}
}

#endif
