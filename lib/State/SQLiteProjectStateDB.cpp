//===-- SQLiteProjectStateDB.cpp ------------------------------------------===//
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

#include "conductor/State/ProjectStateDB.h"

#include "conductor/State/ProjectStateCoding.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

#include <mutex>

#include <sqlite3.h>

using namespace conductor;
using namespace conductor::basic;
using namespace conductor::state;

ProjectStateDB::~ProjectStateDB() {}

// SQLite ProjectStateDB Implementation

// Helper macro checking and returning error messages for failed SQLite calls
#define checkSQLiteResultOKReturnFalse(result) \
if (result != SQLITE_OK) { \
  *error_out = getCurrentErrorMessage(); \
  return false; \
}

// As above, also closing the partially opened database.
#define checkSQLiteResultOKCloseReturnFalse(result) \
if (result != SQLITE_OK) { \
  *error_out = getCurrentErrorMessage(); \
  close(); \
  return false; \
}

namespace {

/// Resets a prepared statement when leaving the scope of its use, so that an
/// unfinished query never keeps the database locked.
class StatementScope {
  sqlite3_stmt* stmt;

public:
  explicit StatementScope(sqlite3_stmt* stmt) : stmt(stmt) {}
  ~StatementScope() {
    // The result repeats the status of the last step, already reported.
    (void)sqlite3_reset(stmt);
  }
};

static int bindText(sqlite3_stmt* stmt, int index, StringRef value) {
  return sqlite3_bind_text(stmt, index, value.data(), value.size(),
                           SQLITE_TRANSIENT);
}

static int bindOptionalText(sqlite3_stmt* stmt, int index,
                            const Optional<std::string>& value) {
  if (!value.hasValue())
    return sqlite3_bind_null(stmt, index);
  return bindText(stmt, index, *value);
}

static StringRef columnText(sqlite3_stmt* stmt, int index) {
  auto text = (const char*) sqlite3_column_text(stmt, index);
  if (!text)
    return StringRef();
  return StringRef(text, sqlite3_column_bytes(stmt, index));
}

static Optional<std::string> columnOptionalText(sqlite3_stmt* stmt,
                                                int index) {
  if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    return None;
  return columnText(stmt, index).str();
}

static bool decodeTimestamp(StringRef text, StringRef column,
                            Timestamp& value_out, std::string* error_out) {
  auto value = parseTimestamp(text);
  if (!value) {
    *error_out = ("invalid timestamp '" + text + "' in column '" + column +
                  "'").str();
    return false;
  }
  value_out = *value;
  return true;
}

class SQLiteProjectStateDB : public ProjectStateDB {
  /// Version History:
  /// * 1: Project state, transactions, and snapshots.
  static const int currentSchemaVersion = 1;

  std::string path;

  sqlite3 *db = nullptr;

  /// The mutex to protect all access to the database and statements.
  std::mutex dbMutex;

  std::string getCurrentErrorMessage() {
    int err_code = sqlite3_errcode(db);
    const char* err_message = sqlite3_errmsg(db);
    const char* filename = sqlite3_db_filename(db, "main");

    std::string out;
    llvm::raw_string_ostream outStream(out);
    outStream << "error: accessing project state database \""
              << (filename ? filename : "") << "\": " << err_message;

    if (err_code == SQLITE_BUSY || err_code == SQLITE_LOCKED) {
      outStream << " Possibly another process holds a lock on the database.";
    }

    outStream.flush();
    return out;
  }

  /// Read the schema version, or -1 if the schema has not been created.
  bool readSchemaVersion(int* version_out, std::string* error_out) {
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(
      db, "SELECT version FROM info LIMIT 1",
      -1, &stmt, nullptr);
    if (result == SQLITE_ERROR) {
      *version_out = -1;
      return true;
    }
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_step(stmt);
    if (result == SQLITE_DONE) {
      *version_out = -1;
    } else if (result == SQLITE_ROW) {
      *version_out = sqlite3_column_int(stmt, 0);
    } else {
      *error_out = getCurrentErrorMessage();
      sqlite3_finalize(stmt);
      return false;
    }
    sqlite3_finalize(stmt);
    return true;
  }

  bool createSchema(std::string* error_out) {
    char *cError = nullptr;

    // Create the schema in a single transaction. Another connection may be
    // racing us to do the same, hence the conditional statements.
    int result = sqlite3_exec(db, "BEGIN EXCLUSIVE;", nullptr, nullptr,
                              &cError);

    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE IF NOT EXISTS info ("
             "id INTEGER PRIMARY KEY, "
             "version INTEGER);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      char* query = sqlite3_mprintf(
        "INSERT OR IGNORE INTO info VALUES (0, %d);", currentSchemaVersion);
      result = sqlite3_exec(db, query, nullptr, nullptr, &cError);
      sqlite3_free(query);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE IF NOT EXISTS project_state ("
             "project_id TEXT PRIMARY KEY, "
             "current_phase TEXT NOT NULL, "
             "active_task_id TEXT, "
             "active_agent_id TEXT, "
             "completed_tasks TEXT NOT NULL, "
             "pending_tasks TEXT NOT NULL, "
             "metadata TEXT NOT NULL, "
             "status TEXT NOT NULL CHECK (status IN "
             "('active', 'paused', 'completed', 'failed')), "
             "last_action TEXT, "
             "created_at TEXT NOT NULL, "
             "last_updated TEXT NOT NULL);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE IF NOT EXISTS project_state_snapshots ("
             "id TEXT PRIMARY KEY, "
             "project_id TEXT NOT NULL, "
             "snapshot_at TEXT NOT NULL, "
             "state TEXT NOT NULL, "
             "taken_by TEXT, "
             "notes TEXT, "
             "FOREIGN KEY(project_id) REFERENCES project_state(project_id) "
             "ON DELETE CASCADE);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE IF NOT EXISTS project_state_transactions ("
             "id TEXT PRIMARY KEY, "
             "project_id TEXT NOT NULL, "
             "occurred_at TEXT NOT NULL, "
             "change_type TEXT NOT NULL, "
             "payload TEXT NOT NULL, "
             "actor TEXT, "
             "previous_state TEXT, "
             "FOREIGN KEY(project_id) REFERENCES project_state(project_id) "
             "ON DELETE CASCADE);"),
        nullptr, nullptr, &cError);
    }

    // Create the indices used to list the records of a project.
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE INDEX IF NOT EXISTS project_state_snapshots_idx "
             "ON project_state_snapshots (project_id);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE INDEX IF NOT EXISTS project_state_transactions_idx "
             "ON project_state_transactions (project_id, occurred_at);"),
        nullptr, nullptr, &cError);
    }

    // Sync changes to disk.
    if (result == SQLITE_OK) {
      result = sqlite3_exec(db, "END;", nullptr, nullptr, &cError);
    }

    if (result != SQLITE_OK) {
      *error_out = (std::string("unable to initialize database (") +
                    (cError ? cError : sqlite3_errstr(result)) + ")");
      sqlite3_free(cError);
      return false;
    }

    return true;
  }

  bool open(std::string *error_out) {
    // The db is opened lazily whenever an operation on it occurs. Thus if it is
    // already open, we don't need to do any further work.
    if (db) return true;

    // Configure SQLite3 on first use.
    //
    // We attempt to set multi-threading mode, but can settle for serialized if
    // the library can't be reinitialized (there are only two modes).
    static int sqliteConfigureResult = []() -> int {
      // We access a single connection from multiple threads.
      return sqlite3_config(SQLITE_CONFIG_MULTITHREAD);
    }();
    if (sqliteConfigureResult != SQLITE_OK) {
      if (!sqlite3_threadsafe()) {
        *error_out = "unable to configure database: not thread-safe";
        return false;
      }
    }

    int result = sqlite3_open(path.c_str(), &db);
    if (result != SQLITE_OK) {
      *error_out = "unable to open database: " + std::string(
          sqlite3_errstr(result));
      sqlite3_close(db);
      db = nullptr;
      return false;
    }

    sqlite3_busy_timeout(db, 5000);

    result = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr,
                          nullptr);
    if (result != SQLITE_OK) {
      *error_out = getCurrentErrorMessage();
      close();
      return false;
    }

    // Create the database schema, if necessary.
    int version;
    if (!readSchemaVersion(&version, error_out)) {
      close();
      return false;
    }
    if (version == -1) {
      if (!createSchema(error_out) || !readSchemaVersion(&version, error_out)) {
        close();
        return false;
      }
    }

    // Stored audit data is never discarded, so a store written by another
    // schema version is an error.
    if (version != currentSchemaVersion) {
      *error_out = ("version mismatch (database-schema: " + Twine(version) +
                    " requested schema: " + Twine(currentSchemaVersion) +
                    ")").str();
      close();
      return false;
    }

    // Initialize prepared statements.
    result = sqlite3_prepare_v2(
      db, findProjectStmtSQL,
      -1, &findProjectStmt, nullptr);
    checkSQLiteResultOKCloseReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, insertProjectStmtSQL,
      -1, &insertProjectStmt, nullptr);
    checkSQLiteResultOKCloseReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, updateProjectStmtSQL,
      -1, &updateProjectStmt, nullptr);
    checkSQLiteResultOKCloseReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, insertTransactionStmtSQL,
      -1, &insertTransactionStmt, nullptr);
    checkSQLiteResultOKCloseReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, findTransactionStmtSQL,
      -1, &findTransactionStmt, nullptr);
    checkSQLiteResultOKCloseReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, findTransactionBeforeStmtSQL,
      -1, &findTransactionBeforeStmt, nullptr);
    checkSQLiteResultOKCloseReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, getTransactionsStmtSQL,
      -1, &getTransactionsStmt, nullptr);
    checkSQLiteResultOKCloseReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, insertSnapshotStmtSQL,
      -1, &insertSnapshotStmt, nullptr);
    checkSQLiteResultOKCloseReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, findSnapshotStmtSQL,
      -1, &findSnapshotStmt, nullptr);
    checkSQLiteResultOKCloseReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, getSnapshotsStmtSQL,
      -1, &getSnapshotsStmt, nullptr);
    checkSQLiteResultOKCloseReturnFalse(result);

    return true;
  }

  void close() {
    if (!db) return;

    // Destroy prepared statements.
    sqlite3_stmt** statements[] = {
      &findProjectStmt, &insertProjectStmt, &updateProjectStmt,
      &insertTransactionStmt, &findTransactionStmt,
      &findTransactionBeforeStmt, &getTransactionsStmt,
      &insertSnapshotStmt, &findSnapshotStmt, &getSnapshotsStmt };
    for (auto stmt: statements) {
      sqlite3_finalize(*stmt);
      *stmt = nullptr;
    }

    sqlite3_close(db);
    db = nullptr;
  }

  /// Bind every stored column of \p state, with the project id last.
  bool bindProjectColumns(sqlite3_stmt* stmt, const ProjectState& state,
                          int projectIDIndex, int firstFieldIndex,
                          std::string* error_out) {
    int index = firstFieldIndex;
    int result = bindText(stmt, projectIDIndex, state.projectID);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, index++, state.currentPhase);
    checkSQLiteResultOKReturnFalse(result);
    result = bindOptionalText(stmt, index++, state.activeTaskID);
    checkSQLiteResultOKReturnFalse(result);
    result = bindOptionalText(stmt, index++, state.activeAgentID);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, index++,
                      serializeJSON(encodeTaskList(state.completedTasks)));
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, index++,
                      serializeJSON(encodeTaskList(state.pendingTasks)));
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, index++,
                      serializeJSON(json::Object(state.metadata)));
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, index++, getProjectStatusName(state.status));
    checkSQLiteResultOKReturnFalse(result);
    result = bindOptionalText(stmt, index++, state.lastAction);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, index++, formatTimestamp(state.createdAt));
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, index++, formatTimestamp(state.lastUpdated));
    checkSQLiteResultOKReturnFalse(result);
    return true;
  }

  bool readProjectRow(sqlite3_stmt* stmt, ProjectState* state_out,
                      std::string* error_out) {
    ProjectState state;
    state.projectID = columnText(stmt, 0).str();
    state.currentPhase = columnText(stmt, 1).str();
    state.activeTaskID = columnOptionalText(stmt, 2);
    state.activeAgentID = columnOptionalText(stmt, 3);
    state.completedTasks = decodeTaskList(columnText(stmt, 4));
    state.pendingTasks = decodeTaskList(columnText(stmt, 5));
    state.metadata = decodeObject(columnText(stmt, 6));

    StringRef status = columnText(stmt, 7);
    auto parsedStatus = parseProjectStatus(status);
    if (!parsedStatus) {
      *error_out = ("invalid status '" + status + "' for project '" +
                    state.projectID + "'").str();
      return false;
    }
    state.status = *parsedStatus;
    state.lastAction = columnOptionalText(stmt, 8);

    if (!decodeTimestamp(columnText(stmt, 9), "created_at", state.createdAt,
                         error_out) ||
        !decodeTimestamp(columnText(stmt, 10), "last_updated",
                         state.lastUpdated, error_out))
      return false;

    *state_out = std::move(state);
    return true;
  }

  bool readTransactionRow(sqlite3_stmt* stmt, TransactionRecord* record_out,
                          std::string* error_out) {
    TransactionRecord record;
    record.id = columnText(stmt, 0).str();
    record.projectID = columnText(stmt, 1).str();
    if (!decodeTimestamp(columnText(stmt, 2), "occurred_at",
                         record.occurredAt, error_out))
      return false;
    record.changeType = columnText(stmt, 3).str();
    record.payload = decodeObject(columnText(stmt, 4));
    record.actor = columnOptionalText(stmt, 5);
    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL)
      record.previousState = decodeObject(columnText(stmt, 6));

    *record_out = std::move(record);
    return true;
  }

  bool readSnapshotRow(sqlite3_stmt* stmt, SnapshotRecord* record_out,
                       std::string* error_out) {
    SnapshotRecord record;
    record.id = columnText(stmt, 0).str();
    record.projectID = columnText(stmt, 1).str();
    if (!decodeTimestamp(columnText(stmt, 2), "snapshot_at",
                         record.snapshotAt, error_out))
      return false;
    record.state = decodeObject(columnText(stmt, 3));
    record.takenBy = columnOptionalText(stmt, 4);
    record.notes = columnOptionalText(stmt, 5);

    *record_out = std::move(record);
    return true;
  }

  /// Run a statement which produces no rows.
  bool stepToCompletion(sqlite3_stmt* stmt, std::string* error_out) {
    int result = sqlite3_step(stmt);
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }
    return true;
  }

public:
  explicit SQLiteProjectStateDB(StringRef path) : path(path) { }

  virtual ~SQLiteProjectStateDB() {
    std::lock_guard<std::mutex> guard(dbMutex);
    if (db)
      close();
  }

  bool openDatabase(std::string* error_out) {
    std::lock_guard<std::mutex> guard(dbMutex);
    return open(error_out);
  }

  /// @name ProjectStateDB API
  /// @{

  virtual bool beginTransaction(std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out))
      return false;

    // Take the write lock up front, so the reads of the transaction are never
    // invalidated by another writer.
    int result = sqlite3_exec(db, "BEGIN IMMEDIATE;", nullptr, nullptr,
                              nullptr);
    checkSQLiteResultOKReturnFalse(result);
    return true;
  }

  virtual bool commitTransaction(std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out))
      return false;

    int result = sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr);
    checkSQLiteResultOKReturnFalse(result);
    return true;
  }

  virtual bool rollbackTransaction(std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out))
      return false;

    // SQLite rolls back on its own after some failures.
    if (sqlite3_get_autocommit(db))
      return true;

    int result = sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
    checkSQLiteResultOKReturnFalse(result);
    return true;
  }

  static constexpr const char *findProjectStmtSQL = (
      "SELECT project_id, current_phase, active_task_id, active_agent_id, "
      "completed_tasks, pending_tasks, metadata, status, last_action, "
      "created_at, last_updated FROM project_state "
      "WHERE project_id == ? LIMIT 1;");
  sqlite3_stmt* findProjectStmt = nullptr;

  virtual bool lookupProject(StringRef projectID, ProjectState* state_out,
                             std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    StatementScope scope(findProjectStmt);
    int result = sqlite3_clear_bindings(findProjectStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(findProjectStmt, /*index=*/1, projectID);
    checkSQLiteResultOKReturnFalse(result);

    // If the project wasn't found, we are done.
    result = sqlite3_step(findProjectStmt);
    if (result == SQLITE_DONE)
      return false;
    if (result != SQLITE_ROW) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    return readProjectRow(findProjectStmt, state_out, error_out);
  }

  static constexpr const char *insertProjectStmtSQL = (
      "INSERT INTO project_state (project_id, current_phase, active_task_id, "
      "active_agent_id, completed_tasks, pending_tasks, metadata, status, "
      "last_action, created_at, last_updated) "
      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
  sqlite3_stmt* insertProjectStmt = nullptr;

  virtual bool insertProject(const ProjectState& state,
                             std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    StatementScope scope(insertProjectStmt);
    int result = sqlite3_clear_bindings(insertProjectStmt);
    checkSQLiteResultOKReturnFalse(result);
    if (!bindProjectColumns(insertProjectStmt, state, /*projectIDIndex=*/1,
                            /*firstFieldIndex=*/2, error_out))
      return false;

    return stepToCompletion(insertProjectStmt, error_out);
  }

  static constexpr const char *updateProjectStmtSQL = (
      "UPDATE project_state SET current_phase = ?, active_task_id = ?, "
      "active_agent_id = ?, completed_tasks = ?, pending_tasks = ?, "
      "metadata = ?, status = ?, last_action = ?, created_at = ?, "
      "last_updated = ? WHERE project_id == ?;");
  sqlite3_stmt* updateProjectStmt = nullptr;

  virtual bool updateProject(const ProjectState& state,
                             std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    StatementScope scope(updateProjectStmt);
    int result = sqlite3_clear_bindings(updateProjectStmt);
    checkSQLiteResultOKReturnFalse(result);
    if (!bindProjectColumns(updateProjectStmt, state, /*projectIDIndex=*/11,
                            /*firstFieldIndex=*/1, error_out))
      return false;

    if (!stepToCompletion(updateProjectStmt, error_out))
      return false;

    if (sqlite3_changes(db) != 1) {
      *error_out = "no stored state for project '" + state.projectID + "'";
      return false;
    }
    return true;
  }

  static constexpr const char *insertTransactionStmtSQL = (
      "INSERT INTO project_state_transactions (id, project_id, occurred_at, "
      "change_type, payload, actor, previous_state) "
      "VALUES (?, ?, ?, ?, ?, ?, ?);");
  sqlite3_stmt* insertTransactionStmt = nullptr;

  virtual bool insertTransaction(const TransactionRecord& record,
                                 std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    sqlite3_stmt* stmt = insertTransactionStmt;
    StatementScope scope(stmt);
    int result = sqlite3_clear_bindings(stmt);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, /*index=*/1, record.id);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, /*index=*/2, record.projectID);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, /*index=*/3, formatTimestamp(record.occurredAt));
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, /*index=*/4, record.changeType);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, /*index=*/5,
                      serializeJSON(json::Object(record.payload)));
    checkSQLiteResultOKReturnFalse(result);
    result = bindOptionalText(stmt, /*index=*/6, record.actor);
    checkSQLiteResultOKReturnFalse(result);
    if (record.previousState.hasValue()) {
      result = bindText(stmt, /*index=*/7,
                        serializeJSON(json::Object(*record.previousState)));
    } else {
      result = sqlite3_bind_null(stmt, /*index=*/7);
    }
    checkSQLiteResultOKReturnFalse(result);

    return stepToCompletion(stmt, error_out);
  }

  static constexpr const char *findTransactionStmtSQL = (
      "SELECT id, project_id, occurred_at, change_type, payload, actor, "
      "previous_state FROM project_state_transactions "
      "WHERE id == ? AND project_id == ? LIMIT 1;");
  sqlite3_stmt* findTransactionStmt = nullptr;

  virtual bool lookupTransaction(StringRef projectID, StringRef transactionID,
                                 TransactionRecord* record_out,
                                 std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    StatementScope scope(findTransactionStmt);
    int result = sqlite3_clear_bindings(findTransactionStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(findTransactionStmt, /*index=*/1, transactionID);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(findTransactionStmt, /*index=*/2, projectID);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_step(findTransactionStmt);
    if (result == SQLITE_DONE)
      return false;
    if (result != SQLITE_ROW) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    return readTransactionRow(findTransactionStmt, record_out, error_out);
  }

  // Stored times are fixed width UTC text, so they compare as strings.
  static constexpr const char *findTransactionBeforeStmtSQL = (
      "SELECT id, project_id, occurred_at, change_type, payload, actor, "
      "previous_state FROM project_state_transactions "
      "WHERE project_id == ? AND occurred_at <= ? "
      "ORDER BY occurred_at DESC, rowid DESC LIMIT 1;");
  sqlite3_stmt* findTransactionBeforeStmt = nullptr;

  virtual bool findTransactionBefore(StringRef projectID,
                                     basic::Timestamp time,
                                     TransactionRecord* record_out,
                                     std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    StatementScope scope(findTransactionBeforeStmt);
    int result = sqlite3_clear_bindings(findTransactionBeforeStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(findTransactionBeforeStmt, /*index=*/1, projectID);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(findTransactionBeforeStmt, /*index=*/2,
                      formatTimestamp(time));
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_step(findTransactionBeforeStmt);
    if (result == SQLITE_DONE)
      return false;
    if (result != SQLITE_ROW) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    return readTransactionRow(findTransactionBeforeStmt, record_out,
                              error_out);
  }

  // The rowid gives the order in which the records were written.
  static constexpr const char *getTransactionsStmtSQL = (
      "SELECT id, project_id, occurred_at, change_type, payload, actor, "
      "previous_state FROM project_state_transactions "
      "WHERE project_id == ? ORDER BY rowid;");
  sqlite3_stmt* getTransactionsStmt = nullptr;

  virtual bool getTransactions(StringRef projectID,
                               std::vector<TransactionRecord>& records_out,
                               std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    StatementScope scope(getTransactionsStmt);
    int result = sqlite3_clear_bindings(getTransactionsStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(getTransactionsStmt, /*index=*/1, projectID);
    checkSQLiteResultOKReturnFalse(result);

    while ((result = sqlite3_step(getTransactionsStmt)) == SQLITE_ROW) {
      TransactionRecord record;
      if (!readTransactionRow(getTransactionsStmt, &record, error_out))
        return false;
      records_out.push_back(std::move(record));
    }
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }
    return true;
  }

  static constexpr const char *insertSnapshotStmtSQL = (
      "INSERT INTO project_state_snapshots (id, project_id, snapshot_at, "
      "state, taken_by, notes) VALUES (?, ?, ?, ?, ?, ?);");
  sqlite3_stmt* insertSnapshotStmt = nullptr;

  virtual bool insertSnapshot(const SnapshotRecord& record,
                              std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    sqlite3_stmt* stmt = insertSnapshotStmt;
    StatementScope scope(stmt);
    int result = sqlite3_clear_bindings(stmt);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, /*index=*/1, record.id);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, /*index=*/2, record.projectID);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, /*index=*/3, formatTimestamp(record.snapshotAt));
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(stmt, /*index=*/4,
                      serializeJSON(json::Object(record.state)));
    checkSQLiteResultOKReturnFalse(result);
    result = bindOptionalText(stmt, /*index=*/5, record.takenBy);
    checkSQLiteResultOKReturnFalse(result);
    result = bindOptionalText(stmt, /*index=*/6, record.notes);
    checkSQLiteResultOKReturnFalse(result);

    return stepToCompletion(stmt, error_out);
  }

  static constexpr const char *findSnapshotStmtSQL = (
      "SELECT id, project_id, snapshot_at, state, taken_by, notes "
      "FROM project_state_snapshots "
      "WHERE id == ? AND project_id == ? LIMIT 1;");
  sqlite3_stmt* findSnapshotStmt = nullptr;

  virtual bool lookupSnapshot(StringRef projectID, StringRef snapshotID,
                              SnapshotRecord* record_out,
                              std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    StatementScope scope(findSnapshotStmt);
    int result = sqlite3_clear_bindings(findSnapshotStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(findSnapshotStmt, /*index=*/1, snapshotID);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(findSnapshotStmt, /*index=*/2, projectID);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_step(findSnapshotStmt);
    if (result == SQLITE_DONE)
      return false;
    if (result != SQLITE_ROW) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    return readSnapshotRow(findSnapshotStmt, record_out, error_out);
  }

  static constexpr const char *getSnapshotsStmtSQL = (
      "SELECT id, project_id, snapshot_at, state, taken_by, notes "
      "FROM project_state_snapshots "
      "WHERE project_id == ? ORDER BY rowid;");
  sqlite3_stmt* getSnapshotsStmt = nullptr;

  virtual bool getSnapshots(StringRef projectID,
                            std::vector<SnapshotRecord>& records_out,
                            std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    StatementScope scope(getSnapshotsStmt);
    int result = sqlite3_clear_bindings(getSnapshotsStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = bindText(getSnapshotsStmt, /*index=*/1, projectID);
    checkSQLiteResultOKReturnFalse(result);

    while ((result = sqlite3_step(getSnapshotsStmt)) == SQLITE_ROW) {
      SnapshotRecord record;
      if (!readSnapshotRow(getSnapshotsStmt, &record, error_out))
        return false;
      records_out.push_back(std::move(record));
    }
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }
    return true;
  }

  /// @}
};

}

std::unique_ptr<ProjectStateDB> state::createSQLiteProjectStateDB(
    StringRef path, std::string* error_out) {
  auto db = std::make_unique<SQLiteProjectStateDB>(path);
  if (!db->openDatabase(error_out))
    return nullptr;
  return std::move(db);
}

#undef checkSQLiteResultOKReturnFalse
#undef checkSQLiteResultOKCloseReturnFalse
