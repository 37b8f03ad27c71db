//===- unittests/State/SQLiteProjectStateDBTest.cpp -----------------------===//
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

#include "../TestSupport/TempDir.h"

#include "gtest/gtest.h"

#include <sqlite3.h>

#include <chrono>

using namespace conductor;
using namespace conductor::state;

namespace {

ProjectState makeState(StringRef projectID) {
  ProjectState state;
  state.projectID = projectID.str();
  state.currentPhase = "design";
  state.pendingTasks = {"t1", "t2"};
  state.metadata = json::Object{{"owner", "team-a"}};
  state.createdAt = basic::Timestamp(std::chrono::microseconds(1000000));
  state.lastUpdated = state.createdAt;
  return state;
}

TEST(SQLiteProjectStateDBTest, storesProjects) {
  TmpDir tempDir("project-state-db");
  std::string error;
  auto db = createSQLiteProjectStateDB(tempDir.path("state.db"), &error);
  ASSERT_TRUE(db != nullptr) << error;

  ProjectState found;
  EXPECT_FALSE(db->lookupProject("P1", &found, &error));
  EXPECT_EQ("", error);

  ProjectState state = makeState("P1");
  ASSERT_TRUE(db->beginTransaction(&error)) << error;
  ASSERT_TRUE(db->insertProject(state, &error)) << error;
  ASSERT_TRUE(db->commitTransaction(&error)) << error;

  ASSERT_TRUE(db->lookupProject("P1", &found, &error)) << error;
  EXPECT_EQ(state, found);

  // Inserting the same project twice violates the key.
  EXPECT_FALSE(db->insertProject(state, &error));
  EXPECT_NE("", error);
  error.clear();

  // Updating a project which does not exist is an error.
  EXPECT_FALSE(db->updateProject(makeState("P2"), &error));
  EXPECT_NE("", error);
}

TEST(SQLiteProjectStateDBTest, rollbackDiscardsWrites) {
  TmpDir tempDir("project-state-db");
  std::string error;
  auto db = createSQLiteProjectStateDB(tempDir.path("state.db"), &error);
  ASSERT_TRUE(db != nullptr) << error;

  ASSERT_TRUE(db->beginTransaction(&error)) << error;
  ASSERT_TRUE(db->insertProject(makeState("P1"), &error)) << error;
  ASSERT_TRUE(db->rollbackTransaction(&error)) << error;

  ProjectState found;
  EXPECT_FALSE(db->lookupProject("P1", &found, &error));
  EXPECT_EQ("", error);

  // Rolling back without an open transaction does nothing.
  EXPECT_TRUE(db->rollbackTransaction(&error)) << error;
}

TEST(SQLiteProjectStateDBTest, transactionLogKeepsWriteOrder) {
  TmpDir tempDir("project-state-db");
  std::string error;
  auto db = createSQLiteProjectStateDB(tempDir.path("state.db"), &error);
  ASSERT_TRUE(db != nullptr) << error;
  ASSERT_TRUE(db->insertProject(makeState("P1"), &error)) << error;

  // Records with equal times are listed in the order they were written.
  for (const char* id: {"tx-b", "tx-a", "tx-c"}) {
    TransactionRecord record;
    record.id = id;
    record.projectID = "P1";
    record.occurredAt = basic::Timestamp(std::chrono::microseconds(5000000));
    record.changeType = "update_state";
    record.payload = json::Object{{"current_phase", id}};
    if (StringRef(id) != "tx-c")
      record.previousState = json::Object{{"current_phase", "design"}};
    ASSERT_TRUE(db->insertTransaction(record, &error)) << error;
  }

  std::vector<TransactionRecord> records;
  ASSERT_TRUE(db->getTransactions("P1", records, &error)) << error;
  ASSERT_EQ(3u, records.size());
  EXPECT_EQ("tx-b", records[0].id);
  EXPECT_EQ("tx-a", records[1].id);
  EXPECT_EQ("tx-c", records[2].id);
  EXPECT_TRUE(records[0].previousState.hasValue());
  EXPECT_FALSE(records[2].previousState.hasValue());
  EXPECT_FALSE(records[2].actor.hasValue());

  TransactionRecord found;
  ASSERT_TRUE(db->lookupTransaction("P1", "tx-a", &found, &error)) << error;
  EXPECT_EQ("tx-a", *found.payload.getString("current_phase"));
  EXPECT_FALSE(db->lookupTransaction("P2", "tx-a", &found, &error));
  EXPECT_EQ("", error);

  // Records must belong to a known project.
  TransactionRecord orphan;
  orphan.id = "tx-orphan";
  orphan.projectID = "nobody";
  orphan.changeType = "update_state";
  EXPECT_FALSE(db->insertTransaction(orphan, &error));
  EXPECT_NE("", error);
}

TEST(SQLiteProjectStateDBTest, storesSnapshots) {
  TmpDir tempDir("project-state-db");
  std::string error;
  auto db = createSQLiteProjectStateDB(tempDir.path("state.db"), &error);
  ASSERT_TRUE(db != nullptr) << error;
  ASSERT_TRUE(db->insertProject(makeState("P1"), &error)) << error;

  SnapshotRecord record;
  record.id = "snap-1";
  record.projectID = "P1";
  record.snapshotAt = basic::Timestamp(std::chrono::microseconds(7000001));
  record.state = json::Object{{"current_phase", "design"}};
  record.notes = std::string("checkpoint");
  ASSERT_TRUE(db->insertSnapshot(record, &error)) << error;

  SnapshotRecord found;
  ASSERT_TRUE(db->lookupSnapshot("P1", "snap-1", &found, &error)) << error;
  EXPECT_EQ(record.snapshotAt, found.snapshotAt);
  EXPECT_EQ(record.state, found.state);
  EXPECT_FALSE(found.takenBy.hasValue());
  EXPECT_EQ("checkpoint", found.notes.getValue());

  std::vector<SnapshotRecord> records;
  ASSERT_TRUE(db->getSnapshots("P1", records, &error)) << error;
  EXPECT_EQ(1u, records.size());
  records.clear();
  ASSERT_TRUE(db->getSnapshots("P2", records, &error)) << error;
  EXPECT_TRUE(records.empty());
}

TEST(SQLiteProjectStateDBTest, findTransactionBefore) {
  TmpDir tempDir("project-state-db");
  std::string error;
  auto db = createSQLiteProjectStateDB(tempDir.path("state.db"), &error);
  ASSERT_TRUE(db != nullptr) << error;
  ASSERT_TRUE(db->insertProject(makeState("P1"), &error)) << error;
  ASSERT_TRUE(db->insertProject(makeState("P2"), &error)) << error;

  auto at = [](int64_t seconds) {
    return basic::Timestamp(std::chrono::seconds(seconds));
  };
  auto append = [&](StringRef projectID, const char* id, int64_t seconds) {
    TransactionRecord record;
    record.id = id;
    record.projectID = projectID.str();
    record.occurredAt = at(seconds);
    record.changeType = "update_state";
    ASSERT_TRUE(db->insertTransaction(record, &error)) << error;
  };
  append("P1", "early", 1);
  append("P1", "same-1", 5);
  append("P1", "same-2", 5);
  append("P1", "late", 9);
  append("P2", "other", 3);

  TransactionRecord found;
  EXPECT_FALSE(db->findTransactionBefore("P1", at(0), &found, &error));
  EXPECT_EQ("", error);

  ASSERT_TRUE(db->findTransactionBefore("P1", at(1), &found, &error)) << error;
  EXPECT_EQ("early", found.id);
  ASSERT_TRUE(db->findTransactionBefore("P1", at(3), &found, &error)) << error;
  EXPECT_EQ("early", found.id);
  ASSERT_TRUE(db->findTransactionBefore("P1", at(5), &found, &error)) << error;
  EXPECT_EQ("same-2", found.id);
  ASSERT_TRUE(db->findTransactionBefore("P1", at(100), &found, &error))
      << error;
  EXPECT_EQ("late", found.id);
  ASSERT_TRUE(db->findTransactionBefore("P2", at(100), &found, &error))
      << error;
  EXPECT_EQ("other", found.id);
}

TEST(SQLiteProjectStateDBTest, missingTableFailsOpenUntilRestored) {
  TmpDir tempDir("project-state-db");
  std::string path = tempDir.path("state.db");
  std::string error;
  ASSERT_TRUE(createSQLiteProjectStateDB(path, &error) != nullptr) << error;

  auto execRaw = [&](const char* sql) {
    sqlite3* raw = nullptr;
    ASSERT_EQ(SQLITE_OK, sqlite3_open(path.c_str(), &raw));
    EXPECT_EQ(SQLITE_OK, sqlite3_exec(raw, sql, nullptr, nullptr, nullptr));
    sqlite3_close(raw);
  };

  // Statements against the moved table can not be prepared.
  execRaw("ALTER TABLE project_state_snapshots RENAME TO moved_snapshots");
  EXPECT_TRUE(createSQLiteProjectStateDB(path, &error) == nullptr);
  EXPECT_NE(std::string::npos, error.find("project_state_snapshots")) << error;

  error.clear();
  execRaw("ALTER TABLE moved_snapshots RENAME TO project_state_snapshots");
  auto db = createSQLiteProjectStateDB(path, &error);
  ASSERT_TRUE(db != nullptr) << error;
  ASSERT_TRUE(db->insertProject(makeState("P1"), &error)) << error;
}

TEST(SQLiteProjectStateDBTest, rejectsOtherSchemaVersions) {
  TmpDir tempDir("project-state-db");
  std::string path = tempDir.path("state.db");

  sqlite3* raw = nullptr;
  ASSERT_EQ(SQLITE_OK, sqlite3_open(path.c_str(), &raw));
  ASSERT_EQ(SQLITE_OK, sqlite3_exec(
      raw, "CREATE TABLE info (id INTEGER PRIMARY KEY, version INTEGER); "
      "INSERT INTO info VALUES (0, 7);", nullptr, nullptr, nullptr));
  sqlite3_close(raw);

  std::string error;
  auto db = createSQLiteProjectStateDB(path, &error);
  EXPECT_TRUE(db == nullptr);
  EXPECT_EQ("version mismatch (database-schema: 7 requested schema: 1)", error);
}

TEST(SQLiteProjectStateDBTest, reportsUnopenablePaths) {
  TmpDir tempDir("project-state-db");
  std::string error;
  auto db = createSQLiteProjectStateDB(
      tempDir.path("missing-dir/state.db"), &error);
  EXPECT_TRUE(db == nullptr);
  EXPECT_NE("", error);
}

TEST(SQLiteProjectStateDBTest, reopensExistingStore) {
  TmpDir tempDir("project-state-db");
  std::string path = tempDir.path("state.db");
  std::string error;
  {
    auto db = createSQLiteProjectStateDB(path, &error);
    ASSERT_TRUE(db != nullptr) << error;
    ASSERT_TRUE(db->insertProject(makeState("P1"), &error)) << error;
  }

  auto db = createSQLiteProjectStateDB(path, &error);
  ASSERT_TRUE(db != nullptr) << error;
  ProjectState found;
  EXPECT_TRUE(db->lookupProject("P1", &found, &error));
  EXPECT_EQ(makeState("P1"), found);
}

}
