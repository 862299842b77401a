#include "internal/restore/restore_coordinator.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/bundle/tar_gz.hpp"
#include "internal/db/sqlite/schema_inspector.hpp"
#include "internal/db/sqlite/sqlite_statement.hpp"
#include "internal/restore/backup_creator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_lock.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;

using canary::db::sqlite::SqliteDB;
using canary::db::sqlite::Statement;
using canary::restore::ConfirmFn;
using canary::restore::RestoreCoordinator;
using canary::testing::Sandbox;
using canary::testing::WriteFile;
using canary::util::ErrorCode;
using canary::verify::BackupVerifier;

constexpr const char* kSchema = R"sql(
CREATE TABLE weekly_digests (id INTEGER PRIMARY KEY, date TEXT NOT NULL, summary TEXT);
CREATE TABLE user_feedback (id INTEGER PRIMARY KEY, digest_date TEXT NOT NULL, rating INTEGER);
)sql";

const ConfirmFn kYes = [](const std::string&) { return true; };
const ConfirmFn kNo  = [](const std::string&) { return false; };

void Seed(SqliteDB& db, const std::string& summary) {
  db.Exec(kSchema);
  db.Exec("INSERT INTO weekly_digests (id, date, summary) VALUES (1, '2024-01-07', '" + summary + "');");
  db.Exec("INSERT INTO user_feedback (id, digest_date, rating) VALUES (1, '2024-01-07', 4);");
}

fs::path MakeDatabaseBackup(const Sandbox& sandbox, const std::string& name, const std::string& summary) {
  const auto path = sandbox.Root() / "backups" / name;
  fs::create_directories(path.parent_path());
  SqliteDB db(path.string());
  Seed(db, summary);
  return path;
}

std::string LiveSummary(const Sandbox& sandbox) {
  SqliteDB  db(sandbox.DatabasePath().string());
  Statement stmt(db.Handle(), "SELECT summary FROM weekly_digests WHERE id = 1;");
  assert(stmt.Step());
  return stmt.ColumnText(0);
}

size_t SafetyBackupsBeside(const fs::path& database) {
  size_t n = 0;
  for (const auto& entry : fs::directory_iterator(database.parent_path())) {
    if (entry.path().filename().string().find(".safety_backup.") != std::string::npos) ++n;
  }
  return n;
}

std::string SummaryIn(const fs::path& database) {
  SqliteDB  db(database.string());
  Statement stmt(db.Handle(), "SELECT summary FROM weekly_digests WHERE id = 1;");
  assert(stmt.Step());
  return stmt.ColumnText(0);
}

bool DirectoryIsEmpty(const fs::path& dir) {
  return !fs::exists(dir) || fs::is_empty(dir);
}

RestoreCoordinator MakeCoordinator(const Sandbox& sandbox) {
  return RestoreCoordinator(sandbox.Config(), std::make_shared<BackupVerifier>(sandbox.Config()));
}

// ---------------------------------------------------------------------------

void TestDatabaseRestoreReplacesLiveAndAudits() {
  Sandbox sandbox("restore_database");
  Seed(*sandbox.OpenLive(), "live");
  const auto backup = MakeDatabaseBackup(sandbox, "canary_protocol_20240101_000000.db", "from backup");

  auto       coordinator = MakeCoordinator(sandbox);
  const auto outcome     = coordinator.RestoreDatabase(backup, kYes);
  assert(outcome.result);
  assert(outcome.status == "success");
  assert(outcome.restore_type == "database");
  assert(outcome.safety_backup && fs::exists(*outcome.safety_backup));
  assert(LiveSummary(sandbox) == "from backup");
  assert(SafetyBackupsBeside(sandbox.DatabasePath()) == 1);

  {
    SqliteDB  safety(outcome.safety_backup->string());
    Statement stmt(safety.Handle(), "SELECT summary FROM weekly_digests WHERE id = 1;");
    assert(stmt.Step());
    assert(stmt.ColumnText(0) == "live");
  }

  const auto history = coordinator.GetRestoreHistory();
  assert(history.size() == 1);
  assert(history[0].status == "success");
  assert(history[0].backup_file == backup.string());
  assert(history[0].safety_backup == outcome.safety_backup->string());
  assert(!history[0].timestamp.empty());

  // the audit table in the live database does not block later restores
  const auto again = coordinator.RestoreDatabase(backup, kYes);
  assert(again.result);
  assert(coordinator.GetRestoreHistory().size() == 2);
}

void TestFailedVerificationRefusesRestore() {
  Sandbox sandbox("restore_refused");
  Seed(*sandbox.OpenLive(), "live");

  const auto partial = sandbox.Root() / "backups" / "partial.db";
  fs::create_directories(partial.parent_path());
  {
    SqliteDB db(partial.string());
    db.Exec("CREATE TABLE weekly_digests (id INTEGER PRIMARY KEY, date TEXT NOT NULL, summary TEXT);");
    db.Exec("INSERT INTO weekly_digests VALUES (1, '2024-01-07', 'partial');");
  }

  auto       coordinator = MakeCoordinator(sandbox);
  const auto outcome     = coordinator.RestoreDatabase(partial, kYes);
  assert(outcome.result.code == ErrorCode::IntegrityFailure);
  assert(outcome.status == "failed");
  assert(outcome.notes.find("Backup failed verification") != std::string::npos);
  assert(LiveSummary(sandbox) == "live");
  assert(SafetyBackupsBeside(sandbox.DatabasePath()) == 1);

  const auto history = coordinator.GetRestoreHistory();
  assert(history.size() == 1);
  assert(history[0].status == "failed");
}

void TestWarnPolicyRestoresAnyway() {
  Sandbox sandbox("restore_warn");
  sandbox.MutableConfig().mutable_restore()->set_verification_policy("warn");
  Seed(*sandbox.OpenLive(), "live");

  const auto partial = sandbox.Root() / "backups" / "partial.db";
  fs::create_directories(partial.parent_path());
  {
    SqliteDB db(partial.string());
    db.Exec("CREATE TABLE weekly_digests (id INTEGER PRIMARY KEY, date TEXT NOT NULL, summary TEXT);");
    db.Exec("INSERT INTO weekly_digests VALUES (1, '2024-01-07', 'partial');");
  }

  auto       coordinator = MakeCoordinator(sandbox);
  const auto outcome     = coordinator.RestoreDatabase(partial, kYes);
  assert(outcome.result);
  assert(outcome.notes.find("Verification warning") != std::string::npos);
  assert(LiveSummary(sandbox) == "partial");

  SqliteDB live(sandbox.DatabasePath().string());
  assert(!canary::db::sqlite::TableExists(live, "user_feedback"));
}

void TestDeclinedRestoreChangesNothing() {
  Sandbox sandbox("restore_declined");
  Seed(*sandbox.OpenLive(), "live");
  const auto backup = MakeDatabaseBackup(sandbox, "b.db", "from backup");

  auto coordinator = MakeCoordinator(sandbox);
  for (const auto& confirm : {kNo, ConfirmFn{}}) {
    const auto outcome = coordinator.RestoreDatabase(backup, confirm);
    assert(outcome.result.code == ErrorCode::ConfirmationDeclined);
    assert(outcome.status == "declined");
    assert(!outcome.safety_backup);
  }
  assert(LiveSummary(sandbox) == "live");
  assert(SafetyBackupsBeside(sandbox.DatabasePath()) == 0);

  const auto history = coordinator.GetRestoreHistory();
  assert(history.size() == 2);
  assert(history[0].status == "declined");
  assert(history[0].id > history[1].id);
  assert(coordinator.GetRestoreHistory(1).size() == 1);
}

void TestAuditCreatesHistoryOnlyDatabaseWhenNoneExists() {
  Sandbox sandbox("restore_no_live");
  const auto backup = MakeDatabaseBackup(sandbox, "b.db", "from backup");
  assert(!fs::exists(sandbox.DatabasePath()));

  auto       coordinator = MakeCoordinator(sandbox);
  const auto outcome     = coordinator.RestoreDatabase(backup, kNo);
  assert(outcome.result.code == ErrorCode::ConfirmationDeclined);

  assert(fs::exists(sandbox.DatabasePath()));
  {
    SqliteDB live(sandbox.DatabasePath().string());
    const auto schema = canary::db::sqlite::InspectSchema(live);
    assert(schema.size() == 1);
    assert(schema.count("restore_history") == 1);
  }
  const auto history = coordinator.GetRestoreHistory();
  assert(history.size() == 1);
  assert(history[0].status == "declined");
}

void TestMissingAndUnsupportedFiles() {
  Sandbox sandbox("restore_missing");
  Seed(*sandbox.OpenLive(), "live");
  auto coordinator = MakeCoordinator(sandbox);

  const auto missing = coordinator.RestoreDatabase(sandbox.Root() / "backups" / "absent.db", kYes);
  assert(missing.result.code == ErrorCode::NotFound);
  assert(missing.status == "failed");

  const auto json = sandbox.Root() / "backups" / "export.json";
  WriteFile(json, "{}");
  const auto unsupported = coordinator.RestoreFromBackup(json, std::nullopt, kYes);
  assert(unsupported.result.code == ErrorCode::UnsupportedFormat);
  assert(unsupported.restore_type == "json_data");

  const auto history = coordinator.GetRestoreHistory();
  assert(history.size() == 2);
  assert(history[0].restore_type == "json_data");
  assert(history[0].status == "failed");
  assert(LiveSummary(sandbox) == "live");
}

void TestHeldLockReportsBusy() {
  Sandbox sandbox("restore_busy");
  Seed(*sandbox.OpenLive(), "live");
  const auto backup = MakeDatabaseBackup(sandbox, "b.db", "from backup");

  auto held = canary::util::FileLock::TryAcquire(sandbox.Config().lock().path(), std::chrono::milliseconds(0));
  assert(held);

  auto       coordinator = MakeCoordinator(sandbox);
  const auto outcome     = coordinator.RestoreDatabase(backup, kYes);
  assert(outcome.result.code == ErrorCode::Busy);
  assert(LiveSummary(sandbox) == "live");
  assert(SafetyBackupsBeside(sandbox.DatabasePath()) == 0);
}

void TestSqlDumpRestore() {
  Sandbox sandbox("restore_sql_dump");
  Seed(*sandbox.OpenLive(), "live");

  const auto dump = sandbox.Root() / "backups" / "canary_protocol.sql";
  WriteFile(dump, std::string("BEGIN TRANSACTION;\n") + kSchema +
                      "INSERT INTO weekly_digests VALUES (1, '2024-01-07', 'from dump');\nCOMMIT;\n");

  auto       coordinator = MakeCoordinator(sandbox);
  const auto outcome     = coordinator.RestoreFromBackup(dump, std::nullopt, kYes);
  assert(outcome.result);
  assert(outcome.restore_type == "sql_dump");
  assert(LiveSummary(sandbox) == "from dump");
}

void TestFullSystemRestoreFromBundle() {
  Sandbox sandbox("restore_full_system");
  Seed(*sandbox.OpenLive(), "live");
  const auto config_file = sandbox.Root() / "config" / "canary.yaml";
  WriteFile(config_file, "database:\n  path: original\n");
  WriteFile(sandbox.Root() / "logs" / "collector.log", "original log\n");

  const auto bundle = canary::restore::BackupCreator(sandbox.Config()).CreateSystemBundle();

  {
    auto live = sandbox.OpenLive();
    live->Exec("UPDATE weekly_digests SET summary = 'changed' WHERE id = 1;");
  }
  WriteFile(config_file, "database:\n  path: changed\n");

  auto       coordinator = MakeCoordinator(sandbox);
  const auto outcome     = coordinator.RestoreFromBackup(bundle, std::nullopt, kYes);
  assert(outcome.result);
  assert(outcome.restore_type == "full_system");
  assert(outcome.safety_backup && fs::exists(*outcome.safety_backup));
  assert(canary::util::HasSuffix(outcome.safety_backup->string(), ".tar.gz"));

  assert(LiveSummary(sandbox) == "live");
  assert(canary::util::ReadFileContents(config_file) == "database:\n  path: original\n");
  assert(canary::util::ReadFileContents(sandbox.Root() / "logs" / "collector.log") == "original log\n");

  const auto not_a_bundle = sandbox.Root() / "backups" / "b.db";
  MakeDatabaseBackup(sandbox, "b.db", "from backup");
  const auto wrong = coordinator.RestoreFullSystem(not_a_bundle, kYes);
  assert(wrong.result.code == ErrorCode::UnsupportedFormat);
}

void TestSafetyBackupIncludesCommitsStillInWal() {
  Sandbox sandbox("restore_wal_safety");
  auto    live = sandbox.OpenLive();
  live->Exec("PRAGMA journal_mode=WAL;");
  live->Exec("PRAGMA wal_autocheckpoint=0;");
  Seed(*live, "live");
  live->Exec("UPDATE weekly_digests SET summary = 'only in wal' WHERE id = 1;");

  const auto wal = sandbox.DatabasePath().string() + "-wal";
  assert(fs::exists(wal) && fs::file_size(wal) > 0);

  auto       coordinator = MakeCoordinator(sandbox);
  const auto safety      = coordinator.CreateSafetyBackup(sandbox.DatabasePath());
  assert(safety && fs::exists(*safety));
  assert(!fs::exists(safety->string() + ".tmp"));
  assert(SafetyBackupsBeside(sandbox.DatabasePath()) == 1);
  assert(SummaryIn(*safety) == "only in wal");

  // the open writer is unaffected
  live->Exec("UPDATE weekly_digests SET summary = 'still in wal' WHERE id = 1;");
  assert(canary::testing::CountRows(*live, "user_feedback") == 1);

  // a restore with the writer still open keeps its uncheckpointed commits
  const auto backup  = MakeDatabaseBackup(sandbox, "b.db", "from backup");
  const auto outcome = coordinator.RestoreDatabase(backup, kYes);
  assert(outcome.result);
  assert(outcome.safety_backup);
  assert(SummaryIn(*outcome.safety_backup) == "still in wal");
  live.reset();
  assert(LiveSummary(sandbox) == "from backup");
}

void TestUnreadableLiveDatabaseIsCopiedAsIs() {
  Sandbox sandbox("restore_unreadable_live");
  // schema comparison against a corrupt live file cannot pass
  sandbox.MutableConfig().mutable_restore()->set_verification_policy("warn");
  const std::string garbage(4096, 'x');
  WriteFile(sandbox.DatabasePath(), garbage);
  const auto backup = MakeDatabaseBackup(sandbox, "b.db", "from backup");

  auto       coordinator = MakeCoordinator(sandbox);
  const auto outcome     = coordinator.RestoreDatabase(backup, kYes);
  assert(outcome.result);
  assert(outcome.safety_backup);
  assert(canary::util::ReadFileContents(*outcome.safety_backup) == garbage);
  assert(LiveSummary(sandbox) == "from backup");
}

void TestFullSystemRestoreKeepsDatabaseOutsideDataDir() {
  Sandbox    sandbox("restore_db_outside_data");
  const auto db_path = sandbox.Root() / "db" / "canary_protocol.db";
  fs::create_directories(db_path.parent_path());
  sandbox.MutableConfig().mutable_database()->set_path(db_path.string());
  Seed(*sandbox.OpenLive(), "live");
  WriteFile(sandbox.Root() / "data" / "notes.txt", "live notes\n");

  const auto bundle = canary::restore::BackupCreator(sandbox.Config()).CreateSystemBundle();
  const auto root   = bundle.filename().string().substr(0, bundle.filename().string().size() - 7);
  const auto names  = canary::bundle::ListTarGz(bundle);
  assert(std::find(names.begin(), names.end(), root + "/data/canary_protocol.db") != names.end());

  {
    auto live = sandbox.OpenLive();
    live->Exec("UPDATE weekly_digests SET summary = 'changed' WHERE id = 1;");
  }

  auto       coordinator = MakeCoordinator(sandbox);
  const auto outcome     = coordinator.RestoreFullSystem(bundle, kYes);
  assert(outcome.result);
  assert(LiveSummary(sandbox) == "live");
  assert(!fs::exists(sandbox.Root() / "data" / "canary_protocol.db"));
  assert(outcome.notes.find("Database safety backup") != std::string::npos);

  // the pre-restore database sits beside the live one
  assert(SafetyBackupsBeside(db_path) == 1);
  for (const auto& entry : fs::directory_iterator(db_path.parent_path())) {
    if (entry.path().filename().string().find(".safety_backup.") != std::string::npos) {
      assert(SummaryIn(entry.path()) == "changed");
    }
  }
}

void TestDamagedBundlesLeaveLiveSystemUntouched() {
  Sandbox sandbox("restore_damaged_bundle");
  Seed(*sandbox.OpenLive(), "live");
  const auto config_file = sandbox.Root() / "config" / "canary.yaml";
  const auto log_file    = sandbox.Root() / "logs" / "collector.log";
  const auto data_file   = sandbox.Root() / "data" / "notes.txt";
  WriteFile(config_file, "database:\n  path: live\n");
  WriteFile(log_file, "live log\n");
  WriteFile(data_file, "live notes\n");

  const auto good  = canary::restore::BackupCreator(sandbox.Config()).CreateSystemBundle();
  const auto bytes = canary::util::ReadFileContents(good);
  const auto dir   = sandbox.Root() / "backups";

  const auto truncated = dir / "truncated.tar.gz";
  WriteFile(truncated, bytes.substr(0, bytes.size() / 2));

  const auto garbage = dir / "garbage.tar.gz";
  WriteFile(garbage, "definitely not gzip");

  // config and logs only, no data/canary_protocol.db
  const auto partial_src = sandbox.Root() / "partial_src";
  WriteFile(partial_src / "config" / "canary.yaml", "database:\n  path: partial\n");
  WriteFile(partial_src / "logs" / "collector.log", "partial log\n");
  WriteFile(partial_src / "data" / "notes.txt", "partial notes\n");
  std::vector<canary::bundle::TarEntry> entries;
  canary::bundle::AddTree(&entries, partial_src, "canary_backup_20240101_000000");
  const auto no_database = dir / "no_database.tar.gz";
  canary::bundle::WriteTarGz(no_database, entries);

  {
    auto live = sandbox.OpenLive();
    live->Exec("UPDATE weekly_digests SET summary = 'current' WHERE id = 1;");
  }

  auto coordinator = MakeCoordinator(sandbox);
  for (const auto& bad : {truncated, garbage, no_database}) {
    const auto outcome = coordinator.RestoreFullSystem(bad, kYes);
    assert(outcome.result.code == ErrorCode::IntegrityFailure);
    assert(outcome.status == "failed");
    assert(!outcome.safety_backup);

    assert(LiveSummary(sandbox) == "current");
    assert(canary::util::ReadFileContents(config_file) == "database:\n  path: live\n");
    assert(canary::util::ReadFileContents(log_file) == "live log\n");
    assert(canary::util::ReadFileContents(data_file) == "live notes\n");
    assert(SafetyBackupsBeside(sandbox.DatabasePath()) == 0);
    assert(DirectoryIsEmpty(sandbox.Config().restore().staging_directory()));
  }

  const auto history = coordinator.GetRestoreHistory();
  assert(history.size() == 3);
  for (const auto& record : history) {
    assert(record.status == "failed");
  }
  assert(history[0].notes.find("does not contain") != std::string::npos);
}

void TestListAvailableBackupsNewestFirst() {
  Sandbox    sandbox("restore_list");
  const auto dir = sandbox.Root() / "backups";
  WriteFile(dir / "older.db", "x");
  WriteFile(dir / "newer.sql", "y");
  WriteFile(dir / "notes.txt", "z");
  const auto now = fs::file_time_type::clock::now();
  fs::last_write_time(dir / "older.db", now - std::chrono::hours(48));
  fs::last_write_time(dir / "newer.sql", now - std::chrono::hours(24));

  auto       coordinator = MakeCoordinator(sandbox);
  const auto backups     = coordinator.ListAvailableBackups();
  assert(backups.size() == 2);
  assert(backups[0].name == "newer.sql");
  assert(backups[1].name == "older.db");
  assert(backups[0].type == canary::verify::BackupType::SqlDump);

  assert(coordinator.ListAvailableBackups(sandbox.Root() / "nowhere").empty());
  assert(coordinator.GetRestoreHistory().empty());
}

void TestVerificationPolicyParsing() {
  using canary::restore::ParseVerificationPolicy;
  using canary::restore::VerificationPolicy;
  assert(ParseVerificationPolicy("") == VerificationPolicy::Refuse);
  assert(ParseVerificationPolicy("refuse") == VerificationPolicy::Refuse);
  assert(ParseVerificationPolicy("warn") == VerificationPolicy::Warn);
  assert(ParseVerificationPolicy("skip") == VerificationPolicy::Skip);

  bool threw = false;
  try {
    (void)ParseVerificationPolicy("sometimes");
  } catch (const canary::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDatabaseRestoreReplacesLiveAndAudits();
  TestFailedVerificationRefusesRestore();
  TestWarnPolicyRestoresAnyway();
  TestDeclinedRestoreChangesNothing();
  TestAuditCreatesHistoryOnlyDatabaseWhenNoneExists();
  TestMissingAndUnsupportedFiles();
  TestHeldLockReportsBusy();
  TestSqlDumpRestore();
  TestFullSystemRestoreFromBundle();
  TestSafetyBackupIncludesCommitsStillInWal();
  TestUnreadableLiveDatabaseIsCopiedAsIs();
  TestFullSystemRestoreKeepsDatabaseOutsideDataDir();
  TestDamagedBundlesLeaveLiveSystemUntouched();
  TestListAvailableBackupsNewestFirst();
  TestVerificationPolicyParsing();

  std::cout << "canary_unit_restore_coordinator: pass\n";
  return 0;
}
