#include "internal/verify/backup_verifier.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/sha256.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;

using canary::db::sqlite::SqliteDB;
using canary::testing::Sandbox;
using canary::testing::WriteFile;
using canary::verify::BackupVerifier;

constexpr const char* kSchema = R"sql(
CREATE TABLE weekly_digests (id INTEGER PRIMARY KEY, date TEXT NOT NULL, summary TEXT);
CREATE TABLE user_feedback (id INTEGER PRIMARY KEY, digest_date TEXT NOT NULL, rating INTEGER);
)sql";

constexpr const char* kRows = R"sql(
INSERT INTO weekly_digests (id, date, summary) VALUES (1, '2024-01-07', 'first'), (2, '2024-01-14', 'second');
INSERT INTO user_feedback (id, digest_date, rating) VALUES (1, '2024-01-07', 5), (2, '2024-01-07', 3), (3, '2023-12-31', 4);
)sql";

void SeedLive(const Sandbox& sandbox) {
  auto db = sandbox.OpenLive();
  db->Exec(kSchema);
  db->Exec(kRows);
}

fs::path CopyLive(const Sandbox& sandbox, const std::string& name) {
  const auto target = sandbox.Root() / "backups" / name;
  fs::create_directories(target.parent_path());
  fs::copy_file(sandbox.DatabasePath(), target, fs::copy_options::overwrite_existing);
  return target;
}

bool HasError(const canary::lifecycle::v1::VerificationReport& report, const std::string& prefix) {
  for (const auto& e : report.errors()) {
    if (e.rfind(prefix, 0) == 0) return true;
  }
  return false;
}

// ---------------------------------------------------------------------------

void TestIdenticalCopyIsValid() {
  Sandbox sandbox("verify_identical");
  SeedLive(sandbox);
  const auto backup = CopyLive(sandbox, "canary_protocol_copy.db");

  BackupVerifier verifier(sandbox.Config());
  const auto     report = verifier.VerifyIntegrity(backup);
  assert(report.overall_valid());
  assert(report.errors_size() == 0);
  assert(report.file_exists());
  assert(report.database_readable());
  assert(report.schema_valid());
  assert(report.data_sample_valid());
  assert(report.table_count() == 2);
  assert(report.backup_type() == "database");
  assert(report.checksum() == canary::util::Sha256File(backup));
  assert(report.file_size_bytes() == fs::file_size(backup));
  assert(report.schema_comparison().original_tables() == 2);
  assert(report.schema_comparison().matching_tables() == 2);
}

void TestMissingTableFailsSchemaCheck() {
  Sandbox sandbox("verify_missing_table");
  SeedLive(sandbox);

  const auto backup = sandbox.Root() / "backups" / "partial.db";
  fs::create_directories(backup.parent_path());
  {
    SqliteDB db(backup.string());
    db.Exec("CREATE TABLE weekly_digests (id INTEGER PRIMARY KEY, date TEXT NOT NULL, summary TEXT);");
  }

  BackupVerifier verifier(sandbox.Config());
  const auto     report = verifier.VerifyIntegrity(backup);
  assert(!report.overall_valid());
  assert(!report.schema_valid());
  assert(HasError(report, "Missing table in backup: user_feedback"));
  assert(report.schema_comparison().matching_tables() == 1);
}

void TestChangedColumnFailsSchemaCheck() {
  Sandbox sandbox("verify_column_diff");
  SeedLive(sandbox);

  const auto backup = sandbox.Root() / "backups" / "drifted.db";
  fs::create_directories(backup.parent_path());
  {
    SqliteDB db(backup.string());
    db.Exec("CREATE TABLE weekly_digests (id INTEGER PRIMARY KEY, date TEXT NOT NULL);");
    db.Exec("CREATE TABLE user_feedback (id INTEGER PRIMARY KEY, digest_date TEXT NOT NULL, rating INTEGER);");
  }

  BackupVerifier verifier(sandbox.Config());
  const auto     report = verifier.VerifyIntegrity(backup);
  assert(!report.schema_valid());
  assert(HasError(report, "Schema mismatch in table: weekly_digests"));
}

void TestSidecarMismatchIsReported() {
  Sandbox sandbox("verify_sidecar");
  SeedLive(sandbox);
  const auto backup = CopyLive(sandbox, "with_sidecar.db");

  BackupVerifier verifier(sandbox.Config());
  WriteFile(backup.string() + ".sha256", canary::util::Sha256File(backup) + "  with_sidecar.db\n");
  assert(verifier.VerifyIntegrity(backup).overall_valid());

  WriteFile(backup.string() + ".sha256", std::string(64, '0') + "  with_sidecar.db\n");
  const auto report = verifier.VerifyIntegrity(backup);
  assert(!report.overall_valid());
  assert(HasError(report, "Checksum mismatch"));
}

void TestNullInRequiredColumnFailsSample() {
  Sandbox sandbox("verify_null_sample");
  SeedLive(sandbox);

  const auto backup = sandbox.Root() / "backups" / "nulls.db";
  fs::create_directories(backup.parent_path());
  {
    SqliteDB db(backup.string());
    db.Exec("CREATE TABLE weekly_digests (id INTEGER PRIMARY KEY, date TEXT, summary TEXT);");
    db.Exec("INSERT INTO weekly_digests (id, date, summary) VALUES (1, NULL, 'undated');");
    // tighten the declaration after the fact so the stored NULL violates it
    db.Exec("PRAGMA writable_schema = ON;");
    db.Exec("UPDATE sqlite_master SET sql = 'CREATE TABLE weekly_digests (id INTEGER PRIMARY KEY, date TEXT NOT NULL, "
            "summary TEXT)' WHERE name = 'weekly_digests';");
    db.Exec("PRAGMA writable_schema = OFF;");
  }

  BackupVerifier           verifier(sandbox.Config());
  std::vector<std::string> errors;
  assert(!verifier.VerifyDataSample(backup, &errors));
  assert(errors.size() == 1);
  assert(errors[0].find("weekly_digests.date") != std::string::npos);

  const auto report = verifier.VerifyIntegrity(backup);
  assert(!report.data_sample_valid());
  assert(!report.overall_valid());
}

void TestUnreadableInputs() {
  Sandbox sandbox("verify_unreadable");
  SeedLive(sandbox);
  BackupVerifier verifier(sandbox.Config());

  const auto missing = verifier.VerifyIntegrity(sandbox.Root() / "backups" / "absent.db");
  assert(!missing.file_exists());
  assert(!missing.overall_valid());
  assert(HasError(missing, "Backup file does not exist"));

  const auto garbage = sandbox.Root() / "backups" / "garbage.db";
  WriteFile(garbage, std::string(4096, 'x'));
  const auto unreadable = verifier.VerifyIntegrity(garbage);
  assert(unreadable.file_exists());
  assert(!unreadable.database_readable());
  assert(!unreadable.overall_valid());

  const auto json = sandbox.Root() / "backups" / "export.json";
  WriteFile(json, "{}");
  const auto unsupported = verifier.VerifyIntegrity(json);
  assert(unsupported.backup_type() == "json_data");
  assert(HasError(unsupported, "Unsupported backup type for verification"));
}

void TestSqlDumpIsLoadedAndChecked() {
  Sandbox sandbox("verify_sql_dump");
  SeedLive(sandbox);

  const auto dump = sandbox.Root() / "backups" / "dump.sql";
  WriteFile(dump, std::string("BEGIN TRANSACTION;\n") + kSchema + kRows + "COMMIT;\n");

  BackupVerifier verifier(sandbox.Config());
  const auto     report = verifier.VerifyIntegrity(dump);
  assert(report.backup_type() == "sql_dump");
  assert(report.overall_valid());
  assert(report.table_count() == 2);
}

void TestRestorationRunsOnAScratchCopy() {
  Sandbox sandbox("verify_restoration");
  SeedLive(sandbox);
  const auto backup = CopyLive(sandbox, "restore_me.db");

  BackupVerifier verifier(sandbox.Config());
  const auto     report = verifier.TestRestoration(backup);
  assert(report.restoration_successful());
  assert(report.data_integrity_verified());
  assert(report.errors_size() == 0);
  assert(report.operation_tests().table_count() == 2);
  assert(report.operation_tests().join_test() == 3);
  assert(!report.operation_tests().join_skipped());
  assert(report.performance_metrics().total_time_seconds() >= 0.0);

  // the scratch copy is gone
  const auto staging = sandbox.Root() / "staging";
  assert(!fs::exists(staging) || fs::is_empty(staging));

  const auto missing = verifier.TestRestoration(sandbox.Root() / "backups" / "absent.db");
  assert(!missing.restoration_successful());
}

void TestRestorationOfGarbageCleansUp() {
  Sandbox sandbox("verify_restoration_garbage");
  SeedLive(sandbox);

  const auto garbage = sandbox.Root() / "backups" / "garbage.db";
  WriteFile(garbage, std::string(8192, 'g'));
  const auto dump = sandbox.Root() / "backups" / "broken.sql";
  WriteFile(dump, "CREATE TABLE half (id INTEGER PRIMARY KEY;\n");

  BackupVerifier verifier(sandbox.Config());
  for (const auto& file : {garbage, dump}) {
    const auto report = verifier.TestRestoration(file);
    assert(!report.restoration_successful());
    assert(report.errors_size() > 0);

    const auto staging = sandbox.Root() / "staging";
    assert(!fs::exists(staging) || fs::is_empty(staging));
  }
}

void TestBatchRunPersistsReport() {
  Sandbox sandbox("verify_batch");
  SeedLive(sandbox);
  const auto good = CopyLive(sandbox, "canary_protocol_good.db");
  const auto bad  = sandbox.Root() / "backups" / "canary_protocol_bad.db";
  WriteFile(bad, std::string(2048, 'z'));
  WriteFile(sandbox.Root() / "backups" / "readme.txt", "not a backup");

  BackupVerifier verifier(sandbox.Config());
  const auto     report = verifier.RunBatchVerification();
  assert(report.error().empty());
  assert(!report.cancelled());
  assert(report.backups_found() == 2);
  assert(report.backups_considered() == 2);
  assert(report.backups_verified() == 1);
  assert(report.backups_failed() == 1);
  assert(report.summary().success_rate() == 50.0);
  assert(fs::exists(report.report_file()));

  const auto history = verifier.GetVerificationHistory(1);
  assert(history.size() == 1);
  assert(history[0].backups_verified() == 1);

  const auto good_status = verifier.LastKnownStatus(good);
  assert(good_status && good_status->overall_status() == "PASS");
  const auto bad_status = verifier.LastKnownStatus(bad);
  assert(bad_status && bad_status->overall_status() != "PASS");
  assert(!verifier.LastKnownStatus(sandbox.Root() / "backups" / "never_seen.db"));
}

void TestBatchRunWithoutBackups() {
  Sandbox        sandbox("verify_batch_empty");
  BackupVerifier verifier(sandbox.Config());

  const auto missing = verifier.RunBatchVerification(sandbox.Root() / "no_such_dir");
  assert(missing.error() == "Backup directory does not exist");
  assert(missing.report_file().empty());

  fs::create_directories(sandbox.Root() / "empty");
  const auto empty = verifier.RunBatchVerification(sandbox.Root() / "empty");
  assert(empty.error() == "No backup files found");
  assert(verifier.GetVerificationHistory(30).empty());
}

void TestCancelledBatchStopsBeforeFirstFile() {
  Sandbox sandbox("verify_batch_cancel");
  SeedLive(sandbox);
  (void)CopyLive(sandbox, "one.db");
  (void)CopyLive(sandbox, "two.db");

  canary::util::CancellationToken cancel;
  cancel.Cancel();
  BackupVerifier verifier(sandbox.Config(), &cancel);
  const auto     report = verifier.RunBatchVerification();
  assert(report.cancelled());
  assert(report.verification_results_size() == 0);
  assert(report.backups_verified() == 0);
}

} // namespace

int main() {
  TestIdenticalCopyIsValid();
  TestMissingTableFailsSchemaCheck();
  TestChangedColumnFailsSchemaCheck();
  TestSidecarMismatchIsReported();
  TestNullInRequiredColumnFailsSample();
  TestUnreadableInputs();
  TestSqlDumpIsLoadedAndChecked();
  TestRestorationRunsOnAScratchCopy();
  TestRestorationOfGarbageCleansUp();
  TestBatchRunPersistsReport();
  TestBatchRunWithoutBackups();
  TestCancelledBatchStopsBeforeFirstFile();

  std::cout << "canary_unit_backup_verifier: pass\n";
  return 0;
}
