#include "backup_verifier.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

#include "internal/bundle/system_bundle.hpp"
#include "internal/bundle/tar_gz.hpp"
#include "internal/db/sqlite/sqlite_statement.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/fs.hpp"
#include "internal/util/json.hpp"
#include "internal/util/sha256.hpp"
#include "internal/util/time.hpp"
#include "backup_artifact.hpp"

namespace canary::verify {

namespace fs = std::filesystem;

using db::sqlite::SqliteDB;
using db::sqlite::Statement;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kReportPrefix = "verification_report_";

// Written into the live database by every restore attempt; older backups predate it.
constexpr const char* kRestoreAuditTable = "restore_history";

double SecondsSince(std::chrono::steady_clock::time_point start, std::chrono::steady_clock::time_point end) {
  return std::chrono::duration<double>(end - start).count();
}

// "<hex>  <name>" as written by sha256sum; first token only.
std::optional<std::string> ReadSidecarChecksum(const fs::path& file) {
  auto sidecar = file;
  sidecar += ".sha256";

  std::error_code ec;
  if (!fs::is_regular_file(sidecar, ec)) {
    return std::nullopt;
  }
  std::istringstream in(util::ReadFileContents(sidecar));
  std::string        token;
  in >> token;
  std::transform(token.begin(), token.end(), token.begin(), [](unsigned char c) { return std::tolower(c); });
  return token;
}

bool SameFile(const fs::path& a, const fs::path& b) {
  std::error_code ec;
  if (fs::equivalent(a, b, ec)) return true;
  return fs::absolute(a).lexically_normal() == fs::absolute(b).lexically_normal();
}

} // namespace

BackupVerifier::BackupVerifier(runtime::config::RuntimeConfig config, const util::CancellationToken* cancel)
    : config_(std::move(config)), cancel_(cancel) {
}

std::string BackupVerifier::ComputeChecksum(const fs::path& file) const {
  return util::Sha256File(file);
}

std::shared_ptr<SqliteDB> BackupVerifier::OpenBackup(const fs::path& file) const {
  if (InferBackupType(file) == BackupType::SqlDump) {
    auto db = SqliteDB::InMemory();
    db->Exec(util::ReadFileContents(file));
    return db;
  }

  SqliteDB::Options options;
  options.read_only       = true;
  options.busy_timeout_ms = config_.database().busy_timeout_ms();
  auto db                 = std::make_shared<SqliteDB>(file.string(), options);

  // open is lazy; force the header read so garbage fails here
  Statement header(db->Handle(), "SELECT COUNT(*) FROM sqlite_master;");
  header.Step();
  return db;
}

std::shared_ptr<SqliteDB> BackupVerifier::OpenLive() const {
  std::error_code ec;
  const fs::path  live(config_.database().path());
  if (!fs::is_regular_file(live, ec)) {
    return nullptr;
  }
  SqliteDB::Options options;
  options.read_only       = true;
  options.busy_timeout_ms = config_.database().busy_timeout_ms();
  return std::make_shared<SqliteDB>(live.string(), options);
}

db::sqlite::SchemaFingerprint BackupVerifier::InspectSchema(const fs::path& file) const {
  auto db = OpenBackup(file);
  return db::sqlite::InspectSchema(*db);
}

bool BackupVerifier::SampleDatabase(SqliteDB& db, std::vector<std::string>* errors) const {
  const auto limit = config_.verification().test_sample_size();
  bool       valid = true;

  for (const auto& table : config_.verification().critical_tables()) {
    if (!db::sqlite::TableExists(db, table)) {
      continue;
    }

    const auto columns = db::sqlite::TableColumns(db, table);
    Statement  rows(db.Handle(), "SELECT * FROM " + db::sqlite::QuoteIdentifier(table) + " LIMIT ?;");
    rows.BindInt64(1, limit);

    int64_t row_index = 0;
    while (rows.Step()) {
      const int n = std::min<int>(rows.ColumnCount(), static_cast<int>(columns.size()));
      for (int col = 0; col < n; ++col) {
        if (columns[col].not_null && rows.IsNull(col)) {
          valid = false;
          if (errors != nullptr) {
            errors->push_back("NULL in NOT NULL column " + table + "." + columns[col].name + " (sample row " +
                              std::to_string(row_index) + ")");
          }
        }
      }
      ++row_index;
    }
  }
  return valid;
}

bool BackupVerifier::VerifyDataSample(const fs::path& file, std::vector<std::string>* errors) const {
  auto db = OpenBackup(file);
  return SampleDatabase(*db, errors);
}

void BackupVerifier::CheckDatabase(SqliteDB& backup, lifecycle::VerificationReport* report) const {
  {
    Statement check(backup.Handle(), "PRAGMA quick_check;");
    while (check.Step()) {
      const auto line = check.ColumnText(0);
      if (line != "ok") {
        report->add_errors("Integrity check failed: " + line);
      }
    }
  }

  const auto backup_schema = db::sqlite::InspectSchema(backup);
  report->set_table_count(static_cast<uint32_t>(backup_schema.size()));

  // schema comparison against the live database
  try {
    auto live = OpenLive();
    if (!live) {
      CANARY_LOG_WARN("live database missing; schema comparison skipped",
                      {StringField("database", config_.database().path())});
      report->set_schema_valid(true);
      report->mutable_schema_comparison()->set_backup_tables(static_cast<uint32_t>(backup_schema.size()));
    } else {
      const auto live_schema = db::sqlite::InspectSchema(*live);
      bool       matches     = true;
      uint32_t   common      = 0;

      for (const auto& [name, info] : live_schema) {
        if (name == kRestoreAuditTable) {
          continue;
        }
        auto it = backup_schema.find(name);
        if (it == backup_schema.end()) {
          matches = false;
          report->add_errors("Missing table in backup: " + name);
          continue;
        }
        ++common;
        const auto diff = db::sqlite::DescribeColumnMismatch(info.columns, it->second.columns);
        if (!diff.empty()) {
          matches = false;
          report->add_errors("Schema mismatch in table: " + name + " (" + diff + ")");
        }
      }

      report->set_schema_valid(matches);
      auto* cmp = report->mutable_schema_comparison();
      cmp->set_original_tables(static_cast<uint32_t>(live_schema.size()));
      cmp->set_backup_tables(static_cast<uint32_t>(backup_schema.size()));
      cmp->set_matching_tables(common);
    }
  } catch (const std::exception& e) {
    report->add_errors(std::string("Schema verification failed: ") + e.what());
  }

  try {
    std::vector<std::string> sample_errors;
    report->set_data_sample_valid(SampleDatabase(backup, &sample_errors));
    for (auto& err : sample_errors) {
      report->add_errors(std::move(err));
    }
  } catch (const std::exception& e) {
    report->add_errors(std::string("Data sample verification failed: ") + e.what());
  }
}

void BackupVerifier::VerifyBundle(const fs::path& file, lifecycle::VerificationReport* report) const {
  auto staging = util::ScopedTempPath::MakeDirectory(config_.restore().staging_directory(), "verify_bundle_");

  try {
    bundle::ExtractTarGz(file, staging.Path());
  } catch (const std::exception& e) {
    report->add_errors(std::string("Bundle not readable: ") + e.what());
    return;
  }

  const auto db_name = fs::path(config_.database().path()).filename().string();
  auto       layout  = bundle::FindBundleRoot(staging.Path(), db_name);
  if (!layout) {
    report->add_errors("Bundle has no " + std::string(bundle::kDataDir) + "/" + db_name);
    return;
  }

  std::shared_ptr<SqliteDB> db;
  try {
    db = OpenBackup(layout->database);
  } catch (const std::exception& e) {
    report->add_errors(std::string("Database not readable: ") + e.what());
    return;
  }
  report->set_database_readable(true);
  CheckDatabase(*db, report);
}

lifecycle::VerificationReport BackupVerifier::VerifyIntegrity(const fs::path& file) const {
  lifecycle::VerificationReport report;
  report.set_backup_file(file.string());
  *report.mutable_verified_at() = util::ToProto(util::Now());

  const auto type = InferBackupType(file);
  report.set_backup_type(std::string(ToString(type)));

  std::error_code ec;
  report.set_file_exists(fs::is_regular_file(file, ec));
  if (!report.file_exists()) {
    report.add_errors("Backup file does not exist");
    CANARY_LOG_ERROR("backup verification failed", {StringField("file", file.string()), StringField("error", "missing")});
    return report;
  }

  try {
    report.set_file_size_bytes(fs::file_size(file));
    report.set_checksum(ComputeChecksum(file));

    if (auto expected = ReadSidecarChecksum(file); expected && *expected != report.checksum()) {
      report.add_errors("Checksum mismatch: sidecar has " + *expected + ", file hashes to " + report.checksum());
    }

    if (type == BackupType::FullSystem) {
      VerifyBundle(file, &report);
    } else if (type == BackupType::Database || type == BackupType::SqlDump || type == BackupType::Unknown) {
      std::shared_ptr<SqliteDB> db;
      try {
        db = OpenBackup(file);
        report.set_database_readable(true);
      } catch (const std::exception& e) {
        report.add_errors(std::string("Database not readable: ") + e.what());
      }
      if (db) {
        CheckDatabase(*db, &report);
      }
    } else {
      report.add_errors("Unsupported backup type for verification: " + std::string(ToString(type)));
    }
  } catch (const std::exception& e) {
    report.add_errors(std::string("General verification error: ") + e.what());
  }

  report.set_overall_valid(report.file_exists() && report.database_readable() && report.schema_valid() &&
                           report.data_sample_valid() && report.errors_size() == 0);

  if (report.overall_valid()) {
    CANARY_LOG_INFO("backup verified", {StringField("file", file.string()), IntField("tables", report.table_count())});
  } else {
    CANARY_LOG_ERROR("backup verification failed",
                     {StringField("file", file.string()), IntField("errors", report.errors_size()),
                      StringField("first_error", report.errors_size() > 0 ? report.errors(0) : "")});
  }
  return report;
}

lifecycle::RestorationReport BackupVerifier::TestRestoration(const fs::path& file) const {
  lifecycle::RestorationReport report;
  report.set_backup_file(file.string());
  *report.mutable_tested_at() = util::ToProto(util::Now());

  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    report.add_errors("Backup file does not exist");
    return report;
  }

  const auto type   = InferBackupType(file);
  const auto suffix = type == BackupType::SqlDump ? ".sql" : ".db";

  try {
    const auto start = std::chrono::steady_clock::now();

    auto copy = util::ScopedTempPath::MakeFile(config_.restore().staging_directory(), "restore_test_", suffix);
    fs::copy_file(file, copy.Path(), fs::copy_options::overwrite_existing);

    const auto copied = std::chrono::steady_clock::now();
    report.mutable_performance_metrics()->set_copy_time_seconds(SecondsSince(start, copied));

    const auto verification = VerifyIntegrity(copy.Path());
    report.set_data_integrity_verified(verification.data_sample_valid());
    for (const auto& err : verification.errors()) {
      report.add_errors(err);
    }

    bool operations_ok = true;
    if (verification.database_readable()) {
      try {
        auto  db    = OpenBackup(copy.Path());
        auto* tests = report.mutable_operation_tests();

        Statement tables(db->Handle(), "SELECT COUNT(*) FROM sqlite_master WHERE type='table';");
        if (tables.Step()) {
          tests->set_table_count(static_cast<uint32_t>(tables.ColumnInt64(0)));
        }

        if (db::sqlite::TableExists(*db, "weekly_digests") && db::sqlite::TableExists(*db, "user_feedback")) {
          Statement join(db->Handle(),
                         "SELECT COUNT(*) FROM weekly_digests w LEFT JOIN user_feedback f ON w.date = f.digest_date;");
          if (join.Step()) {
            tests->set_join_test(join.ColumnInt64(0));
          }
        } else {
          tests->set_join_skipped(true);
        }
      } catch (const std::exception& e) {
        operations_ok = false;
        report.add_errors(std::string("Operation test failed: ") + e.what());
      }
    }

    report.set_restoration_successful(verification.overall_valid() && operations_ok);

    const auto end = std::chrono::steady_clock::now();
    report.mutable_performance_metrics()->set_verification_time_seconds(SecondsSince(copied, end));
    report.mutable_performance_metrics()->set_total_time_seconds(SecondsSince(start, end));
  } catch (const std::exception& e) {
    report.set_restoration_successful(false);
    report.add_errors(std::string("Restoration test failed: ") + e.what());
  }

  CANARY_LOG_INFO("restoration test finished",
                  {StringField("file", file.string()), observability::BoolField("successful", report.restoration_successful()),
                   observability::SecondsField("copy_s", report.performance_metrics().copy_time_seconds()),
                   observability::SecondsField("total_s", report.performance_metrics().total_time_seconds())});
  return report;
}

lifecycle::BatchVerificationReport BackupVerifier::RunBatchVerification(const std::optional<fs::path>& directory) {
  const auto& cfg = config_.verification();
  const fs::path dir = directory.value_or(fs::path(cfg.backup_directory()));
  const auto     now = util::Now();

  lifecycle::BatchVerificationReport report;
  *report.mutable_started_at() = util::ToProto(now);
  report.set_backup_directory(dir.string());

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    report.set_error("Backup directory does not exist");
    CANARY_LOG_ERROR("batch verification aborted", {StringField("directory", dir.string()), StringField("error", report.error())});
    return report;
  }

  std::vector<std::string> extensions(cfg.backup_extensions().begin(), cfg.backup_extensions().end());
  const auto               found = DiscoverArtifacts(dir, extensions);
  report.set_backups_found(static_cast<uint32_t>(found.size()));

  if (found.empty()) {
    report.set_error("No backup files found");
    CANARY_LOG_ERROR("batch verification aborted", {StringField("directory", dir.string()), StringField("error", report.error())});
    return report;
  }

  const auto cutoff = util::DaysAgo(now, cfg.max_backup_age_days());
  std::vector<BackupArtifact> recent;
  for (const auto& a : found) {
    if (a.modified > cutoff) {
      recent.push_back(a);
    }
  }
  report.set_backups_considered(static_cast<uint32_t>(recent.size()));
  CANARY_LOG_INFO("verifying recent backups", {StringField("directory", dir.string()),
                                               IntField("found", static_cast<int64_t>(found.size())),
                                               IntField("recent", static_cast<int64_t>(recent.size()))});

  uint64_t total_bytes = 0;
  for (const auto& artifact : recent) {
    total_bytes += artifact.size_bytes;

    if (cancel_ != nullptr && cancel_->IsCancelled()) {
      report.set_cancelled(true);
      CANARY_LOG_WARN("batch verification cancelled", {IntField("remaining", static_cast<int64_t>(recent.size()) -
                                                                                 report.verification_results_size())});
      break;
    }

    auto* item = report.add_verification_results();
    item->set_backup_file(artifact.path.string());
    item->set_backup_age_days(AgeInDays(artifact, now));

    try {
      *item->mutable_integrity_check() = VerifyIntegrity(artifact.path);
      bool pass                        = item->integrity_check().overall_valid();

      if (artifact.type == BackupType::Database) {
        *item->mutable_restoration_test() = TestRestoration(artifact.path);
        pass                              = pass && item->restoration_test().restoration_successful();
      }
      item->set_overall_status(pass ? "PASS" : "FAIL");
    } catch (const std::exception& e) {
      CANARY_LOG_ERROR("backup verification error", {StringField("file", artifact.path.string()), StringField("error", e.what())});
      item->set_overall_status("ERROR");
      item->set_error(e.what());
    }

    if (item->overall_status() == "PASS") {
      report.set_backups_verified(report.backups_verified() + 1);
    } else {
      report.set_backups_failed(report.backups_failed() + 1);
    }
  }

  auto* summary = report.mutable_summary();
  summary->set_success_rate(recent.empty() ? 0.0 : 100.0 * report.backups_verified() / recent.size());
  summary->set_total_backup_size_mb(static_cast<double>(total_bytes) / (1024.0 * 1024.0));
  for (const auto& item : report.verification_results()) {
    if (item.overall_status() != "PASS") continue;
    const auto age = item.backup_age_days();
    if (!summary->has_oldest_verified_backup() || age > summary->oldest_verified_backup()) {
      summary->set_oldest_verified_backup(age);
    }
    if (!summary->has_newest_verified_backup() || age < summary->newest_verified_backup()) {
      summary->set_newest_verified_backup(age);
    }
  }

  const auto completed             = util::Now();
  *report.mutable_completed_at()   = util::ToProto(completed);
  const fs::path report_file       = fs::path(cfg.report_directory()) / (kReportPrefix + util::FileStamp(completed) + ".json");
  report.set_report_file(report_file.string());
  util::WriteJsonFile(report_file, report);

  CANARY_LOG_INFO("batch verification completed",
                  {IntField("verified", report.backups_verified()), IntField("failed", report.backups_failed()),
                   IntField("found", report.backups_found()), StringField("report", report_file.string())});
  return report;
}

std::vector<fs::path> BackupVerifier::ReportFiles() const {
  std::vector<fs::path> files;
  std::error_code       ec;
  const fs::path        dir(config_.verification().report_directory());
  if (!fs::is_directory(dir, ec)) {
    return files;
  }
  for (const auto& entry : fs::directory_iterator(dir)) {
    const auto name = entry.path().filename().string();
    if (entry.is_regular_file() && name.rfind(kReportPrefix, 0) == 0 && util::HasSuffix(name, ".json")) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::vector<lifecycle::BatchVerificationReport> BackupVerifier::GetVerificationHistory(uint32_t days) const {
  const auto cutoff = util::DaysAgo(util::Now(), days);

  std::vector<lifecycle::BatchVerificationReport> history;
  for (const auto& file : ReportFiles()) {
    try {
      if (util::LastWriteTime(file) <= cutoff) continue;
      lifecycle::BatchVerificationReport report;
      util::ReadJsonFile(file, &report);
      history.push_back(std::move(report));
    } catch (const std::exception& e) {
      CANARY_LOG_WARN("unreadable verification report skipped", {StringField("file", file.string()), StringField("error", e.what())});
    }
  }
  return history;
}

std::optional<lifecycle::BatchItemResult> BackupVerifier::LastKnownStatus(const fs::path& file) const {
  auto files = ReportFiles();
  for (auto it = files.rbegin(); it != files.rend(); ++it) {
    lifecycle::BatchVerificationReport report;
    try {
      util::ReadJsonFile(*it, &report);
    } catch (const std::exception& e) {
      CANARY_LOG_WARN("unreadable verification report skipped", {StringField("file", it->string()), StringField("error", e.what())});
      continue;
    }
    for (const auto& item : report.verification_results()) {
      if (SameFile(item.backup_file(), file)) {
        return item;
      }
    }
  }
  return std::nullopt;
}

} // namespace canary::verify
