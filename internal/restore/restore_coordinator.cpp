#include "restore_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <system_error>

#include "internal/bundle/system_bundle.hpp"
#include "internal/bundle/tar_gz.hpp"
#include "internal/db/sqlite/schema_inspector.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_statement.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_lock.hpp"
#include "internal/util/fs.hpp"
#include "internal/util/time.hpp"

namespace canary::restore {

namespace fs = std::filesystem;

using db::sqlite::SqliteDB;
using db::sqlite::Statement;
using observability::StringField;
using util::ErrorCode;

namespace {

constexpr const char* kCreateRestoreHistory = R"sql(
CREATE TABLE IF NOT EXISTS restore_history (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp TEXT NOT NULL,
    backup_file TEXT NOT NULL,
    restore_type TEXT NOT NULL,
    safety_backup TEXT,
    status TEXT NOT NULL,
    notes TEXT
))sql";

const std::vector<std::string> kRestorableExtensions = {".db", ".sqlite", ".json", ".tar.gz", ".tgz", ".sql", ".zip"};

// Thrown inside a restore body to end it with a specific code.
class RestoreAbort : public std::runtime_error {
 public:
  RestoreAbort(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode Code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

void AppendNote(RestoreOutcome* out, const std::string& note) {
  if (!out->notes.empty()) {
    out->notes += "; ";
  }
  out->notes += note;
}

void RemoveIfExists(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    throw util::StorageError("Cannot remove " + path.string() + ": " + ec.message());
  }
}

// Everything in source except the file named skip, copied over destination.
void CopyDataDirectory(const fs::path& source, const fs::path& destination, const std::string& skip) {
  fs::create_directories(destination);
  for (const auto& entry : fs::directory_iterator(source)) {
    const auto name = entry.path().filename();
    if (name == skip) {
      continue;
    }
    if (entry.is_directory()) {
      util::CopyTree(entry.path(), destination / name);
    } else if (entry.is_regular_file()) {
      fs::copy_file(entry.path(), destination / name, fs::copy_options::overwrite_existing);
    }
  }
}

} // namespace

VerificationPolicy ParseVerificationPolicy(const std::string& text) {
  if (text.empty() || text == "refuse") {
    return VerificationPolicy::Refuse;
  }
  if (text == "warn") {
    return VerificationPolicy::Warn;
  }
  if (text == "skip") {
    return VerificationPolicy::Skip;
  }
  throw util::InvalidState("Unknown verification policy: " + text);
}

RestoreCoordinator::RestoreCoordinator(runtime::config::RuntimeConfig config,
                                       std::shared_ptr<const verify::BackupVerifier> verifier)
    : config_(std::move(config)), verifier_(std::move(verifier)),
      policy_(ParseVerificationPolicy(config_.restore().verification_policy())) {
  if (!verifier_) {
    throw util::InvalidState("RestoreCoordinator requires a verifier");
  }
}

fs::path RestoreCoordinator::DatabasePath() const {
  return config_.database().path();
}

std::vector<verify::BackupArtifact> RestoreCoordinator::ListAvailableBackups(
    const std::optional<fs::path>& directory) const {
  return verify::DiscoverArtifacts(directory.value_or(fs::path(config_.restore().backup_directory())),
                                   kRestorableExtensions);
}

std::optional<fs::path> RestoreCoordinator::CreateSafetyBackup(const fs::path& target) const {
  if (!fs::exists(target)) {
    return std::nullopt;
  }

  const std::string base = target.string() + ".safety_backup." + util::FileStamp(util::Now());
  fs::path          safety(base);
  for (int n = 1; fs::exists(safety); ++n) {
    safety = base + "_" + std::to_string(n);
  }

  // Online backup so commits still in the WAL are part of the copy. A live
  // file sqlite cannot read (the usual reason to restore) is copied as bytes.
  auto tmp = safety;
  tmp += ".tmp";
  try {
    db::sqlite::BackupTo(target.string(), tmp.string(), config_.database().busy_timeout_ms());
    util::SyncFile(tmp);
    fs::rename(tmp, safety);
    util::SyncDirectory(safety.parent_path());
  } catch (const db::sqlite::SqliteError& e) {
    std::error_code ec;
    fs::remove(tmp, ec);
    if (db::sqlite::Translate(e.Code()) != ErrorCode::IntegrityFailure) {
      throw;
    }
    CANARY_LOG_WARN("live database unreadable, copying file as-is",
                    {StringField("target", target.string()), StringField("error", e.what())});
    util::AtomicCopyFile(target, safety);
  } catch (...) {
    std::error_code ec;
    fs::remove(tmp, ec);
    throw;
  }
  CANARY_LOG_INFO("safety backup created", {StringField("target", target.string()), StringField("path", safety.string())});
  return safety;
}

// ---------------------------------------------------------------------------
// Restore sequence
// ---------------------------------------------------------------------------

RestoreOutcome RestoreCoordinator::Run(const fs::path& file, verify::BackupType type, const ConfirmFn& confirm,
                                       const std::string& prompt, const Body& body) {
  RestoreOutcome out;
  out.backup_file  = file.string();
  out.restore_type = verify::ToString(type);
  out.status       = "failed";

  auto finish = [&](ErrorCode code, const std::string& msg) {
    out.result = util::Result::Err(code, msg);
    AppendNote(&out, msg);
    CANARY_LOG_ERROR("restore failed", {StringField("backup", out.backup_file), StringField("error", msg)});
    Audit(&out);
    return out;
  };

  if (!fs::exists(file)) {
    return finish(ErrorCode::NotFound, "Backup file does not exist: " + file.string());
  }

  if (!confirm || !confirm(prompt)) {
    out.status = "declined";
    out.result = util::Result::Err(ErrorCode::ConfirmationDeclined, "Restore not confirmed");
    AppendNote(&out, "Restore declined by operator");
    CANARY_LOG_WARN("restore declined", {StringField("backup", out.backup_file)});
    Audit(&out);
    return out;
  }

  auto lock = util::FileLock::TryAcquire(config_.lock().path(), std::chrono::milliseconds(config_.lock().timeout_ms()));
  if (!lock) {
    return finish(ErrorCode::Busy, "Database lock held by another writer: " + config_.lock().path());
  }

  try {
    body(&out);
  } catch (const RestoreAbort& e) {
    return finish(e.Code(), e.what());
  } catch (const util::IntegrityFailure& e) {
    return finish(ErrorCode::IntegrityFailure, e.what());
  } catch (const util::UnsupportedFormat& e) {
    return finish(ErrorCode::UnsupportedFormat, e.what());
  } catch (const std::exception& e) {
    return finish(ErrorCode::IOError, e.what());
  }

  out.status = "success";
  out.result = util::Result::Ok();
  CANARY_LOG_INFO("restore completed",
                  {StringField("backup", out.backup_file), StringField("type", out.restore_type),
                   StringField("safety_backup", out.safety_backup ? out.safety_backup->string() : "")});
  Audit(&out);
  return out;
}

std::optional<std::string> RestoreCoordinator::VerificationGate(const fs::path& candidate, const fs::path& source,
                                                                RestoreOutcome* out) const {
  if (policy_ == VerificationPolicy::Skip) {
    AppendNote(out, "Verification skipped");
    return std::nullopt;
  }

  std::string problem;
  const auto  report = verifier_->VerifyIntegrity(candidate);
  if (!report.overall_valid()) {
    problem = "Backup failed verification: " + (report.errors_size() > 0 ? report.errors(0) : std::string("unknown error"));
  } else if (auto last = verifier_->LastKnownStatus(source); last && last->overall_status() != "PASS") {
    problem = "Last batch verification reported " + last->overall_status() + " for " + source.filename().string();
  }

  if (problem.empty()) {
    return std::nullopt;
  }
  if (policy_ == VerificationPolicy::Warn) {
    CANARY_LOG_WARN("restoring despite verification failure", {StringField("backup", source.string()), StringField("problem", problem)});
    AppendNote(out, "Verification warning: " + problem);
    return std::nullopt;
  }
  return problem;
}

void RestoreCoordinator::SwapDatabase(const fs::path& staged) const {
  const fs::path target = DatabasePath();
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path());
  }
  util::AtomicCopyFile(staged, target);

  // Journals belong to the replaced file.
  RemoveIfExists(target.string() + "-wal");
  RemoveIfExists(target.string() + "-shm");
  RemoveIfExists(target.string() + "-journal");
}

RestoreOutcome RestoreCoordinator::RestoreDatabase(const fs::path& backup, const ConfirmFn& confirm) {
  const std::string prompt = "Replace " + DatabasePath().string() + " with " + backup.string() + "?";

  return Run(backup, verify::BackupType::Database, confirm, prompt, [&](RestoreOutcome* out) {
    out->safety_backup = CreateSafetyBackup(DatabasePath());
    if (out->safety_backup) {
      AppendNote(out, "Safety backup: " + out->safety_backup->string());
    }

    if (auto refused = VerificationGate(backup, backup, out)) {
      throw RestoreAbort(ErrorCode::IntegrityFailure, *refused);
    }
    SwapDatabase(backup);
  });
}

RestoreOutcome RestoreCoordinator::RestoreSqlDump(const fs::path& dump, const ConfirmFn& confirm) {
  const std::string prompt = "Rebuild " + DatabasePath().string() + " from SQL dump " + dump.string() + "?";

  return Run(dump, verify::BackupType::SqlDump, confirm, prompt, [&](RestoreOutcome* out) {
    out->safety_backup = CreateSafetyBackup(DatabasePath());
    if (out->safety_backup) {
      AppendNote(out, "Safety backup: " + out->safety_backup->string());
    }

    const fs::path staging_dir = config_.restore().staging_directory();
    if (!staging_dir.empty()) {
      fs::create_directories(staging_dir);
    }
    auto staged = util::ScopedTempPath::MakeFile(staging_dir, "sql_restore_", ".db");
    {
      const auto sql = util::ReadFileContents(dump);
      SqliteDB   db(staged.Path().string());
      db.Exec(sql);
    }

    if (auto refused = VerificationGate(staged.Path(), dump, out)) {
      throw RestoreAbort(ErrorCode::IntegrityFailure, *refused);
    }
    SwapDatabase(staged.Path());
  });
}

RestoreOutcome RestoreCoordinator::RestoreFullSystem(const fs::path& bundle_file, const ConfirmFn& confirm) {
  const std::string prompt = "Replace live data, config and logs with the contents of " + bundle_file.string() + "?";

  return Run(bundle_file, verify::BackupType::FullSystem, confirm, prompt, [&](RestoreOutcome* out) {
    const auto name = bundle_file.filename().string();
    if (!util::HasSuffix(name, ".tar.gz") && !util::HasSuffix(name, ".tgz")) {
      throw RestoreAbort(ErrorCode::UnsupportedFormat, "Full system restore requires a .tar.gz bundle: " + name);
    }

    const fs::path staging_dir = config_.restore().staging_directory();
    if (!staging_dir.empty()) {
      fs::create_directories(staging_dir);
    }
    auto staging = util::ScopedTempPath::MakeDirectory(staging_dir, "system_restore_");
    bundle::ExtractTarGz(bundle_file, staging.Path());

    const auto db_file = DatabasePath().filename().string();
    auto       layout  = bundle::FindBundleRoot(staging.Path(), db_file);
    if (!layout) {
      throw RestoreAbort(ErrorCode::IntegrityFailure,
                         "Bundle does not contain " + std::string(bundle::kDataDir) + "/" + db_file);
    }

    if (auto refused = VerificationGate(layout->database, bundle_file, out)) {
      throw RestoreAbort(ErrorCode::IntegrityFailure, *refused);
    }

    // The database gets its own copy: it need not live under data/.
    const auto safety_db = CreateSafetyBackup(DatabasePath());
    if (safety_db) {
      AppendNote(out, "Database safety backup: " + safety_db->string());
    }

    bundle::SystemLayout live;
    live.data_directory   = config_.system().data_directory();
    live.config_directory = config_.system().config_directory();
    live.logs_directory   = config_.system().log_directory();
    live.exclude          = {config_.restore().backup_directory(), config_.verification().backup_directory(),
                             config_.archival().archive_directory(), config_.restore().staging_directory(),
                             config_.lock().path()};
    if (safety_db) {
      live.database          = DatabasePath();
      live.database_snapshot = *safety_db;
      live.exclude.push_back(*safety_db);
    }

    const bool have_live = fs::exists(live.data_directory) || fs::exists(live.config_directory) ||
                           fs::exists(live.logs_directory);
    out->safety_backup = safety_db;
    if (have_live) {
      const fs::path safety_dir = config_.restore().backup_directory();
      fs::create_directories(safety_dir);
      const auto stamp = util::FileStamp(util::Now());
      fs::path   safety = safety_dir / ("safety_backup_" + stamp + ".tar.gz");
      bundle::WriteSystemBundle(safety, "safety_backup_" + stamp, live);
      out->safety_backup = safety;
      AppendNote(out, "Safety backup: " + safety.string());
    }

    SwapDatabase(layout->database);
    if (!live.data_directory.empty()) {
      CopyDataDirectory(layout->root / bundle::kDataDir, live.data_directory, db_file);
    }

    const auto config_src = layout->root / bundle::kConfigDir;
    if (fs::is_directory(config_src) && !live.config_directory.empty()) {
      util::CopyTree(config_src, live.config_directory);
    }
    const auto logs_src = layout->root / bundle::kLogsDir;
    if (fs::is_directory(logs_src) && !live.logs_directory.empty()) {
      util::CopyTree(logs_src, live.logs_directory);
    }
  });
}

RestoreOutcome RestoreCoordinator::RestoreFromBackup(const fs::path& file, std::optional<verify::BackupType> type,
                                                     const ConfirmFn& confirm) {
  const auto resolved = type.value_or(verify::InferBackupType(file));
  switch (resolved) {
    case verify::BackupType::Database:
      return RestoreDatabase(file, confirm);
    case verify::BackupType::FullSystem:
      return RestoreFullSystem(file, confirm);
    case verify::BackupType::SqlDump:
      return RestoreSqlDump(file, confirm);
    case verify::BackupType::JsonData:
    case verify::BackupType::Archive:
    case verify::BackupType::Unknown:
      break;
  }

  RestoreOutcome out;
  out.backup_file  = file.string();
  out.restore_type = verify::ToString(resolved);
  out.status       = "failed";
  out.result       = util::Result::Err(ErrorCode::UnsupportedFormat,
                                       "Unsupported restore type: " + std::string(verify::ToString(resolved)));
  out.notes        = out.result.message;
  CANARY_LOG_ERROR("restore failed", {StringField("backup", out.backup_file), StringField("error", out.notes)});
  Audit(&out);
  return out;
}

// ---------------------------------------------------------------------------
// Audit trail
// ---------------------------------------------------------------------------

// Every attempt is recorded, so with no live file this creates one holding
// only restore_history.
void RestoreCoordinator::Audit(RestoreOutcome* out) const {
  try {
    const fs::path target = DatabasePath();
    if (target.has_parent_path()) {
      fs::create_directories(target.parent_path());
    }
    SqliteDB db(target.string());
    db.Exec(kCreateRestoreHistory);

    // Databases restored from older backups may carry restore_history without safety_backup.
    const auto columns = db::sqlite::TableColumns(db, "restore_history");
    const bool has_safety =
        std::any_of(columns.begin(), columns.end(), [](const db::sqlite::ColumnInfo& c) { return c.name == "safety_backup"; });

    const std::string safety = out->safety_backup ? out->safety_backup->string() : "";
    if (has_safety) {
      Statement stmt(db.Handle(),
                     "INSERT INTO restore_history (timestamp, backup_file, restore_type, safety_backup, status, notes) "
                     "VALUES (?, ?, ?, ?, ?, ?)");
      stmt.BindText(1, util::ToIso8601(util::Now()));
      stmt.BindText(2, out->backup_file);
      stmt.BindText(3, out->restore_type);
      if (out->safety_backup) {
        stmt.BindText(4, safety);
      } else {
        stmt.BindNull(4);
      }
      stmt.BindText(5, out->status);
      stmt.BindText(6, out->notes);
      stmt.Run();
    } else {
      Statement stmt(db.Handle(),
                     "INSERT INTO restore_history (timestamp, backup_file, restore_type, status, notes) "
                     "VALUES (?, ?, ?, ?, ?)");
      stmt.BindText(1, util::ToIso8601(util::Now()));
      stmt.BindText(2, out->backup_file);
      stmt.BindText(3, out->restore_type);
      stmt.BindText(4, out->status);
      stmt.BindText(5, out->notes);
      stmt.Run();
    }
  } catch (const std::exception& e) {
    CANARY_LOG_ERROR("restore history not recorded", {StringField("backup", out->backup_file), StringField("error", e.what())});
    if (out->result) {
      out->result = util::Result::Err(ErrorCode::IOError, std::string("Restore history not recorded: ") + e.what());
    }
  }
}

std::vector<RestoreRecord> RestoreCoordinator::GetRestoreHistory(uint32_t limit) const {
  std::vector<RestoreRecord> records;
  const fs::path             target = DatabasePath();
  if (!fs::exists(target)) {
    return records;
  }

  SqliteDB db(target.string(), SqliteDB::Options{.read_only = true});
  if (!db::sqlite::TableExists(db, "restore_history")) {
    return records;
  }

  const auto columns    = db::sqlite::TableColumns(db, "restore_history");
  const bool has_safety = std::any_of(columns.begin(), columns.end(),
                                      [](const db::sqlite::ColumnInfo& c) { return c.name == "safety_backup"; });

  Statement stmt(db.Handle(), std::string("SELECT id, timestamp, backup_file, restore_type, ") +
                                  (has_safety ? "safety_backup" : "NULL") +
                                  ", status, notes FROM restore_history ORDER BY id DESC LIMIT ?");
  stmt.BindInt64(1, limit);
  while (stmt.Step()) {
    RestoreRecord r;
    r.id           = stmt.ColumnInt64(0);
    r.timestamp    = stmt.ColumnText(1);
    r.backup_file  = stmt.ColumnText(2);
    r.restore_type = stmt.ColumnText(3);
    r.safety_backup = stmt.IsNull(4) ? "" : stmt.ColumnText(4);
    r.status       = stmt.ColumnText(5);
    r.notes        = stmt.IsNull(6) ? "" : stmt.ColumnText(6);
    records.push_back(std::move(r));
  }
  return records;
}

} // namespace canary::restore
