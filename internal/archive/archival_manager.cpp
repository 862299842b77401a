#include "archival_manager.hpp"

#include <algorithm>
#include <map>
#include <optional>

#include "archive_snapshot.hpp"
#include "internal/bundle/tar_gz.hpp"
#include "internal/db/sqlite/schema_inspector.hpp"
#include "internal/db/sqlite/sqlite_statement.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/migration/migration_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_lock.hpp"
#include "internal/util/fs.hpp"
#include "internal/util/json.hpp"

namespace canary::archive {

namespace fs = std::filesystem;

using db::sqlite::QuoteIdentifier;
using db::sqlite::SqliteDB;
using db::sqlite::SqliteTransaction;
using db::sqlite::Statement;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kRowid = "rowid";

constexpr const char* kCreateArchiveHistory = R"sql(
CREATE TABLE IF NOT EXISTS archive_history (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    table_name TEXT NOT NULL,
    date_column TEXT NOT NULL,
    retention_days INTEGER NOT NULL,
    cutoff TEXT NOT NULL,
    archived_count INTEGER NOT NULL,
    archive_file TEXT NOT NULL,
    archived_at TEXT NOT NULL
))sql";

struct Selection {
  CandidateSet                set;
  std::vector<db::sql::Value> keys;
};

bool HasColumn(const std::vector<db::sqlite::ColumnInfo>& columns, const std::string& name) {
  return std::any_of(columns.begin(), columns.end(), [&](const db::sqlite::ColumnInfo& c) { return c.name == name; });
}

/*
  Rows of table whose date_column is older than cutoff.
  key_column empty: no keys collected. "rowid": the implicit rowid.
*/
Selection SelectOlderThan(SqliteDB& db, const std::string& table, const std::string& date_column, util::TimePoint cutoff,
                          const std::string& key_column) {
  const auto live_columns = db::sqlite::TableColumns(db, table);
  if (!HasColumn(live_columns, date_column)) {
    throw util::InvalidState("Date column " + date_column + " not found in table " + table);
  }

  const bool with_rowid = key_column == kRowid;
  std::string sql       = "SELECT *";
  if (with_rowid) sql += ", rowid";
  sql += " FROM " + QuoteIdentifier(table) + " WHERE julianday(" + QuoteIdentifier(date_column) +
         ") < julianday(?) ORDER BY " + QuoteIdentifier(date_column) + ";";

  Statement stmt(db.Handle(), sql);
  stmt.BindText(1, util::ToSqlTimestamp(cutoff));

  Selection out;
  out.set.cutoff = cutoff;

  const int total  = stmt.ColumnCount();
  const int width  = with_rowid ? total - 1 : total;
  for (int i = 0; i < width; ++i) {
    out.set.columns.push_back(stmt.ColumnName(i));
  }

  int key_index = -1;
  if (with_rowid) {
    key_index = total - 1;
  } else if (!key_column.empty()) {
    auto it = std::find(out.set.columns.begin(), out.set.columns.end(), key_column);
    if (it == out.set.columns.end()) {
      throw util::InvalidState("Primary key column " + key_column + " not found in table " + table);
    }
    key_index = static_cast<int>(it - out.set.columns.begin());
  }

  while (stmt.Step()) {
    db::sql::Row row;
    row.reserve(width);
    for (int i = 0; i < width; ++i) {
      row.push_back(stmt.Column(i));
    }
    if (key_index >= 0) {
      out.keys.push_back(stmt.Column(key_index));
    }
    out.set.rows.push_back(std::move(row));
  }
  return out;
}

void SetFailed(lifecycle::TableArchivalResult* r, const std::string& error) {
  r->set_status(lifecycle::ARCHIVAL_STATUS_FAILED);
  r->set_error(error);
  CANARY_LOG_ERROR("table archival failed", {StringField("table", r->table()), StringField("error", error)});
}

std::string ClassifyArchive(const std::string& name) {
  if (name.rfind("archival_report_", 0) == 0 && util::HasSuffix(name, ".json")) return "report";
  if (name.rfind("logs_", 0) == 0 && util::HasSuffix(name, ".tar.gz")) return "log_bundle";
  if (util::HasSuffix(name, ".json.gz")) return "table_snapshot";
  if (util::HasSuffix(name, ".tar.gz") || util::HasSuffix(name, ".tgz")) return "bundle";
  return "other";
}

} // namespace

ArchivalManager::ArchivalManager(std::shared_ptr<SqliteDB> db, runtime::config::RuntimeConfig config,
                                 const util::CancellationToken* cancel)
    : db_(std::move(db)), config_(std::move(config)), policy_(config_.archival()), cancel_(cancel) {
}

std::string ArchivalManager::KeyColumn(const TablePolicy& policy) {
  if (!policy.primary_key.empty()) {
    return policy.primary_key;
  }
  return db::sqlite::PrimaryKeyColumn(*db_, policy.table).value_or(kRowid);
}

std::string ArchivalManager::SchemaVersion() {
  if (!db::sqlite::TableExists(*db_, "schema_migrations")) {
    return std::string(migration::kNoVersion);
  }
  return migration::MigrationEngine(db_, config_).GetCurrentVersion();
}

fs::path ArchivalManager::NextArchivePath(const std::string& stem, const std::string& suffix) const {
  const fs::path dir(config_.archival().archive_directory());
  const auto     base = stem + "_" + util::FileStamp(util::Now());

  auto            path = dir / (base + suffix);
  std::error_code ec;
  for (int n = 1; fs::exists(path, ec); ++n) {
    path = dir / (base + "_" + std::to_string(n) + suffix);
  }
  return path;
}

CandidateSet ArchivalManager::FindCandidates(const std::string& table, const std::string& date_column) {
  const auto cutoff = policy_.Cutoff(table, util::Now());
  return SelectOlderThan(*db_, table, date_column, cutoff, "").set;
}

lifecycle::TableArchivalResult ArchivalManager::ArchiveTable(const std::string& table) {
  lifecycle::TableArchivalResult r;
  r.set_table(table);

  const auto policy = policy_.Find(table);
  if (!policy) {
    SetFailed(&r, "No archival policy configured for table " + table);
    return r;
  }

  const auto now    = util::Now();
  const auto cutoff = util::DaysAgo(now, policy->retention_days);
  r.set_date_column(policy->date_column);
  r.set_retention_days(policy->retention_days);
  *r.mutable_cutoff() = util::ToProto(cutoff);

  try {
    if (!db::sqlite::TableExists(*db_, table)) {
      CANARY_LOG_WARN("table not present, nothing to archive", {StringField("table", table)});
      r.set_status(lifecycle::ARCHIVAL_STATUS_NO_OP);
      return r;
    }

    auto lock = util::FileLock::TryAcquire(config_.lock().path(), std::chrono::milliseconds(config_.lock().timeout_ms()));
    if (!lock) {
      SetFailed(&r, "Database lock held by another writer: " + config_.lock().path());
      return r;
    }

    const auto key_column     = KeyColumn(*policy);
    const auto schema_version = SchemaVersion();

    fs::path written;
    try {
      db::sqlite::WithTransaction(db_, [&](SqliteTransaction& tx) {
        auto sel = SelectOlderThan(tx.DB(), table, policy->date_column, cutoff, key_column);
        if (sel.set.rows.empty()) {
          return;
        }

        lifecycle::TableSnapshot snapshot;
        snapshot.set_table(table);
        snapshot.set_date_column(policy->date_column);
        snapshot.set_primary_key(key_column);
        snapshot.set_retention_days(policy->retention_days);
        *snapshot.mutable_cutoff()      = util::ToProto(cutoff);
        *snapshot.mutable_archived_at() = util::ToProto(now);
        snapshot.set_record_count(sel.set.rows.size());
        snapshot.set_schema_version(schema_version);
        for (const auto& c : sel.set.columns) {
          snapshot.add_columns(c);
        }
        for (const auto& row : sel.set.rows) {
          auto* out = snapshot.add_rows();
          for (const auto& v : row) {
            *out->add_values() = ToProto(v);
          }
        }

        written = NextArchivePath(table, ".json.gz");
        WriteSnapshot(written, snapshot);

        // snapshot is durable; rows may go
        Statement del(tx.Handle(),
                      "DELETE FROM " + QuoteIdentifier(table) + " WHERE " + QuoteIdentifier(key_column) + " = ?;");
        int64_t deleted = 0;
        for (const auto& key : sel.keys) {
          del.Reset();
          del.Bind(1, key);
          del.Run();
          deleted += tx.DB().Changes();
        }
        if (deleted != static_cast<int64_t>(sel.set.rows.size())) {
          throw util::IntegrityFailure("Deleted " + std::to_string(deleted) + " rows but archived " +
                                       std::to_string(sel.set.rows.size()));
        }

        tx.DB().Exec(kCreateArchiveHistory);
        Statement ledger(tx.Handle(),
                         "INSERT INTO archive_history (table_name, date_column, retention_days, cutoff, archived_count, "
                         "archive_file, archived_at) VALUES (?, ?, ?, ?, ?, ?, ?);");
        ledger.BindText(1, table);
        ledger.BindText(2, policy->date_column);
        ledger.BindInt64(3, policy->retention_days);
        ledger.BindText(4, util::ToSqlTimestamp(cutoff));
        ledger.BindInt64(5, deleted);
        ledger.BindText(6, written.string());
        ledger.BindText(7, util::ToSqlTimestamp(now));
        ledger.Run();

        r.set_archived_count(static_cast<uint64_t>(deleted));
        r.set_archive_file(written.string());
      });
    } catch (...) {
      if (!written.empty()) {
        std::error_code ec;
        fs::remove(written, ec);
      }
      throw;
    }
  } catch (const std::exception& e) {
    r.set_archived_count(0);
    r.clear_archive_file();
    SetFailed(&r, e.what());
    return r;
  }

  if (r.archived_count() == 0) {
    r.set_status(lifecycle::ARCHIVAL_STATUS_NO_OP);
    CANARY_LOG_INFO("no rows past retention", {StringField("table", table), IntField("retention_days", policy->retention_days)});
  } else {
    r.set_status(lifecycle::ARCHIVAL_STATUS_ARCHIVED);
    CANARY_LOG_INFO("table archived", {StringField("table", table), IntField("rows", static_cast<int64_t>(r.archived_count())),
                                       StringField("archive", r.archive_file())});
  }
  return r;
}

lifecycle::LogArchivalResult ArchivalManager::ArchiveLogs() {
  lifecycle::LogArchivalResult r;
  const auto&                  cfg = config_.archival();
  const fs::path               log_dir(cfg.log_directory());

  try {
    std::error_code ec;
    if (log_dir.empty() || !fs::is_directory(log_dir, ec)) {
      r.set_status(lifecycle::ARCHIVAL_STATUS_NO_OP);
      return r;
    }

    const auto cutoff = util::DaysAgo(util::Now(), cfg.log_retention_days());

    std::vector<fs::path> old_logs;
    for (const auto& entry : fs::directory_iterator(log_dir)) {
      if (!entry.is_regular_file()) continue;
      const auto name    = entry.path().filename().string();
      const bool matches = std::any_of(cfg.log_extensions().begin(), cfg.log_extensions().end(),
                                       [&](const std::string& ext) { return util::HasSuffix(name, ext); });
      if (matches && util::LastWriteTime(entry.path()) < cutoff) {
        old_logs.push_back(entry.path());
      }
    }
    std::sort(old_logs.begin(), old_logs.end());

    if (old_logs.empty()) {
      r.set_status(lifecycle::ARCHIVAL_STATUS_NO_OP);
      return r;
    }

    auto lock = util::FileLock::TryAcquire(config_.lock().path(), std::chrono::milliseconds(config_.lock().timeout_ms()));
    if (!lock) {
      r.set_status(lifecycle::ARCHIVAL_STATUS_FAILED);
      r.set_error("Database lock held by another writer: " + config_.lock().path());
      CANARY_LOG_ERROR("log archival failed", {StringField("error", r.error())});
      return r;
    }

    std::vector<bundle::TarEntry> entries;
    for (const auto& log : old_logs) {
      entries.push_back(bundle::TarEntry{log.filename().string(), log, false});
    }

    const auto archive = NextArchivePath("logs", ".tar.gz");
    bundle::WriteTarGz(archive, entries);

    if (bundle::ListTarGz(archive).size() != entries.size()) {
      std::error_code rm;
      fs::remove(archive, rm);
      throw util::IntegrityFailure("Log archive entry count mismatch: " + archive.string());
    }

    // archive is durable; originals may go
    std::string remove_errors;
    for (const auto& log : old_logs) {
      std::error_code rm;
      if (!fs::remove(log, rm) && rm) {
        CANARY_LOG_WARN("archived log not removed", {StringField("file", log.string()), StringField("error", rm.message())});
        remove_errors += (remove_errors.empty() ? "" : "; ") + log.string() + ": " + rm.message();
      }
    }

    r.set_archived_files(static_cast<uint32_t>(old_logs.size()));
    r.set_archive_file(archive.string());
    r.set_status(lifecycle::ARCHIVAL_STATUS_ARCHIVED);
    r.set_error(remove_errors);
    CANARY_LOG_INFO("logs archived", {IntField("files", r.archived_files()), StringField("archive", r.archive_file())});
  } catch (const std::exception& e) {
    r.set_status(lifecycle::ARCHIVAL_STATUS_FAILED);
    r.set_error(e.what());
    CANARY_LOG_ERROR("log archival failed", {StringField("error", e.what())});
  }
  return r;
}

lifecycle::ArchivalReport ArchivalManager::RunFullArchival() {
  lifecycle::ArchivalReport report;
  *report.mutable_started_at() = util::ToProto(util::Now());

  try {
    report.set_schema_version(SchemaVersion());
  } catch (const std::exception& e) {
    CANARY_LOG_WARN("schema version unavailable", {StringField("error", e.what())});
  }

  for (const auto& policy : policy_.Tables()) {
    if (cancel_ != nullptr && cancel_->IsCancelled()) {
      report.set_cancelled(true);
      break;
    }

    auto result = ArchiveTable(policy.table);
    if (result.status() == lifecycle::ARCHIVAL_STATUS_ARCHIVED) {
      report.set_tables_archived(report.tables_archived() + 1);
      report.set_total_records_archived(report.total_records_archived() + result.archived_count());
    } else if (result.status() == lifecycle::ARCHIVAL_STATUS_FAILED) {
      report.set_tables_failed(report.tables_failed() + 1);
    }
    *report.add_tables() = std::move(result);
  }

  if (cancel_ != nullptr && cancel_->IsCancelled()) {
    report.set_cancelled(true);
    report.mutable_logs()->set_status(lifecycle::ARCHIVAL_STATUS_CANCELLED);
  } else {
    *report.mutable_logs() = ArchiveLogs();
  }

  const auto completed           = util::Now();
  *report.mutable_completed_at() = util::ToProto(completed);

  const auto report_file = fs::path(config_.archival().archive_directory()) /
                           ("archival_report_" + util::FileStamp(completed) + ".json");
  report.set_report_file(report_file.string());
  util::WriteJsonFile(report_file, report);

  CANARY_LOG_INFO("archival run completed",
                  {IntField("tables_archived", report.tables_archived()), IntField("tables_failed", report.tables_failed()),
                   IntField("records", static_cast<int64_t>(report.total_records_archived())),
                   observability::BoolField("cancelled", report.cancelled()), StringField("report", report_file.string())});
  return report;
}

ArchiveRestoreResult ArchivalManager::RestoreFromArchive(const fs::path& file) {
  ArchiveRestoreResult out;

  lifecycle::TableSnapshot snapshot;
  try {
    snapshot = ReadSnapshot(file);
  } catch (const util::NotFound& e) {
    out.result = util::Result::Err(util::ErrorCode::NotFound, e.what());
    return out;
  } catch (const std::exception& e) {
    out.result = util::Result::Err(util::ErrorCode::IntegrityFailure, e.what());
    CANARY_LOG_ERROR("archive unreadable", {StringField("file", file.string()), StringField("error", e.what())});
    return out;
  }
  out.table = snapshot.table();

  try {
    if (!db::sqlite::TableExists(*db_, snapshot.table())) {
      out.result = util::Result::Err(util::ErrorCode::InvalidState, "Table does not exist: " + snapshot.table());
      CANARY_LOG_ERROR("archive restore failed", {StringField("file", file.string()), StringField("error", out.result.message)});
      return out;
    }

    const auto live_columns = db::sqlite::TableColumns(*db_, snapshot.table());
    for (const auto& c : snapshot.columns()) {
      if (!HasColumn(live_columns, c)) {
        out.result = util::Result::Err(util::ErrorCode::IntegrityFailure,
                                       "Archived column " + c + " not present in live table " + snapshot.table());
        CANARY_LOG_ERROR("archive restore failed", {StringField("file", file.string()), StringField("error", out.result.message)});
        return out;
      }
    }

    // duplicate detection needs the key among the archived columns
    int key_index = -1;
    if (snapshot.primary_key() != kRowid) {
      for (int i = 0; i < snapshot.columns_size(); ++i) {
        if (snapshot.columns(i) == snapshot.primary_key()) key_index = i;
      }
    }

    auto lock = util::FileLock::TryAcquire(config_.lock().path(), std::chrono::milliseconds(config_.lock().timeout_ms()));
    if (!lock) {
      out.result = util::Result::Err(util::ErrorCode::Busy, "Database lock held by another writer: " + config_.lock().path());
      return out;
    }

    std::string column_list;
    std::string placeholders;
    for (int i = 0; i < snapshot.columns_size(); ++i) {
      column_list += (i ? ", " : "") + QuoteIdentifier(snapshot.columns(i));
      placeholders += i ? ", ?" : "?";
    }

    db::sqlite::WithTransaction(db_, [&](SqliteTransaction& tx) {
      Statement insert(tx.Handle(), "INSERT INTO " + QuoteIdentifier(snapshot.table()) + " (" + column_list +
                                        ") VALUES (" + placeholders + ");");
      std::optional<Statement> exists;
      if (key_index >= 0) {
        exists.emplace(tx.Handle(), "SELECT 1 FROM " + QuoteIdentifier(snapshot.table()) + " WHERE " +
                                        QuoteIdentifier(snapshot.primary_key()) + " = ?;");
      }

      for (const auto& row : snapshot.rows()) {
        if (exists) {
          exists->Reset();
          exists->Bind(1, FromProto(row.values(key_index)));
          if (exists->Step()) {
            ++out.skipped;
            continue;
          }
        }

        insert.Reset();
        for (int i = 0; i < row.values_size(); ++i) {
          insert.Bind(i + 1, FromProto(row.values(i)));
        }
        insert.Run();
        ++out.inserted;
      }
    });
  } catch (const std::exception& e) {
    out.inserted = 0;
    out.skipped  = 0;
    out.result   = util::Result::Err(util::ErrorCode::IOError, e.what());
    CANARY_LOG_ERROR("archive restore failed, rolled back", {StringField("file", file.string()), StringField("error", e.what())});
    return out;
  }

  CANARY_LOG_INFO("archive restored", {StringField("table", out.table), IntField("inserted", static_cast<int64_t>(out.inserted)),
                                       IntField("skipped_existing", static_cast<int64_t>(out.skipped))});
  return out;
}

lifecycle::ArchiveSummary ArchivalManager::GetArchiveSummary() const {
  lifecycle::ArchiveSummary summary;
  const fs::path            dir(config_.archival().archive_directory());
  summary.set_archive_directory(dir.string());

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return summary;
  }

  std::map<std::string, lifecycle::ArchiveTypeSummary> by_type;
  std::optional<util::TimePoint>                        oldest;
  std::optional<util::TimePoint>                        newest;

  for (const auto& entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    const auto name = entry.path().filename().string();
    if (util::HasSuffix(name, ".tmp")) continue;

    const auto size  = entry.file_size();
    const auto mtime = util::LastWriteTime(entry.path());
    const auto type  = ClassifyArchive(name);

    auto& t = by_type[type];
    t.set_type(type);
    t.set_count(t.count() + 1);
    t.set_total_bytes(t.total_bytes() + size);

    summary.set_total_files(summary.total_files() + 1);
    summary.set_total_size_bytes(summary.total_size_bytes() + size);
    if (!oldest || mtime < *oldest) oldest = mtime;
    if (!newest || mtime > *newest) newest = mtime;
  }

  for (auto& [_, t] : by_type) {
    *summary.add_by_type() = std::move(t);
  }
  if (oldest) *summary.mutable_oldest() = util::ToProto(*oldest);
  if (newest) *summary.mutable_newest() = util::ToProto(*newest);
  return summary;
}

} // namespace canary::archive
