#include "migration_engine.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <set>

#include "internal/db/sqlite/sqlite_statement.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_lock.hpp"
#include "migration_catalog.hpp"

namespace canary::migration {

using db::sqlite::SqliteTransaction;
using db::sqlite::Statement;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kCreateTrackingTable = R"sql(
CREATE TABLE IF NOT EXISTS schema_migrations (
    version TEXT PRIMARY KEY,
    description TEXT NOT NULL,
    applied_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    checksum TEXT
))sql";

std::optional<util::FileLock> AcquireLock(const runtime::config::LockConfig& lock) {
  return util::FileLock::TryAcquire(lock.path(), std::chrono::milliseconds(lock.timeout_ms()));
}

} // namespace

MigrationEngine::MigrationEngine(std::shared_ptr<db::sqlite::SqliteDB> db, runtime::config::RuntimeConfig config)
    : db_(std::move(db)), config_(std::move(config)) {
}

void MigrationEngine::EnsureTrackingTable() {
  db_->Exec(kCreateTrackingTable);
}

std::vector<Migration> MigrationEngine::LoadDefinedMigrations() const {
  const auto& cfg = config_.migrations();
  return LoadCatalog(cfg.directory(), !cfg.has_include_builtin() || cfg.include_builtin());
}

std::vector<AppliedMigration> MigrationEngine::GetAppliedMigrations() {
  EnsureTrackingTable();

  std::vector<AppliedMigration> out;
  Statement stmt(db_->Handle(),
                 "SELECT version, description, COALESCE(applied_at, ''), COALESCE(checksum, '') FROM schema_migrations");
  while (stmt.Step()) {
    out.push_back(AppliedMigration{stmt.ColumnText(0), stmt.ColumnText(1), stmt.ColumnText(2), stmt.ColumnText(3)});
  }

  std::stable_sort(out.begin(), out.end(), [](const AppliedMigration& a, const AppliedMigration& b) {
    return CompareVersions(a.version, b.version) < 0;
  });
  return out;
}

std::string MigrationEngine::GetCurrentVersion() {
  auto applied = GetAppliedMigrations();
  if (applied.empty()) {
    return std::string(kNoVersion);
  }
  return applied.back().version;
}

util::Result MigrationEngine::ApplyOne(const Migration& migration) {
  CANARY_LOG_INFO("applying migration",
                  {StringField("version", migration.version), StringField("description", migration.description),
                   IntField("statements", static_cast<int64_t>(migration.up.size()))});

  try {
    db::sqlite::WithTransaction(db_, [&](SqliteTransaction& tx) {
      for (size_t i = 0; i < migration.up.size(); ++i) {
        CANARY_LOG_DEBUG("migration statement", {StringField("version", migration.version),
                                                 IntField("index", static_cast<int64_t>(i))});
        tx.DB().Exec(migration.up[i]);
      }

      Statement insert(tx.Handle(), "INSERT INTO schema_migrations (version, description, checksum) VALUES (?, ?, ?)");
      insert.BindText(1, migration.version);
      insert.BindText(2, migration.description);
      insert.BindText(3, migration.Checksum());
      insert.Run();
    });
  } catch (const std::exception& e) {
    CANARY_LOG_ERROR("migration failed, rolled back",
                     {StringField("version", migration.version), StringField("error", e.what())});
    return util::Result::Err(util::ErrorCode::MigrationFailure, "Migration " + migration.version + " failed: " + e.what());
  }

  CANARY_LOG_INFO("migration applied", {StringField("version", migration.version)});
  return util::Result::Ok();
}

ApplyResult MigrationEngine::ApplyPending(const std::optional<std::string>& target) {
  ApplyResult out;

  std::vector<Migration> defined;
  try {
    defined = LoadDefinedMigrations();
  } catch (const util::InvalidState& e) {
    out.result = util::Result::Err(util::ErrorCode::InvalidState, e.what());
    return out;
  }

  if (target) {
    const bool known = std::any_of(defined.begin(), defined.end(),
                                   [&](const Migration& m) { return CompareVersions(m.version, *target) == 0; });
    if (!known) {
      out.result = util::Result::Err(util::ErrorCode::NotFound, "Target version not defined: " + *target);
      return out;
    }
  }

  auto lock = AcquireLock(config_.lock());
  if (!lock) {
    out.result = util::Result::Err(util::ErrorCode::Busy, "Database lock held by another writer: " + config_.lock().path());
    return out;
  }

  std::set<std::string> applied;
  for (const auto& a : GetAppliedMigrations()) {
    applied.insert(a.version);
  }

  for (const auto& migration : defined) {
    if (applied.count(migration.version) > 0) continue;
    if (target && CompareVersions(migration.version, *target) > 0) break;

    auto r = ApplyOne(migration);
    if (!r) {
      out.result         = std::move(r);
      out.failed_version = migration.version;
      break;
    }
    out.applied_versions.push_back(migration.version);
  }

  out.current_version = GetCurrentVersion();

  if (out.applied_versions.empty() && out.result) {
    CANARY_LOG_INFO("schema up to date", {StringField("version", out.current_version)});
  }
  return out;
}

util::Result MigrationEngine::Rollback(const std::string& version) {
  std::vector<Migration> defined;
  try {
    defined = LoadDefinedMigrations();
  } catch (const util::InvalidState& e) {
    return util::Result::Err(util::ErrorCode::InvalidState, e.what());
  }

  auto it = std::find_if(defined.begin(), defined.end(),
                         [&](const Migration& m) { return CompareVersions(m.version, version) == 0; });
  if (it == defined.end()) {
    return util::Result::Err(util::ErrorCode::NotFound, "Migration not defined: " + version);
  }
  const Migration& migration = *it;

  if (!migration.HasRollback()) {
    return util::Result::Err(util::ErrorCode::MissingRollback, "Migration " + version + " has no rollback statements");
  }

  auto lock = AcquireLock(config_.lock());
  if (!lock) {
    return util::Result::Err(util::ErrorCode::Busy, "Database lock held by another writer: " + config_.lock().path());
  }

  auto applied = GetAppliedMigrations();
  auto hit     = std::find_if(applied.begin(), applied.end(),
                              [&](const AppliedMigration& a) { return CompareVersions(a.version, version) == 0; });
  if (hit == applied.end()) {
    return util::Result::Err(util::ErrorCode::NotFound, "Migration not applied: " + version);
  }
  if (std::next(hit) != applied.end()) {
    return util::Result::Err(util::ErrorCode::InvalidState,
                             "Only the current version can be rolled back (current " + applied.back().version + ")");
  }

  CANARY_LOG_INFO("rolling back migration", {StringField("version", migration.version)});

  try {
    db::sqlite::WithTransaction(db_, [&](SqliteTransaction& tx) {
      for (const auto& statement : migration.down) {
        tx.DB().Exec(statement);
      }

      Statement del(tx.Handle(), "DELETE FROM schema_migrations WHERE version = ?");
      del.BindText(1, hit->version);
      del.Run();
    });
  } catch (const std::exception& e) {
    CANARY_LOG_ERROR("rollback failed", {StringField("version", version), StringField("error", e.what())});
    return util::Result::Err(util::ErrorCode::MigrationFailure, "Rollback of " + version + " failed: " + e.what());
  }

  CANARY_LOG_INFO("migration rolled back", {StringField("version", version)});
  return util::Result::Ok();
}

MigrationStatus MigrationEngine::GetStatus() {
  MigrationStatus status;
  status.applied         = GetAppliedMigrations();
  status.current_version = status.applied.empty() ? std::string(kNoVersion) : status.applied.back().version;

  std::map<std::string, const AppliedMigration*> by_version;
  for (const auto& a : status.applied) {
    by_version[a.version] = &a;
  }

  const auto defined = LoadDefinedMigrations();
  std::set<std::string> defined_versions;
  for (const auto& m : defined) {
    defined_versions.insert(m.version);

    auto it = by_version.find(m.version);
    if (it == by_version.end()) {
      status.pending.push_back(m.version);
    } else if (!it->second->checksum.empty() && it->second->checksum != m.Checksum()) {
      status.drifted.push_back(m.version);
    }
  }

  for (const auto& a : status.applied) {
    if (defined_versions.count(a.version) == 0) {
      status.unknown.push_back(a.version);
    }
  }
  return status;
}

} // namespace canary::migration
