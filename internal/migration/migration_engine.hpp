#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/result.hpp"
#include "migration.hpp"

namespace canary::migration {

struct ApplyResult {
  util::Result             result;
  std::vector<std::string> applied_versions;
  std::string              current_version;
  // set when a migration failed and halted the batch
  std::string failed_version;

  std::size_t AppliedCount() const {
    return applied_versions.size();
  }
};

struct MigrationStatus {
  std::string                   current_version;
  std::vector<AppliedMigration> applied;
  std::vector<std::string>      pending;
  // applied, but the stored checksum differs from the current definition
  std::vector<std::string> drifted;
  // applied, but no longer defined anywhere
  std::vector<std::string> unknown;
};

/*
  Versioned schema evolution for the Canary database.

  Applied versions are recorded in schema_migrations and always form an
  unbroken ascending prefix of the defined catalog: each migration's
  statements and its tracking row commit together, and only the highest
  applied version may be rolled back.

  Apply and rollback hold the database's advisory lock for their whole
  duration.
*/
class MigrationEngine {
 public:
  MigrationEngine(std::shared_ptr<db::sqlite::SqliteDB> db, runtime::config::RuntimeConfig config);

  // Idempotent.
  void EnsureTrackingTable();

  // Highest applied version, or kNoVersion.
  std::string GetCurrentVersion();

  // Builtins + definition files, ascending. Throws InvalidState on duplicates.
  std::vector<Migration> LoadDefinedMigrations() const;

  std::vector<AppliedMigration> GetAppliedMigrations();

  /*
    Applies every defined-but-unapplied migration in ascending order,
    stopping after `target` when given (it must be a defined version).
    The first failure rolls back that migration and halts the batch.
  */
  ApplyResult ApplyPending(const std::optional<std::string>& target = std::nullopt);

  util::Result Rollback(const std::string& version);

  MigrationStatus GetStatus();

 private:
  util::Result ApplyOne(const Migration& migration);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  runtime::config::RuntimeConfig        config_;
};

} // namespace canary::migration
