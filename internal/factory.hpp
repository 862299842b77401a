#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/archive/archival_manager.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/migration/migration_engine.hpp"
#include "internal/restore/backup_creator.hpp"
#include "internal/restore/restore_coordinator.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/verify/backup_verifier.hpp"

namespace canary::factory {

/*
  RuntimeDependencies

  Owns the lifecycle components for one canaryctl invocation.

  The live database connection is opened on first use only: restore
  replaces the database file and must not run while this process holds
  a connection to the file being replaced.
*/
class RuntimeDependencies {
 public:
  RuntimeDependencies(runtime::config::RuntimeConfig config, const util::CancellationToken* cancel);

  const runtime::config::RuntimeConfig& Config() const {
    return config_;
  }

  // Opens database.path (creating it) on first call.
  std::shared_ptr<db::sqlite::SqliteDB> Database();

  migration::MigrationEngine& Migrations();
  archive::ArchivalManager&   Archival();

  std::shared_ptr<verify::BackupVerifier> Verifier() const {
    return verifier_;
  }

  restore::RestoreCoordinator& Restore() {
    return *restore_;
  }

  restore::BackupCreator& Backups() {
    return *backups_;
  }

 private:
  runtime::config::RuntimeConfig config_;
  const util::CancellationToken* cancel_;

  std::shared_ptr<db::sqlite::SqliteDB>        db_;
  std::unique_ptr<migration::MigrationEngine>  migrations_;
  std::unique_ptr<archive::ArchivalManager>    archival_;
  std::shared_ptr<verify::BackupVerifier>      verifier_;
  std::unique_ptr<restore::RestoreCoordinator> restore_;
  std::unique_ptr<restore::BackupCreator>      backups_;
};

/*
  BuildRuntime

  Composition root: the only place that wires concrete components
  together. Defaults are applied to config before anything is built.
*/
std::unique_ptr<RuntimeDependencies> BuildRuntime(runtime::config::RuntimeConfig config,
                                                  const util::CancellationToken* cancel = nullptr);

// Opens (and creates if needed) the live database described by config.
std::shared_ptr<db::sqlite::SqliteDB> OpenDatabase(const runtime::config::RuntimeConfig& config);

} // namespace canary::factory
