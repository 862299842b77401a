#include "factory.hpp"

#include <filesystem>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"

namespace canary::factory {

namespace fs = std::filesystem;

std::shared_ptr<db::sqlite::SqliteDB> OpenDatabase(const runtime::config::RuntimeConfig& config) {
  const fs::path path = config.database().path();
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }

  db::sqlite::SqliteDB::Options options;
  options.wal_mode        = config.database().has_wal_mode() && config.database().wal_mode();
  options.busy_timeout_ms = config.database().busy_timeout_ms();

  auto db = std::make_shared<db::sqlite::SqliteDB>(path.string(), options);
  CANARY_LOG_INFO("database opened", {observability::StringField("path", path.string()),
                                      observability::BoolField("wal", options.wal_mode)});
  return db;
}

RuntimeDependencies::RuntimeDependencies(runtime::config::RuntimeConfig config, const util::CancellationToken* cancel)
    : config_(std::move(config)), cancel_(cancel) {
  // ------------------------------------------------------------------
  // Components that never hold the live database open
  // ------------------------------------------------------------------
  verifier_ = std::make_shared<verify::BackupVerifier>(config_, cancel_);
  restore_  = std::make_unique<restore::RestoreCoordinator>(config_, verifier_);
  backups_  = std::make_unique<restore::BackupCreator>(config_);
}

std::shared_ptr<db::sqlite::SqliteDB> RuntimeDependencies::Database() {
  if (!db_) {
    db_ = OpenDatabase(config_);
  }
  return db_;
}

migration::MigrationEngine& RuntimeDependencies::Migrations() {
  if (!migrations_) {
    migrations_ = std::make_unique<migration::MigrationEngine>(Database(), config_);
  }
  return *migrations_;
}

archive::ArchivalManager& RuntimeDependencies::Archival() {
  if (!archival_) {
    archival_ = std::make_unique<archive::ArchivalManager>(Database(), config_, cancel_);
  }
  return *archival_;
}

std::unique_ptr<RuntimeDependencies> BuildRuntime(runtime::config::RuntimeConfig config,
                                                  const util::CancellationToken* cancel) {
  config::ConfigLoader::ApplyDefaults(&config);
  return std::make_unique<RuntimeDependencies>(std::move(config), cancel);
}

} // namespace canary::factory
