#include "backup_creator.hpp"

#include <chrono>
#include <fstream>
#include <system_error>

#include "internal/bundle/system_bundle.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_lock.hpp"
#include "internal/util/fs.hpp"
#include "internal/util/sha256.hpp"
#include "internal/util/time.hpp"

namespace canary::restore {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kBundlePrefix = "canary_backup_";

// Writes path via path.tmp; the tmp file is removed if anything fails.
template <typename Fn>
void WriteThenRename(const fs::path& path, Fn&& write) {
  auto tmp = path;
  tmp += ".tmp";
  try {
    write(tmp);
    util::SyncFile(tmp);
    fs::rename(tmp, path);
    util::SyncDirectory(path.parent_path());
  } catch (...) {
    std::error_code ec;
    fs::remove(tmp, ec);
    throw;
  }
}

fs::path Unique(const fs::path& directory, const std::string& stem, const std::string& suffix) {
  fs::path candidate = directory / (stem + suffix);
  for (int n = 1; fs::exists(candidate); ++n) {
    candidate = directory / (stem + "_" + std::to_string(n) + suffix);
  }
  return candidate;
}

} // namespace

std::string WriteChecksumSidecar(const fs::path& file) {
  const auto digest = util::Sha256File(file);
  auto       sidecar = file;
  sidecar += ".sha256";

  WriteThenRename(sidecar, [&](const fs::path& tmp) {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out << digest << "  " << file.filename().string() << "\n";
    out.flush();
    if (!out) {
      throw util::StorageError("Cannot write checksum file " + tmp.string());
    }
  });
  return digest;
}

BackupCreator::BackupCreator(runtime::config::RuntimeConfig config) : config_(std::move(config)) {
}

fs::path BackupCreator::OutputDirectory(const std::optional<fs::path>& directory) const {
  const fs::path dir = directory.value_or(fs::path(config_.restore().backup_directory()));
  if (dir.empty()) {
    throw util::InvalidState("No backup directory configured");
  }
  fs::create_directories(dir);
  return dir;
}

fs::path BackupCreator::CreateDatabaseBackup(const std::optional<fs::path>& directory) const {
  const fs::path live = config_.database().path();
  if (!fs::exists(live)) {
    throw util::NotFound("Database does not exist: " + live.string());
  }

  const auto dir    = OutputDirectory(directory);
  const auto target = Unique(dir, live.stem().string() + "_" + util::FileStamp(util::Now()), ".db");

  WriteThenRename(target, [&](const fs::path& tmp) {
    db::sqlite::BackupTo(live.string(), tmp.string(), config_.database().busy_timeout_ms());
  });

  const auto digest = WriteChecksumSidecar(target);
  CANARY_LOG_INFO("database backup created",
                  {StringField("file", target.string()), IntField("bytes", static_cast<int64_t>(fs::file_size(target))),
                   StringField("sha256", digest)});
  return target;
}

fs::path BackupCreator::CreateSystemBundle(const std::optional<fs::path>& directory) const {
  const auto dir       = OutputDirectory(directory);
  const auto root_name = kBundlePrefix + util::FileStamp(util::Now());
  const auto archive   = Unique(dir, root_name, ".tar.gz");

  bundle::SystemLayout live;
  live.data_directory   = config_.system().data_directory();
  live.config_directory = config_.system().config_directory();
  live.logs_directory   = config_.system().log_directory();
  live.exclude          = {dir, config_.verification().backup_directory(), config_.archival().archive_directory(),
                           config_.restore().staging_directory(), config_.lock().path()};

  if (!fs::exists(fs::path(config_.database().path()))) {
    throw util::NotFound("Database does not exist: " + config_.database().path());
  }

  // Lifecycle writers are held off so data, config and logs agree.
  auto lock = util::FileLock::TryAcquire(config_.lock().path(), std::chrono::milliseconds(config_.lock().timeout_ms()));
  if (!lock) {
    throw util::InvalidState("Database lock held by another writer: " + config_.lock().path());
  }

  // The database goes in as an online-backup snapshot, never the raw file.
  const fs::path staging_dir = config_.restore().staging_directory();
  if (!staging_dir.empty()) {
    fs::create_directories(staging_dir);
  }
  auto snapshot = util::ScopedTempPath::MakeDirectory(staging_dir, "bundle_");
  live.database          = config_.database().path();
  live.database_snapshot = snapshot.Path() / live.database.filename();
  db::sqlite::BackupTo(live.database.string(), live.database_snapshot.string(), config_.database().busy_timeout_ms());

  bundle::WriteSystemBundle(archive, root_name, live);
  const auto digest = WriteChecksumSidecar(archive);
  CANARY_LOG_INFO("system bundle created",
                  {StringField("file", archive.string()), IntField("bytes", static_cast<int64_t>(fs::file_size(archive))),
                   StringField("sha256", digest)});
  return archive;
}

} // namespace canary::restore
