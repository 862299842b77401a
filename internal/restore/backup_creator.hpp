#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace canary::restore {

/*
  Backup artifacts restorable by RestoreCoordinator.

  Each artifact is written under a temporary name and renamed into place,
  then a sha256sum-style sidecar (<artifact>.sha256) is written beside it.
  Output goes to directory, or restore.backup_directory when omitted.
*/
class BackupCreator {
 public:
  explicit BackupCreator(runtime::config::RuntimeConfig config);

  // Online backup of the live database: <stem>_<stamp>.db. Throws NotFound without a live database.
  std::filesystem::path CreateDatabaseBackup(const std::optional<std::filesystem::path>& directory = std::nullopt) const;

  // canary_backup_<stamp>.tar.gz holding canary_backup_<stamp>/{data,config,logs}.
  std::filesystem::path CreateSystemBundle(const std::optional<std::filesystem::path>& directory = std::nullopt) const;

 private:
  std::filesystem::path OutputDirectory(const std::optional<std::filesystem::path>& directory) const;

  runtime::config::RuntimeConfig config_;
};

// Writes "<hex>  <file name>\n" to <file>.sha256 and returns the digest.
std::string WriteChecksumSidecar(const std::filesystem::path& file);

} // namespace canary::restore
