#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/util/result.hpp"
#include "internal/verify/backup_artifact.hpp"
#include "internal/verify/backup_verifier.hpp"

namespace canary::restore {

// Asked before anything destructive happens; false declines.
using ConfirmFn = std::function<bool(const std::string& prompt)>;

enum class VerificationPolicy { Refuse, Warn, Skip };

VerificationPolicy ParseVerificationPolicy(const std::string& text);

struct RestoreOutcome {
  util::Result                         result;
  std::string                          backup_file;
  std::string                          restore_type;
  std::optional<std::filesystem::path> safety_backup;
  // success | failed | declined
  std::string status;
  std::string notes;
};

// restore_history row.
struct RestoreRecord {
  int64_t     id = 0;
  std::string timestamp;
  std::string backup_file;
  std::string restore_type;
  std::string safety_backup;
  std::string status;
  std::string notes;
};

/*
  Database and full-system restore with a mandatory safety backup.

  Sequence for every destructive restore:
      confirm → lock → safety backup → verification gate → staged write
  and exactly one restore_history row per attempt, whatever the outcome.
  The live database is replaced by rename, never written in place.
*/
class RestoreCoordinator {
 public:
  RestoreCoordinator(runtime::config::RuntimeConfig config, std::shared_ptr<const verify::BackupVerifier> verifier);

  // directory defaults to restore.backup_directory; newest first.
  std::vector<verify::BackupArtifact> ListAvailableBackups(
      const std::optional<std::filesystem::path>& directory = std::nullopt) const;

  // <target>.safety_backup.<stamp>; nullopt only when target does not exist. Throws on copy failure.
  std::optional<std::filesystem::path> CreateSafetyBackup(const std::filesystem::path& target) const;

  RestoreOutcome RestoreDatabase(const std::filesystem::path& backup, const ConfirmFn& confirm);

  RestoreOutcome RestoreFullSystem(const std::filesystem::path& bundle, const ConfirmFn& confirm);

  // SQL text dump, materialised into a staged database before the swap.
  RestoreOutcome RestoreSqlDump(const std::filesystem::path& dump, const ConfirmFn& confirm);

  // type nullopt means infer from the file name.
  RestoreOutcome RestoreFromBackup(const std::filesystem::path& file, std::optional<verify::BackupType> type,
                                   const ConfirmFn& confirm);

  // Most recent first.
  std::vector<RestoreRecord> GetRestoreHistory(uint32_t limit = 10) const;

 private:
  using Body = std::function<void(RestoreOutcome*)>;

  RestoreOutcome Run(const std::filesystem::path& file, verify::BackupType type, const ConfirmFn& confirm,
                     const std::string& prompt, const Body& body);

  // Empty when the restore may proceed.
  std::optional<std::string> VerificationGate(const std::filesystem::path& candidate, const std::filesystem::path& source,
                                              RestoreOutcome* out) const;

  void SwapDatabase(const std::filesystem::path& staged) const;
  void Audit(RestoreOutcome* out) const;

  std::filesystem::path DatabasePath() const;

  runtime::config::RuntimeConfig                config_;
  std::shared_ptr<const verify::BackupVerifier> verifier_;
  VerificationPolicy                            policy_;
};

} // namespace canary::restore
