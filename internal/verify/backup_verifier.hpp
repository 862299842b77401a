#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "canary/lifecycle/v1/reports.pb.h"
#include "config/config.pb.h"
#include "internal/db/sqlite/schema_inspector.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/cancellation.hpp"

namespace canary::verify {

namespace lifecycle = canary::lifecycle::v1;

/*
  Structural and content checks for backup artifacts.

  The live database (database.path) is the reference schema; it is opened
  read-only per check and never written. Per-file problems are recorded in
  the returned reports; only programming or environment failures throw.
*/
class BackupVerifier {
 public:
  explicit BackupVerifier(runtime::config::RuntimeConfig config, const util::CancellationToken* cancel = nullptr);

  std::string ComputeChecksum(const std::filesystem::path& file) const;

  // Throws if the file cannot be opened as a database.
  db::sqlite::SchemaFingerprint InspectSchema(const std::filesystem::path& file) const;

  lifecycle::VerificationReport VerifyIntegrity(const std::filesystem::path& file) const;

  /*
    No NULL in a NOT NULL column within the first test_sample_size rows of
    each critical table. Absent tables are skipped. Violations are
    appended to errors when given.
  */
  bool VerifyDataSample(const std::filesystem::path& file, std::vector<std::string>* errors = nullptr) const;

  // Works on a scoped copy which is removed on every exit path.
  lifecycle::RestorationReport TestRestoration(const std::filesystem::path& file) const;

  // directory defaults to verification.backup_directory.
  lifecycle::BatchVerificationReport RunBatchVerification(const std::optional<std::filesystem::path>& directory = std::nullopt);

  // Persisted batch reports written within the last `days` days, oldest first.
  std::vector<lifecycle::BatchVerificationReport> GetVerificationHistory(uint32_t days) const;

  // Most recent persisted batch outcome for file, if any batch covered it.
  std::optional<lifecycle::BatchItemResult> LastKnownStatus(const std::filesystem::path& file) const;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> OpenBackup(const std::filesystem::path& file) const;
  std::shared_ptr<db::sqlite::SqliteDB> OpenLive() const;

  void CheckDatabase(db::sqlite::SqliteDB& backup, lifecycle::VerificationReport* report) const;
  void VerifyBundle(const std::filesystem::path& file, lifecycle::VerificationReport* report) const;
  bool SampleDatabase(db::sqlite::SqliteDB& db, std::vector<std::string>* errors) const;

  std::vector<std::filesystem::path> ReportFiles() const;

  runtime::config::RuntimeConfig config_;
  const util::CancellationToken* cancel_;
};

} // namespace canary::verify
