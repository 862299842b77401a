#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "canary/lifecycle/v1/reports.pb.h"
#include "config/config.pb.h"
#include "internal/db/sql/sql_value.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/result.hpp"
#include "retention_policy.hpp"

namespace canary::archive {

namespace lifecycle = canary::lifecycle::v1;

struct CandidateSet {
  util::TimePoint          cutoff;
  std::vector<std::string> columns;
  std::vector<db::sql::Row> rows;
};

struct ArchiveRestoreResult {
  util::Result result;
  std::string  table;
  uint64_t     inserted = 0;
  // rows whose primary key already existed
  uint64_t skipped = 0;
};

/*
  Retention-based archival of the live database.

  Ordering per table: the snapshot is written and fsynced before any row
  is deleted, and the delete, the count check and the archive_history
  row commit together. A failure anywhere rolls the deletes back and
  removes the snapshot, so the live table is either untouched or fully
  archived.
*/
class ArchivalManager {
 public:
  ArchivalManager(std::shared_ptr<db::sqlite::SqliteDB> db, runtime::config::RuntimeConfig config,
                  const util::CancellationToken* cancel = nullptr);

  const RetentionPolicy& Policy() const {
    return policy_;
  }

  uint32_t RetentionDays(const std::string& table) const {
    return policy_.RetentionDays(table);
  }

  // Rows with date_column older than now - retention(table).
  CandidateSet FindCandidates(const std::string& table, const std::string& date_column);

  lifecycle::TableArchivalResult ArchiveTable(const std::string& table);

  lifecycle::LogArchivalResult ArchiveLogs();

  // Every configured table, then logs; failures stay per item.
  lifecycle::ArchivalReport RunFullArchival();

  ArchiveRestoreResult RestoreFromArchive(const std::filesystem::path& file);

  lifecycle::ArchiveSummary GetArchiveSummary() const;

 private:
  std::string KeyColumn(const TablePolicy& policy);
  std::string SchemaVersion();
  std::filesystem::path NextArchivePath(const std::string& stem, const std::string& suffix) const;

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  runtime::config::RuntimeConfig        config_;
  RetentionPolicy                       policy_;
  const util::CancellationToken*        cancel_;
};

} // namespace canary::archive
