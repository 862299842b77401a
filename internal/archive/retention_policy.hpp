#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace canary::archive {

/*
  Default retention by table class, matched on the table name:

    log / history          90 days
    economic / indicator  730 days
    digest / feedback    1095 days
    headline / feed       365 days
    anything else         365 days
*/
uint32_t DefaultRetentionDays(std::string_view table);

struct TablePolicy {
  std::string table;
  std::string date_column;
  uint32_t    retention_days = 0;
  // empty: detect the single-column primary key, else rowid
  std::string primary_key;
};

class RetentionPolicy {
 public:
  explicit RetentionPolicy(const runtime::config::ArchivalConfig& config);

  // Configured value when non-zero, class default otherwise.
  uint32_t RetentionDays(std::string_view table) const;

  std::optional<TablePolicy> Find(std::string_view table) const;

  const std::vector<TablePolicy>& Tables() const {
    return tables_;
  }

  util::TimePoint Cutoff(std::string_view table, util::TimePoint now) const;

 private:
  std::vector<TablePolicy> tables_;
};

} // namespace canary::archive
