#include "retention_policy.hpp"

#include <algorithm>

namespace canary::archive {

namespace {

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

} // namespace

uint32_t DefaultRetentionDays(std::string_view table) {
  // "feedback" contains "feed": order matters
  if (Contains(table, "log") || Contains(table, "history")) return 90;
  if (Contains(table, "economic") || Contains(table, "indicator")) return 730;
  if (Contains(table, "digest") || Contains(table, "feedback")) return 1095;
  if (Contains(table, "headline") || Contains(table, "feed")) return 365;
  return 365;
}

RetentionPolicy::RetentionPolicy(const runtime::config::ArchivalConfig& config) {
  for (const auto& t : config.tables()) {
    TablePolicy p;
    p.table          = t.name();
    p.date_column    = t.date_column();
    p.retention_days = t.retention_days() != 0 ? t.retention_days() : DefaultRetentionDays(t.name());
    p.primary_key    = t.primary_key();
    tables_.push_back(std::move(p));
  }
}

uint32_t RetentionPolicy::RetentionDays(std::string_view table) const {
  if (auto p = Find(table)) {
    return p->retention_days;
  }
  return DefaultRetentionDays(table);
}

std::optional<TablePolicy> RetentionPolicy::Find(std::string_view table) const {
  auto it = std::find_if(tables_.begin(), tables_.end(), [&](const TablePolicy& p) { return p.table == table; });
  if (it == tables_.end()) {
    return std::nullopt;
  }
  return *it;
}

util::TimePoint RetentionPolicy::Cutoff(std::string_view table, util::TimePoint now) const {
  return util::DaysAgo(now, RetentionDays(table));
}

} // namespace canary::archive
