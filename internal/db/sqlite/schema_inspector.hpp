#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sqlite_db.hpp"

namespace canary::db::sqlite {

struct ColumnInfo {
  std::string name;
  std::string type;
  bool        not_null = false;
  // position within the primary key, 0 when not part of it
  int         pk = 0;

  bool operator==(const ColumnInfo&) const = default;
};

struct TableInfo {
  std::string             name;
  std::vector<ColumnInfo> columns;
  int64_t                 row_count = 0;
};

/*
  Schema fingerprint: user tables (sqlite_* internals excluded) keyed by name.
*/
using SchemaFingerprint = std::map<std::string, TableInfo>;

SchemaFingerprint InspectSchema(SqliteDB& db);

bool TableExists(SqliteDB& db, const std::string& table);

std::vector<ColumnInfo> TableColumns(SqliteDB& db, const std::string& table);

// Single-column primary key, if the table has exactly one.
std::optional<std::string> PrimaryKeyColumn(SqliteDB& db, const std::string& table);

// "name" with embedded quotes doubled; table/column names come from config.
std::string QuoteIdentifier(std::string_view identifier);

// Human readable diff of two column lists, empty when equal.
std::string DescribeColumnMismatch(const std::vector<ColumnInfo>& expected, const std::vector<ColumnInfo>& actual);

} // namespace canary::db::sqlite
