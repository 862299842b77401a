#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

#include "internal/db/sql/sql_value.hpp"

namespace canary::db::sqlite {

/*
  Prepared statement owner.

  Bind indexes are 1-based (sqlite), column indexes 0-based.
  Every sqlite error surfaces as SqliteError.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();

  Statement(Statement&& other) noexcept;
  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;
  Statement& operator=(Statement&&)      = delete;

  void Bind(int idx, const sql::Value& value);
  void BindText(int idx, const std::string& value);
  void BindInt64(int idx, int64_t value);
  void BindNull(int idx);

  // true while a row is available, false when done.
  bool Step();

  // Step a statement that returns no rows.
  void Run();

  void Reset();

  int         ColumnCount() const;
  std::string ColumnName(int col) const;
  sql::Value  Column(int col) const;
  std::string ColumnText(int col) const;
  int64_t     ColumnInt64(int col) const;
  bool        IsNull(int col) const;

 private:
  void Check(int rc, const char* what) const;

  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace canary::db::sqlite
