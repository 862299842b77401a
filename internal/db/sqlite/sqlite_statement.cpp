#include "sqlite_statement.hpp"

#include <type_traits>

#include "sqlite_db.hpp"

namespace canary::db::sqlite {

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    throw SqliteError(rc, "sqlite prepare: " + std::string(sqlite3_errmsg(db_)) + " [" + sql + "]");
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : db_(other.db_), stmt_(other.stmt_) {
  other.stmt_ = nullptr;
}

void Statement::Check(int rc, const char* what) const {
  if (rc != SQLITE_OK) {
    throw SqliteError(rc, std::string(what) + ": " + sqlite3_errmsg(db_));
  }
}

void Statement::Bind(int idx, const sql::Value& value) {
  std::visit(
      [&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          Check(sqlite3_bind_null(stmt_, idx), "sqlite bind");
        } else if constexpr (std::is_same_v<T, int64_t>) {
          Check(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v)), "sqlite bind");
        } else if constexpr (std::is_same_v<T, double>) {
          Check(sqlite3_bind_double(stmt_, idx, v), "sqlite bind");
        } else if constexpr (std::is_same_v<T, std::string>) {
          Check(sqlite3_bind_text(stmt_, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT), "sqlite bind");
        } else {
          Check(sqlite3_bind_blob(stmt_, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT), "sqlite bind");
        }
      },
      value);
}

void Statement::BindText(int idx, const std::string& value) {
  Bind(idx, value);
}

void Statement::BindInt64(int idx, int64_t value) {
  Bind(idx, value);
}

void Statement::BindNull(int idx) {
  Bind(idx, nullptr);
}

bool Statement::Step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw SqliteError(rc, "sqlite step: " + std::string(sqlite3_errmsg(db_)));
}

void Statement::Run() {
  while (Step()) {
  }
}

void Statement::Reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

int Statement::ColumnCount() const {
  return sqlite3_column_count(stmt_);
}

std::string Statement::ColumnName(int col) const {
  const char* name = sqlite3_column_name(stmt_, col);
  return name ? name : "";
}

sql::Value Statement::Column(int col) const {
  switch (sqlite3_column_type(stmt_, col)) {
    case SQLITE_INTEGER:
      return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
    case SQLITE_FLOAT:
      return sqlite3_column_double(stmt_, col);
    case SQLITE_TEXT: {
      const auto* t = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
      return std::string(t, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
    }
    case SQLITE_BLOB: {
      const auto* b = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt_, col));
      const int   n = sqlite3_column_bytes(stmt_, col);
      return sql::Blob(b, b + n);
    }
    default:
      return nullptr;
  }
}

std::string Statement::ColumnText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t Statement::ColumnInt64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

bool Statement::IsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

} // namespace canary::db::sqlite
