#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/result.hpp"

namespace canary::db::sqlite {

/*
  SQLite failure with its result code kept for translation.
*/
class SqliteError : public util::StorageError {
 public:
  SqliteError(int code, const std::string& msg) : util::StorageError(msg), code_(code) {
  }

  int Code() const {
    return code_;
  }

 private:
  int code_;
};

// Backend code -> portable code. The only place sqlite codes are interpreted.
util::ErrorCode Translate(int rc);

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  struct Options {
    bool     read_only       = false;
    bool     wal_mode        = false;
    uint32_t busy_timeout_ms = 5000;
  };

  explicit SqliteDB(std::string path);
  SqliteDB(std::string path, Options options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  // Private scratch database (SQL dump materialisation, tests).
  static std::shared_ptr<SqliteDB> InMemory();

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, migration statements, dumps)
  void Exec(const std::string& sql);

  // Rows changed by the most recent statement.
  int64_t Changes() const;

  // Configure recommended PRAGMAs (journal mode, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  Options     options_;
};

/*
  Online backup (sqlite3_backup_*) of the database at source into
  destination, which is overwritten. The copy is a single consistent
  snapshot and includes commits still held in a WAL file; writers on
  other connections are not blocked.
*/
void BackupTo(const std::string& source, const std::string& destination, uint32_t busy_timeout_ms);

} // namespace canary::db::sqlite
