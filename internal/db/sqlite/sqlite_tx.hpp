#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include "sqlite_db.hpp"

namespace canary::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Changes are invisible to other connections until Commit(). The
  destructor rolls back anything neither committed nor rolled back.
*/
class SqliteTransaction final {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_->Handle(); }
  SqliteDB& DB() const { return *db_; }

  void Commit();
  void Rollback();

  // true once committed or rolled back
  bool IsFinished() const { return finished_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool finished_ = false;
};

/*
  Runs fn(tx) inside one transaction.

  Commits when fn returns, rolls back when it throws (the exception
  propagates). fn may return a value, which is passed through.
*/
template <typename Fn>
auto WithTransaction(const std::shared_ptr<SqliteDB>& db, Fn&& fn) {
  SqliteTransaction tx(db);
  if constexpr (std::is_void_v<std::invoke_result_t<Fn, SqliteTransaction&>>) {
    std::forward<Fn>(fn)(tx);
    tx.Commit();
  } else {
    auto result = std::forward<Fn>(fn)(tx);
    tx.Commit();
    return result;
  }
}

}
