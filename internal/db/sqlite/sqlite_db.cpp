#include "sqlite_db.hpp"

namespace canary::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw SqliteError(rc, std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

util::ErrorCode Translate(int rc) {
  switch (rc & 0xFF) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return util::ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return util::ErrorCode::Busy;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return util::ErrorCode::IntegrityFailure;
    case SQLITE_CANTOPEN:
      return util::ErrorCode::NotFound;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_READONLY:
      return util::ErrorCode::IOError;
    default:
      return util::ErrorCode::InternalError;
  }
}

SqliteDB::SqliteDB(std::string path) : SqliteDB(std::move(path), Options{}) {
}

SqliteDB::SqliteDB(std::string path, Options options) : path_(std::move(path)), options_(options) {
  const int flags = options_.read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

  int rc = sqlite3_open_v2(path_.c_str(), &db_, flags | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, "sqlite open " + path_ + ": " + msg);
  }

  // keep extended codes so Translate sees SQLITE_IOERR_* etc.
  sqlite3_extended_result_codes(db_, 1);

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

std::shared_ptr<SqliteDB> SqliteDB::InMemory() {
  return std::make_shared<SqliteDB>(":memory:");
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw SqliteError(rc, msg);
  }
}

int64_t SqliteDB::Changes() const {
  return sqlite3_changes64(db_);
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout_ms)), db_, "busy_timeout");

  if (options_.read_only) {
    // inspection of backups must never touch the file header
    Exec("PRAGMA query_only=ON;");
    return;
  }

  // WAL keeps recent commits in a side file; plain file copies of the
  // database are only complete in rollback-journal mode.
  Exec(options_.wal_mode ? "PRAGMA journal_mode=WAL;" : "PRAGMA journal_mode=DELETE;");

  // FULL: archival deletes must not outrun the snapshot they depend on
  Exec("PRAGMA synchronous=FULL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  Exec("PRAGMA temp_store=MEMORY;");
}

void BackupTo(const std::string& source, const std::string& destination, uint32_t busy_timeout_ms) {
  SqliteDB src(source, SqliteDB::Options{.read_only = true, .busy_timeout_ms = busy_timeout_ms});
  SqliteDB dst(destination);

  sqlite3_backup* backup = sqlite3_backup_init(dst.Handle(), "main", src.Handle(), "main");
  if (backup == nullptr) {
    throw SqliteError(sqlite3_errcode(dst.Handle()), std::string("sqlite backup init: ") + sqlite3_errmsg(dst.Handle()));
  }
  const int rc = sqlite3_backup_step(backup, -1);
  sqlite3_backup_finish(backup);
  if (rc != SQLITE_DONE) {
    throw SqliteError(rc, std::string("sqlite backup step ") + source + ": " + sqlite3_errstr(rc));
  }
}

} // namespace canary::db::sqlite
