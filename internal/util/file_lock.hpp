#pragma once

#include <chrono>
#include <filesystem>
#include <optional>

namespace canary::util {

/*
  Advisory exclusive lock on a lock file (flock).

  SQLite allows one writer per database file; every destructive window
  (migration apply/rollback, archival delete phase, restore) runs under
  this lock so cooperating writers cannot interleave with it.

  flock locks belong to the open file description: a second FileLock on
  the same path inside one process conflicts like any other holder.
*/
class FileLock {
 public:
  // Retries until timeout; nullopt if the lock is still held elsewhere.
  static std::optional<FileLock> TryAcquire(const std::filesystem::path& path, std::chrono::milliseconds timeout);

  ~FileLock();

  FileLock(FileLock&& other) noexcept;
  FileLock& operator=(FileLock&& other) noexcept;

  FileLock(const FileLock&)            = delete;
  FileLock& operator=(const FileLock&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  FileLock(std::filesystem::path path, int fd);

  void Release();

  std::filesystem::path path_;
  int                   fd_ = -1;
};

} // namespace canary::util
