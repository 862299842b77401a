#include "file_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "internal/util/errors.hpp"

namespace canary::util {

std::optional<FileLock> FileLock::TryAcquire(const std::filesystem::path& path, std::chrono::milliseconds timeout) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw StorageError("open lock file failed: " + path.string() + ": " + std::strerror(errno));
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
      return FileLock(path, fd);
    }
    if (errno != EWOULDBLOCK && errno != EINTR) {
      int saved = errno;
      ::close(fd);
      throw StorageError("flock failed: " + path.string() + ": " + std::strerror(saved));
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      ::close(fd);
      return std::nullopt;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(25));
  }
}

FileLock::FileLock(std::filesystem::path path, int fd) : path_(std::move(path)), fd_(fd) {
}

FileLock::~FileLock() {
  Release();
}

FileLock::FileLock(FileLock&& other) noexcept : path_(std::move(other.path_)), fd_(other.fd_) {
  other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
  if (this != &other) {
    Release();
    path_     = std::move(other.path_);
    fd_       = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void FileLock::Release() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
}

} // namespace canary::util
