#include "fs.hpp"

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace canary::util {

namespace fs = std::filesystem;

namespace {

void SyncPath(const fs::path& path, int flags) {
  int fd = ::open(path.c_str(), flags);
  if (fd < 0) {
    throw StorageError("open for sync failed: " + path.string() + ": " + std::strerror(errno));
  }
  int rc = ::fsync(fd);
  int saved = errno;
  ::close(fd);
  if (rc != 0) {
    throw StorageError("fsync failed: " + path.string() + ": " + std::strerror(saved));
  }
}

fs::path ResolveParent(const fs::path& parent) {
  if (parent.empty()) {
    return fs::temp_directory_path();
  }
  fs::create_directories(parent);
  return parent;
}

} // namespace

void SyncFile(const fs::path& path) {
  SyncPath(path, O_RDONLY);
}

void SyncDirectory(const fs::path& path) {
  SyncPath(path.empty() ? fs::path(".") : path, O_RDONLY | O_DIRECTORY);
}

void AtomicCopyFile(const fs::path& source, const fs::path& destination) {
  auto tmp_path = destination;
  tmp_path += ".tmp";

  std::error_code ec;
  fs::copy_file(source, tmp_path, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    fs::remove(tmp_path, ec);
    throw StorageError("copy " + source.string() + " -> " + tmp_path.string() + " failed: " + ec.message());
  }

  try {
    SyncFile(tmp_path);
    fs::rename(tmp_path, destination);
    SyncDirectory(destination.parent_path());
  } catch (...) {
    fs::remove(tmp_path, ec);
    throw;
  }
}

void CopyTree(const fs::path& source, const fs::path& destination) {
  fs::create_directories(destination);
  for (const auto& entry : fs::directory_iterator(source)) {
    const auto target = destination / entry.path().filename();
    if (entry.is_directory()) {
      CopyTree(entry.path(), target);
    } else if (entry.is_regular_file()) {
      fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing);
    }
  }
}

bool HasSuffix(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ------------------------------------------------------------
// ScopedTempPath
// ------------------------------------------------------------

ScopedTempPath ScopedTempPath::MakeDirectory(const fs::path& parent, std::string_view prefix) {
  std::string       pattern = (ResolveParent(parent) / (std::string(prefix) + "XXXXXX")).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  if (::mkdtemp(buf.data()) == nullptr) {
    throw StorageError("mkdtemp failed for " + pattern + ": " + std::strerror(errno));
  }
  return ScopedTempPath(fs::path(buf.data()));
}

ScopedTempPath ScopedTempPath::MakeFile(const fs::path& parent, std::string_view prefix, std::string_view suffix) {
  std::string       pattern = (ResolveParent(parent) / (std::string(prefix) + "XXXXXX" + std::string(suffix))).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    throw StorageError("mkstemps failed for " + pattern + ": " + std::strerror(errno));
  }
  ::close(fd);
  return ScopedTempPath(fs::path(buf.data()));
}

ScopedTempPath::ScopedTempPath(fs::path path) : path_(std::move(path)) {
}

ScopedTempPath::~ScopedTempPath() {
  Remove();
}

ScopedTempPath::ScopedTempPath(ScopedTempPath&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScopedTempPath& ScopedTempPath::operator=(ScopedTempPath&& other) noexcept {
  if (this != &other) {
    Remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

void ScopedTempPath::Remove() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    CANARY_LOG_WARN("Failed to remove temporary path",
                    {observability::StringField("path", path_.string()), observability::StringField("error", ec.message())});
  }
  path_.clear();
}

std::string ReadFileContents(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw NotFound("Cannot open " + path.string());
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

} // namespace canary::util
