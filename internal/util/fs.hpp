#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace canary::util {

// fsync a file's contents; throws StorageError.
void SyncFile(const std::filesystem::path& path);

// fsync a directory so renames/unlinks inside it are durable.
void SyncDirectory(const std::filesystem::path& path);

/*
  Atomic copy:
      copy → tmp sibling → fsync → rename → fsync(dir)

  The destination either keeps its old content or holds the full copy.
*/
void AtomicCopyFile(const std::filesystem::path& source, const std::filesystem::path& destination);

// Recursive copy overwriting existing files, creating directories as needed.
void CopyTree(const std::filesystem::path& source, const std::filesystem::path& destination);

bool HasSuffix(std::string_view value, std::string_view suffix);

// Throws NotFound when the file cannot be opened.
std::string ReadFileContents(const std::filesystem::path& path);

/*
  RAII owner of an ephemeral file or directory.

  The path (and everything under it) is removed when the owner goes out of
  scope, whatever the exit path.
*/
class ScopedTempPath {
 public:
  // mkdtemp under parent ("" means the system temp directory).
  static ScopedTempPath MakeDirectory(const std::filesystem::path& parent, std::string_view prefix);

  // mkstemp under parent; the file exists (empty) on return.
  static ScopedTempPath MakeFile(const std::filesystem::path& parent, std::string_view prefix, std::string_view suffix);

  explicit ScopedTempPath(std::filesystem::path path);
  ~ScopedTempPath();

  ScopedTempPath(ScopedTempPath&& other) noexcept;
  ScopedTempPath& operator=(ScopedTempPath&& other) noexcept;

  ScopedTempPath(const ScopedTempPath&)            = delete;
  ScopedTempPath& operator=(const ScopedTempPath&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  void Remove();

  std::filesystem::path path_;
};

} // namespace canary::util
