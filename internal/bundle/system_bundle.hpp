#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace canary::bundle {

/*
  Full-system bundle layout:

      <root>/data/<database file>     required
      <root>/config/                  optional
      <root>/logs/                    optional

  <root> is either the archive top level or one wrapping directory
  (canary_backup_<stamp>/ as written by WriteSystemBundle).
*/

inline constexpr const char* kDataDir   = "data";
inline constexpr const char* kConfigDir = "config";
inline constexpr const char* kLogsDir   = "logs";

struct SystemLayout {
  std::filesystem::path data_directory;
  std::filesystem::path config_directory;
  std::filesystem::path logs_directory;
  // subtrees left out of the bundle (backup directories nested under data/)
  std::vector<std::filesystem::path> exclude;

  // Live database file and a consistent copy of it. When both are set the
  // live file and its -wal/-shm/-journal siblings are left out and the copy
  // is stored as data/<database filename>, wherever the live file sits.
  std::filesystem::path database;
  std::filesystem::path database_snapshot;
};

// Writes <archive> with every existing source directory under <root_name>/.
void WriteSystemBundle(const std::filesystem::path& archive, const std::string& root_name, const SystemLayout& live);

struct ExtractedBundle {
  std::filesystem::path root;
  std::filesystem::path database;
};

/*
  Locates the bundle root inside an extraction directory; nullopt when no
  candidate root holds data/<database_file>.
*/
std::optional<ExtractedBundle> FindBundleRoot(const std::filesystem::path& staging, const std::string& database_file);

} // namespace canary::bundle
