#include "backup_artifact.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/fs.hpp"
#include "internal/util/sha256.hpp"

namespace canary::verify {

namespace fs = std::filesystem;

std::string_view ToString(BackupType type) {
  switch (type) {
    case BackupType::Database:
      return "database";
    case BackupType::JsonData:
      return "json_data";
    case BackupType::FullSystem:
      return "full_system";
    case BackupType::SqlDump:
      return "sql_dump";
    case BackupType::Archive:
      return "archive";
    case BackupType::Unknown:
      return "unknown";
  }
  return "unknown";
}

std::optional<BackupType> ParseBackupType(std::string_view text) {
  for (auto type : {BackupType::Database, BackupType::JsonData, BackupType::FullSystem, BackupType::SqlDump,
                    BackupType::Archive, BackupType::Unknown}) {
    if (ToString(type) == text) {
      return type;
    }
  }
  return std::nullopt;
}

BackupType InferBackupType(const fs::path& path) {
  const auto name = path.filename().string();

  if (util::HasSuffix(name, ".tar.gz") || util::HasSuffix(name, ".tgz")) return BackupType::FullSystem;
  if (util::HasSuffix(name, ".db") || util::HasSuffix(name, ".sqlite")) return BackupType::Database;
  if (util::HasSuffix(name, ".json")) return BackupType::JsonData;
  if (util::HasSuffix(name, ".sql")) return BackupType::SqlDump;
  if (util::HasSuffix(name, ".zip")) return BackupType::Archive;
  return BackupType::Unknown;
}

BackupArtifact DescribeArtifact(const fs::path& path, bool with_checksum) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw util::NotFound("Backup file does not exist: " + path.string());
  }

  BackupArtifact a;
  a.path       = path;
  a.name       = path.filename().string();
  a.size_bytes = fs::file_size(path);
  a.type       = InferBackupType(path);
  a.modified   = util::LastWriteTime(path);
  if (with_checksum) {
    a.checksum = util::Sha256File(path);
  }
  return a;
}

std::vector<BackupArtifact> DiscoverArtifacts(const fs::path& directory, const std::vector<std::string>& extensions) {
  std::vector<BackupArtifact> out;
  std::error_code             ec;
  if (!fs::is_directory(directory, ec)) {
    return out;
  }

  for (const auto& entry : fs::directory_iterator(directory)) {
    if (!entry.is_regular_file()) continue;

    const auto name    = entry.path().filename().string();
    const bool matches = std::any_of(extensions.begin(), extensions.end(),
                                     [&](const std::string& ext) { return util::HasSuffix(name, ext); });
    if (matches) {
      out.push_back(DescribeArtifact(entry.path()));
    }
  }

  std::sort(out.begin(), out.end(), [](const BackupArtifact& a, const BackupArtifact& b) {
    if (a.modified != b.modified) return a.modified > b.modified;
    return a.name > b.name;
  });
  return out;
}

uint32_t AgeInDays(const BackupArtifact& artifact, util::TimePoint now) {
  if (artifact.modified >= now) return 0;
  return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::hours>(now - artifact.modified).count() / 24);
}

} // namespace canary::verify
