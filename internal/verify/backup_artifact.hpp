#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace canary::verify {

enum class BackupType { Database, JsonData, FullSystem, SqlDump, Archive, Unknown };

std::string_view ToString(BackupType type);

// Accepts the ToString() spellings; nullopt otherwise.
std::optional<BackupType> ParseBackupType(std::string_view text);

/*
  Type from the file name:
    .db .sqlite    database
    .json          json_data
    .tar.gz .tgz   full_system
    .sql           sql_dump
    .zip           archive
*/
BackupType InferBackupType(const std::filesystem::path& path);

struct BackupArtifact {
  std::filesystem::path path;
  std::string           name;
  uint64_t              size_bytes = 0;
  BackupType            type       = BackupType::Unknown;
  util::TimePoint       modified;
  // only filled when requested; hashing large bundles is not free
  std::string checksum;
};

// Throws NotFound.
BackupArtifact DescribeArtifact(const std::filesystem::path& path, bool with_checksum = false);

/*
  Regular files in directory whose name ends with one of extensions,
  newest first. Missing directory yields an empty list.
*/
std::vector<BackupArtifact> DiscoverArtifacts(const std::filesystem::path& directory,
                                              const std::vector<std::string>& extensions);

// Whole days between modified and now, never negative.
uint32_t AgeInDays(const BackupArtifact& artifact, util::TimePoint now);

} // namespace canary::verify
