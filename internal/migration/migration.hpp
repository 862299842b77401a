#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canary::migration {

// Reported when no migration has been applied.
inline constexpr std::string_view kNoVersion = "0.0.0";

struct SemanticVersion {
  uint32_t major = 0;
  uint32_t minor = 0;
  uint32_t patch = 0;

  // "MAJOR.MINOR.PATCH"; minor/patch may be omitted ("2", "2.1").
  static std::optional<SemanticVersion> Parse(std::string_view text);

  std::string ToString() const;

  auto operator<=>(const SemanticVersion&) const = default;
};

/*
  Numeric semantic-version ordering ("1.10.0" > "1.9.0").
  Unparseable versions (rows written by older tooling) compare as strings.
*/
int CompareVersions(const std::string& a, const std::string& b);

/*
  A named, versioned schema change.

  Statements are kept as an ordered list and executed one by one;
  nothing is ever split on ';'.
*/
struct Migration {
  std::string              version;
  std::string              description;
  std::vector<std::string> up;
  std::vector<std::string> down;
  // "builtin" or the definition file it came from
  std::string source;

  bool HasRollback() const {
    return !down.empty();
  }

  // SHA-256 over the up statements; stored with the tracking row.
  std::string Checksum() const;
};

// Tracking-table row.
struct AppliedMigration {
  std::string version;
  std::string description;
  std::string applied_at;
  std::string checksum;
};

void SortByVersion(std::vector<Migration>* migrations);

} // namespace canary::migration
