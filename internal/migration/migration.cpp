#include "migration.hpp"

#include <algorithm>
#include <charconv>

#include "internal/util/sha256.hpp"

namespace canary::migration {

namespace {

bool ParsePart(std::string_view part, uint32_t* out) {
  if (part.empty()) return false;
  auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), *out);
  return ec == std::errc() && ptr == part.data() + part.size();
}

} // namespace

std::optional<SemanticVersion> SemanticVersion::Parse(std::string_view text) {
  if (!text.empty() && (text.front() == 'v' || text.front() == 'V')) {
    text.remove_prefix(1);
  }

  SemanticVersion v;
  uint32_t*       parts[] = {&v.major, &v.minor, &v.patch};

  std::size_t index = 0;
  while (true) {
    if (index >= 3) return std::nullopt;
    auto dot = text.find('.');
    if (!ParsePart(text.substr(0, dot), parts[index])) return std::nullopt;
    ++index;
    if (dot == std::string_view::npos) break;
    text.remove_prefix(dot + 1);
  }
  return v;
}

std::string SemanticVersion::ToString() const {
  return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

int CompareVersions(const std::string& a, const std::string& b) {
  auto va = SemanticVersion::Parse(a);
  auto vb = SemanticVersion::Parse(b);
  if (va && vb) {
    if (*va < *vb) return -1;
    if (*vb < *va) return 1;
    return 0;
  }
  return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
}

std::string Migration::Checksum() const {
  std::string joined;
  for (const auto& statement : up) {
    joined += statement;
    joined.push_back('\x1f');
  }
  return util::Sha256Hex(joined);
}

void SortByVersion(std::vector<Migration>* migrations) {
  std::stable_sort(migrations->begin(), migrations->end(),
                   [](const Migration& a, const Migration& b) { return CompareVersions(a.version, b.version) < 0; });
}

} // namespace canary::migration
