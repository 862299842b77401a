#include "system_bundle.hpp"

#include <string_view>
#include <vector>

#include "internal/observability/logging.hpp"
#include "tar_gz.hpp"

namespace canary::bundle {

namespace fs = std::filesystem;

void WriteSystemBundle(const fs::path& archive, const std::string& root_name, const SystemLayout& live) {
  std::vector<TarEntry> entries;
  entries.push_back(TarEntry{root_name, {}, true});

  const std::pair<const char*, const fs::path*> parts[] = {
      {kDataDir, &live.data_directory},
      {kConfigDir, &live.config_directory},
      {kLogsDir, &live.logs_directory},
  };

  const bool snapshot = !live.database.empty() && !live.database_snapshot.empty();
  auto       exclude  = live.exclude;
  if (snapshot) {
    for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
      exclude.emplace_back(live.database.string() + suffix);
    }
  }

  bool have_data = false;
  for (const auto& [name, source] : parts) {
    std::error_code ec;
    if (source->empty() || !fs::is_directory(*source, ec)) {
      continue;
    }
    AddTree(&entries, *source, root_name + "/" + name, exclude);
    have_data = have_data || std::string_view(name) == kDataDir;
  }

  if (snapshot) {
    const auto data = root_name + "/" + kDataDir;
    if (!have_data) {
      entries.push_back(TarEntry{data, {}, true});
    }
    entries.push_back(TarEntry{data + "/" + live.database.filename().string(), live.database_snapshot, false});
  }

  WriteTarGz(archive, entries);

  CANARY_LOG_INFO("system bundle written", {observability::StringField("archive", archive.string()),
                                            observability::IntField("entries", static_cast<int64_t>(entries.size()))});
}

std::optional<ExtractedBundle> FindBundleRoot(const fs::path& staging, const std::string& database_file) {
  auto root_at = [&](const fs::path& root) -> std::optional<ExtractedBundle> {
    std::error_code ec;
    const auto      db = root / kDataDir / database_file;
    if (fs::is_regular_file(db, ec)) {
      return ExtractedBundle{root, db};
    }
    return std::nullopt;
  };

  if (auto hit = root_at(staging)) {
    return hit;
  }

  std::vector<fs::path> dirs;
  for (const auto& entry : fs::directory_iterator(staging)) {
    if (entry.is_directory()) {
      dirs.push_back(entry.path());
    }
  }
  if (dirs.size() == 1) {
    return root_at(dirs.front());
  }
  return std::nullopt;
}

} // namespace canary::bundle
