#include "migration_catalog.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace canary::migration {

namespace fs = std::filesystem;

namespace {

constexpr const char* kBuiltinSource = "builtin";

Migration InitialSchema() {
  Migration m;
  m.version     = "1.0.0";
  m.description = "Initial database schema";
  m.source      = kBuiltinSource;

  m.up = {
      R"sql(CREATE TABLE IF NOT EXISTS weekly_digests (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    date TEXT UNIQUE,
    content TEXT,
    urgency_score REAL,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
))sql",
      R"sql(CREATE TABLE IF NOT EXISTS daily_headlines (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    date TEXT,
    source TEXT,
    title TEXT,
    url TEXT,
    content TEXT,
    urgency_keywords TEXT,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
))sql",
      R"sql(CREATE TABLE IF NOT EXISTS daily_economic (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    date TEXT,
    indicator TEXT,
    value REAL,
    change_percent REAL,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
))sql",
      R"sql(CREATE TABLE IF NOT EXISTS user_feedback (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    digest_date TEXT,
    rating INTEGER,
    comments TEXT,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
))sql",
      R"sql(CREATE TABLE IF NOT EXISTS learning_patterns (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    pattern_type TEXT,
    pattern_data TEXT,
    confidence REAL,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
))sql",
      R"sql(CREATE TABLE IF NOT EXISTS keyword_performance (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    keyword TEXT UNIQUE,
    urgency_correlation REAL,
    frequency INTEGER DEFAULT 0,
    last_seen TIMESTAMP,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
))sql",
  };

  m.down = {
      "DROP TABLE IF EXISTS keyword_performance",
      "DROP TABLE IF EXISTS learning_patterns",
      "DROP TABLE IF EXISTS user_feedback",
      "DROP TABLE IF EXISTS daily_economic",
      "DROP TABLE IF EXISTS daily_headlines",
      "DROP TABLE IF EXISTS weekly_digests",
  };
  return m;
}

Migration ArticleFeedback() {
  Migration m;
  m.version     = "1.1.0";
  m.description = "Add individual article feedback system";
  m.source      = kBuiltinSource;

  m.up = {
      R"sql(CREATE TABLE IF NOT EXISTS individual_article_feedback (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    digest_date TEXT,
    article_title TEXT,
    article_source TEXT,
    article_url TEXT,
    user_rating INTEGER,
    relevance_rating INTEGER,
    comments TEXT,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
))sql",
      "CREATE INDEX IF NOT EXISTS idx_article_feedback_date ON individual_article_feedback(digest_date)",
      "CREATE INDEX IF NOT EXISTS idx_article_feedback_source ON individual_article_feedback(article_source)",
  };

  m.down = {
      "DROP INDEX IF EXISTS idx_article_feedback_source",
      "DROP INDEX IF EXISTS idx_article_feedback_date",
      "DROP TABLE IF EXISTS individual_article_feedback",
  };
  return m;
}

Migration RestoreHistory() {
  Migration m;
  m.version     = "1.2.0";
  m.description = "Add restore audit trail";
  m.source      = kBuiltinSource;

  m.up = {
      R"sql(CREATE TABLE IF NOT EXISTS restore_history (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp TEXT NOT NULL,
    backup_file TEXT NOT NULL,
    restore_type TEXT NOT NULL,
    safety_backup TEXT,
    status TEXT NOT NULL,
    notes TEXT
))sql",
  };
  m.down = {"DROP TABLE IF EXISTS restore_history"};
  return m;
}

Migration ArchiveHistory() {
  Migration m;
  m.version     = "1.3.0";
  m.description = "Add archival ledger";
  m.source      = kBuiltinSource;

  m.up = {
      R"sql(CREATE TABLE IF NOT EXISTS archive_history (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    table_name TEXT NOT NULL,
    date_column TEXT NOT NULL,
    retention_days INTEGER NOT NULL,
    cutoff TEXT NOT NULL,
    archived_count INTEGER NOT NULL,
    archive_file TEXT NOT NULL,
    archived_at TEXT NOT NULL
))sql",
      "CREATE INDEX IF NOT EXISTS idx_archive_history_table ON archive_history(table_name)",
  };
  m.down = {
      "DROP INDEX IF EXISTS idx_archive_history_table",
      "DROP TABLE IF EXISTS archive_history",
  };
  return m;
}

std::vector<std::string> ReadStatements(const YAML::Node& node, const fs::path& path, const char* key) {
  std::vector<std::string> statements;
  if (!node || node.IsNull()) {
    return statements;
  }

  if (node.IsScalar()) {
    statements.push_back(node.Scalar());
  } else if (node.IsSequence()) {
    for (const auto& item : node) {
      if (!item.IsScalar()) {
        throw util::InvalidState(path.string() + ": '" + key + "' entries must be SQL strings");
      }
      statements.push_back(item.Scalar());
    }
  } else {
    throw util::InvalidState(path.string() + ": '" + key + "' must be a string or a list");
  }

  statements.erase(std::remove_if(statements.begin(), statements.end(),
                                  [](const std::string& s) { return s.find_first_not_of(" \t\r\n") == std::string::npos; }),
                   statements.end());
  return statements;
}

bool IsDefinitionFile(const fs::path& path) {
  const auto ext = path.extension().string();
  return ext == ".yaml" || ext == ".yml";
}

} // namespace

std::vector<Migration> BuiltinMigrations() {
  return {InitialSchema(), ArticleFeedback(), RestoreHistory(), ArchiveHistory()};
}

Migration LoadMigrationFile(const fs::path& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    throw util::InvalidState(path.string() + ": " + e.what());
  }

  if (!root.IsMap()) {
    throw util::InvalidState(path.string() + ": migration definition must be a mapping");
  }

  Migration m;
  m.source = path.string();

  if (!root["version"] || !root["version"].IsScalar() || root["version"].Scalar().empty()) {
    throw util::InvalidState(path.string() + ": missing 'version'");
  }
  m.version = root["version"].Scalar();

  if (!SemanticVersion::Parse(m.version)) {
    CANARY_LOG_WARN("migration version is not semantic; ordering falls back to text",
                    {observability::StringField("file", path.string()), observability::StringField("version", m.version)});
  }

  if (root["description"] && root["description"].IsScalar()) {
    m.description = root["description"].Scalar();
  }

  m.up   = ReadStatements(root["up"], path, "up");
  m.down = ReadStatements(root["down"], path, "down");

  if (m.up.empty()) {
    throw util::InvalidState(path.string() + ": 'up' has no statements");
  }
  return m;
}

std::vector<Migration> LoadMigrationDirectory(const fs::path& directory) {
  std::vector<Migration> out;
  std::error_code        ec;
  if (directory.empty() || !fs::is_directory(directory, ec)) {
    return out;
  }

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(directory)) {
    if (entry.is_regular_file() && IsDefinitionFile(entry.path())) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  for (const auto& file : files) {
    out.push_back(LoadMigrationFile(file));
  }
  return out;
}

std::vector<Migration> LoadCatalog(const fs::path& directory, bool include_builtin) {
  std::vector<Migration> catalog;
  if (include_builtin) {
    catalog = BuiltinMigrations();
  }

  for (auto& m : LoadMigrationDirectory(directory)) {
    catalog.push_back(std::move(m));
  }

  SortByVersion(&catalog);

  for (std::size_t i = 1; i < catalog.size(); ++i) {
    if (CompareVersions(catalog[i - 1].version, catalog[i].version) == 0) {
      throw util::InvalidState("Duplicate migration version " + catalog[i].version + " (" + catalog[i - 1].source + ", " +
                               catalog[i].source + ")");
    }
  }
  return catalog;
}

} // namespace canary::migration
