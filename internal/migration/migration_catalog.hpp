#pragma once

#include <filesystem>
#include <vector>

#include "migration.hpp"

namespace canary::migration {

/*
  Migrations compiled into the binary: the base schema of the Canary
  database plus the lifecycle audit tables.
*/
std::vector<Migration> BuiltinMigrations();

/*
  Reads one YAML definition:

      version: "1.4.0"
      description: Add source column
      up:
        - ALTER TABLE daily_headlines ADD COLUMN region TEXT
      down:
        - ...

  A scalar `up`/`down` is a single statement. Throws InvalidState on a
  malformed file.
*/
Migration LoadMigrationFile(const std::filesystem::path& path);

// Every *.yaml / *.yml file in directory; a missing directory yields none.
std::vector<Migration> LoadMigrationDirectory(const std::filesystem::path& directory);

/*
  Builtins (optional) + directory files, ascending by version.
  Duplicate versions throw InvalidState.
*/
std::vector<Migration> LoadCatalog(const std::filesystem::path& directory, bool include_builtin);

} // namespace canary::migration
