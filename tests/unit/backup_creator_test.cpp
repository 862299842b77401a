#include "internal/restore/backup_creator.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "internal/bundle/tar_gz.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"
#include "internal/verify/backup_verifier.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;

using canary::restore::BackupCreator;
using canary::testing::CountRows;
using canary::testing::Sandbox;
using canary::testing::WriteFile;

void SeedLive(const Sandbox& sandbox) {
  auto db = sandbox.OpenLive();
  db->Exec("CREATE TABLE daily_headlines (id INTEGER PRIMARY KEY, date TEXT NOT NULL, title TEXT);");
  db->Exec("INSERT INTO daily_headlines (date, title) VALUES ('2024-03-01', 'a'), ('2024-03-02', 'b');");
}

bool Contains(const std::vector<std::string>& names, const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

void TestDatabaseBackupIsConsistentCopy() {
  Sandbox sandbox("backup_database");
  SeedLive(sandbox);

  BackupCreator creator(sandbox.Config());
  const auto    backup = creator.CreateDatabaseBackup();
  assert(fs::exists(backup));
  assert(backup.parent_path() == fs::path(sandbox.Config().restore().backup_directory()));
  assert(backup.extension() == ".db");
  assert(backup.filename().string().rfind("canary_protocol_", 0) == 0);

  canary::db::sqlite::SqliteDB copy(backup.string());
  assert(CountRows(copy, "daily_headlines") == 2);

  const auto sidecar = backup.string() + ".sha256";
  assert(fs::exists(sidecar));
  const auto line = canary::util::ReadFileContents(sidecar);
  assert(line == canary::util::Sha256File(backup) + "  " + backup.filename().string() + "\n");

  canary::verify::BackupVerifier verifier(sandbox.Config());
  assert(verifier.VerifyIntegrity(backup).overall_valid());

  // same second: second backup gets its own name
  const auto second = creator.CreateDatabaseBackup();
  assert(second != backup);
  assert(fs::exists(second));
}

void TestSystemBundleLayout() {
  Sandbox sandbox("backup_bundle");
  SeedLive(sandbox);
  WriteFile(sandbox.Root() / "config" / "canary.yaml", "logging:\n  level: info\n");
  WriteFile(sandbox.Root() / "logs" / "collector.log", "started\n");

  BackupCreator creator(sandbox.Config());
  (void)creator.CreateDatabaseBackup();
  const auto bundle = creator.CreateSystemBundle();
  assert(canary::util::HasSuffix(bundle.filename().string(), ".tar.gz"));
  assert(fs::exists(bundle.string() + ".sha256"));

  const auto root  = bundle.filename().string().substr(0, bundle.filename().string().size() - 7);
  const auto names = canary::bundle::ListTarGz(bundle);
  assert(Contains(names, root + "/data/canary_protocol.db"));
  assert(Contains(names, root + "/config/canary.yaml"));
  assert(Contains(names, root + "/logs/collector.log"));
  for (const auto& name : names) {
    assert(name.find("backups") == std::string::npos);
    assert(name.find("canary.lock") == std::string::npos);
  }

  canary::verify::BackupVerifier verifier(sandbox.Config());
  const auto                     report = verifier.VerifyIntegrity(bundle);
  assert(report.backup_type() == "full_system");
  assert(report.overall_valid());
}

void TestBundleCarriesCommitsStillInWal() {
  Sandbox sandbox("backup_bundle_wal");
  auto    live = sandbox.OpenLive();
  live->Exec("PRAGMA journal_mode=WAL;");
  live->Exec("PRAGMA wal_autocheckpoint=0;");
  live->Exec("CREATE TABLE daily_headlines (id INTEGER PRIMARY KEY, date TEXT NOT NULL, title TEXT);");
  live->Exec("INSERT INTO daily_headlines (date, title) VALUES ('2024-03-01', 'a'), ('2024-03-02', 'b');");

  const auto wal = sandbox.DatabasePath().string() + "-wal";
  assert(fs::exists(wal) && fs::file_size(wal) > 0);

  BackupCreator creator(sandbox.Config());
  const auto    bundle = creator.CreateSystemBundle();

  const auto root  = bundle.filename().string().substr(0, bundle.filename().string().size() - 7);
  const auto names = canary::bundle::ListTarGz(bundle);
  assert(Contains(names, root + "/data/canary_protocol.db"));
  for (const auto& name : names) {
    assert(!canary::util::HasSuffix(name, "-wal"));
    assert(!canary::util::HasSuffix(name, "-shm"));
    assert(name.find("staging") == std::string::npos);
  }

  const auto out = sandbox.Root() / "extracted";
  canary::bundle::ExtractTarGz(bundle, out);
  {
    canary::db::sqlite::SqliteDB copy((out / root / "data" / "canary_protocol.db").string());
    assert(CountRows(copy, "daily_headlines") == 2);
  }

  // the writer's connection stays usable and nothing is left in staging
  live->Exec("INSERT INTO daily_headlines (date, title) VALUES ('2024-03-03', 'c');");
  assert(CountRows(*live, "daily_headlines") == 3);
  const fs::path staging = sandbox.Config().restore().staging_directory();
  assert(!fs::exists(staging) || fs::is_empty(staging));

  const auto backup = creator.CreateDatabaseBackup();
  canary::db::sqlite::SqliteDB copy(backup.string());
  assert(CountRows(copy, "daily_headlines") == 3);
}

void TestMissingDatabaseIsNotFound() {
  Sandbox       sandbox("backup_missing");
  BackupCreator creator(sandbox.Config());

  bool threw = false;
  try {
    (void)creator.CreateDatabaseBackup();
  } catch (const canary::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)creator.CreateSystemBundle();
  } catch (const canary::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(!fs::exists(sandbox.DatabasePath()));
}

} // namespace

int main() {
  TestDatabaseBackupIsConsistentCopy();
  TestSystemBundleLayout();
  TestBundleCarriesCommitsStillInWal();
  TestMissingDatabaseIsNotFound();

  std::cout << "canary_unit_backup_creator: pass\n";
  return 0;
}
