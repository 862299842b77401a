#include "internal/migration/migration_catalog.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using canary::migration::CompareVersions;
using canary::migration::LoadCatalog;
using canary::migration::LoadMigrationFile;
using canary::migration::SemanticVersion;
using canary::testing::Sandbox;
using canary::testing::WriteFile;

void TestSemanticVersionOrdering() {
  auto v = SemanticVersion::Parse("v2.1");
  assert(v.has_value());
  assert(v->ToString() == "2.1.0");

  assert(!SemanticVersion::Parse("1.2.3.4").has_value());
  assert(!SemanticVersion::Parse("1.x").has_value());
  assert(!SemanticVersion::Parse("").has_value());

  assert(CompareVersions("1.10.0", "1.9.0") > 0);
  assert(CompareVersions("1.2", "1.2.0") == 0);
  assert(CompareVersions("0.0.0", "1.0.0") < 0);
}

void TestBuiltinCatalogIsOrderedAndReversible() {
  const auto builtins = canary::migration::BuiltinMigrations();
  assert(builtins.size() == 4);
  assert(builtins[0].version == "1.0.0");
  assert(builtins[3].version == "1.3.0");
  for (std::size_t i = 0; i < builtins.size(); ++i) {
    assert(builtins[i].HasRollback());
    assert(builtins[i].source == "builtin");
    if (i > 0) {
      assert(CompareVersions(builtins[i - 1].version, builtins[i].version) < 0);
    }
  }
}

void TestDefinitionFileParsing() {
  Sandbox    sandbox("catalog_parse");
  const auto file = sandbox.Root() / "m" / "scalar.yaml";
  WriteFile(file, R"yaml(version: "2.0.0"
description: scalar statements
up: "CREATE TABLE t (a TEXT); CREATE TABLE u (b TEXT)"
down:
  - ""
  - DROP TABLE u
  - DROP TABLE t
)yaml");

  auto m = LoadMigrationFile(file);
  assert(m.version == "2.0.0");
  assert(m.description == "scalar statements");
  // one scalar is one statement, never split on ';'
  assert(m.up.size() == 1);
  assert(m.down.size() == 2);
  assert(m.source == file.string());

  auto changed = m;
  changed.up.push_back("CREATE TABLE v (c TEXT)");
  assert(changed.Checksum() != m.Checksum());
  assert(m.Checksum().size() == 64);
}

void TestMalformedDefinitionsAreRejected() {
  Sandbox    sandbox("catalog_malformed");
  const auto dir = sandbox.Root() / "m";
  WriteFile(dir / "no_up.yaml", "version: \"2.0.0\"\ndescription: nothing to do\n");
  WriteFile(dir / "no_version.yaml", "up: CREATE TABLE t (a TEXT)\n");
  WriteFile(dir / "nested.yaml", "version: \"2.0.0\"\nup:\n  - {sql: nope}\n");

  for (const char* name : {"no_up.yaml", "no_version.yaml", "nested.yaml"}) {
    bool threw = false;
    try {
      (void)LoadMigrationFile(dir / name);
    } catch (const canary::util::InvalidState&) {
      threw = true;
    }
    assert(threw && "malformed migration definitions must be rejected");
  }
}

void TestCatalogMergesAndRejectsDuplicates() {
  Sandbox    sandbox("catalog_merge");
  const auto dir = sandbox.Root() / "m";

  assert(LoadCatalog(sandbox.Root() / "absent", true).size() == 4);

  WriteFile(dir / "b.yml", "version: \"1.4.0\"\nup: CREATE TABLE b (x INTEGER)\n");
  WriteFile(dir / "ignored.txt", "version: 9\n");
  auto catalog = LoadCatalog(dir, true);
  assert(catalog.size() == 5);
  assert(catalog.back().version == "1.4.0");

  assert(LoadCatalog(dir, false).size() == 1);

  WriteFile(dir / "dup.yaml", "version: \"1.0\"\nup: CREATE TABLE dup (x INTEGER)\n");
  bool threw = false;
  try {
    (void)LoadCatalog(dir, true);
  } catch (const canary::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "duplicate versions must be a load error");
}

} // namespace

int main() {
  TestSemanticVersionOrdering();
  TestBuiltinCatalogIsOrderedAndReversible();
  TestDefinitionFileParsing();
  TestMalformedDefinitionsAreRejected();
  TestCatalogMergesAndRejectsDuplicates();

  std::cout << "canary_unit_migration_catalog: pass\n";
  return 0;
}
