#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace canary::bundle {

/*
  tar.gz bundles (libarchive, pax format) for backups and log archives;
  plain gzip files (zlib) for compressed archival snapshots.

  Writers are durable: data goes to a ".tmp" sibling which is fsynced and
  renamed into place, so a reader never observes a partial archive.
*/

struct TarEntry {
  // path inside the archive, '/' separated, relative
  std::string           name;
  std::filesystem::path source;
  bool                  directory = false;
};

// Appends `root` (recursively) under `prefix`; directories get their own entries.
void AddTree(std::vector<TarEntry>* entries, const std::filesystem::path& root, const std::string& prefix,
             const std::vector<std::filesystem::path>& exclude = {});

void WriteTarGz(const std::filesystem::path& archive, const std::vector<TarEntry>& entries);

// Names of regular-file and directory entries, in archive order.
std::vector<std::string> ListTarGz(const std::filesystem::path& archive);

/*
  Extracts into destination (created if missing). Absolute names, ".."
  components and writes through symlinks are rejected with
  IntegrityFailure before anything is written for that entry; links and
  devices are skipped. A damaged stream throws IntegrityFailure, a
  missing archive NotFound. Returns the extracted names.
*/
std::vector<std::string> ExtractTarGz(const std::filesystem::path& archive, const std::filesystem::path& destination);

void        WriteGzipFile(const std::filesystem::path& path, const std::string& data);
std::string ReadGzipFile(const std::filesystem::path& path);

} // namespace canary::bundle
