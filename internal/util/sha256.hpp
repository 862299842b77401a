#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace canary::util {

/*
  SHA-256 (OpenSSL EVP), lowercase hex output.
*/

std::string Sha256Hex(std::string_view data);

// Streams the file in fixed-size chunks; throws NotFound / StorageError.
std::string Sha256File(const std::filesystem::path& path);

} // namespace canary::util
