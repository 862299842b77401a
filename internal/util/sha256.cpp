#include "sha256.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>

#include "internal/util/errors.hpp"

namespace canary::util {

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtx NewSha256() {
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw StorageError("EVP sha256 init failed");
  }
  return ctx;
}

void Update(EVP_MD_CTX* ctx, const void* data, std::size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw StorageError("EVP sha256 update failed");
  }
}

std::string Finish(EVP_MD_CTX* ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
  unsigned int                               hash_len = 0;
  if (EVP_DigestFinal_ex(ctx, hash.data(), &hash_len) != 1) {
    throw StorageError("EVP sha256 final failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(hash_len * 2);
  for (unsigned int i = 0; i < hash_len; ++i) {
    out.push_back(kHex[hash[i] >> 4]);
    out.push_back(kHex[hash[i] & 0x0F]);
  }
  return out;
}

} // namespace

std::string Sha256Hex(std::string_view data) {
  auto ctx = NewSha256();
  Update(ctx.get(), data.data(), data.size());
  return Finish(ctx.get());
}

std::string Sha256File(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw NotFound("Cannot open for checksum: " + path.string());
  }

  auto ctx = NewSha256();
  std::array<char, kChunkSize> buf{};
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = in.gcount();
    if (got > 0) {
      Update(ctx.get(), buf.data(), static_cast<std::size_t>(got));
    }
  }
  if (in.bad()) {
    throw StorageError("Read failed while hashing " + path.string());
  }
  return Finish(ctx.get());
}

} // namespace canary::util
