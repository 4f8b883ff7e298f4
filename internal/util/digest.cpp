#include "digest.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>

#include "internal/util/errors.hpp"

namespace digiplayer::util {

namespace {

struct MdContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using MdContext = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

MdContext NewContext(const EVP_MD* md) {
  MdContext ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
    throw StorageError("EVP_DigestInit_ex failed");
  }
  return ctx;
}

std::string Finish(EVP_MD_CTX* ctx) {
  static constexpr char kHex[] = "0123456789abcdef";

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  length = 0;
  if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
    throw StorageError("EVP_DigestFinal_ex failed");
  }

  std::string result;
  result.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    result.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    result.push_back(kHex[digest[i] & 0x0F]);
  }
  return result;
}

std::string DigestHex(const EVP_MD* md, std::string_view data) {
  auto ctx = NewContext(md);
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw StorageError("EVP_DigestUpdate failed");
  }
  return Finish(ctx.get());
}

} // namespace

std::string Md5Hex(std::string_view data) {
  return DigestHex(EVP_md5(), data);
}

std::string Sha256Hex(std::string_view data) {
  return DigestHex(EVP_sha256(), data);
}

std::string Sha256FileHex(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    throw StorageError("cannot open " + file.string() + " for hashing");
  }

  auto ctx = NewContext(EVP_sha256());
  char buffer[64 * 1024];
  while (in) {
    in.read(buffer, sizeof(buffer));
    const auto n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(n)) != 1) {
      throw StorageError("EVP_DigestUpdate failed");
    }
  }
  if (in.bad()) {
    throw StorageError("read failed while hashing " + file.string());
  }
  return Finish(ctx.get());
}

} // namespace digiplayer::util
