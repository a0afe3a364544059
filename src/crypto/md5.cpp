#include "ba/crypto/md5.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <cerrno>
#include <fstream>
#include <memory>
#include <string>

#include "ba/common.h"
#include "ba/error.h"
#include "ba/errors.h"

namespace ba::crypto {

namespace {

constexpr size_t kReadChunkSize = 64 * 1024;

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

class EVPContextDeleter {
public:
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, EVPContextDeleter>;

[[noreturn]] void ThrowDigestError(const char* context) {
  throw ba::Error(ba::ErrorDomain::Dependency, ba::errors::dependency::kDigestFailed,
                  BuildOpenSSLErrorMessage(context));
}

DigestCtxPtr NewMd5Context() {
  DigestCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowDigestError("EVP_MD_CTX_new");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    ThrowDigestError("EVP_DigestInit_ex");
  }
  return ctx;
}

Md5Digest FinishDigest(EVP_MD_CTX* ctx) {
  Md5Digest digest{};
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx, digest.data(), &out_len) != 1 || out_len != digest.size()) {
    ThrowDigestError("EVP_DigestFinal_ex");
  }
  return digest;
}

}  // namespace

Md5Digest MD5_Hash(std::span<const uint8_t> data) {
  auto ctx = NewMd5Context();
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    ThrowDigestError("EVP_DigestUpdate");
  }
  return FinishDigest(ctx.get());
}

Md5Digest MD5_Hash(const std::vector<uint8_t>& data) {
  return MD5_Hash(std::span<const uint8_t>(data.data(), data.size()));
}

Md5Digest MD5_File(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int saved_errno = errno;
    throw ba::Error(ba::ErrorDomain::IO, ba::errors::io::kBookUnreadable,
                    std::string(ba::errors::msg::kBookUnreadable) + ": " + ba::PathToUtf8String(path),
                    saved_errno);
  }

  auto ctx = NewMd5Context();
  std::vector<char> buffer(kReadChunkSize);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
      ThrowDigestError("EVP_DigestUpdate");
    }
  }
  if (in.bad()) {
    throw ba::Error(ba::ErrorDomain::IO, ba::errors::io::kBookUnreadable,
                    std::string(ba::errors::msg::kBookUnreadable) + ": read error on " +
                        ba::PathToUtf8String(path));
  }
  return FinishDigest(ctx.get());
}

std::string MD5_FileHex(const std::filesystem::path& path) {
  const auto digest = MD5_File(path);
  return ba::HexEncode(std::span<const uint8_t>(digest.data(), digest.size()));
}

}  // namespace ba::crypto
