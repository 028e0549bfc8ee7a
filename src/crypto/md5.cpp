#include "uv/crypto/md5.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <cerrno>
#include <fstream>
#include <vector>

#include "uv/common.h"
#include "uv/error.h"

namespace uv::crypto {

namespace {

constexpr size_t kFileReadBlock = 64 * 1024;

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

[[noreturn]] void ThrowCryptoError(const char* context) {
  throw Error{ErrorDomain::Internal, 0, BuildOpenSSLErrorMessage(context)};
}

}  // namespace

void Md5::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept { EVP_MD_CTX_free(ctx); }

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    ThrowCryptoError("EVP_MD_CTX_new");
  }
  Reset();
}

Md5::~Md5() = default;
Md5::Md5(Md5&& other) noexcept = default;
Md5& Md5::operator=(Md5&& other) noexcept = default;

void Md5::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
    ThrowCryptoError("EVP_DigestInit_ex(md5)");
  }
}

void Md5::Update(std::span<const uint8_t> data) {
  if (data.empty()) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    ThrowCryptoError("EVP_DigestUpdate(md5)");
  }
}

std::array<uint8_t, Md5::DIGEST_SIZE> Md5::Digest() const {
  // Finalize a copy so the running context keeps accepting data.
  std::unique_ptr<evp_md_ctx_st, ContextDeleter> snapshot(EVP_MD_CTX_new());
  if (!snapshot) {
    ThrowCryptoError("EVP_MD_CTX_new");
  }
  if (EVP_MD_CTX_copy_ex(snapshot.get(), ctx_.get()) != 1) {
    ThrowCryptoError("EVP_MD_CTX_copy_ex");
  }
  std::array<uint8_t, DIGEST_SIZE> out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(snapshot.get(), out.data(), &len) != 1 || len != out.size()) {
    ThrowCryptoError("EVP_DigestFinal_ex(md5)");
  }
  return out;
}

std::string Md5::HexDigest() const {
  auto digest = Digest();
  return HexEncode(std::span<const uint8_t>(digest.data(), digest.size()));
}

std::string Md5Hex(std::span<const uint8_t> data) {
  Md5 hasher;
  hasher.Update(data);
  return hasher.HexDigest();
}

std::string Md5Hex(std::string_view text) { return Md5Hex(AsBytes(text)); }

std::string FileMd5Hex(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int err = errno;
    throw Error{ErrorDomain::IO, err, "Failed to open file for hashing: " + PathToUtf8String(path),
                err};
  }
  Md5 hasher;
  std::vector<char> buffer(kFileReadBlock);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0) {
      hasher.Update(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(buffer.data()),
                                             static_cast<size_t>(got)));
    }
  }
  if (in.bad()) {
    throw Error{ErrorDomain::IO, errno, "Failed to read file for hashing: " + PathToUtf8String(path)};
  }
  return hasher.HexDigest();
}

} // namespace uv::crypto
