#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace uv::crypto {

// Streaming MD5 over an OpenSSL EVP digest context. The digest can be read at
// any point without disturbing the running state.
class Md5 {
public:
  static constexpr size_t DIGEST_SIZE = 16;

  Md5();
  ~Md5();
  Md5(Md5&& other) noexcept;
  Md5& operator=(Md5&& other) noexcept;
  Md5(const Md5&) = delete;
  Md5& operator=(const Md5&) = delete;

  void Update(std::span<const uint8_t> data);
  [[nodiscard]] std::array<uint8_t, DIGEST_SIZE> Digest() const;
  [[nodiscard]] std::string HexDigest() const;
  void Reset();

private:
  struct ContextDeleter {
    void operator()(evp_md_ctx_st* ctx) const noexcept;
  };
  std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

std::string Md5Hex(std::span<const uint8_t> data);
std::string Md5Hex(std::string_view text);
// Streams the file in fixed-size blocks; throws uv::Error (IO) if it cannot be read.
std::string FileMd5Hex(const std::filesystem::path& path);

} // namespace uv::crypto
