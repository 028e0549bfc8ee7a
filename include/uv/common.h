#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace uv {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline std::string PathToUtf8String(const std::filesystem::path& path) {
#if defined(_WIN32)
  const std::u8string u8 = path.u8string();
  std::string result;
  result.reserve(u8.size());
  for (auto ch : u8) {
    result.push_back(static_cast<char>(ch));
  }
  return result;
#else
  return path.string();
#endif
}

inline std::string HexEncode(std::span<const std::uint8_t> bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    out.push_back(kHex[(byte >> 4) & 0x0F]);
    out.push_back(kHex[byte & 0x0F]);
  }
  return out;
}

inline std::span<const std::uint8_t> AsBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

// Case-insensitive comparison of two hex digests.
[[nodiscard]] bool DigestEquals(std::string_view lhs, std::string_view rhs) noexcept;

// RFC 3339 UTC timestamp with microsecond precision, e.g. 2024-05-01T10:00:00.000123Z.
std::string FormatTimestamp(TimePoint tp);
// Accepts the output of FormatTimestamp as well as second-precision and
// numeric-offset forms. Returns nullopt for anything else.
std::optional<TimePoint> ParseTimestamp(std::string_view text);

} // namespace uv
