#include "uv/common.h"

#include "uv/error.h"

#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace uv {
namespace {

bool ParseFixed(std::string_view text, size_t pos, size_t width, int& out) {
  if (pos + width > text.size()) {
    return false;
  }
  const char* begin = text.data() + pos;
  const char* end = begin + width;
  auto [ptr, ec] = std::from_chars(begin, end, out);
  return ec == std::errc() && ptr == end;
}

bool Expect(std::string_view text, size_t pos, char ch) {
  return pos < text.size() && text[pos] == ch;
}

}  // namespace

const char* ErrorDomainName(ErrorDomain domain) noexcept {
  switch (domain) {
  case ErrorDomain::Validation:
    return "validation";
  case ErrorDomain::NotFound:
    return "not_found";
  case ErrorDomain::Conflict:
    return "conflict";
  case ErrorDomain::Integrity:
    return "integrity";
  case ErrorDomain::IO:
    return "io";
  case ErrorDomain::Persistence:
    return "persistence";
  case ErrorDomain::Cancelled:
    return "cancelled";
  case ErrorDomain::State:
    return "state";
  case ErrorDomain::Config:
    return "config";
  case ErrorDomain::Internal:
    return "internal";
  }
  return "internal";
}

bool DigestEquals(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
        std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

std::string FormatTimestamp(TimePoint tp) {
  auto tt = Clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  if (fractional.count() < 0) {
    fractional += std::chrono::seconds(1);
  }
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

std::optional<TimePoint> ParseTimestamp(std::string_view text) {
  std::tm tm{};
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!ParseFixed(text, 0, 4, year) || !Expect(text, 4, '-') || !ParseFixed(text, 5, 2, month) ||
      !Expect(text, 7, '-') || !ParseFixed(text, 8, 2, day) ||
      !(Expect(text, 10, 'T') || Expect(text, 10, ' ')) || !ParseFixed(text, 11, 2, hour) ||
      !Expect(text, 13, ':') || !ParseFixed(text, 14, 2, minute) || !Expect(text, 16, ':') ||
      !ParseFixed(text, 17, 2, second)) {
    return std::nullopt;
  }
  size_t pos = 19;
  std::chrono::nanoseconds fraction{0};
  if (Expect(text, pos, '.')) {
    ++pos;
    long long scale = 100000000;
    long long nanos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      nanos += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
    fraction = std::chrono::nanoseconds(nanos);
  }
  std::chrono::seconds offset{0};
  if (Expect(text, pos, 'Z') || Expect(text, pos, 'z')) {
    ++pos;
  } else if (Expect(text, pos, '+') || Expect(text, pos, '-')) {
    const int sign = text[pos] == '-' ? -1 : 1;
    int off_h = 0;
    int off_m = 0;
    if (!ParseFixed(text, pos + 1, 2, off_h) || !Expect(text, pos + 3, ':') ||
        !ParseFixed(text, pos + 4, 2, off_m)) {
      return std::nullopt;
    }
    offset = std::chrono::seconds(sign * (off_h * 3600 + off_m * 60));
    pos += 6;
  } else {
    return std::nullopt;
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
#if defined(_WIN32)
  const std::time_t base = _mkgmtime(&tm);
#else
  const std::time_t base = timegm(&tm);
#endif
  if (base == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  auto tp = Clock::from_time_t(base) - offset;
  return tp + std::chrono::duration_cast<Clock::duration>(fraction);
}

} // namespace uv
