#include "uv/crypto/random.h"

#include <cerrno>
#include <fstream>
#include <vector>

#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#include <unistd.h>
#elif defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#include <unistd.h>
#endif

#include "uv/common.h"
#include "uv/error.h"

namespace {

void ReadFromUrandom(std::span<uint8_t> out) {
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw uv::Error(uv::ErrorDomain::Internal, errno, "Failed to open /dev/urandom");
  }
  urandom.read(reinterpret_cast<char*>(out.data()),
               static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw uv::Error(uv::ErrorDomain::Internal, errno,
                    "Failed to read sufficient entropy from /dev/urandom");
  }
}

}  // namespace

namespace uv::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  arc4random_buf(out.data(), out.size());
#elif defined(__linux__) || defined(__ANDROID__)
  size_t offset = 0;
  bool used_blocking = false;
  while (offset < out.size()) {
    const int flags = used_blocking ? 0 : GRND_NONBLOCK;
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, flags);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN && !used_blocking) {
        break; // fall back to /dev/urandom below
      }
      throw Error(ErrorDomain::Internal, errno, "getrandom failed");
    }
    if (result == 0) {
      break;
    }
    offset += static_cast<size_t>(result);
    used_blocking = true;
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
}

std::string RandomHex(size_t bytes) {
  std::vector<uint8_t> buffer(bytes);
  SystemRandomBytes(std::span<uint8_t>(buffer.data(), buffer.size()));
  return HexEncode(std::span<const uint8_t>(buffer.data(), buffer.size()));
}

}  // namespace uv::crypto
