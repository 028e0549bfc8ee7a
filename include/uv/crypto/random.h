#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace uv::crypto {

void SystemRandomBytes(std::span<uint8_t> out);
// Lowercase hex string of `bytes` random bytes.
std::string RandomHex(size_t bytes);

}  // namespace uv::crypto
