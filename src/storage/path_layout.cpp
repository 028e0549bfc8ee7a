#include "uv/storage/path_layout.h"

#include <cctype>
#include <charconv>
#include <cstdio>

#include "uv/crypto/md5.h"

namespace uv::storage {

std::string SanitizeFileId(std::string_view file_id) {
  const std::string hash = uv::crypto::Md5Hex(file_id);

  std::string readable;
  readable.reserve(file_id.size());
  for (size_t i = 0; i < file_id.size(); ++i) {
    const char c = file_id[i];
    if (c == '/' || c == '\\') {
      readable.push_back('_');
      continue;
    }
    if (c == '.' && i + 1 < file_id.size() && file_id[i + 1] == '.') {
      readable.push_back('_');
      ++i;
      continue;
    }
    readable.push_back(c);
  }
  if (readable.size() > kReadablePrefixMax) {
    readable.resize(kReadablePrefixMax);
  }
  return readable + "_" + hash.substr(0, kSanitizedHashChars);
}

std::string ChunkFileName(int index) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%0*d", kChunkIndexWidth, index);
  return std::string(buffer) + std::string(kChunkSuffix);
}

std::optional<int> ParseChunkFileName(std::string_view name) {
  if (name.size() <= kChunkSuffix.size() ||
      name.substr(name.size() - kChunkSuffix.size()) != kChunkSuffix) {
    return std::nullopt;
  }
  auto digits = name.substr(0, name.size() - kChunkSuffix.size());
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }
  int index = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return index;
}

PathLayout::PathLayout(std::filesystem::path upload_root) : upload_root_(std::move(upload_root)) {}

std::filesystem::path PathLayout::MetadataDir() const { return upload_root_ / ".metadata"; }

std::filesystem::path PathLayout::RecordPath(std::string_view file_id) const {
  return MetadataDir() / (SanitizeFileId(file_id) + ".json");
}

std::filesystem::path PathLayout::ChunkDir(std::string_view file_id) const {
  return upload_root_ / SanitizeFileId(file_id);
}

std::filesystem::path PathLayout::ChunkPath(std::string_view file_id, int index) const {
  return ChunkDir(file_id) / ChunkFileName(index);
}

std::filesystem::path PathLayout::ChunkLockPath(std::string_view file_id) const {
  return upload_root_ / (SanitizeFileId(file_id) + ".lock");
}

std::filesystem::path PathLayout::MergeLockPath(std::string_view file_id) const {
  return upload_root_ / (SanitizeFileId(file_id) + ".merge.lock");
}

}  // namespace uv::storage
