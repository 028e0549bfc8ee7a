#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace uv::storage {

inline constexpr size_t kReadablePrefixMax = 50;
inline constexpr size_t kSanitizedHashChars = 8;
inline constexpr int kChunkIndexWidth = 6;
inline constexpr std::string_view kChunkSuffix = ".part";

// Filesystem-safe encoding of a raw file identifier: separators and ".."
// replaced with '_', truncated to 50 bytes, then "_" plus the first 8 hex
// digits of MD5(raw id).
std::string SanitizeFileId(std::string_view file_id);

std::string ChunkFileName(int index);
// Index of a "<digits>.part" name, nullopt for anything else.
std::optional<int> ParseChunkFileName(std::string_view name);

// Every on-disk location the engine touches, derived from the upload root.
class PathLayout {
public:
  explicit PathLayout(std::filesystem::path upload_root);

  [[nodiscard]] const std::filesystem::path& upload_root() const noexcept { return upload_root_; }
  [[nodiscard]] std::filesystem::path MetadataDir() const;
  [[nodiscard]] std::filesystem::path RecordPath(std::string_view file_id) const;
  [[nodiscard]] std::filesystem::path ChunkDir(std::string_view file_id) const;
  [[nodiscard]] std::filesystem::path ChunkPath(std::string_view file_id, int index) const;
  [[nodiscard]] std::filesystem::path ChunkLockPath(std::string_view file_id) const;
  [[nodiscard]] std::filesystem::path MergeLockPath(std::string_view file_id) const;

private:
  std::filesystem::path upload_root_;
};

}  // namespace uv::storage
