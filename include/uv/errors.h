#pragma once

#include <string_view>

namespace uv::errors::msg {
// centralized message catalog
inline constexpr std::string_view kFileIdRequired{"file_id is required"};
inline constexpr std::string_view kChunkIndexInvalid{"Chunk index must be non-negative"};
inline constexpr std::string_view kChunkTooLarge{"Chunk exceeds the configured maximum size"};
inline constexpr std::string_view kFileTooLarge{"File exceeds the configured maximum size"};
inline constexpr std::string_view kChunkChecksumMismatch{"Chunk MD5 does not match the supplied digest"};
inline constexpr std::string_view kFileChecksumMismatch{"Merged file MD5 does not match the expected digest"};
inline constexpr std::string_view kTaskNotFound{"Task not found"};
inline constexpr std::string_view kFolderFilesEmpty{"Folder task requires at least one file"};
inline constexpr std::string_view kFolderNameRequired{"Folder name is required"};
inline constexpr std::string_view kNotAFolderTask{"Task is not a folder task"};
inline constexpr std::string_view kNotAFileTask{"Task is not a file task"};
inline constexpr std::string_view kDuplicateFolderEntry{"Folder contains two files with the same destination"};
inline constexpr std::string_view kIncompleteUpload{"Not all chunks have been uploaded"};
inline constexpr std::string_view kMissingChunk{"Chunk artifact missing on disk"};
inline constexpr std::string_view kMergeInProgress{"Merge already in progress for this file"};
inline constexpr std::string_view kLockHeld{"Lock already held"};
inline constexpr std::string_view kPathTraversal{"Relative path must not contain parent directory segments"};
inline constexpr std::string_view kFilenameRequired{"Destination filename is required"};
inline constexpr std::string_view kCannotPauseCompleted{"Completed tasks cannot be paused"};
inline constexpr std::string_view kCannotResume{"Only paused or failed tasks can be resumed"};
inline constexpr std::string_view kRetriesExhausted{"Operation failed after exhausting retries"};
inline constexpr std::string_view kCircuitOpen{"Circuit breaker is open"};
inline constexpr std::string_view kDeadlineExceeded{"Operation deadline exceeded"};
inline constexpr std::string_view kOperationCancelled{"Operation cancelled"};
inline constexpr std::string_view kWriterNotOpen{"Atomic writer is not open"};
inline constexpr std::string_view kRecordWriteFailed{"Failed to persist task record"};
inline constexpr std::string_view kRecordRemoveFailed{"Failed to remove task record"};
inline constexpr std::string_view kConfigMalformed{"Configuration file is not valid JSON"};
}  // namespace uv::errors::msg
