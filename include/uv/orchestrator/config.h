#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "uv/orchestrator/retry.h"

namespace uv::orchestrator {

struct ServiceConfig {
  std::filesystem::path upload_dir{"./upload"};
  std::filesystem::path merged_dir{"./merged"};
  std::filesystem::path log_dir{"./logs"};
  uint64_t max_chunk_size{100ull * 1024 * 1024};
  uint64_t max_file_size{10ull * 1024 * 1024 * 1024};
  std::chrono::seconds cleanup_interval{3600};
  int retry_max_attempts{3};
  std::chrono::milliseconds retry_initial_delay{1000};
  std::chrono::milliseconds retry_max_delay{30000};
  double retry_backoff_factor{2.0};
  std::chrono::seconds chunk_timeout{30};
  std::chrono::seconds merge_timeout{300};
  size_t cleanup_workers{2};
  std::chrono::hours task_retention{24 * 7};
  std::chrono::seconds stale_lock_threshold{3600};
  bool enable_integrity_check{true};
  bool enable_atomic_operations{true};
  std::string log_level{"info"};

  [[nodiscard]] RetryPolicy retry_policy() const {
    return RetryPolicy{retry_max_attempts, retry_initial_delay, retry_max_delay, retry_backoff_factor};
  }
};

void to_json(nlohmann::json& j, const ServiceConfig& config);
// Missing keys keep their defaults; unknown keys are ignored.
void from_json(const nlohmann::json& j, ServiceConfig& config);

// Reads `path`, writing the defaults there first when it does not exist.
// Environment overrides are applied and the result validated. Throws
// Error (Config) for malformed files or values.
ServiceConfig LoadConfig(const std::filesystem::path& path);

// UV_UPLOAD_DIR, UV_MERGED_DIR, UV_LOG_DIR, UV_MAX_CHUNK_SIZE,
// UV_RETRY_MAX_ATTEMPTS, UV_RETRY_INITIAL_DELAY_MS, UV_LOG_LEVEL.
void ApplyEnvironmentOverrides(ServiceConfig& config);
void ValidateConfig(const ServiceConfig& config);
// Creates the upload, merged, metadata and log directories.
void EnsureDirectories(const ServiceConfig& config);

}  // namespace uv::orchestrator
