#include "uv/orchestrator/config.h"

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string_view>
#include <system_error>

#include "uv/common.h"
#include "uv/error.h"
#include "uv/errors.h"
#include "uv/orchestrator/event_bus.h"
#include "uv/orchestrator/io_util.h"
#include "uv/storage/path_layout.h"

namespace uv::orchestrator {
namespace {

[[noreturn]] void ThrowInvalid(const std::string& key, const std::string& detail) {
  throw Error{ErrorDomain::Config, errors::config::kInvalidValue, "Invalid configuration value for " + key + ": " + detail};
}

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& ex) {
    ThrowInvalid(key, ex.what());
  }
}

template <typename Duration>
void ReadDuration(const nlohmann::json& j, const char* key, Duration& out) {
  typename Duration::rep count = out.count();
  ReadKey(j, key, count);
  out = Duration(count);
}

void ReadPath(const nlohmann::json& j, const char* key, std::filesystem::path& out) {
  std::string text = PathToUtf8String(out);
  ReadKey(j, key, text);
  out = text;
}

const char* GetEnv(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

template <typename T>
T ParseEnvInteger(const char* name, std::string_view text) {
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    ThrowInvalid(name, "expected an integer, got '" + std::string(text) + "'");
  }
  return value;
}

}  // namespace

void to_json(nlohmann::json& j, const ServiceConfig& config) {
  j = nlohmann::json{{"upload_dir", PathToUtf8String(config.upload_dir)},
                     {"merged_dir", PathToUtf8String(config.merged_dir)},
                     {"log_dir", PathToUtf8String(config.log_dir)},
                     {"max_chunk_size", config.max_chunk_size},
                     {"max_file_size", config.max_file_size},
                     {"cleanup_interval", config.cleanup_interval.count()},
                     {"retry_max_attempts", config.retry_max_attempts},
                     {"retry_initial_delay", config.retry_initial_delay.count()},
                     {"retry_max_delay", config.retry_max_delay.count()},
                     {"retry_backoff_factor", config.retry_backoff_factor},
                     {"chunk_timeout", config.chunk_timeout.count()},
                     {"merge_timeout", config.merge_timeout.count()},
                     {"cleanup_workers", config.cleanup_workers},
                     {"task_retention_hours", config.task_retention.count()},
                     {"stale_lock_threshold", config.stale_lock_threshold.count()},
                     {"enable_integrity_check", config.enable_integrity_check},
                     {"enable_atomic_operations", config.enable_atomic_operations},
                     {"log_level", config.log_level}};
}

void from_json(const nlohmann::json& j, ServiceConfig& config) {
  if (!j.is_object()) {
    throw Error{ErrorDomain::Config, errors::config::kMalformed,
                std::string(errors::msg::kConfigMalformed) + ": top level must be an object"};
  }
  ReadPath(j, "upload_dir", config.upload_dir);
  ReadPath(j, "merged_dir", config.merged_dir);
  ReadPath(j, "log_dir", config.log_dir);
  ReadKey(j, "max_chunk_size", config.max_chunk_size);
  ReadKey(j, "max_file_size", config.max_file_size);
  ReadDuration(j, "cleanup_interval", config.cleanup_interval);
  ReadKey(j, "retry_max_attempts", config.retry_max_attempts);
  ReadDuration(j, "retry_initial_delay", config.retry_initial_delay);
  ReadDuration(j, "retry_max_delay", config.retry_max_delay);
  ReadKey(j, "retry_backoff_factor", config.retry_backoff_factor);
  ReadDuration(j, "chunk_timeout", config.chunk_timeout);
  ReadDuration(j, "merge_timeout", config.merge_timeout);
  ReadKey(j, "cleanup_workers", config.cleanup_workers);
  ReadDuration(j, "task_retention_hours", config.task_retention);
  ReadDuration(j, "stale_lock_threshold", config.stale_lock_threshold);
  ReadKey(j, "enable_integrity_check", config.enable_integrity_check);
  ReadKey(j, "enable_atomic_operations", config.enable_atomic_operations);
  ReadKey(j, "log_level", config.log_level);
}

ServiceConfig LoadConfig(const std::filesystem::path& path) {
  ServiceConfig config;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    const std::string text = nlohmann::json(config).dump(2);
    EnsureDirectory(path.parent_path());
    AtomicReplace(path, AsBytes(text));
    Event event;
    event.category = EventCategory::kLifecycle;
    event.severity = EventSeverity::kInfo;
    event.event_id = "config_defaults_written";
    event.message = "Configuration file created with defaults";
    event.fields.emplace_back("path", PathToUtf8String(path));
    EventBus::Instance().Publish(event);
  } else {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      const int err = errno;
      throw Error{ErrorDomain::IO, err, "Unable to open configuration file " + PathToUtf8String(path), err,
                  ClassifyNativeError(err)};
    }
    nlohmann::json doc;
    try {
      doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& ex) {
      throw Error{ErrorDomain::Config, errors::config::kMalformed,
                  std::string(errors::msg::kConfigMalformed) + ": " + ex.what()};
    }
    config = doc.get<ServiceConfig>();
  }
  ApplyEnvironmentOverrides(config);
  ValidateConfig(config);
  return config;
}

void ApplyEnvironmentOverrides(ServiceConfig& config) {
  if (const char* value = GetEnv("UV_UPLOAD_DIR")) {
    config.upload_dir = value;
  }
  if (const char* value = GetEnv("UV_MERGED_DIR")) {
    config.merged_dir = value;
  }
  if (const char* value = GetEnv("UV_LOG_DIR")) {
    config.log_dir = value;
  }
  if (const char* value = GetEnv("UV_MAX_CHUNK_SIZE")) {
    config.max_chunk_size = ParseEnvInteger<uint64_t>("UV_MAX_CHUNK_SIZE", value);
  }
  if (const char* value = GetEnv("UV_RETRY_MAX_ATTEMPTS")) {
    config.retry_max_attempts = ParseEnvInteger<int>("UV_RETRY_MAX_ATTEMPTS", value);
  }
  if (const char* value = GetEnv("UV_RETRY_INITIAL_DELAY_MS")) {
    config.retry_initial_delay =
        std::chrono::milliseconds(ParseEnvInteger<long long>("UV_RETRY_INITIAL_DELAY_MS", value));
  }
  if (const char* value = GetEnv("UV_LOG_LEVEL")) {
    config.log_level = value;
  }
}

void ValidateConfig(const ServiceConfig& config) {
  if (config.upload_dir.empty()) {
    ThrowInvalid("upload_dir", "must not be empty");
  }
  if (config.merged_dir.empty()) {
    ThrowInvalid("merged_dir", "must not be empty");
  }
  if (config.log_dir.empty()) {
    ThrowInvalid("log_dir", "must not be empty");
  }
  if (config.max_chunk_size == 0) {
    ThrowInvalid("max_chunk_size", "must be positive");
  }
  if (config.max_file_size == 0) {
    ThrowInvalid("max_file_size", "must be positive");
  }
  if (config.cleanup_interval.count() <= 0) {
    ThrowInvalid("cleanup_interval", "must be positive");
  }
  if (config.retry_max_attempts < 0) {
    ThrowInvalid("retry_max_attempts", "must not be negative");
  }
  if (config.retry_initial_delay.count() < 0 || config.retry_max_delay < config.retry_initial_delay) {
    ThrowInvalid("retry_max_delay", "must be at least retry_initial_delay");
  }
  if (!(config.retry_backoff_factor >= 1.0)) {
    ThrowInvalid("retry_backoff_factor", "must be >= 1");
  }
  if (config.chunk_timeout.count() <= 0 || config.merge_timeout.count() <= 0) {
    ThrowInvalid("timeout", "chunk_timeout and merge_timeout must be positive");
  }
  if (config.cleanup_workers == 0) {
    ThrowInvalid("cleanup_workers", "must be positive");
  }
  if (config.task_retention.count() <= 0) {
    ThrowInvalid("task_retention_hours", "must be positive");
  }
  if (config.stale_lock_threshold.count() < 0) {
    ThrowInvalid("stale_lock_threshold", "must not be negative");
  }
  if (!ParseSeverity(config.log_level)) {
    ThrowInvalid("log_level", "expected debug, info, warning or error");
  }
}

void EnsureDirectories(const ServiceConfig& config) {
  EnsureDirectory(config.upload_dir);
  EnsureDirectory(storage::PathLayout(config.upload_dir).MetadataDir());
  EnsureDirectory(config.merged_dir);
  EnsureDirectory(config.log_dir);
}

}  // namespace uv::orchestrator
