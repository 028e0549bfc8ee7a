#include "uv/orchestrator/config.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "test_support.h"
#include "uv/error.h"

namespace {

  using uv::orchestrator::LoadConfig;
  using uv::orchestrator::ServiceConfig;
  using uv::testing::Check;
  using uv::testing::ReadText;
  using uv::testing::TempDir;
  using uv::testing::WriteText;

  class ScopedEnv {
  public:
    ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(name_); }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

  private:
    const char* name_;
  };

  template <typename Fn>
  bool ThrowsConfig(Fn&& fn) {
    try {
      fn();
    } catch (const uv::Error& err) {
      return err.domain == uv::ErrorDomain::Config;
    }
    return false;
  }

  void TestMissingFileWritesDefaults() {
    TempDir dir("uv_config_defaults");
    auto path = dir.path() / "etc" / "config.json";
    auto config = LoadConfig(path);

    Check(std::filesystem::exists(path), "Defaults must be written to disk");
    Check(config.max_chunk_size == 100ull * 1024 * 1024, "Default chunk limit is 100 MiB");
    Check(config.retry_max_attempts == 3, "Default retry count");
    Check(config.task_retention == std::chrono::hours(168), "Default retention is seven days");
    Check(config.enable_integrity_check && config.enable_atomic_operations, "Safety features default on");

    auto written = nlohmann::json::parse(ReadText(path));
    Check(written.at("upload_dir") == "./upload", "Written file carries the upload root");
    Check(written.at("cleanup_workers") == 2, "Written file carries the worker count");
  }

  void TestFileValuesAndPartialFiles() {
    TempDir dir("uv_config_values");
    auto path = dir.path() / "config.json";
    WriteText(path, R"({"upload_dir":"/data/up","max_chunk_size":1024,"retry_initial_delay":10,)"
                    R"("enable_atomic_operations":false,"unknown_key":true})");
    auto config = LoadConfig(path);
    Check(config.upload_dir == "/data/up", "Upload root read from file");
    Check(config.max_chunk_size == 1024, "Chunk limit read from file");
    Check(config.retry_initial_delay == std::chrono::milliseconds(10), "Delay read as milliseconds");
    Check(!config.enable_atomic_operations, "Boolean read from file");
    Check(config.merged_dir == "./merged", "Missing keys keep defaults");
  }

  void TestEnvironmentOverrides() {
    TempDir dir("uv_config_env");
    auto path = dir.path() / "config.json";
    WriteText(path, R"({"upload_dir":"/from/file","retry_max_attempts":5})");

    ScopedEnv upload("UV_UPLOAD_DIR", "/from/env");
    ScopedEnv retries("UV_RETRY_MAX_ATTEMPTS", "7");
    ScopedEnv level("UV_LOG_LEVEL", "debug");
    auto config = LoadConfig(path);
    Check(config.upload_dir == "/from/env", "Environment wins over the file");
    Check(config.retry_max_attempts == 7, "Integer override");
    Check(config.log_level == "debug", "Log level override");
    Check(config.retry_policy().max_retries == 7, "Retry policy follows the config");

    ScopedEnv bad("UV_MAX_CHUNK_SIZE", "12abc");
    Check(ThrowsConfig([&] { (void)LoadConfig(path); }), "Malformed integer override is rejected");
  }

  void TestInvalidFiles() {
    TempDir dir("uv_config_invalid");
    auto malformed = dir.path() / "malformed.json";
    WriteText(malformed, "{ upload_dir: ");
    Check(ThrowsConfig([&] { (void)LoadConfig(malformed); }), "Malformed JSON");

    auto wrong_type = dir.path() / "wrong_type.json";
    WriteText(wrong_type, R"({"max_chunk_size":"big"})");
    Check(ThrowsConfig([&] { (void)LoadConfig(wrong_type); }), "Wrong value type");

    auto not_object = dir.path() / "array.json";
    WriteText(not_object, "[1, 2]");
    Check(ThrowsConfig([&] { (void)LoadConfig(not_object); }), "Top level must be an object");

    auto invalid = dir.path() / "invalid.json";
    WriteText(invalid, R"({"retry_backoff_factor":0.5})");
    Check(ThrowsConfig([&] { (void)LoadConfig(invalid); }), "Backoff factor below one");

    auto bad_level = dir.path() / "bad_level.json";
    WriteText(bad_level, R"({"log_level":"loud"})");
    Check(ThrowsConfig([&] { (void)LoadConfig(bad_level); }), "Unknown log level");
  }

} // namespace

int main() {
  TestMissingFileWritesDefaults();
  TestFileValuesAndPartialFiles();
  TestEnvironmentOverrides();
  TestInvalidFiles();
  std::cout << "config tests ok\n";
  return 0;
}
