#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uv::orchestrator {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  const char* SeverityToString(EventSeverity severity);
  // Accepts debug|info|warning|warn|error|critical, case-insensitive.
  std::optional<EventSeverity> ParseSeverity(std::string_view text);

  std::string HashForTelemetry(std::string_view input);

  class JsonLineLogger {
  public:
    JsonLineLogger();
    void Log(const Event& event);

    // Redirects output to <dir>/uploadvault.log. Takes effect on the next event.
    void Configure(const std::filesystem::path& dir, EventSeverity min_severity);
    [[nodiscard]] std::filesystem::path log_path() const;

  private:
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);
    size_t ResolveMaxBytes() const;

    mutable std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
    EventSeverity min_severity_{EventSeverity::kInfo};
    uint64_t dropped_streak_{0};
  };

  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus();
    ~EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  void ResetEventBusForTesting(); // test-only teardown

} // namespace uv::orchestrator
