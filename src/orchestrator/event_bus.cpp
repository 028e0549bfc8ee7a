#include "uv/orchestrator/event_bus.h"

#include "uv/common.h"
#include "uv/crypto/md5.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <system_error>

namespace uv::orchestrator {
namespace {

struct EventBusSingletonStorage { // manage singleton lifetime
  std::once_flag once;
  std::unique_ptr<EventBus> instance;

  void Reset() { // allow deterministic teardown
    instance.reset();
    this->~EventBusSingletonStorage();
    new (this) EventBusSingletonStorage();
  }
};

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

constexpr size_t kMaxEventBytes = 16 * 1024;
constexpr size_t kDefaultMaxLogBytes = 10 * 1024 * 1024;
constexpr const char* kLogFileName = "uploadvault.log";

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::string BuildEventJson(const Event& event, const std::string& timestamp) {
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"";
  payload += EscapeJson(timestamp);
  payload += "\",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"";
    payload += EscapeJson(event.event_id);
    payload += "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"";
    payload += EscapeJson(event.message);
    payload += "\"";
  }
  for (const auto& field : event.fields) {
    payload += ",\"";
    payload += EscapeJson(field.key);
    payload += "\":";
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      sanitized = HashForTelemetry(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload += sanitized;
    } else {
      payload += "\"";
      payload += EscapeJson(sanitized);
      payload += "\"";
    }
  }
  payload += "}";
  return payload;
}

Event BuildOversizeEvent(const Event& original) {
  Event replacement;
  replacement.category = original.category;
  replacement.severity = original.severity;
  replacement.event_id = original.event_id.empty() ? "event_truncated" : original.event_id;
  replacement.message = "event payload exceeded size limit";
  replacement.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes), FieldPrivacy::kPublic, true);
  return replacement;
}

}  // namespace

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

std::optional<EventSeverity> ParseSeverity(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") {
    return EventSeverity::kDebug;
  }
  if (lowered == "info") {
    return EventSeverity::kInfo;
  }
  if (lowered == "warning" || lowered == "warn") {
    return EventSeverity::kWarning;
  }
  if (lowered == "error") {
    return EventSeverity::kError;
  }
  if (lowered == "critical") {
    return EventSeverity::kCritical;
  }
  return std::nullopt;
}

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  return uv::crypto::Md5Hex(input).substr(0, 16);
}

JsonLineLogger::JsonLineLogger()
    : log_path_(std::filesystem::path("logs") / kLogFileName), max_bytes_(ResolveMaxBytes()) {}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

void JsonLineLogger::Configure(const std::filesystem::path& dir, EventSeverity min_severity) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (stream_.is_open()) {
    stream_.close();
  }
  log_path_ = dir / kLogFileName;
  min_severity_ = min_severity;
  dropped_streak_ = 0;
}

std::filesystem::path JsonLineLogger::log_path() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return log_path_;
}

size_t JsonLineLogger::ResolveMaxBytes() const {
  const char* env = std::getenv("UV_LOG_MAX_SIZE");
  if (!env || *env == '\0') {
    return kDefaultMaxLogBytes;
  }
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(env, env + std::strlen(env), value);
  if (ec != std::errc() || ptr != env + std::strlen(env) || value == 0) {
    return kDefaultMaxLogBytes;
  }
  return static_cast<size_t>(std::min<unsigned long long>(value, std::numeric_limits<size_t>::max()));
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  std::error_code ec;
  auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    const bool parent_exists = std::filesystem::exists(parent, ec);
    if (ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log directory stat failed\",\"error_code\":"
                << ec.value() << "}" << std::endl;
      return;
    }
    if (!parent_exists) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        std::clog << "{\"event\":\"logger_error\",\"message\":\"log directory create failed\",\"error_code\":"
                  << ec.value() << "}" << std::endl;
        return;
      }
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    // Missing file is the normal state before the first write.
    current_size = 0;
    ec.clear();
  }
  if (current_size + incoming_bytes <= max_bytes_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (size_t idx = max_files_; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst =
        std::filesystem::path(log_path_.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    const bool source_exists = std::filesystem::exists(src, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotation stat failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
      continue;
    }
    if (!source_exists) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotation cleanup failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
      rotate_ec.clear();
    }
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotate rename failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (event.severity < min_severity_) {
    return;
  }
  auto timestamp = uv::FormatTimestamp(std::chrono::system_clock::now());
  auto line = BuildEventJson(event, timestamp);
  if (line.size() > kMaxEventBytes) {
    line = BuildEventJson(BuildOversizeEvent(event), timestamp);
  }

  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    ++dropped_streak_;
    if (dropped_streak_ == 1) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}"
                << std::endl;
    }
    std::clog << line << std::endl;
    return;
  }

  stream_ << line << '\n';
  stream_.flush();
  dropped_streak_ = 0;
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(initial),
                             std::memory_order_release);
}

EventBus::~EventBus() {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>{},
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  {
    std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
    std::call_once(storage.once, [&storage]() {
      storage.instance = std::make_unique<EventBus>();
    });
  }
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  storage.Reset();
}

} // namespace uv::orchestrator
