#include "cr/orchestrator/event_bus.h"

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "cr/common.h"
#include "cr/crypto/digest.h"

namespace cr::orchestrator {
namespace {

constexpr size_t kMaxEventBytes = 16 * 1024;

struct EventBusSingletonStorage {
  std::mutex mutex;
  std::unique_ptr<EventBus> instance;
};

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {  // suppresses recursive publish from subscribers
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

std::string HashTag(const std::string& value) {
  auto hashed = HashForTelemetry(value);
  if (hashed.size() > 16) {
    hashed.resize(16);
  }
  return "sha256:" + hashed;
}

} // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  auto digest = cr::crypto::SHA256_Hash(AsByteSpan(input));
  return HexEncode(ByteSpan(digest.data(), digest.size()));
}

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

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kIntegrity:
    return "integrity";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::optional<EventSeverity> ParseSeverity(std::string_view text) {
  for (auto severity : {EventSeverity::kDebug, EventSeverity::kInfo, EventSeverity::kWarning,
                        EventSeverity::kError, EventSeverity::kCritical}) {
    if (text == SeverityToString(severity)) {
      return severity;
    }
  }
  return std::nullopt;
}

std::string FormatEventJson(const Event& event, const std::string& timestamp) {
  std::string payload;
  payload.reserve(256);
  payload.append("{\"ts\":\"").append(EscapeJson(timestamp)).append("\"");
  payload.append(",\"severity\":\"").append(SeverityToString(event.severity)).append("\"");
  payload.append(",\"category\":\"").append(CategoryToString(event.category)).append("\"");
  if (!event.event_id.empty()) {
    payload.append(",\"event_id\":\"").append(EscapeJson(event.event_id)).append("\"");
  }
  if (!event.message.empty()) {
    payload.append(",\"message\":\"").append(EscapeJson(event.message)).append("\"");
  }
  for (const auto& field : event.fields) {
    payload.append(",\"").append(EscapeJson(field.key)).append("\":");
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      sanitized = HashTag(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload.append(sanitized);
    } else {
      payload.append("\"").append(EscapeJson(sanitized)).append("\"");
    }
  }
  payload.push_back('}');
  return payload;
}

JsonLineLogger::JsonLineLogger() : threshold_(ResolveThreshold()) {
  if (const char* path = std::getenv("CR_LOG_PATH"); path && *path != '\0') {
    log_path_ = path;
  }
}

EventSeverity JsonLineLogger::ResolveThreshold() {
  const char* env = std::getenv("CR_LOG_LEVEL");
  if (!env || *env == '\0') {
    return EventSeverity::kInfo;
  }
  return ParseSeverity(env).value_or(EventSeverity::kInfo);
}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

void JsonLineLogger::EnsureOpen() {
  if (log_path_.empty() || stream_.is_open() || open_failed_) {
    return;
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
  if (!stream_.is_open()) {
    open_failed_ = true;
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}"
              << std::endl;
  }
}

void JsonLineLogger::Log(const Event& event) {
  if (event.severity < threshold_) {
    return;
  }
  std::lock_guard<std::mutex> guard(mutex_);
  auto line = FormatEventJson(event, FormatTimestamp(std::chrono::system_clock::now()));
  if (line.size() > kMaxEventBytes) {
    Event replacement{event.category, event.severity, event.event_id, "event truncated", {}};
    replacement.fields.emplace_back("original_bytes", std::to_string(line.size()),
                                    FieldPrivacy::kPublic, true);
    line = FormatEventJson(replacement, FormatTimestamp(std::chrono::system_clock::now()));
  }
  EnsureOpen();
  if (stream_.is_open()) {
    stream_ << line << '\n';
    stream_.flush();
    return;
  }
  std::clog << line << std::endl;
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_,
                             std::const_pointer_cast<const SubscriberList>(initial),
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(storage.mutex);
  if (!storage.instance) {
    storage.instance.reset(new EventBus());
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
  auto updated = current ? std::make_shared<SubscriberList>(*current)
                         : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_,
                             std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(storage.mutex);
  storage.instance.reset();
}

} // namespace cr::orchestrator
