#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cr::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kIntegrity, kDiagnostics };

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

  std::string HashForTelemetry(std::string_view input);
  std::string EscapeJson(std::string_view text);
  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);
  std::optional<EventSeverity> ParseSeverity(std::string_view text);

  // Renders an event as a single JSON object without a trailing newline.
  std::string FormatEventJson(const Event& event, const std::string& timestamp);

  // Writes one JSON object per line to the file named by CR_LOG_PATH, or to
  // std::clog when unset. Events below CR_LOG_LEVEL (default info) are dropped.
  class JsonLineLogger {
  public:
    JsonLineLogger();
    void Log(const Event& event);

    [[nodiscard]] EventSeverity threshold() const noexcept { return threshold_; }

  private:
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    static EventSeverity ResolveThreshold();
    void EnsureOpen();

    std::mutex mutex_;
    std::ofstream stream_;
    std::string log_path_;
    EventSeverity threshold_{EventSeverity::kInfo};
    bool open_failed_{false};
  };

  inline JsonLineLogger& DefaultJsonLogger() {
    static JsonLineLogger logger;
    return logger;
  }

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    // Delivers synchronously to every subscriber on the calling thread.
    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

  private:
    EventBus();

    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  // Drops all subscribers and reinstalls the default logger on next use.
  void ResetEventBusForTesting();

} // namespace cr::orchestrator
