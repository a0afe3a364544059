#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace ba::orchestrator {

  // TSK019 structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kLifecycle, kCatalog, kVerification, kRepair, kDiagnostics };

  struct EventField {
    std::string key;
    std::string value;
    bool numeric{false};

    EventField(std::string k, std::string v, bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;

    // Returns the value of the first field named `key`, or an empty string.
    [[nodiscard]] std::string Field(const std::string& key) const;
  };

  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);

  // Appends one JSON object per event to a log file, rotating to `.1`..`.N`
  // once the file would exceed `max_bytes`.
  class JsonLineLogger {
  public:
    JsonLineLogger(std::filesystem::path log_path, size_t max_bytes);
    void Log(const Event& event);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return log_path_; }

  private:
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
    bool failed_{false};
  };

  std::string BuildEventJson(const Event& event, const std::string& timestamp);

  class EventBus { // TSK019
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

  void ResetEventBusForTesting(); // TSK110_Initialization_and_Cleanup_Order test-only teardown

} // namespace ba::orchestrator
