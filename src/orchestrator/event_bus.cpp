#include "ba/orchestrator/event_bus.h"

#include "ba/common.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace ba::orchestrator {
namespace {

// TSK110_Initialization_and_Cleanup_Order one lazily created bus, replaceable in tests
std::mutex& BusMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unique_ptr<EventBus>& BusSlot() {
  static std::unique_ptr<EventBus> bus;
  return bus;
}

// TSK104_Concurrency_Deadlock_and_Lock_Ordering a subscriber that publishes
// from inside its callback is dropped instead of recursing.
class PublishScope {
 public:
  PublishScope() : entered_(!active_) { active_ = true; }
  ~PublishScope() {
    if (entered_) {
      active_ = false;
    }
  }
  PublishScope(const PublishScope&) = delete;
  PublishScope& operator=(const PublishScope&) = delete;

  [[nodiscard]] bool entered() const noexcept { return entered_; }

 private:
  static thread_local bool active_;
  bool entered_;
};

thread_local bool PublishScope::active_ = false;

void AppendEscaped(std::string& out, std::string_view text) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (unsigned char c : text) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(static_cast<char>(c));
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else if (c < 0x20) {
      out += "\\u00";
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
}

void AppendMember(std::string& out, std::string_view key, std::string_view value, bool quoted) {
  out += out.size() == 1 ? "\"" : ",\"";
  AppendEscaped(out, key);
  out += "\":";
  if (!quoted) {
    out.append(value);
    return;
  }
  out.push_back('"');
  AppendEscaped(out, value);
  out.push_back('"');
}

void ReportLoggerProblem(const char* what, int error_code) {
  std::clog << "{\"event\":\"logger_error\",\"message\":\"" << what << "\",\"error_code\":"
            << error_code << "}" << std::endl;
}

} // namespace

std::string Event::Field(const std::string& key) const {
  for (const auto& field : fields) {
    if (field.key == key) {
      return field.value;
    }
  }
  return {};
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
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kCatalog:
    return "catalog";
  case EventCategory::kVerification:
    return "verification";
  case EventCategory::kRepair:
    return "repair";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::string BuildEventJson(const Event& event, const std::string& timestamp) {
  std::string json = "{";
  json.reserve(256);
  AppendMember(json, "ts", timestamp, true);
  AppendMember(json, "severity", SeverityToString(event.severity), true);
  AppendMember(json, "category", CategoryToString(event.category), true);
  if (!event.event_id.empty()) {
    AppendMember(json, "event_id", event.event_id, true);
  }
  if (!event.message.empty()) {
    AppendMember(json, "message", event.message, true);
  }
  for (const auto& field : event.fields) {
    AppendMember(json, field.key, field.value, !field.numeric);
  }
  json.push_back('}');
  return json;
}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path, size_t max_bytes)
    : log_path_(std::move(log_path)), max_bytes_(max_bytes) {}

// ISO-8601 UTC with microseconds, e.g. 2024-03-05T11:00:00.000042Z.
std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  const auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch());
  const std::time_t seconds = static_cast<std::time_t>(since_epoch.count() / 1000000);
  const long micros = static_cast<long>(since_epoch.count() % 1000000);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char date[32] = {0};
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
  char stamp[48] = {0};
  std::snprintf(stamp, sizeof(stamp), "%s.%06ldZ", date, micros);
  return stamp;
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  const auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      ReportLoggerProblem("log directory create failed", ec.value());
      failed_ = true;
      return;
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

// Shifts log -> log.1 -> log.2 ... dropping the oldest once the current file
// cannot take `incoming_bytes` more.
void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  const auto current = std::filesystem::file_size(log_path_, ec);
  if (ec || current + incoming_bytes <= max_bytes_) {
    return;
  }
  stream_.close();
  const auto rotated = [this](size_t n) {
    return n == 0 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(n));
  };
  std::filesystem::remove(rotated(max_files_), ec);
  for (size_t n = max_files_; n > 0; --n) {
    std::error_code step;
    if (!std::filesystem::exists(rotated(n - 1), step)) {
      continue;
    }
    std::filesystem::rename(rotated(n - 1), rotated(n), step);
    if (step) {
      ReportLoggerProblem("log rotate rename failed", step.value());
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (failed_) {
    return;
  }
  const std::string line = BuildEventJson(event, FormatTimestamp(std::chrono::system_clock::now()));
  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    if (!failed_) {
      ReportLoggerProblem("failed to open log file", 0);
      failed_ = true;
    }
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
}

EventBus::EventBus() : subscribers_snapshot_(std::make_shared<const SubscriberList>()) {}

EventBus::~EventBus() = default;

EventBus& EventBus::Instance() {
  std::lock_guard<std::mutex> guard(BusMutex());
  auto& bus = BusSlot();
  if (!bus) {
    bus = std::make_unique<EventBus>();
  }
  return *bus;
}

void EventBus::Publish(const Event& event) {
  PublishScope scope;
  if (!scope.entered()) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  std::shared_ptr<const SubscriberList> targets;
  {
    std::lock_guard<std::mutex> guard(subscribers_mutex_);
    targets = subscribers_snapshot_;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

// Copy-on-write: publishers keep iterating the list they already hold.
void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto updated = std::make_shared<SubscriberList>(*subscribers_snapshot_);
  updated->push_back(std::move(fn));
  subscribers_snapshot_ = std::move(updated);
}

void ResetEventBusForTesting() {
  std::lock_guard<std::mutex> guard(BusMutex());
  BusSlot().reset();
}

} // namespace ba::orchestrator
