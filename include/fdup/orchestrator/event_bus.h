#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fdup::orchestrator {

  enum class EventSeverity { kDebug, kInfo, kWarning, kError };

  struct Event {
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
  };

  // Synchronous in-process fan-out of run events.
  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;
    using SubscriptionId = std::uint64_t;

    static EventBus& Instance();

    void Publish(const Event& event);
    SubscriptionId Subscribe(Subscriber fn);
    void Unsubscribe(SubscriptionId id);

  private:
    EventBus() = default;
    friend struct EventBusSingletonStorage;

    struct Entry {
      SubscriptionId id;
      Subscriber fn;
    };
    using SubscriberList = std::vector<Entry>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
    SubscriptionId next_id_{1};
  };

  void ResetEventBusForTesting();

  void PublishLog(EventSeverity severity, std::string_view event_id, std::string message);
  inline void LogInfo(std::string_view event_id, std::string message) {
    PublishLog(EventSeverity::kInfo, event_id, std::move(message));
  }
  inline void LogWarning(std::string_view event_id, std::string message) {
    PublishLog(EventSeverity::kWarning, event_id, std::move(message));
  }
  inline void LogError(std::string_view event_id, std::string message) {
    PublishLog(EventSeverity::kError, event_id, std::move(message));
  }

  // "[YYYY-MM-DD HH:MM:SS] Warning: message" in local time. Debug events carry
  // no prefix, like info.
  std::string FormatLogLine(const Event& event, std::chrono::system_clock::time_point when);

  // Writes every bus event to |console| and appends it to the run log file.
  // When the file cannot be opened the logger keeps writing to the console and
  // reports the problem once on stderr.
  class RunLogger {
  public:
    explicit RunLogger(std::optional<std::filesystem::path> log_path,
                       std::ostream& console = std::cout);
    ~RunLogger();

    RunLogger(const RunLogger&) = delete;
    RunLogger& operator=(const RunLogger&) = delete;

    void Attach(EventBus& bus);
    void Detach();
    void Log(const Event& event);

    bool file_ok() const { return stream_.is_open(); }

  private:
    std::mutex mutex_;
    std::ostream& console_;
    std::ofstream stream_;
    EventBus* bus_{nullptr};
    EventBus::SubscriptionId subscription_{0};
  };

} // namespace fdup::orchestrator
