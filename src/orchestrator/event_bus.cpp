#include "fdup/orchestrator/event_bus.h"

#include <ctime>
#include <new>
#include <utility>

namespace fdup::orchestrator {

struct EventBusSingletonStorage {
  std::once_flag once;
  std::unique_ptr<EventBus> instance;

  void Reset() {
    instance.reset();
    this->~EventBusSingletonStorage();
    new (this) EventBusSingletonStorage();
  }

  void Create() { instance.reset(new EventBus()); }
};

namespace {

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

std::string_view SeverityPrefix(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kWarning:
    return "Warning: ";
  case EventSeverity::kError:
    return "Error: ";
  case EventSeverity::kDebug:
  case EventSeverity::kInfo:
    break;
  }
  return {};
}

} // namespace

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  {
    std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
    std::call_once(storage.once, [&storage]() { storage.Create(); });
  }
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "event bus: recursive publish suppressed: " << event.event_id << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& entry : *targets) {
    if (entry.fn) {
      entry.fn(event);
    }
  }
}

EventBus::SubscriptionId EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current)
                         : std::make_shared<SubscriberList>();
  const SubscriptionId id = next_id_++;
  updated->push_back(Entry{id, std::move(fn)});
  std::atomic_store_explicit(&subscribers_snapshot_,
                             std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
  return id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!current) {
    return;
  }
  auto updated = std::make_shared<SubscriberList>();
  for (const auto& entry : *current) {
    if (entry.id != id) {
      updated->push_back(entry);
    }
  }
  std::atomic_store_explicit(&subscribers_snapshot_,
                             std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  storage.Reset();
}

void PublishLog(EventSeverity severity, std::string_view event_id, std::string message) {
  Event event;
  event.severity = severity;
  event.event_id = std::string(event_id);
  event.message = std::move(message);
  EventBus::Instance().Publish(event);
}

std::string FormatLogLine(const Event& event, std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  char stamp[32] = "0000-00-00 00:00:00";
  if (::localtime_r(&seconds, &local) != nullptr) {
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
  }
  std::string line;
  line.reserve(event.message.size() + 32);
  line += '[';
  line += stamp;
  line += "] ";
  line += SeverityPrefix(event.severity);
  line += event.message;
  return line;
}

RunLogger::RunLogger(std::optional<std::filesystem::path> log_path, std::ostream& console)
    : console_(console) {
  if (!log_path) {
    return;
  }
  stream_.open(*log_path, std::ios::out | std::ios::app);
  if (!stream_.is_open()) {
    std::cerr << "fdup: cannot open log file " << log_path->string()
              << "; logging to stdout only" << std::endl;
  }
}

RunLogger::~RunLogger() {
  Detach();
}

void RunLogger::Attach(EventBus& bus) {
  Detach();
  bus_ = &bus;
  subscription_ = bus.Subscribe([this](const Event& event) { Log(event); });
}

void RunLogger::Detach() {
  if (bus_) {
    bus_->Unsubscribe(subscription_);
    bus_ = nullptr;
    subscription_ = 0;
  }
}

void RunLogger::Log(const Event& event) {
  const auto line = FormatLogLine(event, std::chrono::system_clock::now());
  std::lock_guard<std::mutex> guard(mutex_);
  console_ << line << std::endl;
  if (stream_.is_open()) {
    stream_ << line << std::endl;
  }
}

} // namespace fdup::orchestrator
