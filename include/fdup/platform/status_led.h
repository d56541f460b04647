#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace fdup::platform {

// A single on/off operator indicator.
class StatusIndicator {
 public:
  virtual ~StatusIndicator() = default;
  // Configures the output and switches it off.
  virtual void Setup() = 0;
  virtual void Set(bool on) = 0;
};

// LED on a BCM pin driven through the wiringpi `gpio` utility.
class GpioStatusLed final : public StatusIndicator {
 public:
  GpioStatusLed(std::string gpio_tool, int bcm_pin);

  void Setup() override;
  void Set(bool on) override;

 private:
  void Run(const std::string& verb, const std::string& value);

  std::string gpio_tool_;
  int bcm_pin_;
};

// Toggles an indicator on a background thread until stopped. The final
// indicator state is written by Stop(): solid on for success, off otherwise.
// A task that is destroyed without Stop() leaves the indicator off.
class BlinkTask {
 public:
  BlinkTask(StatusIndicator& indicator, std::chrono::milliseconds half_period);
  ~BlinkTask();

  BlinkTask(const BlinkTask&) = delete;
  BlinkTask& operator=(const BlinkTask&) = delete;

  void Start();
  // Idempotent. Throws fdup::Error when the final state cannot be written.
  void Stop(bool success);

  bool running() const noexcept { return running_.load(); }
  std::size_t toggles() const noexcept { return toggles_.load(); }
  // First error raised by the blink thread, if any. The thread stops toggling
  // after an error.
  std::optional<std::string> thread_error() const;

 private:
  void Loop();

  StatusIndicator& indicator_;
  std::chrono::milliseconds half_period_;
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> toggles_{0};
  std::optional<std::string> thread_error_;
};

// Switches the indicator off when the run ends, on every exit path.
class IndicatorOffGuard {
 public:
  explicit IndicatorOffGuard(StatusIndicator* indicator) : indicator_(indicator) {}
  ~IndicatorOffGuard();

  IndicatorOffGuard(const IndicatorOffGuard&) = delete;
  IndicatorOffGuard& operator=(const IndicatorOffGuard&) = delete;

 private:
  StatusIndicator* indicator_;
};

}  // namespace fdup::platform
