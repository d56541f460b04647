#include "fdup/platform/status_led.h"

#include <iostream>
#include <utility>
#include <vector>

#include "fdup/error.h"
#include "fdup/platform/subprocess.h"

namespace fdup::platform {

GpioStatusLed::GpioStatusLed(std::string gpio_tool, int bcm_pin)
    : gpio_tool_(std::move(gpio_tool)), bcm_pin_(bcm_pin) {}

void GpioStatusLed::Setup() {
  Run("mode", "out");
  Set(false);
}

void GpioStatusLed::Set(bool on) {
  Run("write", on ? "1" : "0");
}

void GpioStatusLed::Run(const std::string& verb, const std::string& value) {
  const std::vector<std::string> argv{gpio_tool_, "-g", verb, std::to_string(bcm_pin_), value};
  const int status = RunCommand(argv);
  if (status != 0) {
    throw Error{ErrorDomain::IO, errors::io::kIndicatorFailed,
                gpio_tool_ + " -g " + verb + " " + std::to_string(bcm_pin_) + " " + value +
                    " exited with status " + std::to_string(status)};
  }
}

BlinkTask::BlinkTask(StatusIndicator& indicator, std::chrono::milliseconds half_period)
    : indicator_(indicator), half_period_(half_period) {}

BlinkTask::~BlinkTask() {
  try {
    Stop(false);
  } catch (const Error& err) {
    std::cerr << "status indicator: " << err.what() << std::endl;
  }
}

void BlinkTask::Start() {
  if (worker_.joinable()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
  }
  running_ = true;
  worker_ = std::thread([this]() { Loop(); });
}

void BlinkTask::Stop(bool success) {
  if (!worker_.joinable()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  worker_.join();
  running_ = false;
  indicator_.Set(success);
}

std::optional<std::string> BlinkTask::thread_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return thread_error_;
}

void BlinkTask::Loop() {
  bool on = true;
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    lock.unlock();
    try {
      indicator_.Set(on);
    } catch (const Error& err) {
      lock.lock();
      thread_error_ = err.what();
      break;
    }
    toggles_.fetch_add(1);
    on = !on;
    lock.lock();
    cv_.wait_for(lock, half_period_, [this]() { return stop_requested_; });
  }
  running_ = false;
}

IndicatorOffGuard::~IndicatorOffGuard() {
  if (!indicator_) {
    return;
  }
  try {
    indicator_->Set(false);
  } catch (const Error& err) {
    std::cerr << "status indicator: " << err.what() << std::endl;
  }
}

}  // namespace fdup::platform
