#include "fdup/error.h"
#include "fdup/platform/status_led.h"

#include <sys/stat.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

class RecordingIndicator final : public fdup::platform::StatusIndicator {
 public:
  void Setup() override {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.push_back(false);
  }

  void Set(bool on) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_after_ >= 0 && static_cast<int>(states_.size()) >= fail_after_) {
      throw fdup::Error{fdup::ErrorDomain::IO, fdup::errors::io::kIndicatorFailed, "led gone"};
    }
    states_.push_back(on);
  }

  std::vector<bool> states() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_;
  }

  void FailAfter(int writes) { fail_after_ = writes; }

 private:
  mutable std::mutex mutex_;
  std::vector<bool> states_;
  int fail_after_{-1};
};

void TestBlinkAlternatesAndEndsSolidOnSuccess() {
  RecordingIndicator led;
  fdup::platform::BlinkTask blink(led, std::chrono::milliseconds(5));
  blink.Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  assert(blink.running());
  blink.Stop(true);
  assert(!blink.running());
  const auto states = led.states();
  assert(states.size() >= 3);
  assert(states[0] == true);
  assert(states[1] == false);
  assert(states.back() == true);
  assert(blink.toggles() + 1 == states.size());
  assert(!blink.thread_error().has_value());
}

void TestBlinkEndsOffOnFailureAndOnDestruction() {
  RecordingIndicator led;
  {
    fdup::platform::BlinkTask blink(led, std::chrono::milliseconds(5));
    blink.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    blink.Stop(false);
    blink.Stop(true);  // already stopped; no further writes
  }
  assert(led.states().back() == false);

  RecordingIndicator abandoned;
  {
    fdup::platform::BlinkTask blink(abandoned, std::chrono::milliseconds(5));
    blink.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(12));
  }
  assert(abandoned.states().back() == false);
}

void TestStopIsPrompt() {
  RecordingIndicator led;
  fdup::platform::BlinkTask blink(led, std::chrono::milliseconds(10000));
  blink.Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  const auto started = std::chrono::steady_clock::now();
  blink.Stop(true);
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

void TestBlinkThreadErrorIsRecorded() {
  RecordingIndicator led;
  led.FailAfter(2);
  fdup::platform::BlinkTask blink(led, std::chrono::milliseconds(2));
  blink.Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  assert(blink.thread_error().has_value());
  bool threw = false;
  try {
    blink.Stop(true);
  } catch (const fdup::Error& err) {
    threw = err.code == fdup::errors::io::kIndicatorFailed;
  }
  assert(threw);
}

void TestOffGuard() {
  RecordingIndicator led;
  {
    fdup::platform::IndicatorOffGuard guard(&led);
    led.Set(true);
  }
  assert(led.states().size() == 2);
  assert(led.states().back() == false);
  {
    fdup::platform::IndicatorOffGuard noop(nullptr);
  }
}

void TestGpioCommandLine() {
  const auto dir = std::filesystem::temp_directory_path() / "fdup_gpio_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const auto script = dir / "gpio";
  {
    std::ofstream out(script, std::ios::trunc);
    out << "#!/bin/sh\necho \"$*\" >> '" << (dir / "calls").string() << "'\n";
  }
  ::chmod(script.c_str(), 0755);

  fdup::platform::GpioStatusLed led(script.string(), 18);
  led.Setup();
  led.Set(true);
  std::ifstream in(dir / "calls");
  const std::string calls((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(calls == "-g mode 18 out\n-g write 18 0\n-g write 18 1\n");

  fdup::platform::GpioStatusLed broken((dir / "missing").string(), 18);
  bool threw = false;
  try {
    broken.Set(false);
  } catch (const fdup::Error& err) {
    threw = err.domain == fdup::ErrorDomain::IO;
  }
  assert(threw);
  std::filesystem::remove_all(dir);
}

}  // namespace

int main() {
  TestBlinkAlternatesAndEndsSolidOnSuccess();
  TestBlinkEndsOffOnFailureAndOnDestruction();
  TestStopIsPrompt();
  TestBlinkThreadErrorIsRecorded();
  TestOffGuard();
  TestGpioCommandLine();
  std::cout << "status led tests ok\n";
  return 0;
}
