#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

#include "fdup/pipeline/stream.h"

namespace fdup::pipeline {

// Pass-through stage that counts bytes and prints a status line
// (bytes, elapsed, rate, percent) to |out| at most once per |interval| and
// once more when the stream finishes. An empty |clock| means steady_clock.
class ProgressMeter final : public ByteSink {
 public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  ProgressMeter(ByteSink& next, uint64_t expected_total, std::ostream& out,
                Clock clock = {},
                std::chrono::milliseconds interval = std::chrono::seconds(1));

  void Write(std::span<const uint8_t> data) override;
  void Finish() override;

  [[nodiscard]] uint64_t bytes() const noexcept { return bytes_; }
  [[nodiscard]] size_t reports() const noexcept { return reports_; }

 private:
  void Report(std::chrono::steady_clock::time_point now, bool final);

  ByteSink& next_;
  uint64_t expected_total_;
  std::ostream& out_;
  Clock clock_;
  std::chrono::milliseconds interval_;
  std::chrono::steady_clock::time_point started_;
  std::chrono::steady_clock::time_point last_report_;
  uint64_t bytes_{0};
  size_t reports_{0};
  bool finished_{false};
};

// "1.50 GiB 00:01:05 [23.63 MiB/s] 42%". The percent is omitted when
// |expected_total| is 0.
std::string FormatProgressLine(uint64_t bytes, std::chrono::milliseconds elapsed,
                               uint64_t expected_total);

}  // namespace fdup::pipeline
