#include "fdup/pipeline/progress_meter.h"

#include <cstdio>
#include <utility>

#include "fdup/common.h"
#include "fdup/error.h"

namespace fdup::pipeline {

std::string FormatProgressLine(uint64_t bytes, std::chrono::milliseconds elapsed,
                               uint64_t expected_total) {
  const auto total_seconds = static_cast<uint64_t>(elapsed.count() / 1000);
  char clock[32];
  std::snprintf(clock, sizeof(clock), "%02llu:%02llu:%02llu",
                static_cast<unsigned long long>(total_seconds / 3600),
                static_cast<unsigned long long>((total_seconds / 60) % 60),
                static_cast<unsigned long long>(total_seconds % 60));

  uint64_t rate = 0;
  if (elapsed.count() > 0) {
    rate = static_cast<uint64_t>(static_cast<double>(bytes) * 1000.0 /
                                 static_cast<double>(elapsed.count()));
  }

  std::string line = FormatByteCount(bytes);
  line += ' ';
  line += clock;
  line += " [";
  line += FormatByteCount(rate);
  line += "/s]";
  if (expected_total > 0) {
    uint64_t percent = bytes >= expected_total
                           ? 100u
                           : static_cast<uint64_t>((static_cast<double>(bytes) * 100.0) /
                                                   static_cast<double>(expected_total));
    line += ' ';
    line += std::to_string(percent);
    line += '%';
  }
  return line;
}

ProgressMeter::ProgressMeter(ByteSink& next, uint64_t expected_total, std::ostream& out,
                             Clock clock, std::chrono::milliseconds interval)
    : next_(next),
      expected_total_(expected_total),
      out_(out),
      clock_(std::move(clock)),
      interval_(interval) {
  if (!clock_) {
    clock_ = [] { return std::chrono::steady_clock::now(); };
  }
  started_ = clock_();
  last_report_ = started_;
}

void ProgressMeter::Write(std::span<const uint8_t> data) {
  if (finished_) {
    throw Error{ErrorDomain::State, errors::state::kStageFinished, "progress meter finished"};
  }
  next_.Write(data);
  bytes_ += data.size();
  const auto now = clock_();
  if (now - last_report_ >= interval_) {
    Report(now, false);
  }
}

void ProgressMeter::Finish() {
  if (finished_) {
    return;
  }
  next_.Finish();
  finished_ = true;
  Report(clock_(), true);
}

void ProgressMeter::Report(std::chrono::steady_clock::time_point now, bool final) {
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - started_);
  out_ << '\r' << FormatProgressLine(bytes_, elapsed, expected_total_) << std::flush;
  if (final) {
    out_ << std::endl;
  }
  last_report_ = now;
  ++reports_;
}

}  // namespace fdup::pipeline
