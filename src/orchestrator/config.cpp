#include "fdup/orchestrator/config.h"

#include <charconv>
#include <cstdlib>
#include <utility>

#include "fdup/error.h"

namespace fdup::orchestrator {

namespace {

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

[[noreturn]] void ThrowUsage(std::string message) {
  throw Error{ErrorDomain::Validation, errors::validation::kBadArgument, std::move(message)};
}

} // namespace

std::optional<std::string> ProcessEnvironment(std::string_view name) {
  const char* value = std::getenv(std::string(name).c_str());
  if (!value) {
    return std::nullopt;
  }
  return std::string(value);
}

size_t ParseBlockSize(std::string_view text) {
  size_t value = 0;
  const auto* begin = text.data();
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (text.empty() || ec != std::errc() || ptr != end || value == 0 || value > kMaxBlockSize) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                "block size must be between 1 and " + std::to_string(kMaxBlockSize) +
                    " bytes: '" + std::string(text) + "'"};
  }
  return value;
}

ImagerConfig ParseImagerConfig(std::span<const std::string_view> args,
                               const EnvironmentLookup& env) {
  ImagerConfig config;
  if (env) {
    if (auto gpio = env(kGpioEnabledVariable)) {
      config.gpio_enabled = (*gpio == "true");
    }
    if (auto log_file = env(kLogFileVariable); log_file && !log_file->empty()) {
      config.log_file = *log_file;
    }
  }

  bool list_requested = false;
  std::vector<std::string_view> positional;
  bool flags_done = false;
  for (std::string_view arg : args) {
    if (!flags_done && arg == "--") {
      flags_done = true;
      continue;
    }
    if (flags_done || arg.empty() || arg.front() != '-' || arg == "-") {
      positional.push_back(arg);
      continue;
    }
    if (arg == "--help" || arg == "-h") {
      config.mode = RunMode::kHelp;
      return config;
    }
    if (arg == "--list") {
      list_requested = true;
    } else if (arg == "--gpio") {
      config.gpio_enabled = true;
    } else if (StartsWith(arg, "--log-file=")) {
      auto value = arg.substr(std::string_view("--log-file=").size());
      if (value.empty()) {
        throw Error{ErrorDomain::Config, errors::config::kInvalidValue, "--log-file needs a path"};
      }
      config.log_file = std::string(value);
    } else if (StartsWith(arg, "--block-size=")) {
      config.block_size = ParseBlockSize(arg.substr(std::string_view("--block-size=").size()));
    } else {
      ThrowUsage("unknown option: " + std::string(arg));
    }
  }

  if (positional.size() > 2) {
    ThrowUsage("too many arguments");
  }
  if (list_requested || positional.size() < 2) {
    config.mode = RunMode::kList;
    return config;
  }
  config.mode = RunMode::kDuplicate;
  config.source_device = std::string(positional[0]);
  config.bucket = std::string(positional[1]);
  if (config.bucket.empty()) {
    ThrowUsage("destination bucket is empty");
  }
  return config;
}

std::string UsageText(std::string_view program) {
  std::string p(program);
  return "Usage: ENCRYPTION_KEY='your_secret_key' [GPIO_ENABLED=true] " + p +
         " [options] <source_disk> <s3_bucket>\n"
         "Example: ENCRYPTION_KEY='mySecretKey' GPIO_ENABLED=true " + p +
         " /dev/sda my-forensic-bucket\n"
         "If source_disk is omitted, available unmounted disks will be displayed.\n"
         "Options:\n"
         "  --list              list unmounted disks and exit\n"
         "  --gpio              blink the status LED on BCM pin 18 (needs wiringpi)\n"
         "  --log-file=PATH     run log (default " + std::string(kDefaultLogFile) + ", or $" +
         std::string(kLogFileVariable) + ")\n"
         "  --block-size=BYTES  read size for hashing and transfer (default 4194304)\n"
         "  --help              show this text\n";
}

} // namespace fdup::orchestrator
