#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fdup/common.h"

namespace fdup::orchestrator {

inline constexpr std::string_view kEncryptionKeyVariable{"ENCRYPTION_KEY"};
inline constexpr std::string_view kGpioEnabledVariable{"GPIO_ENABLED"};
inline constexpr std::string_view kLogFileVariable{"FDUP_LOG_FILE"};
inline constexpr std::string_view kDefaultLogFile{"/var/log/fdup.log"};
inline constexpr size_t kDefaultBlockSize = 4 * kMiB;
inline constexpr size_t kMaxBlockSize = 64 * kMiB;

enum class RunMode { kList, kDuplicate, kHelp };

// Settings for one invocation, resolved once from flags and environment.
struct ImagerConfig {
  RunMode mode{RunMode::kList};
  std::filesystem::path source_device;
  std::string bucket;

  bool gpio_enabled{false};
  std::string gpio_tool{"gpio"};
  int led_pin{18};
  std::chrono::milliseconds blink_half_period{500};

  std::filesystem::path log_file{std::string(kDefaultLogFile)};
  size_t block_size{kDefaultBlockSize};
  uint32_t pbkdf2_iterations{10000};

  std::string lsblk_tool{"lsblk"};
  std::vector<std::string> aws_command{"aws"};
  std::vector<std::string> required_tools{"lsblk", "aws"};
};

using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view)>;

std::optional<std::string> ProcessEnvironment(std::string_view name);

// Parses argv (without the program name). Throws fdup::Error
// (Validation, kBadArgument) on usage errors and (Config, kInvalidValue) on
// bad flag values.
ImagerConfig ParseImagerConfig(std::span<const std::string_view> args,
                               const EnvironmentLookup& env = ProcessEnvironment);

// Accepts a positive decimal byte count up to kMaxBlockSize.
size_t ParseBlockSize(std::string_view text);

std::string UsageText(std::string_view program);

} // namespace fdup::orchestrator
