#pragma once

#include <string_view>

namespace fdup::errors::msg {
// Operator-facing messages shared between the CLI and the pipeline.
inline constexpr std::string_view kRunAsRoot{"Please run as root"};
inline constexpr std::string_view kMissingEncryptionKey{"ENCRYPTION_KEY environment variable is not set."};
inline constexpr std::string_view kGpioToolMissing{"GPIO support is enabled but 'gpio' command is not found. Please install wiringpi."};
inline constexpr std::string_view kDuplicationFailed{"Disk duplication failed"};
inline constexpr std::string_view kRemoveIncompleteFailed{"Failed to remove incomplete upload. Manual cleanup may be necessary."};
inline constexpr std::string_view kDigestMismatch{"SHA256 hash mismatch. The source disk may have changed during duplication."};
inline constexpr std::string_view kDigestVerified{"SHA256 hash verification successful. Source disk remained unchanged during duplication."};
inline constexpr std::string_view kStoreDigestReminder{"Please store the SHA256 hash securely for later verification"};
inline constexpr std::string_view kInterruptedBySignal{"interrupted by signal"};
inline constexpr std::string_view kShortDeviceRead{"Device returned fewer bytes than its reported size"};
}  // namespace fdup::errors::msg
