#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include "fdup/storage/device_info.h"

namespace fdup::core {

// Object key for one run: {timestamp}_{model}_{serial}_{size}.img.enc
struct OutputIdentifier {
  std::string timestamp;
  std::string model;
  std::string serial;
  std::string size;

  std::string FileName() const;
};

inline constexpr std::string_view kImageSuffix{".img.enc"};
inline constexpr std::string_view kSyntheticSerialPrefix{"no_serial_"};

// Every character outside [A-Za-z0-9] becomes '_'.
std::string SanitizeComponent(std::string_view value);
// Whitespace is dropped, '.' is kept, anything else non-alphanumeric becomes '_'.
std::string SanitizeSize(std::string_view value);

// Local time as YYYYMMDD_HHMMSS.
std::string FormatTimestamp(std::chrono::system_clock::time_point when);

OutputIdentifier BuildOutputIdentifier(const storage::DeviceMetadata& metadata,
                                       const std::filesystem::path& device,
                                       std::string timestamp);

OutputIdentifier BuildOutputIdentifier(const storage::DeviceMetadata& metadata,
                                       const std::filesystem::path& device,
                                       std::chrono::system_clock::time_point now);

}  // namespace fdup::core
