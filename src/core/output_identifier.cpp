#include "fdup/core/output_identifier.h"

#include <cctype>
#include <ctime>
#include <utility>

#include "fdup/error.h"

namespace fdup::core {

namespace {

constexpr size_t kUuidSuffixLength = 8;

bool IsAsciiAlnum(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

std::string SerialOrFallback(const storage::DeviceMetadata& metadata,
                             const std::filesystem::path& device) {
  if (!metadata.serial.empty()) {
    return SanitizeComponent(metadata.serial);
  }
  std::string fallback;
  if (!metadata.uuid.empty()) {
    const std::string_view uuid = metadata.uuid;
    fallback = SanitizeComponent(
        uuid.size() > kUuidSuffixLength ? uuid.substr(uuid.size() - kUuidSuffixLength) : uuid);
  } else {
    auto base = device.filename().string();
    if (base.empty()) {
      base = device.parent_path().filename().string();
    }
    fallback = SanitizeComponent(base.empty() ? std::string("device") : base);
  }
  return std::string(kSyntheticSerialPrefix) + fallback;
}

std::string ModelOrFallback(const storage::DeviceMetadata& metadata) {
  if (!metadata.model.empty()) {
    return SanitizeComponent(metadata.model);
  }
  if (!metadata.vendor.empty()) {
    return SanitizeComponent(metadata.vendor) + "_unknown_model";
  }
  return "unknown_model";
}

}  // namespace

std::string OutputIdentifier::FileName() const {
  std::string name;
  name.reserve(timestamp.size() + model.size() + serial.size() + size.size() + 16);
  name += timestamp;
  name += '_';
  name += model;
  name += '_';
  name += serial;
  name += '_';
  name += size;
  name += kImageSuffix;
  return name;
}

std::string SanitizeComponent(std::string_view value) {
  std::string out(value);
  for (char& c : out) {
    if (!IsAsciiAlnum(c)) {
      c = '_';
    }
  }
  return out;
}

std::string SanitizeSize(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      continue;
    }
    out.push_back(IsAsciiAlnum(c) || c == '.' ? c : '_');
  }
  return out;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  if (::localtime_r(&seconds, &local) == nullptr) {
    throw Error{ErrorDomain::Internal, errors::internal::kClockFailed,
                "localtime_r failed"};
  }
  char buffer[32];
  const size_t written = std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local);
  return std::string(buffer, written);
}

OutputIdentifier BuildOutputIdentifier(const storage::DeviceMetadata& metadata,
                                       const std::filesystem::path& device,
                                       std::string timestamp) {
  OutputIdentifier id;
  id.timestamp = std::move(timestamp);
  id.model = ModelOrFallback(metadata);
  id.serial = SerialOrFallback(metadata, device);
  id.size = SanitizeSize(metadata.size);
  if (id.size.empty()) {
    id.size = "unknown_size";
  }
  return id;
}

OutputIdentifier BuildOutputIdentifier(const storage::DeviceMetadata& metadata,
                                       const std::filesystem::path& device,
                                       std::chrono::system_clock::time_point now) {
  return BuildOutputIdentifier(metadata, device, FormatTimestamp(now));
}

}  // namespace fdup::core
