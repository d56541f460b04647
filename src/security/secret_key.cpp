#include "fdup/security/secret_key.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

#include "fdup/security/zeroizer.h"

namespace fdup::security {

SecretKey::SecretKey(std::span<const uint8_t> bytes) : bytes_(bytes.begin(), bytes.end()) {
  locked_ = Zeroizer::TryLockMemory(std::span<uint8_t>(bytes_.data(), bytes_.size())) ==
            Zeroizer::LockStatus::Locked;
}

SecretKey::~SecretKey() { Clear(); }

SecretKey::SecretKey(SecretKey&& other) noexcept
    : bytes_(std::move(other.bytes_)), locked_(std::exchange(other.locked_, false)) {
  other.bytes_.clear();
}

SecretKey& SecretKey::operator=(SecretKey&& other) noexcept {
  if (this != &other) {
    Clear();
    bytes_ = std::move(other.bytes_);
    locked_ = std::exchange(other.locked_, false);
    other.bytes_.clear();
  }
  return *this;
}

void SecretKey::Clear() noexcept {
  auto span = std::span<uint8_t>(bytes_.data(), bytes_.size());
  Zeroizer::Wipe(span);
  if (locked_) {
    Zeroizer::UnlockMemory(span);
    locked_ = false;
  }
  bytes_.clear();
}

std::optional<SecretKey> SecretKey::TakeFromEnvironment(std::string_view variable) {
  const std::string name(variable);
  char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  const size_t length = std::strlen(value);
  std::optional<SecretKey> key;
  if (length > 0) {
    key.emplace(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value), length));
  }
  // glibc hands out the live environment string; scrub it before unsetting.
  Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(value), length));
  ::unsetenv(name.c_str());
  return key;
}

}  // namespace fdup::security
