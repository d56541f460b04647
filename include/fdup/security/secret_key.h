#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace fdup::security {

// Owns the operator-supplied passphrase. The bytes are pinned when possible and
// wiped on destruction or Clear(). Never printable.
class SecretKey {
 public:
  SecretKey() = default;
  explicit SecretKey(std::span<const uint8_t> bytes);
  ~SecretKey();

  SecretKey(const SecretKey&) = delete;
  SecretKey& operator=(const SecretKey&) = delete;

  SecretKey(SecretKey&& other) noexcept;
  SecretKey& operator=(SecretKey&& other) noexcept;

  // Reads |variable| from the environment and removes it from the environment
  // immediately. Returns nullopt when unset or empty.
  static std::optional<SecretKey> TakeFromEnvironment(std::string_view variable);

  [[nodiscard]] bool empty() const noexcept { return bytes_.empty(); }
  [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
    return {bytes_.data(), bytes_.size()};
  }

  void Clear() noexcept;

 private:
  std::vector<uint8_t> bytes_;
  bool locked_{false};
};

}  // namespace fdup::security
