#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace fdup::crypto {

class StreamingDigest;

std::array<uint8_t,32> SHA256_Hash(std::span<const uint8_t> data);
std::array<uint8_t,32> SHA256_Hash(const std::vector<uint8_t>& data);

// Incremental hashing through the active CryptoProvider.
class SHA256_Stream {
public:
  SHA256_Stream();
  ~SHA256_Stream();

  SHA256_Stream(const SHA256_Stream&) = delete;
  SHA256_Stream& operator=(const SHA256_Stream&) = delete;

  void Update(std::span<const uint8_t> data);
  std::array<uint8_t, 32> Final();

private:
  std::unique_ptr<StreamingDigest> impl_;
};

} // namespace fdup::crypto
