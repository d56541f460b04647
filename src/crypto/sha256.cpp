#include "fdup/crypto/sha256.h"

#include "fdup/crypto/provider.h"

namespace fdup::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

std::array<uint8_t, 32> SHA256_Hash(const std::vector<uint8_t>& data) {
  return SHA256_Hash(std::span<const uint8_t>(data.data(), data.size()));
}

SHA256_Stream::SHA256_Stream() : impl_(GetCryptoProviderShared()->NewSHA256()) {}

SHA256_Stream::~SHA256_Stream() = default;

void SHA256_Stream::Update(std::span<const uint8_t> data) {
  impl_->Update(data);
}

std::array<uint8_t, 32> SHA256_Stream::Final() {
  return impl_->Final();
}

}  // namespace fdup::crypto
