#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace fdup::crypto {

struct AES256_CBC {
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t IV_SIZE = 16;
  static constexpr size_t BLOCK_SIZE = 16;
};

// Incremental SHA-256. Final() may be called once.
class StreamingDigest {
public:
  virtual ~StreamingDigest() = default;
  virtual void Update(std::span<const uint8_t> data) = 0;
  virtual std::array<uint8_t, 32> Final() = 0;
};

// Incremental AES-256-CBC encryption with PKCS#7 padding. |out| passed to
// Update must hold at least in.size() + BLOCK_SIZE bytes, |out| passed to
// Final at least BLOCK_SIZE bytes. Both return the number of bytes written.
class StreamingCipher {
public:
  virtual ~StreamingCipher() = default;
  virtual size_t Update(std::span<const uint8_t> in, std::span<uint8_t> out) = 0;
  virtual size_t Final(std::span<uint8_t> out) = 0;
};

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;

  virtual std::unique_ptr<StreamingDigest> NewSHA256() = 0;

  virtual std::unique_ptr<StreamingCipher> NewAES256CBCEncryptor(
      std::span<const uint8_t, AES256_CBC::KEY_SIZE> key,
      std::span<const uint8_t, AES256_CBC::IV_SIZE> iv) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;

  std::unique_ptr<StreamingDigest> NewSHA256() override;

  std::unique_ptr<StreamingCipher> NewAES256CBCEncryptor(
      std::span<const uint8_t, AES256_CBC::KEY_SIZE> key,
      std::span<const uint8_t, AES256_CBC::IV_SIZE> iv) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void EnsureCryptoProviderInitialized(); // runs the known-answer tests once

}  // namespace fdup::crypto
