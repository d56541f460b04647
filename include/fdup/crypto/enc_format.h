#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "fdup/crypto/provider.h"

namespace fdup::crypto {

// Container layout produced by `openssl enc -aes-256-cbc -salt -pbkdf2`:
//   "Salted__" | salt[8] | AES-256-CBC(PKCS#7) ciphertext
// Key and IV come from PBKDF2-HMAC-SHA256(passphrase, salt) as 32 + 16 bytes.
inline constexpr std::array<uint8_t, 8> kEncSaltMagic{'S', 'a', 'l', 't', 'e', 'd', '_', '_'};
inline constexpr size_t kEncSaltSize = 8;
inline constexpr size_t kEncHeaderSize = kEncSaltMagic.size() + kEncSaltSize;
inline constexpr uint32_t kEncDefaultIterations = 10000;

struct EncKeyMaterial {
  std::array<uint8_t, AES256_CBC::KEY_SIZE> key{};
  std::array<uint8_t, AES256_CBC::IV_SIZE> iv{};

  ~EncKeyMaterial();
};

void DeriveEncKeyMaterial(std::span<const uint8_t> passphrase,
                          std::span<const uint8_t, kEncSaltSize> salt,
                          uint32_t iterations,
                          EncKeyMaterial& out);

// Ciphertext length for |plaintext_size| input bytes, header included.
constexpr uint64_t EncryptedSize(uint64_t plaintext_size) {
  return kEncHeaderSize + (plaintext_size / AES256_CBC::BLOCK_SIZE + 1) * AES256_CBC::BLOCK_SIZE;
}

}  // namespace fdup::crypto
