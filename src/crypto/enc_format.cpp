#include "fdup/crypto/enc_format.h"

#include <algorithm>

#include "fdup/crypto/pbkdf2.h"
#include "fdup/security/zeroizer.h"

namespace fdup::crypto {

EncKeyMaterial::~EncKeyMaterial() {
  security::Zeroizer::Wipe(std::span<uint8_t>(key.data(), key.size()));
  security::Zeroizer::Wipe(std::span<uint8_t>(iv.data(), iv.size()));
}

void DeriveEncKeyMaterial(std::span<const uint8_t> passphrase,
                          std::span<const uint8_t, kEncSaltSize> salt,
                          uint32_t iterations,
                          EncKeyMaterial& out) {
  std::array<uint8_t, AES256_CBC::KEY_SIZE + AES256_CBC::IV_SIZE> derived{};
  security::Zeroizer::ScopeWiper derived_guard(std::span<uint8_t>(derived.data(), derived.size()));
  PBKDF2_HMAC_SHA256(passphrase, salt, iterations, std::span<uint8_t>(derived.data(), derived.size()));
  std::copy_n(derived.begin(), out.key.size(), out.key.begin());
  std::copy_n(derived.begin() + out.key.size(), out.iv.size(), out.iv.begin());
}

}  // namespace fdup::crypto
