#include "fdup/crypto/pbkdf2.h"

#include <algorithm>
#include <cstddef>
#include <vector>

#include "fdup/crypto/hmac_sha256.h"
#include "fdup/security/zeroizer.h"

namespace fdup::crypto {

namespace {

void DeriveBlock(std::span<const uint8_t> password, std::span<const uint8_t> salt,
                 uint32_t iterations, uint32_t block_index,
                 std::array<uint8_t, HMAC_SHA256::TAG_SIZE>& block_out) {
  std::vector<uint8_t> block(salt.begin(), salt.end());
  block.resize(salt.size() + 4u, 0);
  block[block.size() - 4] = static_cast<uint8_t>((block_index >> 24) & 0xFF);
  block[block.size() - 3] = static_cast<uint8_t>((block_index >> 16) & 0xFF);
  block[block.size() - 2] = static_cast<uint8_t>((block_index >> 8) & 0xFF);
  block[block.size() - 1] = static_cast<uint8_t>(block_index & 0xFF);
  security::Zeroizer::ScopeWiper block_guard(std::span<uint8_t>(block.data(), block.size()));

  auto iter = HMAC_SHA256::Compute(password, std::span<const uint8_t>(block.data(), block.size()));
  security::Zeroizer::ScopeWiper iter_guard(std::span<uint8_t>(iter.data(), iter.size()));
  block_out = iter;

  for (uint32_t i = 1; i < iterations; ++i) {
    iter = HMAC_SHA256::Compute(password, std::span<const uint8_t>(iter.data(), iter.size()));
    for (size_t j = 0; j < block_out.size(); ++j) {
      block_out[j] ^= iter[j];
    }
  }
}

}  // namespace

void PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                        std::span<const uint8_t> salt,
                        uint32_t iterations,
                        std::span<uint8_t> output) {
  iterations = std::max<uint32_t>(iterations, 1u);

  std::array<uint8_t, HMAC_SHA256::TAG_SIZE> block{};
  security::Zeroizer::ScopeWiper block_guard(std::span<uint8_t>(block.data(), block.size()));

  size_t offset = 0;
  uint32_t block_index = 1;
  while (offset < output.size()) {
    DeriveBlock(password, salt, iterations, block_index, block);
    const size_t take = std::min(block.size(), output.size() - offset);
    std::copy_n(block.begin(), take, output.begin() + static_cast<std::ptrdiff_t>(offset));
    offset += take;
    ++block_index;
  }
}

std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations) {
  std::array<uint8_t, 32> output{};
  PBKDF2_HMAC_SHA256(password, salt, iterations, std::span<uint8_t>(output.data(), output.size()));
  return output;
}

}  // namespace fdup::crypto
