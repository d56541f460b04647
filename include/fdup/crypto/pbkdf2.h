#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace fdup::crypto {

// PBKDF2 with HMAC-SHA256 (RFC 8018). Fills |output| completely; any length is
// accepted, blocks beyond the first are derived with increasing block indexes.
void PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                        std::span<const uint8_t> salt,
                        uint32_t iterations,
                        std::span<uint8_t> output);

std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations);

}  // namespace fdup::crypto
