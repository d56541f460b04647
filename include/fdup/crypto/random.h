#pragma once

#include <cstdint>
#include <span>

namespace fdup::crypto {

// Fills |out| from the kernel CSPRNG. Throws fdup::Error on failure.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace fdup::crypto
