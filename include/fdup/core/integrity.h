#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "fdup/crypto/sha256.h"
#include "fdup/pipeline/stream.h"
#include "fdup/pipeline/transfer.h"

namespace fdup::core {

// Lowercase hex SHA-256 of a full device pass and the number of bytes hashed.
struct IntegrityDigest {
  std::string hex;
  uint64_t bytes{0};

  bool operator==(const IntegrityDigest& other) const = default;
};

// Terminal stage that hashes everything written to it.
class DigestSink final : public pipeline::ByteSink {
 public:
  void Write(std::span<const uint8_t> data) override;
  void Finish() override;

  // Valid after Finish().
  [[nodiscard]] const IntegrityDigest& digest() const noexcept { return digest_; }

 private:
  crypto::SHA256_Stream stream_;
  IntegrityDigest digest_;
  bool finished_{false};
};

// Reads |source| to the end in |block_size| reads and hashes every byte.
IntegrityDigest ComputeDigest(pipeline::ByteSource& source, size_t block_size,
                              const pipeline::InterruptCheck& interrupted = {});

}  // namespace fdup::core
