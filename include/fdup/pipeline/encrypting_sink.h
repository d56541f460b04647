#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <vector>

#include "fdup/crypto/enc_format.h"
#include "fdup/crypto/provider.h"
#include "fdup/pipeline/stream.h"

namespace fdup::pipeline {

// Encrypts the byte stream into the `openssl enc -aes-256-cbc -salt -pbkdf2`
// container and forwards it to |next|. The header goes out with the first
// write (or on Finish() for empty input). Key material lives only inside the
// cipher context.
class EncryptingSink final : public ByteSink {
 public:
  using SaltSource = std::function<void(std::span<uint8_t>)>;

  EncryptingSink(ByteSink& next, std::span<const uint8_t> passphrase,
                 uint32_t iterations = crypto::kEncDefaultIterations,
                 SaltSource salt_source = {});

  void Write(std::span<const uint8_t> data) override;
  void Finish() override;

  [[nodiscard]] uint64_t bytes_in() const noexcept { return bytes_in_; }
  [[nodiscard]] uint64_t bytes_out() const noexcept { return bytes_out_; }

 private:
  void EmitHeader();
  void Forward(size_t produced);

  ByteSink& next_;
  std::unique_ptr<crypto::StreamingCipher> cipher_;
  std::array<uint8_t, crypto::kEncSaltSize> salt_{};
  std::vector<uint8_t> scratch_;
  bool header_sent_{false};
  bool finished_{false};
  uint64_t bytes_in_{0};
  uint64_t bytes_out_{0};
};

}  // namespace fdup::pipeline
