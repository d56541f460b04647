#include "fdup/pipeline/encrypting_sink.h"

#include <algorithm>

#include "fdup/crypto/random.h"
#include "fdup/error.h"
#include "fdup/security/zeroizer.h"

namespace fdup::pipeline {

EncryptingSink::EncryptingSink(ByteSink& next, std::span<const uint8_t> passphrase,
                               uint32_t iterations, SaltSource salt_source)
    : next_(next) {
  if (passphrase.empty()) {
    throw Error{ErrorDomain::Security, errors::security::kMissingSecret,
                "encryption passphrase is empty"};
  }
  if (salt_source) {
    salt_source(std::span<uint8_t>(salt_.data(), salt_.size()));
  } else {
    crypto::SystemRandomBytes(std::span<uint8_t>(salt_.data(), salt_.size()));
  }

  crypto::EncKeyMaterial material;
  crypto::DeriveEncKeyMaterial(passphrase,
                               std::span<const uint8_t, crypto::kEncSaltSize>(salt_), iterations,
                               material);
  cipher_ = crypto::GetCryptoProvider().NewAES256CBCEncryptor(
      std::span<const uint8_t, crypto::AES256_CBC::KEY_SIZE>(material.key),
      std::span<const uint8_t, crypto::AES256_CBC::IV_SIZE>(material.iv));
}

void EncryptingSink::EmitHeader() {
  if (header_sent_) {
    return;
  }
  std::array<uint8_t, crypto::kEncHeaderSize> header{};
  std::copy(crypto::kEncSaltMagic.begin(), crypto::kEncSaltMagic.end(), header.begin());
  std::copy(salt_.begin(), salt_.end(), header.begin() + crypto::kEncSaltMagic.size());
  next_.Write(std::span<const uint8_t>(header.data(), header.size()));
  bytes_out_ += header.size();
  header_sent_ = true;
}

void EncryptingSink::Forward(size_t produced) {
  if (produced == 0) {
    return;
  }
  next_.Write(std::span<const uint8_t>(scratch_.data(), produced));
  bytes_out_ += produced;
}

void EncryptingSink::Write(std::span<const uint8_t> data) {
  if (finished_) {
    throw Error{ErrorDomain::State, errors::state::kStageFinished, "encryption already finished"};
  }
  EmitHeader();
  if (data.empty()) {
    return;
  }
  const size_t needed = data.size() + crypto::AES256_CBC::BLOCK_SIZE;
  if (scratch_.size() < needed) {
    scratch_.resize(needed);
  }
  const size_t produced = cipher_->Update(data, std::span<uint8_t>(scratch_.data(), needed));
  bytes_in_ += data.size();
  Forward(produced);
}

void EncryptingSink::Finish() {
  if (finished_) {
    return;
  }
  EmitHeader();
  if (scratch_.size() < crypto::AES256_CBC::BLOCK_SIZE) {
    scratch_.resize(crypto::AES256_CBC::BLOCK_SIZE);
  }
  const size_t produced =
      cipher_->Final(std::span<uint8_t>(scratch_.data(), crypto::AES256_CBC::BLOCK_SIZE));
  Forward(produced);
  finished_ = true;
  cipher_.reset();
  security::Zeroizer::WipeVector(scratch_);
  next_.Finish();
}

}  // namespace fdup::pipeline
