#include "fdup/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <array>
#include <climits>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "fdup/error.h"

namespace fdup::crypto {

namespace {

void ThrowCryptoError(const std::string& message, int code = 0);

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

class EVPContextDeleter {
public:
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPContextDeleter>;
using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, EVPContextDeleter>;

struct RuntimeState {
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

void ThrowCryptoError(const std::string& message, int code) {
  throw fdup::Error(fdup::ErrorDomain::Crypto, code, message);
}

class OpenSSLStreamingDigest final : public StreamingDigest {
public:
  OpenSSLStreamingDigest() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
      ThrowCryptoError("Failed to allocate SHA-256 context");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestInit_ex(EVP_sha256)"));
    }
  }

  void Update(std::span<const uint8_t> data) override {
    if (finalized_) {
      ThrowCryptoError("SHA-256 context already finalized");
    }
    if (data.empty()) {
      return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestUpdate"));
    }
  }

  std::array<uint8_t, 32> Final() override {
    if (finalized_) {
      ThrowCryptoError("SHA-256 context already finalized");
    }
    std::array<uint8_t, 32> out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestFinal_ex"));
    }
    if (len != out.size()) {
      ThrowCryptoError("Unexpected SHA-256 length", static_cast<int>(len));
    }
    finalized_ = true;
    return out;
  }

private:
  DigestCtxPtr ctx_;
  bool finalized_{false};
};

class OpenSSLStreamingCipher final : public StreamingCipher {
public:
  OpenSSLStreamingCipher(std::span<const uint8_t, AES256_CBC::KEY_SIZE> key,
                         std::span<const uint8_t, AES256_CBC::IV_SIZE> iv)
      : ctx_(EVP_CIPHER_CTX_new()) {
    if (!ctx_) {
      ThrowCryptoError("Failed to allocate AES-CBC context");
    }
    if (EVP_EncryptInit_ex(ctx_.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex"));
    }
  }

  size_t Update(std::span<const uint8_t> in, std::span<uint8_t> out) override {
    if (finalized_) {
      ThrowCryptoError("AES-CBC context already finalized");
    }
    if (in.empty()) {
      return 0;
    }
    if (in.size() > static_cast<size_t>(INT_MAX - AES256_CBC::BLOCK_SIZE)) {
      ThrowCryptoError("AES-CBC update too large");
    }
    if (out.size() < in.size() + AES256_CBC::BLOCK_SIZE) {
      ThrowCryptoError("AES-CBC output buffer too small");
    }
    int len = 0;
    if (EVP_EncryptUpdate(ctx_.get(), out.data(), &len, in.data(),
                          static_cast<int>(in.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate"));
    }
    return static_cast<size_t>(len);
  }

  size_t Final(std::span<uint8_t> out) override {
    if (finalized_) {
      ThrowCryptoError("AES-CBC context already finalized");
    }
    if (out.size() < AES256_CBC::BLOCK_SIZE) {
      ThrowCryptoError("AES-CBC output buffer too small");
    }
    int len = 0;
    if (EVP_EncryptFinal_ex(ctx_.get(), out.data(), &len) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
    }
    finalized_ = true;
    return static_cast<size_t>(len);
  }

private:
  CipherCtxPtr ctx_;
  bool finalized_{false};
};

void RunSHA256KnownAnswerTest() {
  static constexpr std::array<uint8_t, 3> kMessage{'a', 'b', 'c'};
  static constexpr std::array<uint8_t, 32> kExpected{
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
      0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};

  OpenSSLCryptoProvider provider;
  auto streaming = provider.NewSHA256();
  streaming->Update(std::span<const uint8_t>(kMessage.data(), 1));
  streaming->Update(std::span<const uint8_t>(kMessage.data() + 1, kMessage.size() - 1));
  if (streaming->Final() != kExpected) {
    ThrowCryptoError("SHA-256 KAT streaming mismatch");
  }
  if (provider.SHA256(std::span<const uint8_t>(kMessage.data(), kMessage.size())) != kExpected) {
    ThrowCryptoError("SHA-256 KAT one-shot mismatch");
  }
}

void RunAESCBCKnownAnswerTest() {
  // NIST SP 800-38A F.2.5, first two blocks.
  static constexpr std::array<uint8_t, AES256_CBC::KEY_SIZE> kKey{
      0x60, 0x3d, 0xeb, 0x10, 0x15, 0xca, 0x71, 0xbe, 0x2b, 0x73, 0xae, 0xf0, 0x85, 0x7d, 0x77, 0x81,
      0x1f, 0x35, 0x2c, 0x07, 0x3b, 0x61, 0x08, 0xd7, 0x2d, 0x98, 0x10, 0xa3, 0x09, 0x14, 0xdf, 0xf4};
  static constexpr std::array<uint8_t, AES256_CBC::IV_SIZE> kIv{
      0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f};
  static constexpr std::array<uint8_t, 32> kPlaintext{
      0x6b, 0xc1, 0xbe, 0xe2, 0x2e, 0x40, 0x9f, 0x96, 0xe9, 0x3d, 0x7e, 0x11, 0x73, 0x93, 0x17, 0x2a,
      0xae, 0x2d, 0x8a, 0x57, 0x1e, 0x03, 0xac, 0x9c, 0x9e, 0xb7, 0x6f, 0xac, 0x45, 0xaf, 0x8e, 0x51};
  static constexpr std::array<uint8_t, 32> kExpectedCiphertext{
      0xf5, 0x8c, 0x4c, 0x04, 0xd6, 0xe5, 0xf1, 0xba, 0x77, 0x9e, 0xab, 0xfb, 0x5f, 0x7b, 0xfb, 0xd6,
      0x9c, 0xfc, 0x4e, 0x96, 0x7e, 0xdb, 0x80, 0x8d, 0x67, 0x9f, 0x77, 0x7b, 0xc6, 0x70, 0x2c, 0x7d};

  OpenSSLCryptoProvider provider;
  auto cipher = provider.NewAES256CBCEncryptor(
      std::span<const uint8_t, AES256_CBC::KEY_SIZE>(kKey),
      std::span<const uint8_t, AES256_CBC::IV_SIZE>(kIv));
  std::array<uint8_t, kPlaintext.size() + 2 * AES256_CBC::BLOCK_SIZE> out{};
  size_t written = cipher->Update(std::span<const uint8_t>(kPlaintext.data(), kPlaintext.size()),
                                  std::span<uint8_t>(out.data(), out.size()));
  written += cipher->Final(std::span<uint8_t>(out.data() + written, out.size() - written));
  // 32 bytes of plaintext always gain one full padding block.
  if (written != kPlaintext.size() + AES256_CBC::BLOCK_SIZE) {
    ThrowCryptoError("AES-CBC KAT length mismatch");
  }
  if (!std::equal(kExpectedCiphertext.begin(), kExpectedCiphertext.end(), out.begin())) {
    ThrowCryptoError("AES-CBC KAT ciphertext mismatch");
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
    RunSHA256KnownAnswerTest();
    RunAESCBCKnownAnswerTest();
    state.kat_passed = true;
  });
}

}  // namespace

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::HMACSHA256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), message.data(),
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA256 length", static_cast<int>(len));
  }
  return out;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length", static_cast<int>(len));
  }
  return out;
}

std::unique_ptr<StreamingDigest> OpenSSLCryptoProvider::NewSHA256() {
  return std::make_unique<OpenSSLStreamingDigest>();
}

std::unique_ptr<StreamingCipher> OpenSSLCryptoProvider::NewAES256CBCEncryptor(
    std::span<const uint8_t, AES256_CBC::KEY_SIZE> key,
    std::span<const uint8_t, AES256_CBC::IV_SIZE> iv) {
  return std::make_unique<OpenSSLStreamingCipher>(key, iv);
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

}  // namespace fdup::crypto
