#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace fdup {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain owns the 0x100 codes above its base, so framework codes never
  // collide with propagated errno values.
  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace security {
      inline constexpr int kMissingSecret = Make(ErrorDomain::Security, 0x01);
    } // namespace security

    namespace io {
      inline constexpr int kDeviceOpenFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kDeviceReadFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kPipeFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kSpawnFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kUploadWriteFailed = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kUploadFailed = Make(ErrorDomain::IO, 0x06);
      inline constexpr int kRemoveFailed = Make(ErrorDomain::IO, 0x07);
      inline constexpr int kIndicatorFailed = Make(ErrorDomain::IO, 0x08);
    } // namespace io

    namespace validation {
      inline constexpr int kNotBlockDevice = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kBadArgument = Make(ErrorDomain::Validation, 0x02);
    } // namespace validation

    namespace config {
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x01);
    } // namespace config

    namespace state {
      inline constexpr int kInterrupted = Make(ErrorDomain::State, 0x01);
      inline constexpr int kStageFinished = Make(ErrorDomain::State, 0x02);
    } // namespace state

    namespace internal {
      inline constexpr int kClockFailed = Make(ErrorDomain::Internal, 0x01);
    } // namespace internal

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt)
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native) {}
  };
} // namespace fdup
