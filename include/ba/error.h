#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ba {
  enum class ErrorDomain : std::uint16_t {
    IO = 0x02,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Repair = 0x08,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Repair:
      return 0x0800;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    // Helper to construct reserved error codes.
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kLedgerUnreadable = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kLedgerWriteFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kCatalogUnreadable = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kCatalogWriteFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kBookUnreadable = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kBookDirUnreadable = Make(ErrorDomain::IO, 0x06);
      inline constexpr int kRepairDirUnavailable = Make(ErrorDomain::IO, 0x07);
      inline constexpr int kArtifactMoveFailed = Make(ErrorDomain::IO, 0x08);
    } // namespace io

    namespace validation {
      inline constexpr int kMalformedChecksum = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kInvalidBookKey = Make(ErrorDomain::Validation, 0x02);
    } // namespace validation

    namespace config {
      inline constexpr int kInvalidRedundancy = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kMissingHome = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kInvalidPolicy = Make(ErrorDomain::Config, 0x03);
      inline constexpr int kInvalidBoolean = Make(ErrorDomain::Config, 0x04);
      inline constexpr int kInvalidSize = Make(ErrorDomain::Config, 0x05);
      inline constexpr int kBookDirMissing = Make(ErrorDomain::Config, 0x06);
    } // namespace config

    namespace dependency {
      inline constexpr int kSpawnFailed = Make(ErrorDomain::Dependency, 0x01);
      inline constexpr int kToolMissing = Make(ErrorDomain::Dependency, 0x02);
      inline constexpr int kToolFailed = Make(ErrorDomain::Dependency, 0x03);
      inline constexpr int kDigestFailed = Make(ErrorDomain::Dependency, 0x04);
    } // namespace dependency

    namespace repair {
      inline constexpr int kGenerationFailed = Make(ErrorDomain::Repair, 0x01);
      inline constexpr int kNoArtifacts = Make(ErrorDomain::Repair, 0x02);
      inline constexpr int kPlacementFailed = Make(ErrorDomain::Repair, 0x03);
      inline constexpr int kLinkFailed = Make(ErrorDomain::Repair, 0x04);
      inline constexpr int kSelfVerificationFailed = Make(ErrorDomain::Repair, 0x05);
    } // namespace repair

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Raised when recovery data could not be generated, placed, or proven usable.
  // The repair store removes whatever the failed attempt left behind before throwing.
  struct RepairCreationError : public Error {
    std::string book_key;
    RepairCreationError(std::string key, int c, std::string msg,
                        std::optional<int> native = std::nullopt)
        : Error(ErrorDomain::Repair, c, std::move(msg), native),
          book_key(std::move(key)) {}
  };
} // namespace ba
