#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cr {
  enum class ErrorDomain : std::uint16_t {
    Archive = 0x01,
    Validation = 0x02,
    Integrity = 0x03,
    IO = 0x04,
    Config = 0x05,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so propagated platform error numbers
  // never collide with framework codes. Codes inside the span are stable.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Archive:
      return 0x0100;
    case ErrorDomain::Validation:
      return 0x0200;
    case ErrorDomain::Integrity:
      return 0x0300;
    case ErrorDomain::IO:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
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
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace archive {
      inline constexpr int kMalformedArchive = Make(ErrorDomain::Archive, 0x01);
      inline constexpr int kTruncatedSection = Make(ErrorDomain::Archive, 0x02);
      inline constexpr int kSectionTooLarge = Make(ErrorDomain::Archive, 0x03);
      inline constexpr int kBadVarint = Make(ErrorDomain::Archive, 0x04);
      inline constexpr int kBadCid = Make(ErrorDomain::Archive, 0x05);
      inline constexpr int kBadHeader = Make(ErrorDomain::Archive, 0x06);
      inline constexpr int kUnsupportedVersion = Make(ErrorDomain::Archive, 0x07);
    } // namespace archive

    namespace validation {
      inline constexpr int kInvalidRange = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kRangeOutsideFile = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kInvalidQuery = Make(ErrorDomain::Validation, 0x03);
    } // namespace validation

    namespace integrity {
      inline constexpr int kDigestMismatch = Make(ErrorDomain::Integrity, 0x01);
      inline constexpr int kDigestUnavailable = Make(ErrorDomain::Integrity, 0x02);
    } // namespace integrity

    namespace io {
      inline constexpr int kSourceReadFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kSinkWriteFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kOpenFailed = Make(ErrorDomain::IO, 0x03);
    } // namespace io

    namespace internal {
      inline constexpr int kHeaderWrittenTwice = Make(ErrorDomain::Internal, 0x01);
      inline constexpr int kBlockBeforeHeader = Make(ErrorDomain::Internal, 0x02);
    } // namespace internal

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

  // Thrown for framing or header damage. Nothing of the response may be sent
  // once this is raised.
  struct MalformedArchiveError : public Error {
    MalformedArchiveError(int c, std::string msg, std::vector<std::string> ctx = {})
        : Error(ErrorDomain::Archive, c, std::move(msg), std::nullopt, Retryability::kFatal,
                std::move(ctx)) {}
  };
} // namespace cr
