#pragma once

#include <string_view>

namespace cr::errors::msg {
// Centralized message catalog
inline constexpr std::string_view kHeaderTruncated{"CAR header truncated"};
inline constexpr std::string_view kHeaderTooLarge{"CAR header exceeds configured maximum"};
inline constexpr std::string_view kHeaderNotCbor{"CAR header is not a valid CBOR map"};
inline constexpr std::string_view kHeaderMissingVersion{"CAR header missing version"};
inline constexpr std::string_view kHeaderUnsupportedVersion{"Only CAR v1 is supported"};
inline constexpr std::string_view kHeaderMissingRoots{"CAR header has no roots"};
inline constexpr std::string_view kHeaderBadRoot{"CAR header root is not a CID link"};
inline constexpr std::string_view kSectionLengthTruncated{"Section length prefix truncated"};
inline constexpr std::string_view kSectionTruncated{"Section shorter than its length prefix"};
inline constexpr std::string_view kSectionTooLarge{"Section exceeds configured maximum"};
inline constexpr std::string_view kSectionZeroLength{"Zero-length section"};
inline constexpr std::string_view kVarintOverlong{"Varint exceeds 63 bits"};
inline constexpr std::string_view kCidMalformed{"Section does not start with a valid CID"};
inline constexpr std::string_view kDigestMismatch{"Block digest does not match its CID"};
inline constexpr std::string_view kDigestBackendFailed{"Digest computation failed"};
inline constexpr std::string_view kRangeStartAfterEnd{"Range start is after range end"};
inline constexpr std::string_view kRangeOutsideFile{"Range lies outside the file"};
inline constexpr std::string_view kRangeSyntax{"Range must have the form start:end"};
inline constexpr std::string_view kSourceReadFailed{"Failed to read from upstream source"};
inline constexpr std::string_view kSinkWriteFailed{"Failed to write filtered output"};
inline constexpr std::string_view kHeaderWrittenTwice{"CAR header already written"};
inline constexpr std::string_view kBlockBeforeHeader{"CAR block written before header"};
}  // namespace cr::errors::msg
