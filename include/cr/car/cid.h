#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "cr/common.h"

namespace cr::car {

namespace codec {
inline constexpr std::uint64_t kRaw = 0x55;
inline constexpr std::uint64_t kDagPb = 0x70;
inline constexpr std::uint64_t kDagCbor = 0x71;
inline constexpr std::uint64_t kDagJson = 0x0129;
}  // namespace codec

namespace multihash {
inline constexpr std::uint64_t kIdentity = 0x00;
inline constexpr std::uint64_t kSha2_256 = 0x12;
inline constexpr std::uint64_t kSha2_512 = 0x13;
}  // namespace multihash

// Closed set of codecs the classifier distinguishes.
enum class CodecTag : std::uint8_t { kDagPb, kRaw, kDagCbor, kOther };

[[nodiscard]] CodecTag ClassifyCodec(std::uint64_t codec) noexcept;
[[nodiscard]] const char* CodecName(std::uint64_t codec) noexcept;

struct Cid {
  std::uint64_t version{1};
  std::uint64_t codec{codec::kRaw};
  std::uint64_t hash_code{multihash::kSha2_256};
  Bytes digest{};
  Bytes bytes{};  // binary form exactly as encoded

  [[nodiscard]] CodecTag tag() const noexcept { return ClassifyCodec(codec); }
  [[nodiscard]] std::string ToString() const;

  friend bool operator==(const Cid& a, const Cid& b) noexcept { return a.bytes == b.bytes; }
};

inline constexpr std::size_t kMaxDigestSize = 128;

// Decodes a binary CID from the front of src. On success consumed holds the
// encoded length. CIDv0 is recognized by its bare sha2-256 multihash prefix.
[[nodiscard]] std::optional<Cid> DecodeCid(ByteSpan src, std::size_t& consumed);

// Builds the binary form of a CIDv1 (or v0 when version is 0).
[[nodiscard]] Cid MakeCid(std::uint64_t version, std::uint64_t codec, std::uint64_t hash_code,
                          ByteSpan digest);

std::string EncodeBase32Lower(ByteSpan data);
std::string EncodeBase58Btc(ByteSpan data);

}  // namespace cr::car
