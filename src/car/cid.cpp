#include "cr/car/cid.h"

#include <algorithm>
#include <array>

#include "cr/car/varint.h"

namespace cr::car {

namespace {
constexpr std::uint8_t kCidV0Prefix0 = 0x12;  // sha2-256
constexpr std::uint8_t kCidV0Prefix1 = 0x20;  // 32 byte digest
constexpr std::size_t kCidV0Size = 34;
constexpr std::string_view kBase32Alphabet{"abcdefghijklmnopqrstuvwxyz234567"};
constexpr std::string_view kBase58Alphabet{"123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

bool ReadVarint(ByteSpan src, std::size_t& offset, std::uint64_t& value) {
  if (offset >= src.size()) {
    return false;
  }
  Varint v{};
  if (DecodeVarint(src.subspan(offset), v) != VarintStatus::kOk) {
    return false;
  }
  value = v.value;
  offset += v.length;
  return true;
}
}  // namespace

CodecTag ClassifyCodec(std::uint64_t value) noexcept {
  switch (value) {
  case codec::kDagPb:
    return CodecTag::kDagPb;
  case codec::kRaw:
    return CodecTag::kRaw;
  case codec::kDagCbor:
    return CodecTag::kDagCbor;
  default:
    return CodecTag::kOther;
  }
}

const char* CodecName(std::uint64_t value) noexcept {
  switch (value) {
  case codec::kDagPb:
    return "dag-pb";
  case codec::kRaw:
    return "raw";
  case codec::kDagCbor:
    return "dag-cbor";
  case codec::kDagJson:
    return "dag-json";
  default:
    return "unknown";
  }
}

std::optional<Cid> DecodeCid(ByteSpan src, std::size_t& consumed) {
  consumed = 0;
  if (src.size() >= kCidV0Size && src[0] == kCidV0Prefix0 && src[1] == kCidV0Prefix1) {
    Cid cid{};
    cid.version = 0;
    cid.codec = codec::kDagPb;
    cid.hash_code = multihash::kSha2_256;
    cid.digest.assign(src.begin() + 2, src.begin() + kCidV0Size);
    cid.bytes.assign(src.begin(), src.begin() + kCidV0Size);
    consumed = kCidV0Size;
    return cid;
  }

  std::size_t offset = 0;
  Cid cid{};
  std::uint64_t digest_size = 0;
  if (!ReadVarint(src, offset, cid.version) || cid.version != 1) {
    return std::nullopt;
  }
  if (!ReadVarint(src, offset, cid.codec) || !ReadVarint(src, offset, cid.hash_code) ||
      !ReadVarint(src, offset, digest_size)) {
    return std::nullopt;
  }
  if (digest_size > kMaxDigestSize || digest_size > src.size() - offset) {
    return std::nullopt;
  }
  cid.digest.assign(src.begin() + static_cast<std::ptrdiff_t>(offset),
                    src.begin() + static_cast<std::ptrdiff_t>(offset + digest_size));
  offset += static_cast<std::size_t>(digest_size);
  cid.bytes.assign(src.begin(), src.begin() + static_cast<std::ptrdiff_t>(offset));
  consumed = offset;
  return cid;
}

Cid MakeCid(std::uint64_t version, std::uint64_t codec_value, std::uint64_t hash_code, ByteSpan digest) {
  Cid cid{};
  cid.version = version;
  cid.codec = codec_value;
  cid.hash_code = hash_code;
  cid.digest.assign(digest.begin(), digest.end());
  if (version != 0) {
    AppendVarint(version, cid.bytes);
    AppendVarint(codec_value, cid.bytes);
  }
  AppendVarint(hash_code, cid.bytes);
  AppendVarint(digest.size(), cid.bytes);
  cid.bytes.insert(cid.bytes.end(), digest.begin(), digest.end());
  return cid;
}

std::string EncodeBase32Lower(ByteSpan data) {
  std::string out;
  out.reserve((data.size() * 8 + 4) / 5);
  std::uint32_t buffer = 0;
  int bits = 0;
  for (auto byte : data) {
    buffer = (buffer << 8) | byte;
    bits += 8;
    while (bits >= 5) {
      out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
      bits -= 5;
    }
  }
  if (bits > 0) {
    out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1F]);
  }
  return out;
}

std::string EncodeBase58Btc(ByteSpan data) {
  std::size_t zeros = 0;
  while (zeros < data.size() && data[zeros] == 0) {
    ++zeros;
  }
  // log(256) / log(58) ~= 1.37
  std::vector<std::uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
  std::size_t used = 0;
  for (std::size_t i = zeros; i < data.size(); ++i) {
    std::uint32_t carry = data[i];
    std::size_t j = 0;
    for (auto it = digits.rbegin(); (carry != 0 || j < used) && it != digits.rend(); ++it, ++j) {
      carry += 256u * (*it);
      *it = static_cast<std::uint8_t>(carry % 58);
      carry /= 58;
    }
    used = j;
  }
  auto first = std::find_if(digits.begin(), digits.end(), [](std::uint8_t d) { return d != 0; });
  std::string out(zeros, '1');
  for (auto it = first; it != digits.end(); ++it) {
    out.push_back(kBase58Alphabet[*it]);
  }
  return out;
}

std::string Cid::ToString() const {
  if (version == 0) {
    return EncodeBase58Btc(bytes);
  }
  return "b" + EncodeBase32Lower(bytes);
}

}  // namespace cr::car
