#include "cr/car/cid.h"
#include "cr/car/varint.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "car_builder.h"

namespace {

void TestVarintBoundaries() {
  const std::array<uint8_t, 1> zero{0x00};
  auto v = cr::car::DecodeVarint(cr::ByteSpan(zero));
  assert(v && v->value == 0 && v->length == 1);

  const std::array<uint8_t, 2> three_hundred{0xAC, 0x02};
  v = cr::car::DecodeVarint(cr::ByteSpan(three_hundred));
  assert(v && v->value == 300 && v->length == 2);

  cr::Bytes encoded;
  cr::car::AppendVarint(0x7FFFFFFFFFFFFFFFull, encoded);
  assert(encoded.size() == cr::car::kMaxVarintBytes);
  assert(cr::car::VarintSize(0x7FFFFFFFFFFFFFFFull) == 9);
  v = cr::car::DecodeVarint(cr::ByteSpan(encoded));
  assert(v && v->value == 0x7FFFFFFFFFFFFFFFull);

  const std::array<uint8_t, 2> truncated{0x80, 0x80};
  cr::car::Varint out{};
  assert(cr::car::DecodeVarint(cr::ByteSpan(truncated), out) == cr::car::VarintStatus::kTruncated);

  std::array<uint8_t, 10> overlong{};
  overlong.fill(0xFF);
  overlong.back() = 0x01;
  assert(cr::car::DecodeVarint(cr::ByteSpan(overlong), out) == cr::car::VarintStatus::kOverlong);
}

void TestAccumulator() {
  cr::car::VarintAccumulator acc;
  assert(!acc.started());
  assert(acc.Push(0xAC) == cr::car::VarintAccumulator::State::kNeedMore);
  assert(acc.started());
  assert(acc.Push(0x02) == cr::car::VarintAccumulator::State::kComplete);
  assert(acc.value() == 300 && acc.length() == 2);
  acc.Reset();
  for (size_t i = 0; i + 1 < cr::car::kMaxVarintBytes; ++i) {
    assert(acc.Push(0x80) == cr::car::VarintAccumulator::State::kNeedMore);
  }
  assert(acc.Push(0x80) == cr::car::VarintAccumulator::State::kOverlong);
}

void TestCidV0() {
  const auto bytes = cr::testing::FromHex(
      "122046d44814b9c5af141c3aaab7c05dc5e844ead5f91f12858b021eba45768b4c0e");
  size_t consumed = 0;
  auto cid = cr::car::DecodeCid(cr::ByteSpan(bytes), consumed);
  assert(cid.has_value());
  assert(consumed == 34);
  assert(cid->version == 0);
  assert(cid->tag() == cr::car::CodecTag::kDagPb);
  assert(cid->digest.size() == 32);
  assert(cid->ToString() == "QmT78zSuBmuS4z925WZfrqQ1qHaJ56DQaTfyMUF7F8ff5o");
}

void TestCidV1() {
  const auto bytes = cr::testing::FromHex(
      "01711220151fe9e73c6267a7060c6f6c4cca943c236f4b196723489608edb42a8b8fa80bff");
  size_t consumed = 0;
  auto cid = cr::car::DecodeCid(cr::ByteSpan(bytes), consumed);
  assert(cid.has_value());
  assert(consumed == bytes.size() - 1);
  assert(cid->version == 1);
  assert(cid->codec == cr::car::codec::kDagCbor);
  assert(cid->hash_code == cr::car::multihash::kSha2_256);
  assert(cid->ToString() == "bafyreiavd7u6opdcm6tqmddpnrgmvfb4enxuwglhenejmchnwqvixd5ibm");

  const auto identity = cr::car::MakeCid(1, cr::car::codec::kRaw, cr::car::multihash::kIdentity,
                                         cr::ByteSpan{});
  assert(identity.bytes == (cr::Bytes{0x01, 0x55, 0x00, 0x00}));
  assert(identity.ToString() == "bafkqaaa");
  assert(std::string(cr::car::CodecName(identity.codec)) == "raw");
}

void TestCidRejects() {
  size_t consumed = 0;
  const cr::Bytes v2{0x02, 0x55, 0x12, 0x00};
  assert(!cr::car::DecodeCid(cr::ByteSpan(v2), consumed));
  const cr::Bytes short_digest{0x01, 0x55, 0x12, 0x20, 0xAA};
  assert(!cr::car::DecodeCid(cr::ByteSpan(short_digest), consumed));
  assert(!cr::car::DecodeCid(cr::ByteSpan{}, consumed));
  assert(consumed == 0);
}

}  // namespace

int main() {
  TestVarintBoundaries();
  TestAccumulator();
  TestCidV0();
  TestCidV1();
  TestCidRejects();
  std::cout << "varint and cid tests ok\n";
  return 0;
}
