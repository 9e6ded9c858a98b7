#pragma once

#include <cstdint>
#include <vector>

#include "cr/car/cid.h"
#include "cr/common.h"

namespace cr::car {

inline constexpr std::uint64_t kCarVersion1 = 1;

struct CarHeader {
  std::uint64_t version{0};
  std::vector<Cid> roots{};
  Bytes frame{};  // length prefix and DAG-CBOR body exactly as read
};

// Decodes the DAG-CBOR body {roots: [CID...], version: 1}. Unknown keys are
// skipped. Throws MalformedArchiveError.
CarHeader DecodeCarHeader(ByteSpan body);

// Inverse of DecodeCarHeader, used by fixtures and the listing tool.
Bytes EncodeCarHeaderBody(const std::vector<Cid>& roots, std::uint64_t version = kCarVersion1);

}  // namespace cr::car
