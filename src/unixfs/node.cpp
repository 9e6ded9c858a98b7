#include "cr/unixfs/node.h"

#include <span>
#include <utility>

#include "cr/unixfs/pb_parser.h"

namespace cr::unixfs {

namespace {
// dag-pb PBNode / PBLink
constexpr uint32_t kPbNodeData = 1;
constexpr uint32_t kPbNodeLinks = 2;
constexpr uint32_t kPbLinkHash = 1;

// UnixFS Data
constexpr uint32_t kDataType = 1;
constexpr uint32_t kDataData = 2;
constexpr uint32_t kDataFilesize = 3;
constexpr uint32_t kDataBlocksizes = 4;

constexpr uint64_t kMaxNodeKind = static_cast<uint64_t>(NodeKind::kHamtShard);

bool ValidLink(std::span<const uint8_t> link) {
  pb::Parser parser(link);
  if (!parser.valid()) {
    return false;
  }
  for (const auto& field : parser) {
    if (field.number == kPbLinkHash && field.wire == pb::WireType::kLengthDelimited) {
      return true;
    }
  }
  return false;
}

bool DecodeUnixfsData(std::span<const uint8_t> data, Node& node) {
  pb::Parser parser(data);
  if (!parser.valid()) {
    return false;
  }
  bool have_type = false;
  for (const auto& field : parser) {
    switch (field.number) {
    case kDataType:
      if (field.wire != pb::WireType::kVarint || field.varint > kMaxNodeKind) {
        return false;
      }
      node.kind = static_cast<NodeKind>(field.varint);
      have_type = true;
      break;
    case kDataData:
      if (field.wire != pb::WireType::kLengthDelimited) {
        return false;
      }
      node.inline_size = field.bytes.size();
      break;
    case kDataFilesize:
      if (field.wire != pb::WireType::kVarint) {
        return false;
      }
      node.filesize = field.varint;
      break;
    case kDataBlocksizes:
      if (field.wire == pb::WireType::kVarint) {
        node.child_sizes.push_back(field.varint);
      } else if (field.wire != pb::WireType::kLengthDelimited ||
                 !pb::DecodePackedVarints(field.bytes, node.child_sizes)) {
        return false;
      }
      break;
    default:
      // hashType, fanout, mode and mtime carry no size information.
      break;
    }
  }
  return have_type;
}

}  // namespace

const char* NodeKindName(NodeKind kind) noexcept {
  switch (kind) {
  case NodeKind::kRaw:
    return "raw";
  case NodeKind::kDirectory:
    return "directory";
  case NodeKind::kFile:
    return "file";
  case NodeKind::kMetadata:
    return "metadata";
  case NodeKind::kSymlink:
    return "symlink";
  case NodeKind::kHamtShard:
    return "hamt-shard";
  }
  return "unknown";
}

uint64_t Node::ContentSize() const noexcept {
  uint64_t total = inline_size;
  for (auto size : child_sizes) {
    total = SaturatingAdd(total, size);
  }
  return total;
}

std::optional<Node> DecodeDagPbNode(ByteSpan payload) {
  pb::Parser parser(payload);
  if (!parser.valid()) {
    return std::nullopt;
  }
  Node node{};
  bool have_data = false;
  for (const auto& field : parser) {
    if (field.wire != pb::WireType::kLengthDelimited) {
      return std::nullopt;
    }
    if (field.number == kPbNodeLinks) {
      if (!ValidLink(field.bytes)) {
        return std::nullopt;
      }
      ++node.link_count;
    } else if (field.number == kPbNodeData) {
      if (!DecodeUnixfsData(field.bytes, node)) {
        return std::nullopt;
      }
      have_data = true;
    } else {
      return std::nullopt;
    }
  }
  if (!have_data) {
    return std::nullopt;
  }
  return node;
}

Classification Classify(const cr::car::Block& block) {
  const ByteSpan payload = block.payload();
  if (block.cid.tag() == cr::car::CodecTag::kDagPb) {
    if (auto node = DecodeDagPbNode(payload)) {
      return std::move(*node);
    }
  }
  return OpaqueLeaf{payload.size()};
}

}  // namespace cr::unixfs
