#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "cr/car/reader.h"
#include "cr/common.h"

namespace cr::unixfs {

// Values of the UnixFS Data.Type enum.
enum class NodeKind : uint8_t {
  kRaw = 0,
  kDirectory = 1,
  kFile = 2,
  kMetadata = 3,
  kSymlink = 4,
  kHamtShard = 5
};

const char* NodeKindName(NodeKind kind) noexcept;

struct Node {
  NodeKind kind{NodeKind::kRaw};
  std::vector<uint64_t> child_sizes{};  // blocksizes, one per link in link order
  std::size_t link_count{0};
  uint64_t inline_size{0};               // length of the inline Data bytes
  std::optional<uint64_t> filesize{};

  // Files and raw nodes without links carry their bytes inline.
  [[nodiscard]] bool IsInlineLeaf() const noexcept {
    return link_count == 0 && (kind == NodeKind::kFile || kind == NodeKind::kRaw);
  }
  [[nodiscard]] bool SizesMatchLinks() const noexcept { return child_sizes.size() == link_count; }
  // Bytes of the virtual file this node spans according to its own metadata.
  [[nodiscard]] uint64_t ContentSize() const noexcept;
  [[nodiscard]] uint64_t DeclaredSize() const noexcept { return filesize.value_or(ContentSize()); }
};

// A block carrying no size metadata; its payload is file data.
struct OpaqueLeaf {
  uint64_t size{0};
};

using Classification = std::variant<Node, OpaqueLeaf>;

// Decodes a dag-pb payload holding UnixFS Data. Read-only: the payload is not
// modified. Empty result when the payload is not a UnixFS node.
std::optional<Node> DecodeDagPbNode(ByteSpan payload);

// Pure classification of a block. Never throws for payload content; blocks
// that fail to decode degrade to OpaqueLeaf.
Classification Classify(const cr::car::Block& block);

}  // namespace cr::unixfs
