#include "cr/range/offset_map.h"

#include <utility>
#include <variant>

#include "cr/common.h"

namespace cr::range {

using cr::unixfs::Node;
using cr::unixfs::NodeKind;
using cr::unixfs::OpaqueLeaf;

Placement OffsetMapBuilder::Place(const cr::unixfs::Classification& block) {
  if (failed_) {
    return Placement{PlacementKind::kMismatch, Interval{cursor_, cursor_, false}, failure_};
  }
  if (complete_) {
    return Placement{PlacementKind::kDetached, Interval{cursor_, cursor_, false}, {}};
  }
  if (!started_) {
    started_ = true;
    return PlaceRoot(block);
  }
  return PlaceInFrame(block);
}

Placement OffsetMapBuilder::PlaceRoot(const cr::unixfs::Classification& block) {
  const auto* node = std::get_if<Node>(&block);
  if (node == nullptr || node->kind != NodeKind::kFile) {
    return Fail("root block is not a UnixFS file");
  }
  if (!node->SizesMatchLinks()) {
    return Fail("root blocksizes count differs from link count");
  }
  const uint64_t content = node->ContentSize();
  if (node->filesize && *node->filesize != content) {
    return Fail("root filesize differs from the sum of its parts");
  }
  file_size_ = content;
  if (node->link_count == 0) {
    auto placement = Record(PlacementKind::kLeaf, node->inline_size);
    complete_ = true;
    return placement;
  }
  frames_.push_back(Frame{node->child_sizes});
  return Record(PlacementKind::kStructural, node->inline_size);
}

Placement OffsetMapBuilder::PlaceInFrame(const cr::unixfs::Classification& block) {
  Frame& frame = frames_.back();
  const uint64_t slot = frame.child_sizes[frame.child_index];
  const uint64_t remaining = slot - frame.consumed_in_child;

  uint64_t leaf_size = 0;
  if (const auto* node = std::get_if<Node>(&block)) {
    if (node->IsInlineLeaf()) {
      leaf_size = node->inline_size;
    } else {
      if (node->kind != NodeKind::kFile) {
        return Fail(std::string("unexpected ") + cr::unixfs::NodeKindName(node->kind) +
                    " node inside file");
      }
      if (!node->SizesMatchLinks()) {
        return Fail("blocksizes count differs from link count");
      }
      const uint64_t content = node->ContentSize();
      if (content != remaining || (node->filesize && *node->filesize != content)) {
        return Fail("child node size disagrees with parent blocksizes");
      }
      // The new frame owns the rest of the parent slot; popping it closes the slot.
      frames_.push_back(Frame{node->child_sizes});
      return Record(PlacementKind::kStructural, node->inline_size);
    }
  } else {
    leaf_size = std::get<OpaqueLeaf>(block).size;
  }

  if (leaf_size > remaining) {
    return Fail("leaf overruns its parent slot");
  }
  frame.consumed_in_child += leaf_size;
  auto placement = Record(PlacementKind::kLeaf, leaf_size);
  if (frame.consumed_in_child == slot && !CloseSlot()) {
    return Fail("file ended at offset " + std::to_string(cursor_) + ", declared size " +
                std::to_string(file_size_.value_or(0)));
  }
  return placement;
}

bool OffsetMapBuilder::CloseSlot() {
  while (!frames_.empty()) {
    Frame& top = frames_.back();
    ++top.child_index;
    top.consumed_in_child = 0;
    if (top.child_index < top.child_sizes.size()) {
      return true;
    }
    frames_.pop_back();
  }
  complete_ = true;
  return cursor_ == file_size_.value_or(0);
}

Placement OffsetMapBuilder::Record(PlacementKind kind, uint64_t length) {
  const Interval interval{cursor_, SaturatingAdd(cursor_, length), kind == PlacementKind::kLeaf};
  cursor_ = interval.end;
  last_ = interval;
  if (retain_map_) {
    map_.Append(interval);
  }
  return Placement{kind, interval, {}};
}

Placement OffsetMapBuilder::Fail(std::string reason) {
  failed_ = true;
  complete_ = false;
  frames_.clear();
  failure_ = std::move(reason);
  return Placement{PlacementKind::kMismatch, Interval{cursor_, cursor_, false}, failure_};
}

}  // namespace cr::range
