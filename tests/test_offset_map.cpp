#include "cr/range/offset_map.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "cr/unixfs/node.h"

namespace {

using cr::range::Interval;
using cr::range::OffsetMapBuilder;
using cr::range::PlacementKind;
using cr::unixfs::Node;
using cr::unixfs::NodeKind;
using cr::unixfs::OpaqueLeaf;

Node FileNode(std::vector<uint64_t> sizes, uint64_t inline_size = 0) {
  Node node;
  node.kind = NodeKind::kFile;
  node.link_count = sizes.size();
  node.child_sizes = std::move(sizes);
  node.inline_size = inline_size;
  node.filesize = node.ContentSize();
  return node;
}

Node InlineLeaf(uint64_t size) {
  Node node;
  node.kind = NodeKind::kFile;
  node.inline_size = size;
  node.filesize = size;
  return node;
}

void TestFlatFile() {
  OffsetMapBuilder builder(true);
  auto root = builder.Place(FileNode({10, 20, 30}));
  assert(root.kind == PlacementKind::kStructural);
  assert(root.interval == (Interval{0, 0, false}));
  assert(builder.file_size() == 60u);
  assert(builder.depth() == 1);

  auto a = builder.Place(OpaqueLeaf{10});
  auto b = builder.Place(OpaqueLeaf{20});
  assert(!builder.complete());
  auto c = builder.Place(OpaqueLeaf{30});
  assert(a.interval == (Interval{0, 10, true}));
  assert(b.interval == (Interval{10, 30, true}));
  assert(c.interval == (Interval{30, 60, true}));
  assert(builder.complete());
  assert(builder.depth() == 0);
  assert(builder.cursor() == 60);

  auto extra = builder.Place(OpaqueLeaf{5});
  assert(extra.kind == PlacementKind::kDetached);
  assert(builder.map()->size() == 4);
}

void TestNestedFile() {
  // root -> [inner(40 = 15 + 25), leaf 5]; inner carries 4 inline bytes of its own.
  OffsetMapBuilder builder(true);
  builder.Place(FileNode({44, 5}));
  auto inner = builder.Place(FileNode({15, 25}, 4));
  assert(inner.kind == PlacementKind::kStructural);
  assert(inner.interval == (Interval{0, 4, false}));
  assert(builder.depth() == 2);
  assert(builder.Place(OpaqueLeaf{15}).interval == (Interval{4, 19, true}));
  assert(builder.Place(InlineLeaf(25)).interval == (Interval{19, 44, true}));
  assert(builder.depth() == 1);
  assert(builder.Place(OpaqueLeaf{5}).interval == (Interval{44, 49, true}));
  assert(builder.complete());
  assert(builder.file_size() == 49u);

  const auto& intervals = builder.map()->intervals();
  uint64_t expected_start = 0;
  for (const auto& interval : intervals) {
    assert(interval.start == expected_start);
    expected_start = interval.end;
  }
}

void TestZeroLengthChildren() {
  OffsetMapBuilder builder;
  builder.Place(FileNode({0, 8, 0}));
  auto empty = builder.Place(OpaqueLeaf{0});
  assert(empty.kind == PlacementKind::kLeaf);
  assert(empty.interval == (Interval{0, 0, true}));
  assert(builder.Place(OpaqueLeaf{8}).interval == (Interval{0, 8, true}));
  assert(!builder.complete());
  assert(builder.Place(OpaqueLeaf{0}).interval == (Interval{8, 8, true}));
  assert(builder.complete());
  assert(builder.map() == nullptr);
  assert(builder.last_interval() == (Interval{8, 8, true}));
}

void TestSingleLeafRoot() {
  OffsetMapBuilder builder;
  auto root = builder.Place(InlineLeaf(12));
  assert(root.kind == PlacementKind::kLeaf);
  assert(root.interval == (Interval{0, 12, true}));
  assert(builder.complete());
  assert(builder.file_size() == 12u);
}

void TestRootMustBeFile() {
  OffsetMapBuilder opaque_root;
  auto placement = opaque_root.Place(OpaqueLeaf{100});
  assert(placement.kind == PlacementKind::kMismatch);
  assert(!placement.reason.empty());
  assert(opaque_root.failed());
  assert(opaque_root.Place(OpaqueLeaf{1}).kind == PlacementKind::kMismatch);

  Node directory = FileNode({10});
  directory.kind = NodeKind::kDirectory;
  OffsetMapBuilder dir_root;
  assert(dir_root.Place(directory).kind == PlacementKind::kMismatch);

  Node lying = FileNode({10, 10});
  lying.filesize = 25;
  OffsetMapBuilder lying_root;
  assert(lying_root.Place(lying).kind == PlacementKind::kMismatch);

  Node uneven = FileNode({10, 10});
  uneven.link_count = 3;
  OffsetMapBuilder uneven_root;
  assert(uneven_root.Place(uneven).kind == PlacementKind::kMismatch);
}

void TestMismatchInsideFile() {
  OffsetMapBuilder overshoot;
  overshoot.Place(FileNode({10, 10}));
  assert(overshoot.Place(OpaqueLeaf{11}).kind == PlacementKind::kMismatch);
  assert(overshoot.failed());
  assert(!overshoot.incomplete());

  OffsetMapBuilder wrong_child;
  wrong_child.Place(FileNode({10, 10}));
  assert(wrong_child.Place(FileNode({4, 4})).kind == PlacementKind::kMismatch);

  OffsetMapBuilder symlink_child;
  symlink_child.Place(FileNode({10}));
  Node link;
  link.kind = NodeKind::kSymlink;
  link.inline_size = 10;
  assert(symlink_child.Place(link).kind == PlacementKind::kMismatch);
}

void TestPartialLeavesFillSlot() {
  OffsetMapBuilder builder;
  builder.Place(FileNode({10}));
  assert(builder.Place(OpaqueLeaf{4}).interval == (Interval{0, 4, true}));
  assert(!builder.complete());
  assert(builder.Place(OpaqueLeaf{6}).interval == (Interval{4, 10, true}));
  assert(builder.complete());
}

void TestIncompleteStream() {
  OffsetMapBuilder builder;
  builder.Place(FileNode({10, 10}));
  builder.Place(OpaqueLeaf{10});
  assert(builder.incomplete());
  assert(builder.depth() == 1);
}

}  // namespace

int main() {
  TestFlatFile();
  TestNestedFile();
  TestZeroLengthChildren();
  TestSingleLeafRoot();
  TestRootMustBeFile();
  TestMismatchInsideFile();
  TestPartialLeavesFillSlot();
  TestIncompleteStream();
  std::cout << "offset map tests ok\n";
  return 0;
}
