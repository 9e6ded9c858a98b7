#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cr/unixfs/node.h"

namespace cr::range {

// Half-open interval of the virtual file covered by one block. Structural
// nodes are recorded with is_data == false and span only their inline bytes.
struct Interval {
  uint64_t start{0};
  uint64_t end{0};
  bool is_data{false};

  [[nodiscard]] uint64_t length() const noexcept { return end - start; }
  friend bool operator==(const Interval&, const Interval&) = default;
};

// Append-only record of intervals in stream order.
class OffsetMap {
 public:
  void Append(const Interval& interval) { intervals_.push_back(interval); }

  [[nodiscard]] const std::vector<Interval>& intervals() const noexcept { return intervals_; }
  [[nodiscard]] std::size_t size() const noexcept { return intervals_.size(); }
  [[nodiscard]] bool empty() const noexcept { return intervals_.empty(); }

 private:
  std::vector<Interval> intervals_{};
};

enum class PlacementKind : uint8_t {
  kStructural,  // interior node; always needed for verification
  kLeaf,        // carries file bytes
  kMismatch,    // stream disagrees with the DAG metadata seen so far
  kDetached     // arrived after the file DAG was complete
};

struct Placement {
  PlacementKind kind{PlacementKind::kDetached};
  Interval interval{};
  std::string reason{};  // set for kMismatch
};

// Assigns file intervals to classified blocks arriving in preorder. State is an
// explicit stack of frames, one per open File node, so memory is bounded by DAG
// depth rather than block count.
class OffsetMapBuilder {
 public:
  explicit OffsetMapBuilder(bool retain_map = false) noexcept : retain_map_(retain_map) {}

  Placement Place(const cr::unixfs::Classification& block);

  [[nodiscard]] bool started() const noexcept { return started_; }
  [[nodiscard]] bool complete() const noexcept { return complete_; }
  [[nodiscard]] bool failed() const noexcept { return failed_; }
  // True when the stream ended while frames were still open.
  [[nodiscard]] bool incomplete() const noexcept { return started_ && !complete_ && !failed_; }

  [[nodiscard]] uint64_t cursor() const noexcept { return cursor_; }
  [[nodiscard]] std::optional<uint64_t> file_size() const noexcept { return file_size_; }
  [[nodiscard]] std::size_t depth() const noexcept { return frames_.size(); }
  [[nodiscard]] const std::optional<Interval>& last_interval() const noexcept { return last_; }
  // Null unless the builder was created with retain_map.
  [[nodiscard]] const OffsetMap* map() const noexcept { return retain_map_ ? &map_ : nullptr; }

 private:
  struct Frame {
    std::vector<uint64_t> child_sizes;
    std::size_t child_index{0};
    uint64_t consumed_in_child{0};
  };

  Placement PlaceRoot(const cr::unixfs::Classification& block);
  Placement PlaceInFrame(const cr::unixfs::Classification& block);
  Placement Record(PlacementKind kind, uint64_t length);
  Placement Fail(std::string reason);
  bool CloseSlot();

  std::vector<Frame> frames_{};
  uint64_t cursor_{0};
  std::optional<uint64_t> file_size_{};
  std::optional<Interval> last_{};
  OffsetMap map_{};
  std::string failure_{};
  bool retain_map_{false};
  bool started_{false};
  bool complete_{false};
  bool failed_{false};
};

}  // namespace cr::range
