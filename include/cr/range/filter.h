#pragma once

#include <cstdint>
#include <optional>

#include "cr/range/offset_map.h"

namespace cr::range {

enum class Phase : uint8_t {
  kAwaitingStructure,
  kDiscarding,
  kEmitting,
  kSatisfied,
  kPassthrough
};

const char* PhaseName(Phase phase) noexcept;

enum class Decision : uint8_t { kEmit, kDrop };

// Keep/discard state machine for a resolved range [start, end). The two
// counters hold the bytes still to be seen before the range start and range
// end; each placement decrements them by its length. When the range end is
// the end of the file, only DAG completion satisfies the filter so that
// trailing zero-length children are still emitted.
class RangeFilter {
 public:
  RangeFilter(uint64_t start, uint64_t end,
              std::optional<uint64_t> file_size = std::nullopt) noexcept;

  Decision Decide(const Placement& placement);
  // Root is not a file: every block is forwarded and early exit is disabled.
  void EnterPassthrough() noexcept { phase_ = Phase::kPassthrough; }
  // No further file bytes can arrive once the DAG is complete.
  void OnDagComplete() noexcept;

  [[nodiscard]] Phase phase() const noexcept { return phase_; }
  [[nodiscard]] bool satisfied() const noexcept { return phase_ == Phase::kSatisfied; }
  [[nodiscard]] bool early_exit_enabled() const noexcept { return phase_ != Phase::kPassthrough; }
  [[nodiscard]] bool late_mismatch() const noexcept { return late_mismatch_; }
  [[nodiscard]] uint64_t start_remaining() const noexcept { return start_remaining_; }
  [[nodiscard]] uint64_t end_remaining() const noexcept { return end_remaining_; }

 private:
  Decision DecideSpan(uint64_t length, bool structural);
  void Consume(uint64_t length) noexcept;

  uint64_t start_remaining_;
  uint64_t end_remaining_;
  bool end_is_eof_;
  Phase phase_{Phase::kAwaitingStructure};
  bool late_mismatch_{false};
};

}  // namespace cr::range
