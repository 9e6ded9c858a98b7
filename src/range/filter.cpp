#include "cr/range/filter.h"

namespace cr::range {

const char* PhaseName(Phase phase) noexcept {
  switch (phase) {
  case Phase::kAwaitingStructure:
    return "awaiting_structure";
  case Phase::kDiscarding:
    return "discarding";
  case Phase::kEmitting:
    return "emitting";
  case Phase::kSatisfied:
    return "satisfied";
  case Phase::kPassthrough:
    return "passthrough";
  }
  return "unknown";
}

RangeFilter::RangeFilter(uint64_t start, uint64_t end, std::optional<uint64_t> file_size) noexcept
    : start_remaining_(start), end_remaining_(end), end_is_eof_(file_size && *file_size == end) {}

void RangeFilter::Consume(uint64_t length) noexcept {
  start_remaining_ = length >= start_remaining_ ? 0 : start_remaining_ - length;
  end_remaining_ = length >= end_remaining_ ? 0 : end_remaining_ - length;
}

void RangeFilter::OnDagComplete() noexcept {
  if (phase_ != Phase::kPassthrough) {
    phase_ = Phase::kSatisfied;
  }
}

Decision RangeFilter::Decide(const Placement& placement) {
  switch (phase_) {
  case Phase::kPassthrough:
    return Decision::kEmit;
  case Phase::kSatisfied:
    return Decision::kDrop;
  default:
    break;
  }

  switch (placement.kind) {
  case PlacementKind::kMismatch:
    // Blocks already dropped cannot be recalled; forward everything from here.
    late_mismatch_ = phase_ != Phase::kAwaitingStructure;
    phase_ = Phase::kPassthrough;
    return Decision::kEmit;
  case PlacementKind::kDetached:
    return Decision::kDrop;
  case PlacementKind::kStructural:
    return DecideSpan(placement.interval.length(), true);
  case PlacementKind::kLeaf:
    return DecideSpan(placement.interval.length(), false);
  }
  return Decision::kEmit;
}

Decision RangeFilter::DecideSpan(uint64_t length, bool structural) {
  Decision decision = Decision::kEmit;
  if (phase_ == Phase::kAwaitingStructure || phase_ == Phase::kDiscarding) {
    if (start_remaining_ > 0 && length <= start_remaining_) {
      // Entirely before the range start.
      if (!structural) {
        phase_ = Phase::kDiscarding;
        decision = Decision::kDrop;
      }
      Consume(length);
      return decision;
    }
    if (structural && length == 0) {
      return decision;
    }
    phase_ = Phase::kEmitting;
  }
  if (!end_is_eof_ && length >= end_remaining_) {
    phase_ = Phase::kSatisfied;
  }
  Consume(length);
  return decision;
}

}  // namespace cr::range
