#include "cr/car/varint.h"

namespace cr::car {

VarintAccumulator::State VarintAccumulator::Push(std::uint8_t byte) noexcept {
  if (state_ != State::kNeedMore) {
    return state_;
  }
  if (length_ == kMaxVarintBytes) {
    state_ = State::kOverlong;
    return state_;
  }
  value_ |= static_cast<std::uint64_t>(byte & 0x7F) << (7 * length_);
  ++length_;
  if ((byte & kVarintContinuation) == 0) {
    state_ = State::kComplete;
  } else if (length_ == kMaxVarintBytes) {
    state_ = State::kOverlong;
  }
  return state_;
}

void VarintAccumulator::Reset() noexcept {
  value_ = 0;
  length_ = 0;
  state_ = State::kNeedMore;
}

VarintStatus DecodeVarint(ByteSpan src, Varint& out) noexcept {
  VarintAccumulator acc;
  for (auto byte : src) {
    switch (acc.Push(byte)) {
    case VarintAccumulator::State::kComplete:
      out.value = acc.value();
      out.length = acc.length();
      return VarintStatus::kOk;
    case VarintAccumulator::State::kOverlong:
      return VarintStatus::kOverlong;
    case VarintAccumulator::State::kNeedMore:
      break;
    }
  }
  return VarintStatus::kTruncated;
}

std::optional<Varint> DecodeVarint(ByteSpan src) noexcept {
  Varint out{};
  if (DecodeVarint(src, out) != VarintStatus::kOk) {
    return std::nullopt;
  }
  return out;
}

std::size_t VarintSize(std::uint64_t value) noexcept {
  std::size_t size = 1;
  while (value >= kVarintContinuation) {
    value >>= 7;
    ++size;
  }
  return size;
}

void AppendVarint(std::uint64_t value, Bytes& out) {
  while (value >= kVarintContinuation) {
    out.push_back(static_cast<std::uint8_t>(value | kVarintContinuation));
    value >>= 7;
  }
  out.push_back(static_cast<std::uint8_t>(value));
}

}  // namespace cr::car
