#include "cr/car/cbor.h"

namespace cr::car::cbor {

namespace {
constexpr std::uint8_t kAdditionalMask = 0x1F;
}  // namespace

bool Reader::DecodeHeadAt(std::size_t at, Head& head, std::size_t& next) const noexcept {
  if (at >= buffer_.size()) {
    return false;
  }
  const std::uint8_t initial = buffer_[at];
  head.major = static_cast<MajorType>(initial >> 5);
  const std::uint8_t additional = initial & kAdditionalMask;
  std::size_t extra = 0;
  if (additional < 24) {
    head.argument = additional;
  } else if (additional <= 27) {
    extra = std::size_t{1} << (additional - 24);
  } else {
    // Reserved values and indefinite lengths are not valid DAG-CBOR.
    return false;
  }
  if (buffer_.size() - at - 1 < extra) {
    return false;
  }
  if (extra != 0) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < extra; ++i) {
      value = (value << 8) | buffer_[at + 1 + i];
    }
    head.argument = value;
  }
  next = at + 1 + extra;
  return true;
}

bool Reader::PeekHead(Head& head) const noexcept {
  std::size_t next = 0;
  return DecodeHeadAt(offset_, head, next);
}

bool Reader::ReadHead(Head& head) noexcept {
  std::size_t next = 0;
  if (!DecodeHeadAt(offset_, head, next)) {
    return false;
  }
  offset_ = next;
  return true;
}

bool Reader::ReadUnsigned(std::uint64_t& value) noexcept {
  Head head{};
  std::size_t next = 0;
  if (!DecodeHeadAt(offset_, head, next) || head.major != MajorType::kUnsigned) {
    return false;
  }
  value = head.argument;
  offset_ = next;
  return true;
}

bool Reader::ReadPayload(MajorType expected, ByteSpan& payload) noexcept {
  Head head{};
  std::size_t next = 0;
  if (!DecodeHeadAt(offset_, head, next) || head.major != expected) {
    return false;
  }
  if (head.argument > buffer_.size() - next) {
    return false;
  }
  payload = buffer_.subspan(next, static_cast<std::size_t>(head.argument));
  offset_ = next + static_cast<std::size_t>(head.argument);
  return true;
}

bool Reader::ReadText(std::string_view& text) noexcept {
  ByteSpan payload{};
  if (!ReadPayload(MajorType::kText, payload)) {
    return false;
  }
  text = AsStringView(payload);
  return true;
}

bool Reader::ReadBytes(ByteSpan& bytes) noexcept {
  return ReadPayload(MajorType::kBytes, bytes);
}

bool Reader::Skip() noexcept {
  const std::size_t saved = offset_;
  if (!SkipItem(0)) {
    offset_ = saved;
    return false;
  }
  return true;
}

bool Reader::SkipItem(std::size_t depth) noexcept {
  if (depth > max_depth_) {
    return false;
  }
  Head head{};
  if (!ReadHead(head)) {
    return false;
  }
  switch (head.major) {
  case MajorType::kUnsigned:
  case MajorType::kNegative:
  case MajorType::kSimple:
    return true;
  case MajorType::kBytes:
  case MajorType::kText:
    if (head.argument > buffer_.size() - offset_) {
      return false;
    }
    offset_ += static_cast<std::size_t>(head.argument);
    return true;
  case MajorType::kArray:
    for (std::uint64_t i = 0; i < head.argument; ++i) {
      if (!SkipItem(depth + 1)) {
        return false;
      }
    }
    return true;
  case MajorType::kMap:
    for (std::uint64_t i = 0; i < head.argument; ++i) {
      if (!SkipItem(depth + 1) || !SkipItem(depth + 1)) {
        return false;
      }
    }
    return true;
  case MajorType::kTag:
    return SkipItem(depth + 1);
  }
  return false;
}

}  // namespace cr::car::cbor
