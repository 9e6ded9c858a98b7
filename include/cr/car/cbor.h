#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "cr/common.h"

namespace cr::car::cbor {

enum class MajorType : std::uint8_t {
  kUnsigned = 0,
  kNegative = 1,
  kBytes = 2,
  kText = 3,
  kArray = 4,
  kMap = 5,
  kTag = 6,
  kSimple = 7
};

struct Head {
  MajorType major{MajorType::kUnsigned};
  std::uint64_t argument{0};
};

inline constexpr std::uint64_t kTagCidLink = 42;

// Strict DAG-CBOR item reader: definite lengths only. Each Read* call leaves
// the cursor untouched on failure.
class Reader {
 public:
  explicit Reader(ByteSpan buffer, std::size_t max_depth = 16) noexcept
      : buffer_(buffer), max_depth_(max_depth) {}

  [[nodiscard]] bool PeekHead(Head& head) const noexcept;
  [[nodiscard]] bool ReadHead(Head& head) noexcept;
  [[nodiscard]] bool ReadUnsigned(std::uint64_t& value) noexcept;
  [[nodiscard]] bool ReadText(std::string_view& text) noexcept;
  [[nodiscard]] bool ReadBytes(ByteSpan& bytes) noexcept;
  [[nodiscard]] bool Skip() noexcept;

  [[nodiscard]] bool at_end() const noexcept { return offset_ == buffer_.size(); }
  [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

 private:
  bool DecodeHeadAt(std::size_t at, Head& head, std::size_t& next) const noexcept;
  bool ReadPayload(MajorType expected, ByteSpan& payload) noexcept;
  bool SkipItem(std::size_t depth) noexcept;

  ByteSpan buffer_;
  std::size_t offset_{0};
  std::size_t max_depth_;
};

}  // namespace cr::car::cbor
