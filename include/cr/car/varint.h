#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "cr/common.h"

namespace cr::car {

// Unsigned LEB128 as used by multiformats: at most nine bytes, 63 bits.
inline constexpr std::size_t kMaxVarintBytes = 9;
inline constexpr std::uint8_t kVarintContinuation = 0x80;

struct Varint {
  std::uint64_t value{0};
  std::size_t length{0};
};

enum class VarintStatus { kOk, kTruncated, kOverlong };

[[nodiscard]] VarintStatus DecodeVarint(ByteSpan src, Varint& out) noexcept;
[[nodiscard]] std::optional<Varint> DecodeVarint(ByteSpan src) noexcept;
[[nodiscard]] std::size_t VarintSize(std::uint64_t value) noexcept;
void AppendVarint(std::uint64_t value, Bytes& out);

// Byte-at-a-time decoder for length prefixes read straight off a stream.
class VarintAccumulator {
 public:
  enum class State { kNeedMore, kComplete, kOverlong };

  State Push(std::uint8_t byte) noexcept;
  void Reset() noexcept;

  [[nodiscard]] std::uint64_t value() const noexcept { return value_; }
  [[nodiscard]] std::size_t length() const noexcept { return length_; }
  [[nodiscard]] bool started() const noexcept { return length_ != 0; }

 private:
  std::uint64_t value_{0};
  std::size_t length_{0};
  State state_{State::kNeedMore};
};

}  // namespace cr::car
