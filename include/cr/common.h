#pragma once
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cr {

using ByteSpan = std::span<const std::uint8_t>;
using MutableByteSpan = std::span<std::uint8_t>;
using Bytes = std::vector<std::uint8_t>;

inline ByteSpan AsByteSpan(std::string_view text) noexcept {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

inline std::string_view AsStringView(ByteSpan bytes) noexcept {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline std::string HexEncode(ByteSpan data) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (auto byte : data) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

// Saturating add for byte counters that must never wrap.
inline constexpr std::uint64_t SaturatingAdd(std::uint64_t a, std::uint64_t b) noexcept {
  return (a > UINT64_MAX - b) ? UINT64_MAX : a + b;
}

} // namespace cr
