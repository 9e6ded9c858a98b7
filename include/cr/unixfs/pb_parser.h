#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace cr::unixfs::pb {

enum class WireType : uint8_t { kVarint = 0, kFixed64 = 1, kLengthDelimited = 2, kFixed32 = 5 };

struct Field {
  uint32_t number{0};
  WireType wire{WireType::kVarint};
  uint64_t varint{0};               // kVarint value
  std::span<const uint8_t> bytes{}; // kLengthDelimited payload or raw fixed-width bytes
};

// Splits a protobuf message into its top-level fields without a schema.
// Group wire types and truncated fields mark the message invalid.
class Parser {
 public:
  explicit Parser(std::span<const uint8_t> buffer, std::size_t max_fields = 64 * 1024);

  [[nodiscard]] bool valid() const noexcept { return valid_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }

  [[nodiscard]] auto begin() const noexcept { return fields_.begin(); }
  [[nodiscard]] auto end() const noexcept { return fields_.end(); }

 private:
  bool valid_{false};
  std::size_t consumed_{0};
  std::vector<Field> fields_{};
};

// Decodes a packed repeated varint payload. Returns false on a malformed entry.
bool DecodePackedVarints(std::span<const uint8_t> payload, std::vector<uint64_t>& out);

}  // namespace cr::unixfs::pb
