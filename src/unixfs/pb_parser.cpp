#include "cr/unixfs/pb_parser.h"

#include "cr/car/varint.h"

namespace cr::unixfs::pb {

namespace {
constexpr uint32_t kMaxFieldNumber = (1u << 29) - 1;
}  // namespace

Parser::Parser(std::span<const uint8_t> buffer, std::size_t max_fields) {
  std::size_t offset = 0;
  while (offset < buffer.size()) {
    if (fields_.size() >= max_fields) {
      return;
    }

    cr::car::Varint key{};
    if (cr::car::DecodeVarint(buffer.subspan(offset), key) != cr::car::VarintStatus::kOk) {
      return;
    }
    offset += key.length;

    const uint64_t number = key.value >> 3;
    if (number == 0 || number > kMaxFieldNumber) {
      return;
    }
    Field field{};
    field.number = static_cast<uint32_t>(number);
    field.wire = static_cast<WireType>(key.value & 0x7);

    switch (field.wire) {
    case WireType::kVarint: {
      cr::car::Varint value{};
      if (cr::car::DecodeVarint(buffer.subspan(offset), value) != cr::car::VarintStatus::kOk) {
        return;
      }
      field.varint = value.value;
      offset += value.length;
      break;
    }
    case WireType::kFixed64:
    case WireType::kFixed32: {
      const std::size_t width = field.wire == WireType::kFixed64 ? 8 : 4;
      if (buffer.size() - offset < width) {
        return;
      }
      field.bytes = buffer.subspan(offset, width);
      offset += width;
      break;
    }
    case WireType::kLengthDelimited: {
      cr::car::Varint length{};
      if (cr::car::DecodeVarint(buffer.subspan(offset), length) != cr::car::VarintStatus::kOk) {
        return;
      }
      offset += length.length;
      if (length.value > buffer.size() - offset) {
        return;
      }
      field.bytes = buffer.subspan(offset, static_cast<std::size_t>(length.value));
      offset += static_cast<std::size_t>(length.value);
      break;
    }
    default:
      return;
    }
    fields_.push_back(field);
  }

  valid_ = offset == buffer.size();
  consumed_ = offset;
}

bool DecodePackedVarints(std::span<const uint8_t> payload, std::vector<uint64_t>& out) {
  std::size_t offset = 0;
  while (offset < payload.size()) {
    cr::car::Varint value{};
    if (cr::car::DecodeVarint(payload.subspan(offset), value) != cr::car::VarintStatus::kOk) {
      return false;
    }
    out.push_back(value.value);
    offset += value.length;
  }
  return true;
}

}  // namespace cr::unixfs::pb
