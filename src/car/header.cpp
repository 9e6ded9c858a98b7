#include "cr/car/header.h"

#include <string>
#include <string_view>
#include <utility>

#include "cr/car/cbor.h"
#include "cr/error.h"
#include "cr/errors.h"

namespace cr::car {

namespace {
constexpr std::string_view kRootsKey{"roots"};
constexpr std::string_view kVersionKey{"version"};
constexpr std::uint8_t kMultibaseIdentityPrefix = 0x00;

[[noreturn]] void ThrowHeaderError(std::string_view message, int code = errors::archive::kBadHeader) {
  throw MalformedArchiveError(code, std::string(message));
}

Cid ReadRoot(cbor::Reader& reader) {
  cbor::Head tag{};
  if (!reader.ReadHead(tag) || tag.major != cbor::MajorType::kTag || tag.argument != cbor::kTagCidLink) {
    ThrowHeaderError(errors::msg::kHeaderBadRoot);
  }
  ByteSpan link{};
  if (!reader.ReadBytes(link) || link.empty() || link[0] != kMultibaseIdentityPrefix) {
    ThrowHeaderError(errors::msg::kHeaderBadRoot);
  }
  const ByteSpan encoded = link.subspan(1);
  std::size_t consumed = 0;
  auto cid = DecodeCid(encoded, consumed);
  if (!cid || consumed != encoded.size()) {
    ThrowHeaderError(errors::msg::kHeaderBadRoot, errors::archive::kBadCid);
  }
  return std::move(*cid);
}

void AppendHead(cbor::MajorType major, std::uint64_t argument, Bytes& out) {
  const auto initial = static_cast<std::uint8_t>(static_cast<std::uint8_t>(major) << 5);
  if (argument < 24) {
    out.push_back(static_cast<std::uint8_t>(initial | argument));
    return;
  }
  std::size_t width = 8;
  std::uint8_t additional = 27;
  if (argument <= 0xFF) {
    width = 1;
    additional = 24;
  } else if (argument <= 0xFFFF) {
    width = 2;
    additional = 25;
  } else if (argument <= 0xFFFFFFFFull) {
    width = 4;
    additional = 26;
  }
  out.push_back(static_cast<std::uint8_t>(initial | additional));
  for (std::size_t i = width; i > 0; --i) {
    out.push_back(static_cast<std::uint8_t>(argument >> (8 * (i - 1))));
  }
}

void AppendText(std::string_view text, Bytes& out) {
  AppendHead(cbor::MajorType::kText, text.size(), out);
  out.insert(out.end(), text.begin(), text.end());
}
}  // namespace

CarHeader DecodeCarHeader(ByteSpan body) {
  cbor::Reader reader(body);
  cbor::Head map{};
  if (!reader.ReadHead(map) || map.major != cbor::MajorType::kMap) {
    ThrowHeaderError(errors::msg::kHeaderNotCbor);
  }

  CarHeader header{};
  bool have_version = false;
  bool have_roots = false;
  for (std::uint64_t i = 0; i < map.argument; ++i) {
    std::string_view key;
    if (!reader.ReadText(key)) {
      ThrowHeaderError(errors::msg::kHeaderNotCbor);
    }
    if (key == kVersionKey) {
      if (!reader.ReadUnsigned(header.version)) {
        ThrowHeaderError(errors::msg::kHeaderMissingVersion);
      }
      have_version = true;
    } else if (key == kRootsKey) {
      cbor::Head roots{};
      if (!reader.ReadHead(roots) || roots.major != cbor::MajorType::kArray) {
        ThrowHeaderError(errors::msg::kHeaderMissingRoots);
      }
      for (std::uint64_t r = 0; r < roots.argument; ++r) {
        header.roots.push_back(ReadRoot(reader));
      }
      have_roots = true;
    } else if (!reader.Skip()) {
      ThrowHeaderError(errors::msg::kHeaderNotCbor);
    }
  }
  if (!reader.at_end()) {
    ThrowHeaderError(errors::msg::kHeaderNotCbor);
  }
  if (!have_version) {
    ThrowHeaderError(errors::msg::kHeaderMissingVersion);
  }
  if (header.version != kCarVersion1) {
    ThrowHeaderError(errors::msg::kHeaderUnsupportedVersion, errors::archive::kUnsupportedVersion);
  }
  if (!have_roots || header.roots.empty()) {
    ThrowHeaderError(errors::msg::kHeaderMissingRoots);
  }
  return header;
}

Bytes EncodeCarHeaderBody(const std::vector<Cid>& roots, std::uint64_t version) {
  Bytes out;
  AppendHead(cbor::MajorType::kMap, 2, out);
  AppendText(kRootsKey, out);
  AppendHead(cbor::MajorType::kArray, roots.size(), out);
  for (const auto& root : roots) {
    AppendHead(cbor::MajorType::kTag, cbor::kTagCidLink, out);
    AppendHead(cbor::MajorType::kBytes, root.bytes.size() + 1, out);
    out.push_back(kMultibaseIdentityPrefix);
    out.insert(out.end(), root.bytes.begin(), root.bytes.end());
  }
  AppendText(kVersionKey, out);
  AppendHead(cbor::MajorType::kUnsigned, version, out);
  return out;
}

}  // namespace cr::car
