#include "cr/car/reader.h"

#include <array>
#include <string>
#include <utility>

#include "cr/car/varint.h"
#include "cr/crypto/digest.h"
#include "cr/error.h"
#include "cr/errors.h"

namespace cr::car {

namespace {
[[noreturn]] void ThrowMalformed(int code, std::string_view message, std::uint64_t at) {
  throw MalformedArchiveError(code, std::string(message), {"stream offset " + std::to_string(at)});
}
}  // namespace

CarReader::CarReader(ByteSource& source, ReaderOptions options) noexcept
    : source_(source), options_(options) {}

CarReader::Prefix CarReader::ReadLengthPrefix(Bytes& frame, std::uint64_t& length,
                                              bool at_section_boundary) {
  VarintAccumulator acc;
  std::array<std::uint8_t, 1> byte{};
  while (true) {
    if (source_.Read(byte) == 0) {
      if (!acc.started() && at_section_boundary) {
        return Prefix::kEndOfStream;
      }
      ThrowMalformed(errors::archive::kTruncatedSection, errors::msg::kSectionLengthTruncated,
                     bytes_consumed_);
    }
    ++bytes_consumed_;
    frame.push_back(byte[0]);
    switch (acc.Push(byte[0])) {
    case VarintAccumulator::State::kComplete:
      length = acc.value();
      return Prefix::kLength;
    case VarintAccumulator::State::kOverlong:
      ThrowMalformed(errors::archive::kBadVarint, errors::msg::kVarintOverlong, bytes_consumed_);
    case VarintAccumulator::State::kNeedMore:
      break;
    }
  }
}

void CarReader::ReadBody(Bytes& frame, std::size_t length) {
  const std::size_t prefix_size = frame.size();
  frame.resize(prefix_size + length);
  const std::size_t got = ReadFully(source_, MutableByteSpan(frame).subspan(prefix_size));
  bytes_consumed_ += got;
  if (got != length) {
    ThrowMalformed(errors::archive::kTruncatedSection, errors::msg::kSectionTruncated, bytes_consumed_);
  }
}

const CarHeader& CarReader::ReadHeader() {
  if (header_read_) {
    return header_;
  }
  Bytes frame;
  std::uint64_t length = 0;
  if (ReadLengthPrefix(frame, length, true) != Prefix::kLength || length == 0) {
    ThrowMalformed(errors::archive::kBadHeader, errors::msg::kHeaderTruncated, bytes_consumed_);
  }
  if (length > options_.max_header_size) {
    ThrowMalformed(errors::archive::kSectionTooLarge, errors::msg::kHeaderTooLarge, bytes_consumed_);
  }
  const std::size_t prefix_size = frame.size();
  try {
    ReadBody(frame, static_cast<std::size_t>(length));
  } catch (const MalformedArchiveError&) {
    ThrowMalformed(errors::archive::kBadHeader, errors::msg::kHeaderTruncated, bytes_consumed_);
  }
  header_ = DecodeCarHeader(ByteSpan(frame).subspan(prefix_size));
  header_.frame = std::move(frame);
  header_read_ = true;
  return header_;
}

bool CarReader::Next(Block& block) {
  if (!header_read_) {
    ReadHeader();
  }
  block.frame.clear();
  block.payload_offset = 0;

  std::uint64_t length = 0;
  if (ReadLengthPrefix(block.frame, length, true) == Prefix::kEndOfStream) {
    return false;
  }
  if (length == 0) {
    if (options_.zero_length_section_as_eof) {
      return false;
    }
    ThrowMalformed(errors::archive::kMalformedArchive, errors::msg::kSectionZeroLength, bytes_consumed_);
  }
  if (length > options_.max_section_size) {
    ThrowMalformed(errors::archive::kSectionTooLarge, errors::msg::kSectionTooLarge, bytes_consumed_);
  }
  const std::size_t prefix_size = block.frame.size();
  ReadBody(block.frame, static_cast<std::size_t>(length));

  std::size_t cid_size = 0;
  auto cid = DecodeCid(ByteSpan(block.frame).subspan(prefix_size), cid_size);
  if (!cid) {
    ThrowMalformed(errors::archive::kBadCid, errors::msg::kCidMalformed, bytes_consumed_);
  }
  block.cid = std::move(*cid);
  block.payload_offset = prefix_size + cid_size;
  ++blocks_read_;

  if (options_.verify_digests) {
    VerifyDigest(block);
  }
  return true;
}

void CarReader::VerifyDigest(const Block& block) {
  switch (cr::crypto::VerifyMultihash(block.cid.hash_code, block.cid.digest, block.payload())) {
  case cr::crypto::DigestCheck::kMatch:
    return;
  case cr::crypto::DigestCheck::kUnsupported:
    ++unverified_blocks_;
    return;
  case cr::crypto::DigestCheck::kMismatch:
    throw Error{ErrorDomain::Integrity, errors::integrity::kDigestMismatch,
                std::string(errors::msg::kDigestMismatch), std::nullopt, Retryability::kFatal,
                {block.cid.ToString()}};
  }
}

}  // namespace cr::car
