#pragma once

#include <cstddef>
#include <cstdint>

#include "cr/car/byte_stream.h"
#include "cr/car/cid.h"
#include "cr/car/header.h"
#include "cr/common.h"

namespace cr::car {

struct Block {
  Cid cid{};
  Bytes frame{};               // length prefix, CID and payload exactly as read
  std::size_t payload_offset{0};

  [[nodiscard]] ByteSpan payload() const noexcept {
    return ByteSpan(frame).subspan(payload_offset);
  }
  [[nodiscard]] std::uint64_t codec() const noexcept { return cid.codec; }
};

struct ReaderOptions {
  std::size_t max_header_size{1u << 20};
  std::size_t max_section_size{4u << 20};
  bool zero_length_section_as_eof{true};
  bool verify_digests{false};
};

// Forward-only CARv1 decoder. Consumes exactly the bytes of each element and
// never reads ahead of the section it is returning.
class CarReader {
 public:
  CarReader(ByteSource& source, ReaderOptions options) noexcept;

  CarReader(const CarReader&) = delete;
  CarReader& operator=(const CarReader&) = delete;

  // Must be called once before Next. Throws MalformedArchiveError.
  const CarHeader& ReadHeader();
  // Fills block with the next section; false at end of stream. The block's
  // buffer is reused between calls.
  bool Next(Block& block);

  [[nodiscard]] const CarHeader& header() const noexcept { return header_; }
  [[nodiscard]] std::uint64_t bytes_consumed() const noexcept { return bytes_consumed_; }
  [[nodiscard]] std::uint64_t blocks_read() const noexcept { return blocks_read_; }
  [[nodiscard]] std::uint64_t unverified_blocks() const noexcept { return unverified_blocks_; }

 private:
  enum class Prefix { kEndOfStream, kLength };

  Prefix ReadLengthPrefix(Bytes& frame, std::uint64_t& length, bool at_section_boundary);
  void ReadBody(Bytes& frame, std::size_t length);
  void VerifyDigest(const Block& block);

  ByteSource& source_;
  ReaderOptions options_;
  CarHeader header_{};
  bool header_read_{false};
  std::uint64_t bytes_consumed_{0};
  std::uint64_t blocks_read_{0};
  std::uint64_t unverified_blocks_{0};
};

}  // namespace cr::car
