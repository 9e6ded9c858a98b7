#pragma once

#include <cstdint>

#include "cr/car/byte_stream.h"
#include "cr/car/header.h"
#include "cr/car/reader.h"

namespace cr::car {

// Re-emits header and blocks with their original framing. Nothing is
// re-encoded, so the output verifies against the same CIDs as the input.
class CarWriter {
 public:
  explicit CarWriter(ByteSink& sink) noexcept : sink_(sink) {}

  CarWriter(const CarWriter&) = delete;
  CarWriter& operator=(const CarWriter&) = delete;

  void WriteHeader(const CarHeader& header);
  void WriteBlock(const Block& block);
  void Flush();

  [[nodiscard]] bool header_written() const noexcept { return header_written_; }
  [[nodiscard]] uint64_t bytes_written() const noexcept { return bytes_written_; }
  [[nodiscard]] uint64_t blocks_written() const noexcept { return blocks_written_; }

 private:
  void Emit(ByteSpan bytes);

  ByteSink& sink_;
  bool header_written_{false};
  uint64_t bytes_written_{0};
  uint64_t blocks_written_{0};
};

}  // namespace cr::car
