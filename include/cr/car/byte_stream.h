#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>

#include "cr/common.h"

namespace cr::car {

// Forward-only upstream byte stream. Read blocks until at least one byte is
// available and returns 0 only at end of stream.
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  virtual std::size_t Read(MutableByteSpan out) = 0;
  // Aborts the upstream transfer. Further reads return 0.
  virtual void Close() noexcept = 0;
  [[nodiscard]] virtual bool closed() const noexcept = 0;
};

class ByteSink {
 public:
  virtual ~ByteSink() = default;

  virtual void Write(ByteSpan bytes) = 0;
  virtual void Flush() {}
};

// Loops over short reads; returns fewer than out.size() bytes only at EOF.
std::size_t ReadFully(ByteSource& source, MutableByteSpan out);

class MemorySource final : public ByteSource {
 public:
  // max_chunk caps each Read to simulate a network source delivering partial buffers.
  explicit MemorySource(ByteSpan data, std::size_t max_chunk = 0) noexcept
      : data_(data), max_chunk_(max_chunk) {}

  std::size_t Read(MutableByteSpan out) override;
  void Close() noexcept override { closed_ = true; }
  [[nodiscard]] bool closed() const noexcept override { return closed_; }

  [[nodiscard]] std::size_t position() const noexcept { return offset_; }
  [[nodiscard]] std::size_t read_calls() const noexcept { return read_calls_; }

 private:
  ByteSpan data_;
  std::size_t max_chunk_{0};
  std::size_t offset_{0};
  std::size_t read_calls_{0};
  bool closed_{false};
};

class IStreamSource final : public ByteSource {
 public:
  explicit IStreamSource(std::istream& in) noexcept : in_(in) {}

  std::size_t Read(MutableByteSpan out) override;
  void Close() noexcept override { closed_ = true; }
  [[nodiscard]] bool closed() const noexcept override { return closed_; }

 private:
  std::istream& in_;
  bool closed_{false};
};

class VectorSink final : public ByteSink {
 public:
  void Write(ByteSpan bytes) override { data_.insert(data_.end(), bytes.begin(), bytes.end()); }

  [[nodiscard]] const Bytes& data() const noexcept { return data_; }

 private:
  Bytes data_;
};

class OStreamSink final : public ByteSink {
 public:
  explicit OStreamSink(std::ostream& out) noexcept : out_(out) {}

  void Write(ByteSpan bytes) override;
  void Flush() override;

 private:
  std::ostream& out_;
};

}  // namespace cr::car
