#include "cr/car/byte_stream.h"

#include <algorithm>
#include <cerrno>
#include <string>

#include "cr/error.h"
#include "cr/errors.h"

namespace cr::car {

std::size_t ReadFully(ByteSource& source, MutableByteSpan out) {
  std::size_t total = 0;
  while (total < out.size()) {
    const std::size_t n = source.Read(out.subspan(total));
    if (n == 0) {
      break;
    }
    total += n;
  }
  return total;
}

std::size_t MemorySource::Read(MutableByteSpan out) {
  if (closed_ || out.empty()) {
    return 0;
  }
  ++read_calls_;
  std::size_t n = std::min(out.size(), data_.size() - offset_);
  if (max_chunk_ != 0) {
    n = std::min(n, max_chunk_);
  }
  std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), n, out.begin());
  offset_ += n;
  return n;
}

std::size_t IStreamSource::Read(MutableByteSpan out) {
  if (closed_ || out.empty()) {
    return 0;
  }
  in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  const auto got = in_.gcount();
  if (in_.bad()) {
    const int err = errno;
    throw Error{ErrorDomain::IO, errors::io::kSourceReadFailed,
                std::string(errors::msg::kSourceReadFailed), err, Retryability::kTransient};
  }
  return static_cast<std::size_t>(got);
}

void OStreamSink::Write(ByteSpan bytes) {
  out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out_) {
    const int err = errno;
    throw Error{ErrorDomain::IO, errors::io::kSinkWriteFailed,
                std::string(errors::msg::kSinkWriteFailed), err, Retryability::kTransient};
  }
}

void OStreamSink::Flush() {
  out_.flush();
  if (!out_) {
    const int err = errno;
    throw Error{ErrorDomain::IO, errors::io::kSinkWriteFailed,
                std::string(errors::msg::kSinkWriteFailed), err, Retryability::kTransient};
  }
}

}  // namespace cr::car
