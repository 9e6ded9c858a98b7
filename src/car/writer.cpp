#include "cr/car/writer.h"

#include <exception>
#include <string>

#include "cr/error.h"
#include "cr/errors.h"

namespace cr::car {

void CarWriter::Emit(ByteSpan bytes) {
  try {
    sink_.Write(bytes);
  } catch (const Error&) {
    throw;
  } catch (const std::exception& ex) {
    throw Error(ErrorDomain::IO, errors::io::kSinkWriteFailed,
                std::string(errors::msg::kSinkWriteFailed) + ": " + ex.what(), std::nullopt,
                Retryability::kTransient);
  }
  bytes_written_ = SaturatingAdd(bytes_written_, bytes.size());
}

void CarWriter::WriteHeader(const CarHeader& header) {
  if (header_written_) {
    throw Error(ErrorDomain::Internal, errors::internal::kHeaderWrittenTwice,
                std::string(errors::msg::kHeaderWrittenTwice));
  }
  Emit(header.frame);
  header_written_ = true;
}

void CarWriter::WriteBlock(const Block& block) {
  if (!header_written_) {
    throw Error(ErrorDomain::Internal, errors::internal::kBlockBeforeHeader,
                std::string(errors::msg::kBlockBeforeHeader));
  }
  Emit(block.frame);
  ++blocks_written_;
}

void CarWriter::Flush() {
  sink_.Flush();
}

}  // namespace cr::car
