#include "cr/range/range_request.h"

#include "cr/error.h"
#include "cr/errors.h"

namespace cr::range {

RangeRequest::RangeRequest(uint64_t start, uint64_t end) : start_(start), end_(end) {
  if (start > end) {
    throw Error(ErrorDomain::Validation, errors::validation::kInvalidRange,
                std::string(errors::msg::kRangeStartAfterEnd), std::nullopt, Retryability::kFatal,
                {"range " + ToString()});
  }
}

RangeRequest RangeRequest::OpenEnded(uint64_t start) noexcept {
  return RangeRequest(start, std::optional<uint64_t>{});
}

uint64_t RangeRequest::ResolveAgainst(uint64_t file_size) const {
  const uint64_t end = end_.value_or(file_size);
  // An empty file only admits the empty range at offset zero.
  const bool start_ok = start_ < file_size || (file_size == 0 && start_ == 0);
  if (!start_ok || end > file_size || start_ > end) {
    throw Error(ErrorDomain::Validation, errors::validation::kRangeOutsideFile,
                std::string(errors::msg::kRangeOutsideFile), std::nullopt, Retryability::kFatal,
                {"range " + ToString(), "file size " + std::to_string(file_size)});
  }
  return end;
}

std::string RangeRequest::ToString() const {
  return std::to_string(start_) + ":" + (end_ ? std::to_string(*end_) : std::string("*"));
}

}  // namespace cr::range
