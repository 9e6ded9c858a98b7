#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cr::range {

// Half-open byte range [start, end) over the virtual file. An absent end means
// "through the end of the file" and is resolved once the root node is known.
class RangeRequest {
 public:
  // Throws cr::Error (Validation) when start > end.
  RangeRequest(uint64_t start, uint64_t end);
  static RangeRequest OpenEnded(uint64_t start) noexcept;

  [[nodiscard]] uint64_t start() const noexcept { return start_; }
  [[nodiscard]] std::optional<uint64_t> end() const noexcept { return end_; }
  [[nodiscard]] bool open_ended() const noexcept { return !end_.has_value(); }

  // Returns the concrete end for a file of the given size. Throws cr::Error
  // (Validation) when the range does not lie inside the file.
  [[nodiscard]] uint64_t ResolveAgainst(uint64_t file_size) const;

  [[nodiscard]] std::string ToString() const;

 private:
  RangeRequest(uint64_t start, std::optional<uint64_t> end) noexcept : start_(start), end_(end) {}

  uint64_t start_{0};
  std::optional<uint64_t> end_{};
};

}  // namespace cr::range
