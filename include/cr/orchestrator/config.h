#pragma once

#include <cstddef>

#include "cr/car/reader.h"

namespace cr::orchestrator {

struct FilterConfig {
  std::size_t max_header_size{1u << 20};
  std::size_t max_section_size{4u << 20};
  bool zero_length_section_as_eof{true};
  bool verify_digests{false};
  bool retain_offset_map{false};
};

// Overlays CR_MAX_HEADER_SIZE, CR_MAX_SECTION_SIZE, CR_VERIFY_DIGESTS and
// CR_ZERO_LENGTH_AS_EOF on the defaults. Malformed values are ignored.
FilterConfig LoadFilterConfigFromEnvironment();

cr::car::ReaderOptions ToReaderOptions(const FilterConfig& config) noexcept;

}  // namespace cr::orchestrator
