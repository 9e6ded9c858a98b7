#include "cr/orchestrator/config.h"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <optional>
#include <string_view>

namespace cr::orchestrator {

namespace {

std::optional<std::size_t> ResolveSize(const char* name) {
  const char* env = std::getenv(name);
  if (!env || *env == '\0') {
    return std::nullopt;
  }
  unsigned long long value = 0;
  const char* end = env + std::strlen(env);
  auto [ptr, ec] = std::from_chars(env, end, value);
  if (ec != std::errc() || ptr != end || value == 0) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(
      std::min<unsigned long long>(value, std::numeric_limits<std::size_t>::max()));
}

std::optional<bool> ResolveFlag(const char* name) {
  const char* env = std::getenv(name);
  if (!env) {
    return std::nullopt;
  }
  const std::string_view text(env);
  if (text == "1" || text == "true" || text == "yes" || text == "on") {
    return true;
  }
  if (text == "0" || text == "false" || text == "no" || text == "off") {
    return false;
  }
  return std::nullopt;
}

}  // namespace

FilterConfig LoadFilterConfigFromEnvironment() {
  FilterConfig config{};
  if (auto size = ResolveSize("CR_MAX_HEADER_SIZE")) {
    config.max_header_size = *size;
  }
  if (auto size = ResolveSize("CR_MAX_SECTION_SIZE")) {
    config.max_section_size = *size;
  }
  if (auto flag = ResolveFlag("CR_VERIFY_DIGESTS")) {
    config.verify_digests = *flag;
  }
  if (auto flag = ResolveFlag("CR_ZERO_LENGTH_AS_EOF")) {
    config.zero_length_section_as_eof = *flag;
  }
  return config;
}

cr::car::ReaderOptions ToReaderOptions(const FilterConfig& config) noexcept {
  cr::car::ReaderOptions options{};
  options.max_header_size = config.max_header_size;
  options.max_section_size = config.max_section_size;
  options.zero_length_section_as_eof = config.zero_length_section_as_eof;
  options.verify_digests = config.verify_digests;
  return options;
}

}  // namespace cr::orchestrator
