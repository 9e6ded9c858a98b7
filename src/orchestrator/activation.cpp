#include "cr/orchestrator/activation.h"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <vector>

#include "cr/error.h"
#include "cr/errors.h"

namespace cr::orchestrator {

namespace {

std::string_view Trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::vector<std::string_view> Split(std::string_view text, char separator) {
  std::vector<std::string_view> parts;
  while (true) {
    const auto pos = text.find(separator);
    parts.push_back(text.substr(0, pos));
    if (pos == std::string_view::npos) {
      return parts;
    }
    text.remove_prefix(pos + 1);
  }
}

bool IsRangeKey(std::string_view key) {
  return key == "bytes" || key == "entity-bytes";
}

int HexValue(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  return -1;
}

std::optional<std::string> PercentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      out.push_back(text[i]);
      continue;
    }
    if (i + 2 >= text.size()) {
      return std::nullopt;
    }
    const int high = HexValue(text[i + 1]);
    const int low = HexValue(text[i + 2]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((high << 4) | low));
    i += 2;
  }
  return out;
}

std::optional<uint64_t> ParseOffset(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

[[noreturn]] void ThrowQueryError(std::string_view value) {
  throw Error(ErrorDomain::Validation, errors::validation::kInvalidQuery,
              std::string(errors::msg::kRangeSyntax), std::nullopt, Retryability::kFatal,
              {"value " + std::string(value)});
}

}  // namespace

bool AcceptsCar(std::string_view accept) {
  for (auto range : Split(accept, ',')) {
    auto media = Trim(range.substr(0, range.find(';')));
    if (EqualsIgnoreCase(media, kCarMediaType)) {
      return true;
    }
  }
  return false;
}

std::optional<cr::range::RangeRequest> ParseRangeQuery(std::string_view query) {
  if (!query.empty() && query.front() == '?') {
    query.remove_prefix(1);
  }
  for (auto param : Split(query, '&')) {
    const auto eq = param.find('=');
    if (!IsRangeKey(param.substr(0, eq))) {
      continue;
    }
    if (eq == std::string_view::npos) {
      ThrowQueryError(param);
    }
    auto decoded = PercentDecode(param.substr(eq + 1));
    if (!decoded) {
      ThrowQueryError(param);
    }
    const std::string_view value(*decoded);
    const auto colon = value.find(':');
    if (colon == std::string_view::npos) {
      ThrowQueryError(value);
    }
    auto start = ParseOffset(value.substr(0, colon));
    if (!start) {
      ThrowQueryError(value);
    }
    const auto end_text = value.substr(colon + 1);
    if (end_text == "*") {
      return cr::range::RangeRequest::OpenEnded(*start);
    }
    auto end = ParseOffset(end_text);
    if (!end) {
      ThrowQueryError(value);
    }
    return cr::range::RangeRequest(*start, *end);
  }
  return std::nullopt;
}

std::optional<cr::range::RangeRequest> ParseActivation(std::string_view accept,
                                                       std::string_view query) {
  if (!AcceptsCar(accept)) {
    return std::nullopt;
  }
  return ParseRangeQuery(query);
}

std::string StripRangeParameter(std::string_view query) {
  const bool leading_mark = !query.empty() && query.front() == '?';
  if (leading_mark) {
    query.remove_prefix(1);
  }
  std::string out;
  for (auto param : Split(query, '&')) {
    if (param.empty() || IsRangeKey(param.substr(0, param.find('=')))) {
      continue;
    }
    if (!out.empty()) {
      out.push_back('&');
    }
    out.append(param);
  }
  if (leading_mark && !out.empty()) {
    out.insert(out.begin(), '?');
  }
  return out;
}

}  // namespace cr::orchestrator
