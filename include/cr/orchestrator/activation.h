#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "cr/range/range_request.h"

namespace cr::orchestrator {

inline constexpr std::string_view kCarMediaType{"application/vnd.ipld.car"};

// True when any media range in an Accept header value names the CAR media
// type. Parameters (version, order, q) are ignored; comparison is
// case-insensitive.
bool AcceptsCar(std::string_view accept);

// Extracts `bytes=` or `entity-bytes=` from a URL query string. Values take the
// form start:end or start:*. Returns nullopt when neither parameter is present
// and throws cr::Error (Validation) when one is present but malformed.
std::optional<cr::range::RangeRequest> ParseRangeQuery(std::string_view query);

// Filtering applies only when the client accepts CAR and names a range.
std::optional<cr::range::RangeRequest> ParseActivation(std::string_view accept,
                                                       std::string_view query);

// Query string for fetching the unfiltered archive from the origin.
std::string StripRangeParameter(std::string_view query);

}  // namespace cr::orchestrator
