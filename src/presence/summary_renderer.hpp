#pragma once

#include "registry/listing.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace masterlist::presence {

constexpr std::size_t kSummaryMaxLines = 30;
constexpr std::size_t kSummaryMaxLength = 4096;

// Regional-indicator flag for a two-letter region code, or "" if it is not one.
std::string RegionFlag(const std::string &region);

// Text digest of the given servers in the order supplied: a header, a blank line
// and one bullet per server up to kSummaryMaxLines. Capped at kSummaryMaxLength
// code points.
std::string RenderServerSummary(const std::vector<registry::Listing> &servers);

} // namespace masterlist::presence
