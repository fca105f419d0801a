#include "scpi-driver/protocol/ReadbackVerifier.hpp"
#include "scpi-driver/protocol/ResponseParser.hpp"

#include <algorithm>
#include <cmath>

namespace scpidrv {

bool ReadbackVerifier::numeric_matches(double requested, double actual) const {
  if (std::isnan(requested) || std::isnan(actual)) {
    return false;
  }
  double tolerance = std::max(limits_.relative_tolerance * std::abs(requested),
                              limits_.absolute_tolerance);
  return std::abs(actual - requested) <= tolerance;
}

bool ReadbackVerifier::range_matches(double requested, double actual) const {
  if (std::isnan(requested) || std::isnan(actual)) {
    return false;
  }
  return limits_.range_upper_factor * actual >= requested &&
         actual <= limits_.range_lower_factor * requested;
}

bool ReadbackVerifier::token_matches(const std::string &requested,
                                     const std::string &actual) {
  return ResponseParser::to_lower(ResponseParser::trim(requested)) ==
         ResponseParser::to_lower(ResponseParser::trim(actual));
}

} // namespace scpidrv
