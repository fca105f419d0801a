#pragma once
#include "scpi-driver/export.h"
#include "scpi-driver/transport/Transport.hpp"

#include <string>
#include <vector>

namespace scpidrv {

/// Marker for a response token that matches no known enumeration value
inline const std::string kUnexpectedResponse = "error - unexpected response";
/// Marker for an enumerated query that failed at the transport level
inline const std::string kCommunicationProblem =
    "error - communication problem";

/// One enumeration value: canonical long form, the token written to the
/// device and every (lower-case) abbreviation accepted from either side
struct EnumAlias {
  std::string canonical;
  std::string wire;
  std::vector<std::string> tokens;
};

using EnumTable = std::vector<EnumAlias>;

/// Converts raw response lines into typed values. Never throws: failures map
/// to NaN, false or a marker string.
class SCPI_DRIVER_API ResponseParser {
public:
  /// "1", "ON" and "CLOSED" are true. Everything else, including a failed
  /// transfer, is false.
  static bool parse_bool(const QueryResult &result);
  static bool parse_bool(const std::string &text);

  /// NaN on transport failure or when the text is not a complete number
  static double parse_double(const QueryResult &result);
  static double parse_double(const std::string &text);

  /// Canonical form of the matching alias, kUnexpectedResponse when nothing
  /// matches and kCommunicationProblem on transport failure
  static std::string parse_enum(const QueryResult &result,
                                const EnumTable &table);
  static std::string parse_enum(const std::string &text,
                                const EnumTable &table);

  /// Alias lookup without markers, nullptr when nothing matches
  static const EnumAlias *find_alias(const std::string &text,
                                     const EnumTable &table);

  static bool is_marker(const std::string &value);

  static std::string trim(const std::string &text);
  /// Trims and drops one pair of surrounding double quotes
  static std::string unquote(const std::string &text);
  static std::string to_lower(std::string text);
  static std::string to_upper(std::string text);
};

} // namespace scpidrv
