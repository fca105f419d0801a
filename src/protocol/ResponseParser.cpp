#include "scpi-driver/protocol/ResponseParser.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace scpidrv {

std::string ResponseParser::trim(const std::string &text) {
  const char *ws = " \t\r\n";
  auto begin = text.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = text.find_last_not_of(ws);
  return text.substr(begin, end - begin + 1);
}

std::string ResponseParser::unquote(const std::string &text) {
  std::string trimmed = trim(text);
  if (trimmed.size() >= 2 && trimmed.front() == '"' && trimmed.back() == '"') {
    return trimmed.substr(1, trimmed.size() - 2);
  }
  return trimmed;
}

std::string ResponseParser::to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::string ResponseParser::to_upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

bool ResponseParser::parse_bool(const QueryResult &result) {
  if (!result.ok()) {
    return false;
  }
  return parse_bool(result.response);
}

bool ResponseParser::parse_bool(const std::string &text) {
  std::string token = to_upper(trim(text));
  return token == "1" || token == "ON" || token == "CLOSED";
}

double ResponseParser::parse_double(const QueryResult &result) {
  if (!result.ok()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return parse_double(result.response);
}

double ResponseParser::parse_double(const std::string &text) {
  std::string token = trim(text);
  if (token.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }

  errno = 0;
  char *end = nullptr;
  double value = std::strtod(token.c_str(), &end);
  if (end != token.c_str() + token.size() || errno == ERANGE) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return value;
}

const EnumAlias *ResponseParser::find_alias(const std::string &text,
                                            const EnumTable &table) {
  std::string token = to_lower(unquote(text));
  for (const auto &alias : table) {
    if (token == to_lower(alias.canonical) || token == to_lower(alias.wire)) {
      return &alias;
    }
    if (std::find(alias.tokens.begin(), alias.tokens.end(), token) !=
        alias.tokens.end()) {
      return &alias;
    }
  }
  return nullptr;
}

std::string ResponseParser::parse_enum(const QueryResult &result,
                                       const EnumTable &table) {
  if (!result.ok()) {
    return kCommunicationProblem;
  }
  return parse_enum(result.response, table);
}

std::string ResponseParser::parse_enum(const std::string &text,
                                       const EnumTable &table) {
  const EnumAlias *alias = find_alias(text, table);
  if (!alias) {
    return kUnexpectedResponse;
  }
  return alias->canonical;
}

bool ResponseParser::is_marker(const std::string &value) {
  return value == kUnexpectedResponse || value == kCommunicationProblem;
}

} // namespace scpidrv
