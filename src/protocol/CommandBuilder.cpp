#include "scpi-driver/protocol/CommandBuilder.hpp"
#include "scpi-driver/Logger.hpp"

#include <fmt/format.h>

namespace scpidrv {

double CommandBuilder::clip(const CommandSpec &spec, double value) {
  if (!spec.range) {
    return value;
  }
  double clipped = spec.range->clip(value);
  if (clipped != value) {
    LOG_DEBUG("BUILDER", spec.name, "Clipped {} to [{}, {}] -> {}", value,
              spec.range->min, spec.range->max, clipped);
  }
  return clipped;
}

std::string CommandBuilder::format_number(double value, NumberFormat format,
                                          int precision) {
  std::string text;
  if (format == NumberFormat::Fixed) {
    text = fmt::format("{:.{}f}", value, precision);
  } else {
    text = fmt::format("{:.{}g}", value, precision);
  }
  // "-0.000000" is a valid but confusing rendering of zero
  if (text.find_first_not_of("-0.") == std::string::npos && text[0] == '-') {
    text.erase(0, 1);
  }
  return text;
}

std::string CommandBuilder::build_numeric(const CommandSpec &spec,
                                          double value) {
  double wire = clip(spec, value) * spec.unit_scale;
  return fmt::format(fmt::runtime(spec.templ),
                     format_number(wire, spec.format, spec.precision));
}

std::string CommandBuilder::build_flag(const CommandSpec &spec, bool value,
                                       BoolDialect dialect) {
  const char *token;
  if (dialect == BoolDialect::OnOff) {
    token = value ? "ON" : "OFF";
  } else {
    token = value ? "1" : "0";
  }
  return fmt::format(fmt::runtime(spec.templ), token);
}

std::string CommandBuilder::build_token(const CommandSpec &spec,
                                        const std::string &token) {
  return fmt::format(fmt::runtime(spec.templ), token);
}

std::string CommandBuilder::header(const CommandSpec &spec) {
  auto space = spec.templ.find(' ');
  return spec.templ.substr(0, space);
}

std::string CommandBuilder::build_query(const CommandSpec &spec) {
  if (spec.query) {
    return *spec.query;
  }
  return header(spec) + "?";
}

} // namespace scpidrv
