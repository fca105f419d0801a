#pragma once
#include "scpi-driver/export.h"
#include "scpi-driver/types.hpp"

#include <optional>
#include <string>

namespace scpidrv {

enum class NumberFormat {
  Fixed,       // fixed decimals, "{:.6f}"
  Significant, // significant digits, "{:.6g}"
};

enum class BoolDialect { ZeroOne, OnOff };

/// Immutable description of one settable/queryable SCPI command.
/// The template carries a single "{}" placeholder for the argument,
/// e.g. "SOUR:CURR {}". Ranges are in caller units (before scaling).
struct CommandSpec {
  std::string name;
  std::string templ;
  double unit_scale{1.0}; // caller unit -> wire unit, e.g. mA -> A = 1e-3
  NumberFormat format{NumberFormat::Fixed};
  int precision{6};
  std::optional<NumericRange> range;
  std::optional<std::string> query; // defaults to "<header>?"
};

/// Turns a CommandSpec plus a typed value into a single-line command without
/// terminator. Values are clipped to the spec's range before scaling, so an
/// out-of-range value is never transmitted.
class SCPI_DRIVER_API CommandBuilder {
public:
  static std::string build_numeric(const CommandSpec &spec, double value);
  static std::string build_flag(const CommandSpec &spec, bool value,
                                BoolDialect dialect = BoolDialect::ZeroOne);
  static std::string build_token(const CommandSpec &spec,
                                 const std::string &token);

  /// The matching query, e.g. "SOUR:CURR?"
  static std::string build_query(const CommandSpec &spec);

  /// Header part of the template, e.g. "SOUR:CURR"
  static std::string header(const CommandSpec &spec);

  /// Value after clipping, still in caller units
  static double clip(const CommandSpec &spec, double value);

  static std::string format_number(double value, NumberFormat format,
                                   int precision);
};

} // namespace scpidrv
