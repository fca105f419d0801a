#include "scpi-driver/devices/LaserController.hpp"
#include "scpi-driver/Logger.hpp"

#include <cmath>

namespace scpidrv {

namespace {

// Ranges are in API units (mA, mW, degC)
const CommandSpec kCurrent{"current", "SOUR:CURR {}", 1e-3,
                           NumberFormat::Fixed, 6, NumericRange{0.0, 1000.0}};
const CommandSpec kCurrentLimit{"current limit", "SOUR:CURR:LIM {}", 1e-3,
                                NumberFormat::Fixed, 6,
                                NumericRange{0.0, 1000.0}};
const CommandSpec kPower{"power", "SOUR:POW {}", 1e-3, NumberFormat::Fixed, 6,
                         NumericRange{0.0, 500.0}};
const CommandSpec kPowerLimit{"power limit", "SOUR:POW:LIM {}", 1e-3,
                              NumberFormat::Fixed, 6,
                              NumericRange{0.0, 500.0}};
const CommandSpec kTempLimitLow{"temperature limit low",
                                "SOUR:TEMP:LIM:LOW {}", 1.0,
                                NumberFormat::Fixed, 3,
                                NumericRange{-10.0, 80.0}};
const CommandSpec kTempLimitHigh{"temperature limit high",
                                 "SOUR:TEMP:LIM:HIGH {}", 1.0,
                                 NumberFormat::Fixed, 3,
                                 NumericRange{-10.0, 80.0}};
const CommandSpec kOutput{"output", "OUTP {}"};
const CommandSpec kMode{"mode", "SOUR:FUNC:MODE {}"};

const EnumTable kModes = {
    {"current", "CURR", {"curr", "current", "cc", "i"}},
    {"power", "POW", {"pow", "power", "cp", "p"}},
};

OperatingMode to_operating_mode(const std::string &canonical) {
  if (canonical == "current")
    return OperatingMode::CurrentMode;
  if (canonical == "power")
    return OperatingMode::PowerMode;
  return OperatingMode::Unknown;
}

} // namespace

DriverMetadata LaserController::default_metadata() {
  return {"ComboSource6301", "1.0.0", "2026-01-19"};
}

SessionOptions LaserController::prepare_options(SessionOptions options,
                                                const DriverMetadata &metadata) {
  if (options.device_name.empty()) {
    options.device_name = metadata.name;
  }
  options.error_queue.dialect = ErrorQueueDialect::Standard;
  options.error_queue.next_query = "SYST:ERR?";
  options.error_queue.clear_command = "*CLS";
  return options;
}

LaserController::LaserController(std::unique_ptr<Transport> transport,
                                 SessionOptions options,
                                 DriverMetadata metadata)
    : session_(std::move(transport), prepare_options(std::move(options),
                                                     metadata)),
      metadata_(std::move(metadata)) {
  session_.notify("INIT", fmt::format("{} driver {} ({})", metadata_.name,
                                      metadata_.version,
                                      metadata_.release_date));
}

const ParameterValidator &LaserController::parameter_table() {
  static const ParameterValidator validator({
      {"mode", {"mode", "opmode"}, FieldShape::Token},
      {"limit", {"limit", "lim"}, FieldShape::Numeric},
      {"current", {"current", "curr", "i"}, FieldShape::Numeric},
      {"power", {"power", "pow", "p"}, FieldShape::Numeric},
      {"temperature", {"temperature", "temp", "t"}, FieldShape::Numeric},
      {"enable", {"enable", "output"}, FieldShape::Token},
  });
  return validator;
}

// Identity and housekeeping

std::string LaserController::get_id() { return session_.query_text("*IDN?"); }

std::string LaserController::get_error() {
  return session_.query_text("SYST:ERR?");
}

int LaserController::clear() { return session_.write("*CLS"); }

int LaserController::reset() {
  int status = session_.write("*RST");
  session_.settle(std::chrono::milliseconds(500));
  if (status == 0) {
    session_.status().output_enabled = false;
    session_.status().mode = OperatingMode::Unknown;
    session_.notify("RESET", "Device reset to factory defaults");
  }
  return status;
}

int LaserController::lock() { return session_.write("SYST:LOCK ON"); }

int LaserController::unlock() { return session_.write("SYST:LOCK OFF"); }

// Laser output

SetStatus LaserController::enable_laser() {
  SetStatus status = session_.set_flag(kOutput, true, BoolDialect::OnOff);
  if (status == SetStatus::Applied) {
    session_.status().output_enabled = true;
    session_.notify("OUTPUT", "Laser output enabled");
  }
  return status;
}

SetStatus LaserController::disable_laser() {
  SetStatus status = session_.set_flag(kOutput, false, BoolDialect::OnOff);
  if (status == SetStatus::Applied) {
    session_.status().output_enabled = false;
    session_.notify("OUTPUT", "Laser output disabled");
  }
  return status;
}

bool LaserController::is_laser_enabled() {
  bool enabled = session_.query_bool("OUTP?");
  session_.status().output_enabled = enabled;
  return enabled;
}

// Current control

SetStatus LaserController::set_current(double milliamps) {
  return session_.set_numeric(kCurrent, milliamps);
}

double LaserController::get_current() {
  return session_.query_double("SOUR:CURR?") * 1e3;
}

double LaserController::get_measured_current() {
  return session_.query_double("MEAS:CURR?") * 1e3;
}

SetStatus LaserController::set_current_limit(double milliamps) {
  return session_.set_numeric(kCurrentLimit, milliamps);
}

double LaserController::get_current_limit() {
  return session_.query_double("SOUR:CURR:LIM?") * 1e3;
}

// Power control

SetStatus LaserController::set_power(double milliwatts) {
  return session_.set_numeric(kPower, milliwatts);
}

double LaserController::get_power() {
  return session_.query_double("SOUR:POW?") * 1e3;
}

double LaserController::get_measured_power() {
  return session_.query_double("MEAS:POW?") * 1e3;
}

SetStatus LaserController::set_power_limit(double milliwatts) {
  return session_.set_numeric(kPowerLimit, milliwatts);
}

double LaserController::get_power_limit() {
  return session_.query_double("SOUR:POW:LIM?") * 1e3;
}

// Temperature

double LaserController::get_temperature() {
  return session_.query_double("MEAS:TEMP?");
}

double LaserController::get_tec_current() {
  return session_.query_double("MEAS:TEC:CURR?");
}

SetStatus LaserController::set_temp_limit_low(double celsius) {
  return session_.set_numeric(kTempLimitLow, celsius);
}

double LaserController::get_temp_limit_low() {
  return session_.query_double("SOUR:TEMP:LIM:LOW?");
}

SetStatus LaserController::set_temp_limit_high(double celsius) {
  return session_.set_numeric(kTempLimitHigh, celsius);
}

double LaserController::get_temp_limit_high() {
  return session_.query_double("SOUR:TEMP:LIM:HIGH?");
}

// Operating mode

SetStatus LaserController::set_mode(const std::string &mode) {
  SetStatus status = session_.set_token(kMode, mode, kModes);
  if (status == SetStatus::Applied) {
    const EnumAlias *alias = ResponseParser::find_alias(mode, kModes);
    session_.status().mode = to_operating_mode(alias->canonical);
    session_.notify("MODE", fmt::format("Operating mode set to constant {}",
                                        alias->canonical));
  }
  return status;
}

SetStatus LaserController::set_mode_constant_current() {
  return set_mode("current");
}

SetStatus LaserController::set_mode_constant_power() {
  return set_mode("power");
}

std::string LaserController::get_mode() {
  std::string mode = session_.query_enum("SOUR:FUNC:MODE?", kModes);
  session_.status().mode = to_operating_mode(mode);
  return mode;
}

// Status and safety

int LaserController::get_status_byte() {
  double value = session_.query_double("*STB?");
  // The status byte is 8 bits wide
  if (std::isnan(value) || value < 0 || value > 255) {
    return -1;
  }
  return static_cast<int>(value);
}

bool LaserController::is_interlock_closed() {
  return session_.query_bool("SYST:INTL?");
}

bool LaserController::is_over_temp() {
  return session_.query_bool("SYST:TEMP:PROT?");
}

// Batch configuration

SetStatus LaserController::apply(const ParamList &params) {
  ValidationResult validated = parameter_table().validate(params);
  session_.report("APPLY", validated.diagnostics);

  if (validated.params.empty()) {
    session_.notify("APPLY", "No valid parameters, nothing sent");
    return SetStatus::NotSent;
  }
  if (session_.verbosity() == Verbosity::All) {
    session_.notify("APPLY", "Parameters:\n" +
                                 validated.params.format_table());
  }

  SetStatus aggregate = SetStatus::NotSent;
  for (const auto &[name, value] : validated.params) {
    aggregate = combine(aggregate, apply_field(name, value));
  }
  return aggregate;
}

SetStatus LaserController::apply_field(const std::string &name,
                                       const std::string &value) {
  if (name == "mode") {
    return set_mode(value);
  }

  if (name == "enable") {
    if (value == "1" || value == "ON" || value == "TRUE" || value == "YES") {
      return enable_laser();
    }
    if (value == "0" || value == "OFF" || value == "FALSE" || value == "NO") {
      return disable_laser();
    }
    session_.diagnose("APPLY",
                      fmt::format("Invalid value '{}' for 'enable'", value));
    return SetStatus::NotSent;
  }

  double number = ResponseParser::parse_double(value);
  if (std::isnan(number)) {
    session_.diagnose("APPLY",
                      fmt::format("Invalid value '{}' for '{}'", value, name));
    return SetStatus::NotSent;
  }

  if (name == "current") {
    return set_current(number);
  }
  if (name == "power") {
    return set_power(number);
  }
  if (name == "temperature") {
    return set_temp_limit_high(number);
  }
  if (name == "limit") {
    if (status().mode == OperatingMode::Unknown) {
      get_mode();
    }
    switch (status().mode) {
    case OperatingMode::CurrentMode:
      return set_current_limit(number);
    case OperatingMode::PowerMode:
      return set_power_limit(number);
    case OperatingMode::Unknown:
      break;
    }
    session_.diagnose("APPLY", "Operating mode unknown, 'limit' not sent");
    return SetStatus::NotSent;
  }

  session_.diagnose("APPLY", fmt::format("Unhandled field '{}'", name));
  return SetStatus::NotSent;
}

// Error queue

std::vector<ErrorLogEntry> LaserController::error_messages() {
  auto fresh = session_.read_errors();
  if (fresh.empty()) {
    session_.notify("ERRORS", "No new messages");
  }
  for (const auto &entry : fresh) {
    session_.notify("ERRORS", fmt::format("{}: {} ({})", entry.code,
                                          entry.description,
                                          to_string(entry.severity)));
  }
  return fresh;
}

bool LaserController::clear_error_messages() { return session_.clear_errors(); }

} // namespace scpidrv
