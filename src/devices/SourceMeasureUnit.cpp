#include "scpi-driver/devices/SourceMeasureUnit.hpp"
#include "scpi-driver/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

namespace scpidrv {

namespace {

const EnumTable kSourceFunctions = {
    {"voltage", "VOLT", {"volt", "voltage", "v"}},
    {"current", "CURR", {"curr", "current", "i", "a"}},
};

const EnumTable kSenseFunctions = {
    {"voltage", "VOLT:DC", {"volt:dc", "volt", "voltage", "v"}},
    {"current", "CURR:DC", {"curr:dc", "curr", "current", "i", "a"}},
    {"resistance", "RES", {"res", "resistance", "ohm"}},
};

const EnumTable kTerminals = {
    {"front", "FRON", {"f", "fr", "fro", "fron", "front"}},
    {"rear", "REAR", {"r", "re", "rea", "rear"}},
};

const EnumTable kOperationModes = {
    {"Source:V_Sense:I", "SVMI", {"svmi", "source:v_sense:i"}},
    {"Source:I_Sense:V", "SIMV", {"simv", "source:i_sense:v"}},
};

const EnumTable kOffStates = {
    {"normal", "NORM", {"norm", "normal", "n"}},
    {"high impedance", "HIMP", {"himp", "highimpedance", "h"}},
    {"zero", "ZERO", {"zero", "z"}},
    {"guard", "GUAR", {"guar", "guard", "g"}},
};

const EnumTable kSenseUnits = {
    {"volt", "VOLT", {"volt", "v"}},
    {"amp", "AMP", {"amp", "ampere", "a"}},
    {"ohm", "OHM", {"ohm", "o"}},
    {"watt", "WATT", {"watt", "w"}},
};

const EnumTable kAverageModes = {
    {"repeat", "REP", {"rep", "repeat"}},
    {"moving", "MOV", {"mov", "moving"}},
};

const std::vector<std::string> kDefaultBuffers = {"defbuffer1",
                                                  "defbuffer2"};

CommandSpec smu_spec(std::string name, std::string templ,
                     std::optional<NumericRange> range = std::nullopt) {
  return CommandSpec{std::move(name),          std::move(templ), 1.0,
                     NumberFormat::Significant, 6,                range};
}

std::string header_word(const std::string &function) {
  if (function == "voltage")
    return "Voltage";
  if (function == "current")
    return "Current";
  if (function == "resistance")
    return "Resistance";
  return "";
}

bool same_name(const std::string &a, const std::string &b) {
  return ResponseParser::to_lower(a) == ResponseParser::to_lower(b);
}

/// Over-voltage protection is set in discrete steps
std::string ov_protection_step(double volts) {
  static const int kSteps[] = {2, 5, 10, 20, 40, 60, 80, 100, 120, 140, 160,
                               180};
  if (std::isnan(volts) || volts <= 0) {
    return "";
  }
  for (int step : kSteps) {
    if (volts <= step) {
      return fmt::format("PROT{}", step);
    }
  }
  return "NONE";
}

NumericRange sense_range_limits(const std::string &fm) {
  if (fm == "Current")
    return {1e-8, 1.0};
  if (fm == "Voltage")
    return {0.02, 200.0};
  return {2.0, 200e6};
}

} // namespace

nlohmann::json to_json(const FieldValue &value) {
  return std::visit(
      [](const auto &v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, double>) {
          if (std::isnan(v)) {
            return nullptr;
          }
        }
        return v;
      },
      value);
}

DriverMetadata SourceMeasureUnit::default_metadata() {
  return {"SMU2450", "1.0.1", "2025-09-01"};
}

SessionOptions SourceMeasureUnit::prepare_options(
    SessionOptions options, const DriverMetadata &metadata) {
  if (options.device_name.empty()) {
    options.device_name = metadata.name;
  }
  options.error_queue.dialect = ErrorQueueDialect::EventLog;
  options.error_queue.next_query = ":System:Eventlog:Next?";
  options.error_queue.count_query = ":System:Eventlog:Count? All";
  options.error_queue.clear_command = ":System:Clear";
  return options;
}

std::vector<FieldSpec> SourceMeasureUnit::source_field_specs() {
  return {
      {"OutputValue", {"value", "level"}, FieldShape::Numeric},
      {"Readback", {}, FieldShape::Numeric},
      {"Range", {}, FieldShape::Numeric},
      {"AutoRange", {}, FieldShape::Numeric},
      {"OutputOffState", {"offstate"}, FieldShape::Numeric},
      {"Interlock", {}, FieldShape::Numeric},
      {"InterlockSignal", {}, FieldShape::Numeric},
      {"LimitValue", {"limit"}, FieldShape::Numeric},
      {"LimitTripped", {}, FieldShape::Numeric},
      {"OVProtectionValue", {"ovp"}, FieldShape::Numeric},
      {"OVProtectionTripped", {}, FieldShape::Numeric},
      {"Delay", {}, FieldShape::Numeric},
      {"AutoDelay", {}, FieldShape::Numeric},
      {"HighCapMode", {"highcap"}, FieldShape::Numeric},
  };
}

std::vector<FieldSpec> SourceMeasureUnit::sense_field_specs() {
  return {
      {"Unit", {}, FieldShape::Token},
      {"Range", {}, FieldShape::Numeric},
      {"AutoRange", {}, FieldShape::Numeric},
      {"AutoRangeLowerLimit", {"lowerlimit"}, FieldShape::Numeric},
      {"AutoRangeRebound", {"rebound"}, FieldShape::Numeric},
      {"NPLCycles", {"nplc"}, FieldShape::Numeric},
      {"AverageCount", {"average"}, FieldShape::Numeric},
      {"AverageMode", {}, FieldShape::Token},
      {"RemoteSensing", {"rsense"}, FieldShape::Numeric},
      {"AutoZero", {"azero"}, FieldShape::Numeric},
      {"OffsetCompensation", {"ocomp"}, FieldShape::Numeric},
  };
}

SourceMeasureUnit::SourceMeasureUnit(std::unique_ptr<Transport> transport,
                                     SessionOptions options,
                                     DriverMetadata metadata)
    : session_(std::move(transport),
               prepare_options(std::move(options), metadata)),
      metadata_(std::move(metadata)), source_validator_(source_field_specs()),
      sense_validator_(sense_field_specs()) {
  build_field_tables();
  reset_buffers();

  int status = run_after_open();
  if (status != 0) {
    throw TransportError(
        fmt::format("{}: switching the output off after open failed",
                    session_.device_name()),
        status);
  }
  session_.notify("INIT", fmt::format("{} driver {} ({})", metadata_.name,
                                      metadata_.version,
                                      metadata_.release_date));
}

SourceMeasureUnit::~SourceMeasureUnit() {
  try {
    run_before_close();
  } catch (const std::exception &ex) {
    LOG_ERROR(session_.device_name(), "CLOSE", "Output off failed: {}",
              ex.what());
  }
}

// Housekeeping

std::string SourceMeasureUnit::get_id() {
  return session_.query_text("*IDN?");
}

int SourceMeasureUnit::reset() {
  int status = session_.write("*RST");
  if (status == 0) {
    status = session_.write("*CLS");
  }
  if (status == 0) {
    status = run_after_open();
  }
  if (status == 0) {
    session_.notify("RESET", "Device reset to default settings");
  }
  return status;
}

int SourceMeasureUnit::clear() {
  int status = session_.write("*CLS");
  if (status != 0) {
    return status;
  }
  return session_.wait_complete();
}

int SourceMeasureUnit::lock() {
  session_.diagnose("LOCK", "Locking the front panel is not supported");
  return 0;
}

int SourceMeasureUnit::unlock() {
  session_.diagnose("UNLOCK", "Unlocking the front panel is not supported");
  return 0;
}

int SourceMeasureUnit::run_after_open() { return output_disable(); }

int SourceMeasureUnit::run_before_close() {
  int status = session_.write(":OUTP OFF");
  if (status == 0) {
    session_.status().output_enabled = false;
  }
  return status;
}

// Output

int SourceMeasureUnit::output_enable() {
  int status = session_.write(":OUTP ON");
  if (status == 0) {
    status = session_.wait_complete();
  }
  if (status == 0) {
    session_.status().output_enabled = true;
    session_.notify("OUTPUT", "Output enabled");
  }
  return status;
}

int SourceMeasureUnit::output_disable() {
  int status = session_.write(":OUTP OFF");
  if (status == 0) {
    status = session_.wait_complete();
  }
  if (status == 0) {
    session_.status().output_enabled = false;
    session_.notify("OUTPUT", "Output disabled");
  }
  return status;
}

SetStatus SourceMeasureUnit::set_output_state(bool on) {
  SetStatus status =
      session_.set_flag(smu_spec("OutputState", ":Output:State {}"), on);
  if (status == SetStatus::Applied) {
    session_.status().output_enabled = on;
  }
  return status;
}

bool SourceMeasureUnit::get_output_state() {
  bool on = session_.query_bool(":Output:State?");
  session_.status().output_enabled = on;
  return on;
}

int SourceMeasureUnit::output_tone(const ParamList &params) {
  static const ParameterValidator validator({
      {"frequency", {"freq", "f"}, FieldShape::Numeric},
      {"duration", {"dur", "d", "time"}, FieldShape::Numeric},
  });

  ValidationResult validated = validator.validate(params);
  session_.report("TONE", validated.diagnostics);

  double frequency = 1e3;
  double duration = 1.0;
  if (auto value = validated.params.get("frequency")) {
    double parsed = ResponseParser::parse_double(*value);
    if (!std::isnan(parsed)) {
      frequency = std::clamp(parsed, 20.0, 8e3);
    }
  }
  if (auto value = validated.params.get("duration")) {
    double parsed = ResponseParser::parse_double(*value);
    if (!std::isnan(parsed)) {
      duration = std::clamp(parsed, 1e-3, 1e2);
    }
  }

  return session_.write(
      fmt::format(":System:Beeper {:g},{:g}", frequency, duration));
}

// Triggering

int SourceMeasureUnit::restart_trigger() {
  int status = session_.write(":Trigger:Continuous Restart");
  session_.settle(std::chrono::milliseconds(1000));
  return status;
}

int SourceMeasureUnit::abort_trigger() { return session_.write(":Abort"); }

int SourceMeasureUnit::refresh_zero_reference() {
  return session_.write(":Sense:Azero:Once");
}

TriggerState SourceMeasureUnit::get_trigger_state() {
  TriggerState state;
  QueryResult result = session_.query(":Trigger:State?");
  if (!result.ok()) {
    state.state = kCommunicationProblem;
    return state;
  }

  std::vector<std::string> parts;
  std::string text = ResponseParser::trim(result.response);
  size_t start = 0;
  while (true) {
    size_t pos = text.find(';', start);
    parts.push_back(ResponseParser::trim(text.substr(start, pos - start)));
    if (pos == std::string::npos)
      break;
    start = pos + 1;
  }

  if (parts.size() != 3) {
    state.state = kUnexpectedResponse;
    return state;
  }
  state.state = ResponseParser::to_lower(parts[0]);
  state.block_state = ResponseParser::to_lower(parts[1]);
  state.block_number = parts[2];
  return state;
}

// Terminals

SetStatus SourceMeasureUnit::set_terminals(const std::string &terminals) {
  return session_.set_token(smu_spec("Terminals", ":Route:Terminals {}"),
                            terminals, kTerminals);
}

std::string SourceMeasureUnit::get_terminals() {
  return session_.query_enum(":Route:Terminals?", kTerminals);
}

// Functions

SetStatus SourceMeasureUnit::set_operation_mode(const std::string &mode) {
  const EnumAlias *alias = ResponseParser::find_alias(mode, kOperationModes);
  if (!alias) {
    session_.diagnose("OperationMode",
                      fmt::format("Invalid parameter value '{}'", mode));
    return SetStatus::NotSent;
  }

  SetStatus status;
  if (alias->wire == "SVMI") {
    status = combine(set_source_function("voltage"),
                     set_sense_function("current"));
  } else {
    status = combine(set_source_function("current"),
                     set_sense_function("voltage"));
  }
  if (status == SetStatus::Applied) {
    session_.notify("OperationMode",
                    fmt::format("Operation mode set to {}", alias->canonical));
  }
  return status;
}

std::string SourceMeasureUnit::get_operation_mode() {
  std::string source = get_source_function();
  std::string sense = get_sense_function();
  if (source == kCommunicationProblem || sense == kCommunicationProblem) {
    return kCommunicationProblem;
  }
  if (source == "voltage" && sense == "current") {
    return kOperationModes[0].canonical;
  }
  if (source == "current" && sense == "voltage") {
    return kOperationModes[1].canonical;
  }
  return kUnexpectedResponse;
}

SetStatus SourceMeasureUnit::set_source_function(const std::string &function) {
  return session_.set_token(smu_spec("SourceMode", ":Source:Function {}"),
                            function, kSourceFunctions);
}

std::string SourceMeasureUnit::get_source_function() {
  return session_.query_enum(":Source:Function?", kSourceFunctions);
}

SetStatus SourceMeasureUnit::set_sense_function(const std::string &function) {
  return session_.set_token(smu_spec("SenseMode", ":Sense:Function \"{}\""),
                            function, kSenseFunctions);
}

std::string SourceMeasureUnit::get_sense_function() {
  return session_.query_enum(":Sense:Function?", kSenseFunctions);
}

std::string SourceMeasureUnit::source_header() {
  std::string word = header_word(get_source_function());
  if (word.empty() || word == "Resistance") {
    session_.diagnose("SOURCE", "Source function unknown, nothing sent");
    return "";
  }
  return word;
}

std::string SourceMeasureUnit::sense_header() {
  std::string word = header_word(get_sense_function());
  if (word.empty()) {
    session_.diagnose("SENSE", "Sense function unknown, nothing sent");
  }
  return word;
}

// Source parameters

SetStatus SourceMeasureUnit::set_output_value(double value) {
  std::string fm = source_header();
  if (fm.empty())
    return SetStatus::NotSent;
  NumericRange range = fm == "Current" ? NumericRange{-1.05, 1.05}
                                       : NumericRange{-210.0, 210.0};
  return session_.set_numeric(
      smu_spec("OutputValue",
               fmt::format(":Source:{}:Level:Amplitude {{}}", fm), range),
      value);
}

double SourceMeasureUnit::get_output_value() {
  std::string fm = source_header();
  if (fm.empty())
    return std::numeric_limits<double>::quiet_NaN();
  return session_.query_double(
      fmt::format(":Source:{}:Level:Amplitude?", fm));
}

SetStatus SourceMeasureUnit::set_source_readback(bool on) {
  std::string fm = source_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_flag(
      smu_spec("Readback", fmt::format(":Source:{}:Read:Back {{}}", fm)), on);
}

bool SourceMeasureUnit::get_source_readback() {
  std::string fm = source_header();
  return !fm.empty() &&
         session_.query_bool(fmt::format(":Source:{}:Read:Back?", fm));
}

SetStatus SourceMeasureUnit::set_source_range(double range) {
  std::string fm = source_header();
  if (fm.empty())
    return SetStatus::NotSent;
  NumericRange limits = fm == "Current" ? NumericRange{1e-8, 1.0}
                                        : NumericRange{0.02, 200.0};
  return session_.set_range(
      smu_spec("Range", fmt::format(":Source:{}:Range {{}}", fm), limits),
      range);
}

double SourceMeasureUnit::get_source_range() {
  std::string fm = source_header();
  if (fm.empty())
    return std::numeric_limits<double>::quiet_NaN();
  return session_.query_double(fmt::format(":Source:{}:Range?", fm));
}

SetStatus SourceMeasureUnit::set_source_auto_range(bool on) {
  std::string fm = source_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_flag(
      smu_spec("AutoRange", fmt::format(":Source:{}:Range:Auto {{}}", fm)),
      on);
}

bool SourceMeasureUnit::get_source_auto_range() {
  std::string fm = source_header();
  return !fm.empty() &&
         session_.query_bool(fmt::format(":Source:{}:Range:Auto?", fm));
}

SetStatus SourceMeasureUnit::set_output_off_state(const std::string &state) {
  std::string fm = source_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_token(
      smu_spec("OutputOffState", fmt::format(":Output:{}:SMode {{}}", fm)),
      state, kOffStates);
}

std::string SourceMeasureUnit::get_output_off_state() {
  std::string fm = source_header();
  if (fm.empty())
    return kCommunicationProblem;
  return session_.query_enum(fmt::format(":Output:{}:SMode?", fm),
                             kOffStates);
}

SetStatus SourceMeasureUnit::set_interlock(bool on) {
  return session_.set_flag(
      smu_spec("Interlock", ":Output:Interlock:State {}"), on);
}

bool SourceMeasureUnit::get_interlock() {
  return session_.query_bool(":Output:Interlock:State?");
}

bool SourceMeasureUnit::get_interlock_signal() {
  return session_.query_bool(":Output:Interlock:Tripped?");
}

SetStatus SourceMeasureUnit::set_limit_value(double limit) {
  std::string fm = source_header();
  if (fm.empty())
    return SetStatus::NotSent;
  // Current source limits the voltage and vice versa
  if (fm == "Current") {
    return session_.set_numeric(smu_spec("LimitValue",
                                         ":Source:Current:Vlimit {}",
                                         NumericRange{0.002, 210.0}),
                                limit);
  }
  return session_.set_numeric(smu_spec("LimitValue",
                                       ":Source:Voltage:Ilimit {}",
                                       NumericRange{1e-9, 1.05}),
                              limit);
}

double SourceMeasureUnit::get_limit_value() {
  std::string fm = source_header();
  if (fm.empty())
    return std::numeric_limits<double>::quiet_NaN();
  return session_.query_double(fm == "Current" ? ":Source:Current:Vlimit?"
                                               : ":Source:Voltage:Ilimit?");
}

bool SourceMeasureUnit::get_limit_tripped() {
  std::string fm = source_header();
  if (fm.empty())
    return false;
  return session_.query_bool(fm == "Current"
                                 ? ":Source:Current:Vlimit:Tripped?"
                                 : ":Source:Voltage:Ilimit:Tripped?");
}

SetStatus SourceMeasureUnit::set_ov_protection_value(double volts) {
  std::string step = ov_protection_step(volts);
  if (step.empty()) {
    session_.diagnose("OVProtectionValue",
                      fmt::format("Invalid parameter value {}", volts));
    return SetStatus::NotSent;
  }
  return session_.set_exact(
      smu_spec("OVProtectionValue", ":Source:Voltage:Protection:Level {}"),
      step);
}

std::string SourceMeasureUnit::get_ov_protection_value() {
  return ResponseParser::to_upper(
      session_.query_text(":Source:Voltage:Protection:Level?"));
}

bool SourceMeasureUnit::get_ov_protection_tripped() {
  return session_.query_bool(":Source:Voltage:Protection:Tripped?");
}

SetStatus SourceMeasureUnit::set_source_delay(double seconds) {
  std::string fm = source_header();
  if (fm.empty())
    return SetStatus::NotSent;
  // The 2450 accepts up to 1e4 s; longer delays would outlast the timeout
  return session_.set_numeric(smu_spec("Delay",
                                       fmt::format(":Source:{}:Delay {{}}", fm),
                                       NumericRange{0.0, 1.0}),
                              seconds);
}

double SourceMeasureUnit::get_source_delay() {
  std::string fm = source_header();
  if (fm.empty())
    return std::numeric_limits<double>::quiet_NaN();
  return session_.query_double(fmt::format(":Source:{}:Delay?", fm));
}

SetStatus SourceMeasureUnit::set_source_auto_delay(bool on) {
  std::string fm = source_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_flag(
      smu_spec("AutoDelay", fmt::format(":Source:{}:Delay:Auto {{}}", fm)),
      on);
}

bool SourceMeasureUnit::get_source_auto_delay() {
  std::string fm = source_header();
  return !fm.empty() &&
         session_.query_bool(fmt::format(":Source:{}:Delay:Auto?", fm));
}

SetStatus SourceMeasureUnit::set_high_cap_mode(bool on) {
  std::string fm = source_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_flag(
      smu_spec("HighCapMode", fmt::format(":Source:{}:High:Cap {{}}", fm)),
      on);
}

bool SourceMeasureUnit::get_high_cap_mode() {
  std::string fm = source_header();
  return !fm.empty() &&
         session_.query_bool(fmt::format(":Source:{}:High:Cap?", fm));
}

// Sense parameters

SetStatus SourceMeasureUnit::set_sense_unit(const std::string &unit) {
  std::string fm = sense_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_token(
      smu_spec("Unit", fmt::format(":Sense:{}:Unit {{}}", fm)), unit,
      kSenseUnits);
}

std::string SourceMeasureUnit::get_sense_unit() {
  std::string fm = sense_header();
  if (fm.empty())
    return kCommunicationProblem;
  return session_.query_enum(fmt::format(":Sense:{}:Unit?", fm), kSenseUnits);
}

SetStatus SourceMeasureUnit::set_sense_range(double range) {
  std::string fm = sense_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_range(smu_spec("Range",
                                     fmt::format(":Sense:{}:Range {{}}", fm),
                                     sense_range_limits(fm)),
                            range);
}

double SourceMeasureUnit::get_sense_range() {
  std::string fm = sense_header();
  if (fm.empty())
    return std::numeric_limits<double>::quiet_NaN();
  return session_.query_double(fmt::format(":Sense:{}:Range?", fm));
}

SetStatus SourceMeasureUnit::set_sense_auto_range(bool on) {
  std::string fm = sense_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_flag(
      smu_spec("AutoRange", fmt::format(":Sense:{}:Range:Auto {{}}", fm)), on);
}

bool SourceMeasureUnit::get_sense_auto_range() {
  std::string fm = sense_header();
  return !fm.empty() &&
         session_.query_bool(fmt::format(":Sense:{}:Range:Auto?", fm));
}

SetStatus SourceMeasureUnit::set_auto_range_lower_limit(double limit) {
  std::string fm = sense_header();
  if (fm.empty())
    return SetStatus::NotSent;

  // The lower limit must stay below the upper limit
  NumericRange limits = sense_range_limits(fm);
  double upper = session_.query_double(
      fmt::format(":Sense:{}:Range:Auto:ULimit?", fm));
  if (!std::isnan(upper) && upper >= limits.min) {
    limits.max = upper;
  }

  return session_.set_range(
      smu_spec("AutoRangeLowerLimit",
               fmt::format(":Sense:{}:Range:Auto:LLimit {{}}", fm), limits),
      limit);
}

double SourceMeasureUnit::get_auto_range_lower_limit() {
  std::string fm = sense_header();
  if (fm.empty())
    return std::numeric_limits<double>::quiet_NaN();
  return session_.query_double(
      fmt::format(":Sense:{}:Range:Auto:LLimit?", fm));
}

SetStatus SourceMeasureUnit::set_auto_range_rebound(bool on) {
  std::string fm = sense_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_flag(
      smu_spec("AutoRangeRebound",
               fmt::format(":Sense:{}:Range:Auto:Rebound {{}}", fm)),
      on);
}

bool SourceMeasureUnit::get_auto_range_rebound() {
  std::string fm = sense_header();
  return !fm.empty() &&
         session_.query_bool(fmt::format(":Sense:{}:Range:Auto:Rebound?", fm));
}

SetStatus SourceMeasureUnit::set_nplc(double cycles) {
  std::string fm = sense_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_numeric(smu_spec("NPLCycles",
                                       fmt::format(":Sense:{}:NPLCycles {{}}",
                                                   fm),
                                       NumericRange{0.01, 10.0}),
                              cycles);
}

double SourceMeasureUnit::get_nplc() {
  std::string fm = sense_header();
  if (fm.empty())
    return std::numeric_limits<double>::quiet_NaN();
  return session_.query_double(fmt::format(":Sense:{}:NPLCycles?", fm));
}

SetStatus SourceMeasureUnit::set_average_count(double count) {
  if (std::isnan(count)) {
    session_.diagnose("AverageCount", "Invalid parameter value");
    return SetStatus::NotSent;
  }
  std::string fm = sense_header();
  if (fm.empty())
    return SetStatus::NotSent;

  double filter = std::round(std::clamp(count, 0.0, 100.0));
  SetStatus status = session_.set_flag(
      smu_spec("AverageCount", fmt::format(":Sense:{}:Average:State {{}}", fm)),
      filter > 0);
  if (filter > 0) {
    CommandSpec count_spec{"AverageCount",
                           fmt::format(":Sense:{}:Average:Count {{}}", fm),
                           1.0,
                           NumberFormat::Fixed,
                           0,
                           NumericRange{1.0, 100.0}};
    status = combine(status, session_.set_numeric(count_spec, filter));
  }
  return status;
}

double SourceMeasureUnit::get_average_count() {
  std::string fm = sense_header();
  if (fm.empty())
    return std::numeric_limits<double>::quiet_NaN();

  QueryResult state =
      session_.query(fmt::format(":Sense:{}:Average:State?", fm));
  if (!state.ok()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (!ResponseParser::parse_bool(state.response)) {
    return 0.0;
  }
  return session_.query_double(fmt::format(":Sense:{}:Average:Count?", fm));
}

SetStatus SourceMeasureUnit::set_average_mode(const std::string &mode) {
  std::string fm = sense_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_token(
      smu_spec("AverageMode", fmt::format(":Sense:{}:Average:Tcontrol {{}}", fm)),
      mode, kAverageModes);
}

std::string SourceMeasureUnit::get_average_mode() {
  std::string fm = sense_header();
  if (fm.empty())
    return kCommunicationProblem;
  return session_.query_enum(fmt::format(":Sense:{}:Average:Tcontrol?", fm),
                             kAverageModes);
}

SetStatus SourceMeasureUnit::set_remote_sensing(bool on) {
  std::string fm = sense_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_flag(
      smu_spec("RemoteSensing", fmt::format(":Sense:{}:Rsense {{}}", fm)), on);
}

bool SourceMeasureUnit::get_remote_sensing() {
  std::string fm = sense_header();
  return !fm.empty() &&
         session_.query_bool(fmt::format(":Sense:{}:Rsense?", fm));
}

SetStatus SourceMeasureUnit::set_auto_zero(bool on) {
  std::string fm = sense_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_flag(
      smu_spec("AutoZero", fmt::format(":Sense:{}:Azero:State {{}}", fm)), on);
}

bool SourceMeasureUnit::get_auto_zero() {
  std::string fm = sense_header();
  return !fm.empty() &&
         session_.query_bool(fmt::format(":Sense:{}:Azero:State?", fm));
}

SetStatus SourceMeasureUnit::set_offset_compensation(bool on) {
  std::string fm = sense_header();
  if (fm.empty())
    return SetStatus::NotSent;
  return session_.set_flag(
      smu_spec("OffsetCompensation",
               fmt::format(":Sense:{}:Ocompensated {{}}", fm)),
      on);
}

bool SourceMeasureUnit::get_offset_compensation() {
  std::string fm = sense_header();
  return !fm.empty() &&
         session_.query_bool(fmt::format(":Sense:{}:Ocompensated?", fm));
}

// Named field access

SetStatus SourceMeasureUnit::set_flag_text(
    const std::string &field, const std::string &value,
    const std::function<SetStatus(bool)> &setter) {
  std::string token = ResponseParser::to_upper(ResponseParser::trim(value));
  if (token == "1" || token == "ON" || token == "YES" || token == "TRUE") {
    return setter(true);
  }
  if (token == "0" || token == "OFF" || token == "NO" || token == "FALSE") {
    return setter(false);
  }
  session_.diagnose(field, fmt::format("Invalid parameter value '{}'", value));
  return SetStatus::NotSent;
}

SetStatus SourceMeasureUnit::set_number_text(
    const std::string &field, const std::string &value,
    const std::function<SetStatus(double)> &setter) {
  double number = ResponseParser::parse_double(value);
  if (std::isnan(number)) {
    session_.diagnose(field,
                      fmt::format("Invalid parameter value '{}'", value));
    return SetStatus::NotSent;
  }
  return setter(number);
}

void SourceMeasureUnit::build_field_tables() {
  auto flag = [this](const std::string &field,
                     SetStatus (SourceMeasureUnit::*setter)(bool),
                     bool (SourceMeasureUnit::*getter)()) {
    FieldAccessor accessor;
    accessor.set = [this, field, setter](const std::string &value) {
      return set_flag_text(field, value,
                           [this, setter](bool on) { return (this->*setter)(on); });
    };
    accessor.get = [this, getter]() { return FieldValue((this->*getter)()); };
    return std::make_pair(field, accessor);
  };

  auto number = [this](const std::string &field,
                       SetStatus (SourceMeasureUnit::*setter)(double),
                       double (SourceMeasureUnit::*getter)()) {
    FieldAccessor accessor;
    accessor.set = [this, field, setter](const std::string &value) {
      return set_number_text(
          field, value, [this, setter](double v) { return (this->*setter)(v); });
    };
    accessor.get = [this, getter]() { return FieldValue((this->*getter)()); };
    return std::make_pair(field, accessor);
  };

  auto token = [this](const std::string &field,
                      SetStatus (SourceMeasureUnit::*setter)(
                          const std::string &),
                      std::string (SourceMeasureUnit::*getter)()) {
    FieldAccessor accessor;
    accessor.set = [this, setter](const std::string &value) {
      return (this->*setter)(value);
    };
    accessor.get = [this, getter]() { return FieldValue((this->*getter)()); };
    return std::make_pair(field, accessor);
  };

  auto read_only = [this](const std::string &field,
                          bool (SourceMeasureUnit::*getter)()) {
    FieldAccessor accessor;
    accessor.get = [this, getter]() { return FieldValue((this->*getter)()); };
    return std::make_pair(field, accessor);
  };

  auto ov_protection = [this]() {
    FieldAccessor accessor;
    accessor.set = [this](const std::string &value) {
      return set_number_text("OVProtectionValue", value, [this](double v) {
        return set_ov_protection_value(v);
      });
    };
    accessor.get = [this]() { return FieldValue(get_ov_protection_value()); };
    return std::make_pair(std::string("OVProtectionValue"), accessor);
  };

  using S = SourceMeasureUnit;
  source_fields_ = {
      number("OutputValue", &S::set_output_value, &S::get_output_value),
      flag("Readback", &S::set_source_readback, &S::get_source_readback),
      number("Range", &S::set_source_range, &S::get_source_range),
      flag("AutoRange", &S::set_source_auto_range, &S::get_source_auto_range),
      token("OutputOffState", &S::set_output_off_state,
            &S::get_output_off_state),
      flag("Interlock", &S::set_interlock, &S::get_interlock),
      read_only("InterlockSignal", &S::get_interlock_signal),
      number("LimitValue", &S::set_limit_value, &S::get_limit_value),
      read_only("LimitTripped", &S::get_limit_tripped),
      ov_protection(),
      read_only("OVProtectionTripped", &S::get_ov_protection_tripped),
      number("Delay", &S::set_source_delay, &S::get_source_delay),
      flag("AutoDelay", &S::set_source_auto_delay, &S::get_source_auto_delay),
      flag("HighCapMode", &S::set_high_cap_mode, &S::get_high_cap_mode),
  };

  sense_fields_ = {
      token("Unit", &S::set_sense_unit, &S::get_sense_unit),
      number("Range", &S::set_sense_range, &S::get_sense_range),
      flag("AutoRange", &S::set_sense_auto_range, &S::get_sense_auto_range),
      number("AutoRangeLowerLimit", &S::set_auto_range_lower_limit,
             &S::get_auto_range_lower_limit),
      flag("AutoRangeRebound", &S::set_auto_range_rebound,
           &S::get_auto_range_rebound),
      number("NPLCycles", &S::set_nplc, &S::get_nplc),
      number("AverageCount", &S::set_average_count, &S::get_average_count),
      token("AverageMode", &S::set_average_mode, &S::get_average_mode),
      flag("RemoteSensing", &S::set_remote_sensing, &S::get_remote_sensing),
      flag("AutoZero", &S::set_auto_zero, &S::get_auto_zero),
      flag("OffsetCompensation", &S::set_offset_compensation,
           &S::get_offset_compensation),
  };
}

FieldAccessor *SourceMeasureUnit::find_accessor(FieldTable &table,
                                                const std::string &name) {
  for (auto &[field, accessor] : table) {
    if (same_name(field, name)) {
      return &accessor;
    }
  }
  return nullptr;
}

SetStatus SourceMeasureUnit::set_field(FieldTable &table,
                                       const std::string &operation,
                                       const std::string &name,
                                       const ParamValue &value) {
  FieldAccessor *accessor = find_accessor(table, name);
  if (!accessor) {
    session_.diagnose(operation,
                      fmt::format("Parameter name '{}' is unknown. Ignore "
                                  "parameter.",
                                  name));
    return SetStatus::NotSent;
  }
  if (!accessor->set) {
    session_.diagnose(operation,
                      fmt::format("Parameter '{}' is read-only", name));
    return SetStatus::NotSent;
  }

  FieldResult coerced = ParameterValidator::coerce(value);
  if (auto *rejected = std::get_if<Rejected>(&coerced)) {
    session_.diagnose(operation, fmt::format("Parameter '{}': {}", name,
                                             rejected->reason));
    return SetStatus::NotSent;
  }
  return accessor->set(std::get<Accepted>(coerced).value);
}

SetStatus SourceMeasureUnit::configure(FieldTable &table,
                                       const ParameterValidator &validator,
                                       const std::string &operation,
                                       const ParamList &params) {
  ValidationResult validated = validator.validate(params);
  session_.report(operation, validated.diagnostics);
  if (validated.params.empty()) {
    return SetStatus::NotSent;
  }

  SetStatus aggregate = SetStatus::NotSent;
  for (const auto &[name, value] : validated.params) {
    FieldAccessor *accessor = find_accessor(table, name);
    if (!accessor || !accessor->set) {
      session_.diagnose(operation,
                        fmt::format("Parameter '{}' is read-only", name));
      continue;
    }
    aggregate = combine(aggregate, accessor->set(value));
  }
  return aggregate;
}

SetStatus SourceMeasureUnit::set_source_parameter(const std::string &name,
                                                  const ParamValue &value) {
  return set_field(source_fields_, "SourceParameters", name, value);
}

std::optional<FieldValue>
SourceMeasureUnit::get_source_parameter(const std::string &name) {
  FieldAccessor *accessor = find_accessor(source_fields_, name);
  if (!accessor) {
    session_.diagnose("SourceParameters",
                      fmt::format("Parameter name '{}' is unknown", name));
    return std::nullopt;
  }
  return accessor->get();
}

SetStatus SourceMeasureUnit::set_sense_parameter(const std::string &name,
                                                 const ParamValue &value) {
  return set_field(sense_fields_, "SenseParameters", name, value);
}

std::optional<FieldValue>
SourceMeasureUnit::get_sense_parameter(const std::string &name) {
  FieldAccessor *accessor = find_accessor(sense_fields_, name);
  if (!accessor) {
    session_.diagnose("SenseParameters",
                      fmt::format("Parameter name '{}' is unknown", name));
    return std::nullopt;
  }
  return accessor->get();
}

SetStatus SourceMeasureUnit::configure_source(const ParamList &params) {
  return configure(source_fields_, source_validator_, "SourceParameters",
                   params);
}

SetStatus SourceMeasureUnit::configure_sense(const ParamList &params) {
  return configure(sense_fields_, sense_validator_, "SenseParameters", params);
}

std::vector<std::string> SourceMeasureUnit::source_parameter_names() const {
  std::vector<std::string> names;
  for (const auto &entry : source_fields_) {
    names.push_back(entry.first);
  }
  return names;
}

std::vector<std::string> SourceMeasureUnit::sense_parameter_names() const {
  std::vector<std::string> names;
  for (const auto &entry : sense_fields_) {
    names.push_back(entry.first);
  }
  return names;
}

// Miscellaneous

double SourceMeasureUnit::get_power_line_frequency() {
  return session_.query_double(":System:LFrequency?");
}

std::string SourceMeasureUnit::get_active_buffer() {
  std::string buffer = session_.query_text(":Display:Buffer:Active?");
  if (ResponseParser::is_marker(buffer)) {
    return buffer;
  }
  return ResponseParser::to_lower(buffer);
}

bool SourceMeasureUnit::is_buffer(const std::string &name) const {
  return std::any_of(buffers_.begin(), buffers_.end(),
                     [&](const std::string &b) { return same_name(b, name); });
}

int SourceMeasureUnit::add_buffer(const std::string &name) {
  if (is_buffer(name)) {
    return -1;
  }
  buffers_.push_back(name);
  return 0;
}

int SourceMeasureUnit::delete_buffer(const std::string &name) {
  bool is_default =
      std::any_of(kDefaultBuffers.begin(), kDefaultBuffers.end(),
                  [&](const std::string &b) { return same_name(b, name); });
  if (is_default) {
    return -1;
  }
  if (!is_buffer(name)) {
    return -2;
  }
  buffers_.erase(std::remove_if(buffers_.begin(), buffers_.end(),
                                [&](const std::string &b) {
                                  return same_name(b, name);
                                }),
                 buffers_.end());
  return 0;
}

void SourceMeasureUnit::reset_buffers() { buffers_ = kDefaultBuffers; }

// Event log

std::vector<ErrorLogEntry> SourceMeasureUnit::error_messages() {
  auto fresh = session_.read_errors();
  if (fresh.empty()) {
    session_.notify("ERRORS", "No new messages");
  }
  for (const auto &entry : fresh) {
    session_.notify("ERRORS",
                    fmt::format("{} {} {}: {}", entry.device_time,
                                to_string(entry.severity), entry.code,
                                entry.description));
  }
  return fresh;
}

bool SourceMeasureUnit::clear_error_messages() {
  session_.notify("ERRORS", "Clear event log");
  return session_.clear_errors();
}

nlohmann::json SourceMeasureUnit::settings_snapshot() {
  nlohmann::json j;
  j["driver"] = metadata_.to_json();
  j["terminals"] = get_terminals();
  j["operation_mode"] = get_operation_mode();
  j["output_state"] = get_output_state();

  nlohmann::json source = nlohmann::json::object();
  for (auto &[name, accessor] : source_fields_) {
    source[name] = to_json(accessor.get());
  }
  j["source"] = source;

  nlohmann::json sense = nlohmann::json::object();
  for (auto &[name, accessor] : sense_fields_) {
    sense[name] = to_json(accessor.get());
  }
  j["sense"] = sense;

  j["power_line_frequency"] = to_json(FieldValue(get_power_line_frequency()));
  j["active_buffer"] = get_active_buffer();
  j["available_buffers"] = buffers_;
  return j;
}

} // namespace scpidrv
