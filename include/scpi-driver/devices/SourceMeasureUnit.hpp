#pragma once
#include "scpi-driver/export.h"
#include "scpi-driver/protocol/ParameterValidator.hpp"
#include "scpi-driver/protocol/ScpiSession.hpp"
#include "scpi-driver/types.hpp"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace scpidrv {

/// Value of a named source/sense field
using FieldValue = std::variant<double, bool, std::string>;

SCPI_DRIVER_API nlohmann::json to_json(const FieldValue &value);

/// Typed accessor pair behind one named field. Read-only fields have no
/// setter.
struct FieldAccessor {
  std::function<SetStatus(const std::string &)> set;
  std::function<FieldValue()> get;
};

struct TriggerState {
  std::string state; // e.g. "idle", or a marker string
  std::string block_state;
  std::string block_number;
};

/// Driver for the Keithley 2450 source-measure unit.
///
/// Source and sense settings are reachable both through typed methods and
/// by field name (e.g. "OutputValue", "NPLCycles"). Field setters take the
/// coerced text form of a value and always read the setting back.
class SCPI_DRIVER_API SourceMeasureUnit {
public:
  static DriverMetadata default_metadata();

  /// Switches the output off and waits for completion; throws
  /// TransportError when the device does not confirm
  explicit SourceMeasureUnit(std::unique_ptr<Transport> transport,
                             SessionOptions options = {},
                             DriverMetadata metadata = default_metadata());
  /// Switches the output off before the transport is closed
  ~SourceMeasureUnit();

  SourceMeasureUnit(const SourceMeasureUnit &) = delete;
  SourceMeasureUnit &operator=(const SourceMeasureUnit &) = delete;

  // Housekeeping
  std::string get_id();
  int reset();
  int clear();
  /// Not supported by the 2450, always 0
  int lock();
  int unlock();
  int run_after_open();
  int run_before_close();

  // Output
  int output_enable();
  int output_disable();
  SetStatus set_output_state(bool on);
  bool get_output_state();

  /// Beeper; parameters "frequency" (Hz, 20..8000, default 1000) and
  /// "duration" (s, 0.001..100, default 1). Does not wait for the tone.
  int output_tone(const ParamList &params = {});

  // Triggering
  int restart_trigger();
  int abort_trigger();
  int refresh_zero_reference();
  TriggerState get_trigger_state();

  // Terminals, "front" or "rear"
  SetStatus set_terminals(const std::string &terminals);
  std::string get_terminals();

  // Functions
  /// "SVMI" (source voltage, measure current) or "SIMV"
  SetStatus set_operation_mode(const std::string &mode);
  /// "Source:V_Sense:I", "Source:I_Sense:V" or a marker string
  std::string get_operation_mode();
  SetStatus set_source_function(const std::string &function);
  /// "voltage", "current" or a marker string
  std::string get_source_function();
  SetStatus set_sense_function(const std::string &function);
  /// "voltage", "current", "resistance" or a marker string
  std::string get_sense_function();

  // Source parameters (unit follows the source function)
  SetStatus set_output_value(double value);
  double get_output_value();
  SetStatus set_source_readback(bool on);
  bool get_source_readback();
  SetStatus set_source_range(double range);
  double get_source_range();
  SetStatus set_source_auto_range(bool on);
  bool get_source_auto_range();
  SetStatus set_output_off_state(const std::string &state);
  std::string get_output_off_state();
  SetStatus set_interlock(bool on);
  bool get_interlock();
  bool get_interlock_signal();
  SetStatus set_limit_value(double limit);
  double get_limit_value();
  bool get_limit_tripped();
  /// Coerced up to the next protection step (2, 5, 10, 20, 40 ... 180 V),
  /// above 180 V protection is off
  SetStatus set_ov_protection_value(double volts);
  std::string get_ov_protection_value();
  bool get_ov_protection_tripped();
  SetStatus set_source_delay(double seconds);
  double get_source_delay();
  SetStatus set_source_auto_delay(bool on);
  bool get_source_auto_delay();
  SetStatus set_high_cap_mode(bool on);
  bool get_high_cap_mode();

  // Sense parameters (unit follows the sense function)
  SetStatus set_sense_unit(const std::string &unit);
  std::string get_sense_unit();
  SetStatus set_sense_range(double range);
  double get_sense_range();
  SetStatus set_sense_auto_range(bool on);
  bool get_sense_auto_range();
  SetStatus set_auto_range_lower_limit(double limit);
  double get_auto_range_lower_limit();
  SetStatus set_auto_range_rebound(bool on);
  bool get_auto_range_rebound();
  SetStatus set_nplc(double cycles);
  double get_nplc();
  /// 0 disables averaging, 1..100 sets the filter count
  SetStatus set_average_count(double count);
  double get_average_count();
  SetStatus set_average_mode(const std::string &mode);
  std::string get_average_mode();
  SetStatus set_remote_sensing(bool on);
  bool get_remote_sensing();
  SetStatus set_auto_zero(bool on);
  bool get_auto_zero();
  SetStatus set_offset_compensation(bool on);
  bool get_offset_compensation();

  // Named field access
  SetStatus set_source_parameter(const std::string &name,
                                 const ParamValue &value);
  std::optional<FieldValue> get_source_parameter(const std::string &name);
  SetStatus set_sense_parameter(const std::string &name,
                                const ParamValue &value);
  std::optional<FieldValue> get_sense_parameter(const std::string &name);
  /// Batch variants over name/value pairs
  SetStatus configure_source(const ParamList &params);
  SetStatus configure_sense(const ParamList &params);

  std::vector<std::string> source_parameter_names() const;
  std::vector<std::string> sense_parameter_names() const;

  // Miscellaneous
  double get_power_line_frequency();
  std::string get_active_buffer();

  // Reading buffers known to this session
  const std::vector<std::string> &available_buffers() const {
    return buffers_;
  }
  bool is_buffer(const std::string &name) const;
  /// 0 added, -1 already known
  int add_buffer(const std::string &name);
  /// 0 removed, -1 default buffer, -2 unknown buffer
  int delete_buffer(const std::string &name);
  void reset_buffers();

  // Event log
  std::vector<ErrorLogEntry> error_messages();
  bool clear_error_messages();
  const std::vector<ErrorLogEntry> &error_log() const {
    return session_.error_log();
  }

  /// All readable settings as one JSON document
  nlohmann::json settings_snapshot();

  const DeviceStatus &status() const { return session_.status(); }
  const DriverMetadata &metadata() const { return metadata_; }
  ScpiSession &session() { return session_; }

private:
  using FieldTable = std::vector<std::pair<std::string, FieldAccessor>>;

  static SessionOptions prepare_options(SessionOptions options,
                                        const DriverMetadata &metadata);

  static std::vector<FieldSpec> source_field_specs();
  static std::vector<FieldSpec> sense_field_specs();

  void build_field_tables();
  FieldAccessor *find_accessor(FieldTable &table, const std::string &name);
  SetStatus set_field(FieldTable &table, const std::string &operation,
                      const std::string &name, const ParamValue &value);
  SetStatus configure(FieldTable &table, const ParameterValidator &validator,
                      const std::string &operation, const ParamList &params);

  /// "Current"/"Voltage"(/"Resistance") as used in command headers, empty
  /// when the function cannot be read
  std::string source_header();
  std::string sense_header();

  SetStatus set_flag_text(const std::string &field, const std::string &value,
                          const std::function<SetStatus(bool)> &setter);
  SetStatus set_number_text(const std::string &field,
                            const std::string &value,
                            const std::function<SetStatus(double)> &setter);

  ScpiSession session_;
  DriverMetadata metadata_;
  FieldTable source_fields_;
  FieldTable sense_fields_;
  ParameterValidator source_validator_;
  ParameterValidator sense_validator_;
  std::vector<std::string> buffers_;
};

} // namespace scpidrv
