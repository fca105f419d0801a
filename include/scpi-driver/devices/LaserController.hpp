#pragma once
#include "scpi-driver/export.h"
#include "scpi-driver/protocol/ParameterValidator.hpp"
#include "scpi-driver/protocol/ScpiSession.hpp"
#include "scpi-driver/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace scpidrv {

/// Driver for the ComboSource 6301 laser diode / TEC controller.
///
/// Currents are in mA and powers in mW on this API; the wire uses A and W.
/// Getters return NaN (numbers), false (flags) or a marker string when the
/// device does not answer.
class SCPI_DRIVER_API LaserController {
public:
  static DriverMetadata default_metadata();

  explicit LaserController(std::unique_ptr<Transport> transport,
                           SessionOptions options = {},
                           DriverMetadata metadata = default_metadata());

  // Identity and housekeeping
  std::string get_id();
  std::string get_error();
  int clear();
  int reset();
  int lock();
  int unlock();

  // Laser output
  SetStatus enable_laser();
  SetStatus disable_laser();
  bool is_laser_enabled();

  // Current control (mA)
  SetStatus set_current(double milliamps);
  double get_current();
  double get_measured_current();
  SetStatus set_current_limit(double milliamps);
  double get_current_limit();

  // Power control (mW)
  SetStatus set_power(double milliwatts);
  double get_power();
  double get_measured_power();
  SetStatus set_power_limit(double milliwatts);
  double get_power_limit();

  // Temperature (degC)
  double get_temperature();
  /// TEC current in A
  double get_tec_current();
  SetStatus set_temp_limit_low(double celsius);
  double get_temp_limit_low();
  SetStatus set_temp_limit_high(double celsius);
  double get_temp_limit_high();

  // Operating mode
  /// Accepts "current"/"curr"/"cc" or "power"/"pow"/"cp"; anything else is
  /// dropped and nothing is sent
  SetStatus set_mode(const std::string &mode);
  SetStatus set_mode_constant_current();
  SetStatus set_mode_constant_power();
  /// "current", "power" or a marker string
  std::string get_mode();

  // Status and safety
  /// -1 when the status byte cannot be read
  int get_status_byte();
  /// false on communication failure
  bool is_interlock_closed();
  bool is_over_temp();

  /// Batch configuration from name/value pairs.
  /// Fields: mode, limit, current, power, temperature, enable. "limit" goes
  /// to the current or power limit depending on the active mode,
  /// "temperature" is the upper temperature limit.
  SetStatus apply(const ParamList &params);

  /// Drains SYST:ERR? and returns the entries read by this call
  std::vector<ErrorLogEntry> error_messages();
  bool clear_error_messages();
  const std::vector<ErrorLogEntry> &error_log() const {
    return session_.error_log();
  }

  const DeviceStatus &status() const { return session_.status(); }
  const DriverMetadata &metadata() const { return metadata_; }
  ScpiSession &session() { return session_; }

  static const ParameterValidator &parameter_table();

private:
  static SessionOptions prepare_options(SessionOptions options,
                                        const DriverMetadata &metadata);

  SetStatus apply_field(const std::string &name, const std::string &value);

  ScpiSession session_;
  DriverMetadata metadata_;
};

} // namespace scpidrv
