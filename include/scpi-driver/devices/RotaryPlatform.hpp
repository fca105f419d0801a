#pragma once
#include "scpi-driver/export.h"
#include "scpi-driver/protocol/ScpiSession.hpp"
#include "scpi-driver/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace scpidrv {

/// Driver for the HTWD-DT-2025 rotary platform.
///
/// The firmware echoes every received line, so the transport handed to the
/// constructor is wrapped in an EchoingTransport. Angles are in degrees.
class SCPI_DRIVER_API RotaryPlatform {
public:
  static DriverMetadata default_metadata();

  explicit RotaryPlatform(std::unique_ptr<Transport> transport,
                          SessionOptions options = {},
                          DriverMetadata metadata = default_metadata());

  std::string get_id();
  std::string get_error();

  // Front panel
  int lock_local();
  int unlock_local();
  bool is_locked();

  // Rotation
  /// Target angle, clipped to -360..360 and verified against the target
  /// readback. Returns once the command is accepted; poll is_reached().
  SetStatus set_angle(double degrees);
  double get_target_angle();
  double get_position();
  /// True once the target is reached and held
  bool is_reached();

  SetStatus set_upper_limit(double degrees);
  double get_upper_limit();
  SetStatus set_lower_limit(double degrees);
  double get_lower_limit();

  // Motor
  bool is_motor_enabled();
  /// State of the green enable button
  bool is_motor_enable_local();
  bool is_motor_enable_remote();
  SetStatus set_motor_enable_remote(bool enable);
  /// Under-voltage lockout
  bool is_motor_volt_lockout();

  std::vector<ErrorLogEntry> error_messages();
  bool clear_error_messages();
  const std::vector<ErrorLogEntry> &error_log() const {
    return session_.error_log();
  }

  const DeviceStatus &status() const { return session_.status(); }
  const DriverMetadata &metadata() const { return metadata_; }
  ScpiSession &session() { return session_; }

private:
  static SessionOptions prepare_options(SessionOptions options,
                                        const DriverMetadata &metadata);
  static std::unique_ptr<Transport>
  wrap_transport(std::unique_ptr<Transport> transport,
                 const SessionOptions &options);

  ScpiSession session_;
  DriverMetadata metadata_;
};

} // namespace scpidrv
