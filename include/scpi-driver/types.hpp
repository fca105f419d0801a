#pragma once
#include "scpi-driver/export.h"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace scpidrv {

enum class OperatingMode { CurrentMode, PowerMode, Unknown };

/// Controls how much human-readable progress text a session emits
enum class Verbosity { None, Few, All };

/// Outcome of every setter
enum class SetStatus : int {
  Applied = 0,  // written and verified by readback
  NotSent = 1,  // nothing (valid) to send
  Mismatch = 2, // written, readback disagrees
};

enum class ErrorSeverity { Error, Warning, Info, Unknown };

SCPI_DRIVER_API std::string to_string(OperatingMode mode);
SCPI_DRIVER_API std::string to_string(Verbosity verbosity);
SCPI_DRIVER_API std::string to_string(SetStatus status);
SCPI_DRIVER_API std::string to_string(ErrorSeverity severity);

/// Parses "none" / "few" / "all" (case-insensitive)
SCPI_DRIVER_API std::optional<Verbosity>
parse_verbosity(const std::string &text);

inline int to_int(SetStatus status) { return static_cast<int>(status); }

/// Folds the status of one more field into an aggregate batch status.
/// Mismatch dominates Applied, Applied dominates NotSent.
SCPI_DRIVER_API SetStatus combine(SetStatus aggregate, SetStatus next);

struct SCPI_DRIVER_API NumericRange {
  double min;
  double max;

  double clip(double value) const;
  bool contains(double value) const { return value >= min && value <= max; }
};

/// One entry of the per-session device error log
struct SCPI_DRIVER_API ErrorLogEntry {
  std::chrono::system_clock::time_point timestamp; // host time when drained
  int code{0};
  ErrorSeverity severity{ErrorSeverity::Unknown};
  std::string description;
  std::string device_time; // only set by devices with a time-stamped log

  nlohmann::json to_json() const;
};

/// Session-lifetime status cache of a device
struct SCPI_DRIVER_API DeviceStatus {
  bool output_enabled{false};
  OperatingMode mode{OperatingMode::Unknown};
  std::optional<std::string> last_error;

  nlohmann::json to_json() const;
};

/// Driver identity injected at construction
struct SCPI_DRIVER_API DriverMetadata {
  std::string name;
  std::string version;
  std::string release_date;

  nlohmann::json to_json() const;
};

} // namespace scpidrv
