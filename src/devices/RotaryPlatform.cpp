#include "scpi-driver/devices/RotaryPlatform.hpp"
#include "scpi-driver/Logger.hpp"
#include "scpi-driver/transport/EchoingTransport.hpp"

namespace scpidrv {

namespace {

const NumericRange kAngleRange{-360.0, 360.0};

const CommandSpec kAngle{"angle", "ROTAtion:ANGLE {}", 1.0, NumberFormat::Fixed,
                         3, kAngleRange};
const CommandSpec kUpperLimit{"upper limit", "ROTAtion:LIMit:UPPer {}", 1.0,
                              NumberFormat::Fixed, 3, kAngleRange};
const CommandSpec kLowerLimit{"lower limit", "ROTAtion:LIMit:LOWer {}", 1.0,
                              NumberFormat::Fixed, 3, kAngleRange};
const CommandSpec kEnableRemote{"motor enable remote",
                                "MOTOR:ENABLEREMote {}"};

} // namespace

DriverMetadata RotaryPlatform::default_metadata() {
  return {"RotaryPlatform", "2.0.0", "2026-01-19"};
}

SessionOptions RotaryPlatform::prepare_options(SessionOptions options,
                                               const DriverMetadata &metadata) {
  if (options.device_name.empty()) {
    options.device_name = metadata.name;
  }
  options.error_queue.dialect = ErrorQueueDialect::Standard;
  options.error_queue.next_query = "SYSTem:ERRor?";
  options.error_queue.clear_command = "*CLS";
  return options;
}

std::unique_ptr<Transport>
RotaryPlatform::wrap_transport(std::unique_ptr<Transport> transport,
                               const SessionOptions &options) {
  if (!transport) {
    throw std::invalid_argument("RotaryPlatform requires a transport");
  }
  if (!options.settle_pauses) {
    return std::make_unique<EchoingTransport>(
        std::move(transport),
        EchoingTransport::Timing{std::chrono::milliseconds(0),
                                 std::chrono::milliseconds(0)});
  }
  return std::make_unique<EchoingTransport>(std::move(transport));
}

RotaryPlatform::RotaryPlatform(std::unique_ptr<Transport> transport,
                               SessionOptions options, DriverMetadata metadata)
    : session_(wrap_transport(std::move(transport), options),
               prepare_options(options, metadata)),
      metadata_(std::move(metadata)) {
  session_.notify("INIT", fmt::format("{} driver {} ({})", metadata_.name,
                                      metadata_.version,
                                      metadata_.release_date));
}

std::string RotaryPlatform::get_id() { return session_.query_text("*IDN?"); }

std::string RotaryPlatform::get_error() {
  return session_.query_text("SYSTem:ERRor?");
}

// Front panel

int RotaryPlatform::lock_local() {
  return session_.write("SYSTem:LOCal:LOCK");
}

int RotaryPlatform::unlock_local() {
  return session_.write("SYSTem:LOCal:UNLock");
}

bool RotaryPlatform::is_locked() {
  return session_.query_bool("SYSTem:LOCal:LOCK?");
}

// Rotation

SetStatus RotaryPlatform::set_angle(double degrees) {
  SetStatus status = session_.set_numeric(kAngle, degrees);
  if (status == SetStatus::Applied) {
    session_.notify("ROTATE", fmt::format("Moving to {:.3f} deg",
                                          kAngleRange.clip(degrees)));
  }
  return status;
}

double RotaryPlatform::get_target_angle() {
  return session_.query_double("ROTAtion:ANGLE?");
}

double RotaryPlatform::get_position() {
  return session_.query_double("ROTAtion:POSition?");
}

bool RotaryPlatform::is_reached() {
  return session_.query_bool("ROTAtion:REACHED?");
}

SetStatus RotaryPlatform::set_upper_limit(double degrees) {
  return session_.set_numeric(kUpperLimit, degrees);
}

double RotaryPlatform::get_upper_limit() {
  return session_.query_double("ROTAtion:LIMit:UPPer?");
}

SetStatus RotaryPlatform::set_lower_limit(double degrees) {
  return session_.set_numeric(kLowerLimit, degrees);
}

double RotaryPlatform::get_lower_limit() {
  return session_.query_double("ROTAtion:LIMit:LOWer?");
}

// Motor

bool RotaryPlatform::is_motor_enabled() {
  bool enabled = session_.query_bool("MOTOR:ENABLED?");
  session_.status().output_enabled = enabled;
  return enabled;
}

bool RotaryPlatform::is_motor_enable_local() {
  return session_.query_bool("MOTOR:ENABLELOCal?");
}

bool RotaryPlatform::is_motor_enable_remote() {
  return session_.query_bool("MOTOR:ENABLEREMote?");
}

SetStatus RotaryPlatform::set_motor_enable_remote(bool enable) {
  SetStatus status = session_.set_flag(kEnableRemote, enable);
  if (status == SetStatus::Applied) {
    session_.notify("MOTOR", enable ? "Remote enable set"
                                    : "Remote enable cleared");
  }
  return status;
}

bool RotaryPlatform::is_motor_volt_lockout() {
  return session_.query_bool("MOTOR:VOLTLOCKout?");
}

// Error queue

std::vector<ErrorLogEntry> RotaryPlatform::error_messages() {
  auto fresh = session_.read_errors();
  if (fresh.empty()) {
    session_.notify("ERRORS", "No new messages");
  }
  for (const auto &entry : fresh) {
    session_.notify("ERRORS",
                    fmt::format("{}: {}", entry.code, entry.description));
  }
  return fresh;
}

bool RotaryPlatform::clear_error_messages() { return session_.clear_errors(); }

} // namespace scpidrv
