#pragma once
#include "scpi-driver/export.h"
#include "scpi-driver/protocol/CommandBuilder.hpp"
#include "scpi-driver/protocol/ErrorQueue.hpp"
#include "scpi-driver/protocol/ParameterValidator.hpp"
#include "scpi-driver/protocol/ReadbackVerifier.hpp"
#include "scpi-driver/protocol/ResponseParser.hpp"
#include "scpi-driver/transport/Transport.hpp"
#include "scpi-driver/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace scpidrv {

struct SessionOptions {
  std::string device_name;
  Verbosity verbosity{Verbosity::Few};
  VerifierLimits limits;
  ErrorQueueConfig error_queue;
  bool settle_pauses{true}; // firmware settle sleeps after reset/clear
};

/// One synchronous command/response conversation with one device.
///
/// Owns the transport, the status cache and the error log. Getters map
/// transport failures to sentinels, setters write, read back once and
/// report a SetStatus. Human-readable progress and diagnostics are gated by
/// the verbosity: None keeps them in the debug log only.
///
/// Not thread-safe; serialize all calls to one session.
class SCPI_DRIVER_API ScpiSession {
public:
  ScpiSession(std::unique_ptr<Transport> transport, SessionOptions options);

  ScpiSession(const ScpiSession &) = delete;
  ScpiSession &operator=(const ScpiSession &) = delete;

  // Raw I/O
  int write(const std::string &command);
  QueryResult query(const std::string &command);

  // Typed queries
  double query_double(const std::string &command);
  bool query_bool(const std::string &command);
  std::string query_enum(const std::string &command, const EnumTable &table);
  /// Trimmed, unquoted response or kCommunicationProblem
  std::string query_text(const std::string &command);

  /// "*OPC?" round trip, 0 once the device reports completion
  int wait_complete();

  // Verified setters
  SetStatus set_numeric(const CommandSpec &spec, double value);
  SetStatus set_range(const CommandSpec &spec, double value);
  SetStatus set_flag(const CommandSpec &spec, bool value,
                     BoolDialect dialect = BoolDialect::ZeroOne);
  /// Token is resolved through the table; unknown tokens send nothing
  SetStatus set_token(const CommandSpec &spec, const std::string &token,
                      const EnumTable &table);
  /// Writes the token as-is and requires the identical token back
  SetStatus set_exact(const CommandSpec &spec, const std::string &token);

  // Diagnostics
  void notify(const std::string &operation, const std::string &message);
  void diagnose(const std::string &operation, const std::string &message);
  void report(const std::string &operation,
              const std::vector<std::string> &diagnostics);
  void mismatch(const std::string &operation, const std::string &wanted,
                const std::string &actual);

  // Error queue
  std::vector<ErrorLogEntry> read_errors();
  bool clear_errors();
  const std::vector<ErrorLogEntry> &error_log() const {
    return error_queue_.entries();
  }

  void settle(std::chrono::milliseconds duration);

  DeviceStatus &status() { return status_; }
  const DeviceStatus &status() const { return status_; }

  Verbosity verbosity() const { return verbosity_; }
  void set_verbosity(Verbosity verbosity) { verbosity_ = verbosity; }

  const std::string &device_name() const { return device_name_; }
  bool settle_pauses() const { return settle_pauses_; }
  Transport &transport() { return *transport_; }

private:
  std::unique_ptr<Transport> transport_;
  std::string device_name_;
  Verbosity verbosity_;
  ReadbackVerifier verifier_;
  ErrorQueue error_queue_;
  bool settle_pauses_;
  DeviceStatus status_;
};

} // namespace scpidrv
