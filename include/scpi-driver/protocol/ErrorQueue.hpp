#pragma once
#include "scpi-driver/export.h"
#include "scpi-driver/transport/Transport.hpp"
#include "scpi-driver/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace scpidrv {

enum class ErrorQueueDialect {
  Standard, // repeated next-error query, 'code,"description"'
  EventLog, // pending count, then 'code,"description;type;time"' per event
};

struct ErrorQueueConfig {
  ErrorQueueDialect dialect{ErrorQueueDialect::Standard};
  std::string next_query{"SYST:ERR?"};
  std::string count_query;         // EventLog only
  std::string clear_command{"*CLS"};
  size_t max_iterations{10};       // upper bound of queries per drain
};

/// Session-lifetime, append-only log of device errors. Every drain bounds
/// the number of next-error queries, so a device that never reports an empty
/// queue cannot stall the caller.
class SCPI_DRIVER_API ErrorQueue {
public:
  explicit ErrorQueue(ErrorQueueConfig config);

  /// Reads pending entries from the device and appends them to the log.
  /// Returns only the entries appended by this call.
  std::vector<ErrorLogEntry> drain(Transport &transport,
                                   const std::string &device);

  /// Clears the device-side queue, then the local log. The local log is
  /// kept when the device could not be reached.
  bool clear(Transport &transport, const std::string &device);

  const std::vector<ErrorLogEntry> &entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  const ErrorQueueConfig &config() const { return config_; }

  /// nullopt for "no error" replies, an Unknown entry for malformed ones
  static std::optional<ErrorLogEntry> parse_standard(const std::string &line);
  static ErrorLogEntry parse_event(const std::string &line);

  static ErrorLogEntry unexpected_entry(const std::string &description);

private:
  std::vector<ErrorLogEntry> drain_standard(Transport &transport,
                                            const std::string &device);
  std::vector<ErrorLogEntry> drain_event_log(Transport &transport,
                                             const std::string &device);

  ErrorQueueConfig config_;
  std::vector<ErrorLogEntry> entries_;
};

} // namespace scpidrv
