#pragma once
#include "scpi-driver/export.h"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace scpidrv {

/// Thrown only when a transport cannot be opened at all
class SCPI_DRIVER_API TransportError : public std::runtime_error {
public:
  TransportError(const std::string &message, int status)
      : std::runtime_error(message), status_(status) {}

  int status() const { return status_; }

private:
  int status_;
};

/// Result of a command-then-read round trip. status 0 means success,
/// anything else is a transport-level failure (timeout, I/O error)
struct QueryResult {
  int status{0};
  std::string response;

  bool ok() const { return status == 0; }
};

/// Line-oriented ASCII transport to one instrument. Terminators are a
/// transport concern: write() appends one, read() strips it.
class SCPI_DRIVER_API Transport {
public:
  virtual ~Transport() = default;

  virtual int write(const std::string &line) = 0;
  virtual int read(std::string &line) = 0;

  /// Write followed by a single read
  virtual QueryResult query(const std::string &command);

  /// Number of bytes waiting in the input buffer, 0 when unknown
  virtual size_t bytes_pending() { return 0; }
};

} // namespace scpidrv
