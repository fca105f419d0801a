#pragma once
#include "scpi-driver/export.h"
#include "scpi-driver/transport/Transport.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace scpidrv {

/// Decorator for serial firmware that retransmits every received line
/// before answering. Echoed lines are read and discarded so callers only
/// ever see the real response.
class SCPI_DRIVER_API EchoingTransport : public Transport {
public:
  struct Timing {
    std::chrono::milliseconds write_settle{50};
    std::chrono::milliseconds query_settle{100};
  };

  explicit EchoingTransport(std::unique_ptr<Transport> inner);
  EchoingTransport(std::unique_ptr<Transport> inner, Timing timing);

  int write(const std::string &line) override;
  int read(std::string &line) override;
  QueryResult query(const std::string &command) override;
  size_t bytes_pending() override { return inner_->bytes_pending(); }

  /// Number of echo lines discarded so far
  size_t echoes_discarded() const { return echoes_discarded_; }

private:
  static bool is_echo(const std::string &sent, const std::string &received);

  std::unique_ptr<Transport> inner_;
  Timing timing_;
  size_t echoes_discarded_{0};
};

} // namespace scpidrv
