#pragma once
#include "scpi-driver/SessionConfig.hpp"
#include "scpi-driver/export.h"
#include "scpi-driver/transport/Transport.hpp"

#include <string>
#include <visa.h>

namespace scpidrv {

/// Transport over a VISA session (TCPIP, USB, GPIB or ASRL serial).
/// "COMn" identifiers are accepted and mapped to "ASRLn::INSTR".
class VisaTransport : public Transport {
public:
  /// Throws TransportError when the resource manager or resource cannot be
  /// opened
  explicit VisaTransport(const ConnectionConfig &config);
  ~VisaTransport() override;

  VisaTransport(const VisaTransport &) = delete;
  VisaTransport &operator=(const VisaTransport &) = delete;

  int write(const std::string &line) override;
  int read(std::string &line) override;
  size_t bytes_pending() override;

  const std::string &resource() const { return resource_; }
  bool is_serial() const { return serial_; }

  static std::string normalize_resource(const std::string &address);

private:
  void configure_serial(const ConnectionConfig &config);
  void set_attribute(const char *name, ViAttr attribute, ViAttrState value);
  void close();

  std::string resource_;
  std::string terminator_;
  bool serial_{false};
  ViSession default_rm_{VI_NULL};
  ViSession session_{VI_NULL};
};

} // namespace scpidrv
