#include "scpi-driver/transport/VisaTransport.hpp"
#include "scpi-driver/Logger.hpp"

#include <algorithm>
#include <cctype>

namespace scpidrv {

std::string VisaTransport::normalize_resource(const std::string &address) {
  std::string upper = address;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper.size() > 3 && upper.compare(0, 3, "COM") == 0 &&
      std::all_of(upper.begin() + 3, upper.end(),
                  [](unsigned char c) { return std::isdigit(c); })) {
    return "ASRL" + upper.substr(3) + "::INSTR";
  }
  return address;
}

VisaTransport::VisaTransport(const ConnectionConfig &config)
    : resource_(normalize_resource(config.resource)),
      terminator_(config.terminator) {
  std::string upper = resource_;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  serial_ = upper.compare(0, 4, "ASRL") == 0;

  ViStatus status = viOpenDefaultRM(&default_rm_);
  if (status < VI_SUCCESS) {
    throw TransportError("Failed to open VISA resource manager", status);
  }

  status = viOpen(default_rm_, const_cast<ViRsrc>(resource_.c_str()), VI_NULL,
                  VI_NULL, &session_);
  if (status < VI_SUCCESS) {
    viClose(default_rm_);
    default_rm_ = VI_NULL;
    throw TransportError(
        fmt::format("Failed to open VISA resource '{}'", resource_), status);
  }

  set_attribute("timeout", VI_ATTR_TMO_VALUE,
                static_cast<ViAttrState>(config.timeout.count()));
  set_attribute("termchar", VI_ATTR_TERMCHAR,
                static_cast<ViAttrState>(terminator_.back()));
  set_attribute("termchar enable", VI_ATTR_TERMCHAR_EN, VI_TRUE);

  if (serial_) {
    configure_serial(config);
  }

  LOG_INFO("VISA", "OPEN", "Opened '{}' (timeout {} ms)", resource_,
           config.timeout.count());
}

void VisaTransport::configure_serial(const ConnectionConfig &config) {
  set_attribute("baud rate", VI_ATTR_ASRL_BAUD, config.baud_rate);
  set_attribute("data bits", VI_ATTR_ASRL_DATA_BITS, 8);
  set_attribute("parity", VI_ATTR_ASRL_PARITY, VI_ASRL_PAR_NONE);
  set_attribute("stop bits", VI_ATTR_ASRL_STOP_BITS, VI_ASRL_STOP_ONE);
  set_attribute("end in", VI_ATTR_ASRL_END_IN, VI_ASRL_END_TERMCHAR);
  set_attribute("end out", VI_ATTR_ASRL_END_OUT, VI_ASRL_END_NONE);
}

void VisaTransport::set_attribute(const char *name, ViAttr attribute,
                                  ViAttrState value) {
  ViStatus status = viSetAttribute(session_, attribute, value);
  if (status < VI_SUCCESS) {
    LOG_WARN("VISA", "OPEN", "Setting {} on '{}' failed: {}", name, resource_,
             status);
  }
}

VisaTransport::~VisaTransport() { close(); }

void VisaTransport::close() {
  if (session_ != VI_NULL) {
    viClose(session_);
    session_ = VI_NULL;
  }
  if (default_rm_ != VI_NULL) {
    viClose(default_rm_);
    default_rm_ = VI_NULL;
  }
}

int VisaTransport::write(const std::string &line) {
  std::string data = line + terminator_;
  ViUInt32 written = 0;
  ViStatus status =
      viWrite(session_, (ViBuf)data.c_str(),
              static_cast<ViUInt32>(data.size()), &written);
  if (status < VI_SUCCESS) {
    LOG_DEBUG("VISA", "WRITE", "viWrite '{}' failed: {}", line, status);
    return status;
  }
  if (written != data.size()) {
    LOG_DEBUG("VISA", "WRITE", "Short write: {} of {} bytes", written,
              data.size());
    return -1;
  }
  return 0;
}

int VisaTransport::read(std::string &line) {
  line.clear();
  char buffer[1024];
  ViStatus status;

  do {
    ViUInt32 bytes_read = 0;
    status = viRead(session_, reinterpret_cast<ViBuf>(buffer), sizeof(buffer),
                    &bytes_read);
    if (status < VI_SUCCESS) {
      LOG_DEBUG("VISA", "READ", "viRead failed: {}", status);
      return status;
    }
    line.append(buffer, bytes_read);
  } while (status == VI_SUCCESS_MAX_CNT);

  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
  return 0;
}

size_t VisaTransport::bytes_pending() {
  if (!serial_) {
    return 0;
  }
  ViUInt32 available = 0;
  ViStatus status =
      viGetAttribute(session_, VI_ATTR_ASRL_AVAIL_NUM, &available);
  if (status < VI_SUCCESS) {
    return 0;
  }
  return available;
}

} // namespace scpidrv
