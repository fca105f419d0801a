#include "scpi-driver/transport/EchoingTransport.hpp"
#include "scpi-driver/Logger.hpp"
#include "scpi-driver/protocol/ResponseParser.hpp"

#include <thread>

namespace scpidrv {

EchoingTransport::EchoingTransport(std::unique_ptr<Transport> inner)
    : EchoingTransport(std::move(inner), Timing{}) {}

EchoingTransport::EchoingTransport(std::unique_ptr<Transport> inner,
                                   Timing timing)
    : inner_(std::move(inner)), timing_(timing) {
  if (!inner_) {
    throw std::invalid_argument("EchoingTransport requires a transport");
  }
}

bool EchoingTransport::is_echo(const std::string &sent,
                               const std::string &received) {
  return ResponseParser::trim(sent) == ResponseParser::trim(received);
}

int EchoingTransport::write(const std::string &line) {
  int status = inner_->write(line);
  if (status != 0) {
    return status;
  }

  if (timing_.write_settle.count() > 0) {
    std::this_thread::sleep_for(timing_.write_settle);
  }

  // Setters produce no response, so anything waiting is the echo
  if (inner_->bytes_pending() > 0) {
    std::string echo;
    if (inner_->read(echo) == 0) {
      if (is_echo(line, echo)) {
        ++echoes_discarded_;
      } else {
        LOG_DEBUG("TRANSPORT", "ECHO",
                  "Discarded unexpected line after '{}': '{}'",
                  ResponseParser::trim(line), ResponseParser::trim(echo));
      }
    }
  }
  return 0;
}

int EchoingTransport::read(std::string &line) { return inner_->read(line); }

QueryResult EchoingTransport::query(const std::string &command) {
  QueryResult result;
  result.status = inner_->write(command);
  if (result.status != 0) {
    return result;
  }

  if (timing_.query_settle.count() > 0) {
    std::this_thread::sleep_for(timing_.query_settle);
  }

  std::string first;
  result.status = inner_->read(first);
  if (result.status != 0) {
    return result;
  }

  if (!is_echo(command, first)) {
    // Firmware skipped the echo, the first line is already the answer
    result.response = ResponseParser::trim(first);
    return result;
  }

  ++echoes_discarded_;
  std::string response;
  result.status = inner_->read(response);
  if (result.status == 0) {
    result.response = ResponseParser::trim(response);
  }
  return result;
}

} // namespace scpidrv
