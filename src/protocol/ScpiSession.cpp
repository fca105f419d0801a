#include "scpi-driver/protocol/ScpiSession.hpp"
#include "scpi-driver/Logger.hpp"

#include <cmath>
#include <thread>

namespace scpidrv {

ScpiSession::ScpiSession(std::unique_ptr<Transport> transport,
                         SessionOptions options)
    : transport_(std::move(transport)),
      device_name_(options.device_name.empty() ? "SCPI"
                                               : options.device_name),
      verbosity_(options.verbosity), verifier_(options.limits),
      error_queue_(options.error_queue),
      settle_pauses_(options.settle_pauses) {
  if (!transport_) {
    throw std::invalid_argument("ScpiSession requires a transport");
  }
}

// Raw I/O

int ScpiSession::write(const std::string &command) {
  auto level = verbosity_ == Verbosity::All ? spdlog::level::info
                                            : spdlog::level::trace;
  DriverLogger::instance().log(level, device_name_, "WRITE", "-> {}", command);

  int status = transport_->write(command);
  if (status != 0) {
    status_.last_error =
        fmt::format("write '{}' failed with status {}", command, status);
    diagnose("WRITE", *status_.last_error);
  }
  return status;
}

QueryResult ScpiSession::query(const std::string &command) {
  auto level = verbosity_ == Verbosity::All ? spdlog::level::info
                                            : spdlog::level::trace;
  DriverLogger::instance().log(level, device_name_, "QUERY", "-> {}", command);

  QueryResult result = transport_->query(command);
  if (!result.ok()) {
    status_.last_error =
        fmt::format("query '{}' failed with status {}", command, result.status);
    diagnose("QUERY", *status_.last_error);
  } else {
    DriverLogger::instance().log(level, device_name_, "QUERY", "<- {}",
                                 result.response);
  }
  return result;
}

double ScpiSession::query_double(const std::string &command) {
  return ResponseParser::parse_double(query(command));
}

bool ScpiSession::query_bool(const std::string &command) {
  return ResponseParser::parse_bool(query(command));
}

std::string ScpiSession::query_enum(const std::string &command,
                                    const EnumTable &table) {
  QueryResult result = query(command);
  std::string value = ResponseParser::parse_enum(result, table);
  if (value == kUnexpectedResponse) {
    diagnose("QUERY", fmt::format("Unexpected response '{}' to '{}'",
                                  result.response, command));
  }
  return value;
}

std::string ScpiSession::query_text(const std::string &command) {
  QueryResult result = query(command);
  if (!result.ok()) {
    return kCommunicationProblem;
  }
  return ResponseParser::unquote(result.response);
}

int ScpiSession::wait_complete() {
  QueryResult result = query("*OPC?");
  if (!result.ok()) {
    return result.status;
  }
  return ResponseParser::parse_double(result.response) == 1.0 ? 0 : -1;
}

// Verified setters

SetStatus ScpiSession::set_numeric(const CommandSpec &spec, double value) {
  if (!std::isfinite(value)) {
    diagnose(spec.name, fmt::format("Invalid parameter value {}", value));
    return SetStatus::NotSent;
  }

  double requested = CommandBuilder::clip(spec, value);
  if (requested != value) {
    notify(spec.name, fmt::format("Value {} clipped to {}", value, requested));
  }

  write(CommandBuilder::build_numeric(spec, value));
  double actual =
      query_double(CommandBuilder::build_query(spec)) / spec.unit_scale;

  if (!verifier_.numeric_matches(requested, actual)) {
    mismatch(spec.name, fmt::format("{}", requested),
             fmt::format("{}", actual));
    return SetStatus::Mismatch;
  }
  return SetStatus::Applied;
}

SetStatus ScpiSession::set_range(const CommandSpec &spec, double value) {
  if (!std::isfinite(value)) {
    diagnose(spec.name, fmt::format("Invalid parameter value {}", value));
    return SetStatus::NotSent;
  }

  double requested = CommandBuilder::clip(spec, value);
  write(CommandBuilder::build_numeric(spec, value));
  double actual =
      query_double(CommandBuilder::build_query(spec)) / spec.unit_scale;

  if (!verifier_.range_matches(requested, actual)) {
    mismatch(spec.name, fmt::format("{}", requested),
             fmt::format("{}", actual));
    return SetStatus::Mismatch;
  }
  return SetStatus::Applied;
}

SetStatus ScpiSession::set_flag(const CommandSpec &spec, bool value,
                                BoolDialect dialect) {
  write(CommandBuilder::build_flag(spec, value, dialect));
  bool actual = query_bool(CommandBuilder::build_query(spec));

  if (!ReadbackVerifier::flag_matches(value, actual)) {
    mismatch(spec.name, value ? "on" : "off", actual ? "on" : "off");
    return SetStatus::Mismatch;
  }
  return SetStatus::Applied;
}

SetStatus ScpiSession::set_token(const CommandSpec &spec,
                                 const std::string &token,
                                 const EnumTable &table) {
  const EnumAlias *alias = ResponseParser::find_alias(token, table);
  if (!alias) {
    diagnose(spec.name, fmt::format("Invalid parameter value '{}'", token));
    return SetStatus::NotSent;
  }

  write(CommandBuilder::build_token(spec, alias->wire));
  std::string actual = query_enum(CommandBuilder::build_query(spec), table);

  if (!ReadbackVerifier::token_matches(alias->canonical, actual)) {
    mismatch(spec.name, alias->canonical, actual);
    return SetStatus::Mismatch;
  }
  return SetStatus::Applied;
}

SetStatus ScpiSession::set_exact(const CommandSpec &spec,
                                 const std::string &token) {
  if (ResponseParser::trim(token).empty()) {
    return SetStatus::NotSent;
  }

  write(CommandBuilder::build_token(spec, token));
  std::string actual = query_text(CommandBuilder::build_query(spec));

  if (!ReadbackVerifier::token_matches(token, actual)) {
    mismatch(spec.name, token, actual);
    return SetStatus::Mismatch;
  }
  return SetStatus::Applied;
}

// Diagnostics

void ScpiSession::notify(const std::string &operation,
                         const std::string &message) {
  auto level = verbosity_ == Verbosity::None ? spdlog::level::debug
                                             : spdlog::level::info;
  DriverLogger::instance().log(level, device_name_, operation, "{}", message);
}

void ScpiSession::diagnose(const std::string &operation,
                           const std::string &message) {
  auto level = verbosity_ == Verbosity::None ? spdlog::level::debug
                                             : spdlog::level::warn;
  DriverLogger::instance().log(level, device_name_, operation, "{}", message);
}

void ScpiSession::report(const std::string &operation,
                         const std::vector<std::string> &diagnostics) {
  for (const auto &message : diagnostics) {
    diagnose(operation, message);
  }
}

void ScpiSession::mismatch(const std::string &operation,
                           const std::string &wanted,
                           const std::string &actual) {
  status_.last_error = fmt::format(
      "{} was not set properly (wanted {}, actually set {})", operation,
      wanted, actual);
  diagnose(operation, *status_.last_error);
}

// Error queue

std::vector<ErrorLogEntry> ScpiSession::read_errors() {
  auto fresh = error_queue_.drain(*transport_, device_name_);
  for (const auto &entry : fresh) {
    if (entry.severity == ErrorSeverity::Unknown) {
      status_.last_error = entry.description;
    } else {
      status_.last_error =
          fmt::format("{},\"{}\"", entry.code, entry.description);
    }
  }
  return fresh;
}

bool ScpiSession::clear_errors() {
  if (!error_queue_.clear(*transport_, device_name_)) {
    diagnose("ERRORS", "Clearing the device error queue failed");
    return false;
  }
  status_.last_error.reset();
  return true;
}

void ScpiSession::settle(std::chrono::milliseconds duration) {
  if (settle_pauses_ && duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
}

} // namespace scpidrv
