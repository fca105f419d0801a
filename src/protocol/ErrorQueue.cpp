#include "scpi-driver/protocol/ErrorQueue.hpp"
#include "scpi-driver/Logger.hpp"
#include "scpi-driver/protocol/ResponseParser.hpp"

#include <cmath>
#include <regex>
#include <stdexcept>

namespace scpidrv {

ErrorQueue::ErrorQueue(ErrorQueueConfig config) : config_(std::move(config)) {}

static std::optional<int> parse_code(const std::string &digits) {
  try {
    return std::stoi(digits);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

ErrorLogEntry ErrorQueue::unexpected_entry(const std::string &description) {
  ErrorLogEntry entry;
  entry.timestamp = std::chrono::system_clock::now();
  entry.code = 0;
  entry.severity = ErrorSeverity::Unknown;
  entry.description = description;
  return entry;
}

std::optional<ErrorLogEntry>
ErrorQueue::parse_standard(const std::string &line) {
  static const std::regex entry_pattern(R"(^([+-]?\d+)\s*,\s*(.*)$)");

  std::string text = ResponseParser::trim(line);
  if (ResponseParser::to_lower(text).find("no error") != std::string::npos) {
    return std::nullopt;
  }

  std::smatch match;
  if (!std::regex_match(text, match, entry_pattern)) {
    return unexpected_entry("unexpected response");
  }

  auto code = parse_code(match[1].str());
  if (!code) {
    return unexpected_entry("unexpected response");
  }
  if (*code == 0) {
    return std::nullopt;
  }

  ErrorLogEntry entry;
  entry.timestamp = std::chrono::system_clock::now();
  entry.code = *code;
  entry.severity = ErrorSeverity::Error;
  entry.description = ResponseParser::unquote(match[2].str());
  return entry;
}

ErrorLogEntry ErrorQueue::parse_event(const std::string &line) {
  static const std::regex event_pattern(R"re(^(-?\d+),"(.*);(\d);(.*)"$)re");

  std::string text = ResponseParser::trim(line);
  std::smatch match;
  if (!std::regex_match(text, match, event_pattern)) {
    return unexpected_entry("unexpected response");
  }

  auto code = parse_code(match[1].str());
  if (!code) {
    return unexpected_entry("unexpected response");
  }

  ErrorLogEntry entry;
  entry.timestamp = std::chrono::system_clock::now();
  entry.code = *code;
  switch (match[3].str()[0]) {
  case '1':
    entry.severity = ErrorSeverity::Error;
    break;
  case '2':
    entry.severity = ErrorSeverity::Warning;
    break;
  case '4':
    entry.severity = ErrorSeverity::Info;
    break;
  default:
    entry.severity = ErrorSeverity::Unknown;
    break;
  }
  entry.description = match[2].str();
  entry.device_time = match[4].str();
  return entry;
}

std::vector<ErrorLogEntry> ErrorQueue::drain(Transport &transport,
                                             const std::string &device) {
  std::vector<ErrorLogEntry> fresh =
      config_.dialect == ErrorQueueDialect::EventLog
          ? drain_event_log(transport, device)
          : drain_standard(transport, device);

  entries_.insert(entries_.end(), fresh.begin(), fresh.end());
  return fresh;
}

std::vector<ErrorLogEntry>
ErrorQueue::drain_standard(Transport &transport, const std::string &device) {
  std::vector<ErrorLogEntry> fresh;

  for (size_t i = 0; i < config_.max_iterations; ++i) {
    QueryResult result = transport.query(config_.next_query);
    if (!result.ok()) {
      LOG_DEBUG(device, "ERRORS", "'{}' failed with status {}",
                config_.next_query, result.status);
      fresh.push_back(unexpected_entry("communication problem"));
      return fresh;
    }

    auto entry = parse_standard(result.response);
    if (!entry) {
      return fresh;
    }
    if (entry->severity == ErrorSeverity::Unknown) {
      LOG_DEBUG(device, "ERRORS", "Malformed error entry: '{}'",
                result.response);
    }
    fresh.push_back(std::move(*entry));
  }

  LOG_DEBUG(device, "ERRORS",
            "Stopped after {} queries without an empty-queue reply",
            config_.max_iterations);
  return fresh;
}

std::vector<ErrorLogEntry>
ErrorQueue::drain_event_log(Transport &transport, const std::string &device) {
  std::vector<ErrorLogEntry> fresh;

  double count = ResponseParser::parse_double(
      transport.query(config_.count_query));
  if (!std::isfinite(count) || count < 0) {
    fresh.push_back(unexpected_entry("could not read event buffer"));
    return fresh;
  }

  // Compare before converting, the device may report absurd counts
  size_t pending = config_.max_iterations;
  if (count > static_cast<double>(config_.max_iterations)) {
    LOG_DEBUG(device, "ERRORS", "{} events pending, reading the first {}",
              count, config_.max_iterations);
  } else {
    pending = static_cast<size_t>(count);
  }

  for (size_t i = 0; i < pending; ++i) {
    QueryResult result = transport.query(config_.next_query);
    if (!result.ok()) {
      fresh.push_back(unexpected_entry("communication problem"));
      return fresh;
    }
    ErrorLogEntry entry = parse_event(result.response);
    if (entry.severity == ErrorSeverity::Unknown &&
        entry.device_time.empty()) {
      LOG_DEBUG(device, "ERRORS", "Malformed event entry: '{}'",
                result.response);
    }
    fresh.push_back(std::move(entry));
  }
  return fresh;
}

bool ErrorQueue::clear(Transport &transport, const std::string &device) {
  int status = transport.write(config_.clear_command);
  if (status != 0) {
    LOG_DEBUG(device, "ERRORS", "'{}' failed with status {}",
              config_.clear_command, status);
    return false;
  }
  entries_.clear();
  return true;
}

} // namespace scpidrv
