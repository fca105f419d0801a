#include "scpi-driver/types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace scpidrv {

std::string to_string(OperatingMode mode) {
  switch (mode) {
  case OperatingMode::CurrentMode:
    return "current";
  case OperatingMode::PowerMode:
    return "power";
  case OperatingMode::Unknown:
    break;
  }
  return "unknown";
}

std::string to_string(Verbosity verbosity) {
  switch (verbosity) {
  case Verbosity::None:
    return "none";
  case Verbosity::Few:
    return "few";
  case Verbosity::All:
    return "all";
  }
  return "few";
}

std::string to_string(SetStatus status) {
  switch (status) {
  case SetStatus::Applied:
    return "applied";
  case SetStatus::NotSent:
    return "not sent";
  case SetStatus::Mismatch:
    return "readback mismatch";
  }
  return "unknown";
}

std::string to_string(ErrorSeverity severity) {
  switch (severity) {
  case ErrorSeverity::Error:
    return "Error";
  case ErrorSeverity::Warning:
    return "Warning";
  case ErrorSeverity::Info:
    return "Information";
  case ErrorSeverity::Unknown:
    break;
  }
  return "unknown";
}

std::optional<Verbosity> parse_verbosity(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "none")
    return Verbosity::None;
  if (lower == "few")
    return Verbosity::Few;
  if (lower == "all")
    return Verbosity::All;
  return std::nullopt;
}

SetStatus combine(SetStatus aggregate, SetStatus next) {
  if (aggregate == SetStatus::Mismatch || next == SetStatus::Mismatch)
    return SetStatus::Mismatch;
  if (aggregate == SetStatus::Applied || next == SetStatus::Applied)
    return SetStatus::Applied;
  return SetStatus::NotSent;
}

double NumericRange::clip(double value) const {
  return std::clamp(value, min, max);
}

nlohmann::json ErrorLogEntry::to_json() const {
  std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
  nlohmann::json j;
  j["timestamp"] = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(t));
  j["code"] = code;
  j["severity"] = to_string(severity);
  j["description"] = description;
  if (!device_time.empty()) {
    j["device_time"] = device_time;
  }
  return j;
}

nlohmann::json DeviceStatus::to_json() const {
  nlohmann::json j;
  j["output_enabled"] = output_enabled;
  j["mode"] = to_string(mode);
  if (last_error) {
    j["last_error"] = *last_error;
  } else {
    j["last_error"] = nullptr;
  }
  return j;
}

nlohmann::json DriverMetadata::to_json() const {
  return {{"name", name}, {"version", version}, {"release_date", release_date}};
}

} // namespace scpidrv
