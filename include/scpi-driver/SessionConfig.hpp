#pragma once
#include "scpi-driver/export.h"
#include "scpi-driver/types.hpp"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace scpidrv {

class SCPI_DRIVER_API ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ConnectionConfig {
  std::string resource;           // VISA resource string or COM identifier
  uint32_t baud_rate{115200};     // serial resources only
  std::string terminator{"\n"};
  bool echo{false};               // device echoes every received line
  std::chrono::milliseconds timeout{5000};
};

/// Per-device session configuration, loaded from YAML
struct SCPI_DRIVER_API SessionConfig {
  std::string name;
  std::string driver; // "ComboSource6301", "SMU2450" or "RotaryPlatform"
  ConnectionConfig connection;
  Verbosity verbosity{Verbosity::Few};
  std::string log_file{"scpi_driver.log"};
  spdlog::level::level_enum log_level{spdlog::level::info};

  /// Throws ConfigError when the file is unreadable or incomplete
  static SessionConfig load_file(const std::string &path);
  static SessionConfig from_yaml(const YAML::Node &node);

  nlohmann::json to_json() const;
};

/// Converts a YAML tree into JSON, typing scalars as int, double, bool or
/// string in that order of preference
SCPI_DRIVER_API nlohmann::json yaml_to_json(const YAML::Node &node);

} // namespace scpidrv
