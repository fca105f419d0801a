#include "scpi-driver/SessionConfig.hpp"
#include "scpi-driver/Logger.hpp"

namespace scpidrv {

nlohmann::json yaml_to_json(const YAML::Node &node) {
  if (node.IsNull()) {
    return nullptr;
  } else if (node.IsScalar()) {
    // Quoted scalars are always strings
    if (node.Tag() == "!") {
      return node.as<std::string>();
    }
    int64_t int_value;
    if (YAML::convert<int64_t>::decode(node, int_value)) {
      return int_value;
    }
    double double_value;
    if (YAML::convert<double>::decode(node, double_value)) {
      return double_value;
    }
    bool bool_value;
    if (YAML::convert<bool>::decode(node, bool_value)) {
      return bool_value;
    }
    return node.as<std::string>();
  } else if (node.IsSequence()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  } else if (node.IsMap()) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  return nullptr;
}

static std::string scalar_text(const nlohmann::json &value) {
  return value.is_string() ? value.get<std::string>() : value.dump();
}

SessionConfig SessionConfig::load_file(const std::string &path) {
  LOG_INFO("CONFIG", "LOAD", "Loading session config from: {}", path);

  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception &ex) {
    throw ConfigError(fmt::format("Failed to load {}: {}", path, ex.what()));
  }
  return from_yaml(root);
}

SessionConfig SessionConfig::from_yaml(const YAML::Node &node) {
  if (!node.IsMap()) {
    throw ConfigError("Session config must be a mapping");
  }

  nlohmann::json config = yaml_to_json(node);
  SessionConfig result;

  if (!config.contains("name")) {
    throw ConfigError("Config missing 'name' field");
  }
  result.name = scalar_text(config["name"]);

  if (!config.contains("driver")) {
    throw ConfigError("Config missing 'driver' field");
  }
  result.driver = scalar_text(config["driver"]);
  if (result.driver != "ComboSource6301" && result.driver != "SMU2450" &&
      result.driver != "RotaryPlatform") {
    throw ConfigError(fmt::format(
        "Unknown driver '{}' (ComboSource6301|SMU2450|RotaryPlatform)",
        result.driver));
  }

  if (!config.contains("connection") || !config["connection"].is_object()) {
    throw ConfigError("Config missing 'connection' section");
  }
  const auto &conn = config["connection"];
  if (!conn.contains("resource")) {
    throw ConfigError("Config missing 'connection.resource' field");
  }
  result.connection.resource = scalar_text(conn["resource"]);

  try {
    if (conn.contains("baud_rate")) {
      result.connection.baud_rate = conn["baud_rate"].get<uint32_t>();
    }
    if (conn.contains("terminator")) {
      result.connection.terminator = conn["terminator"].get<std::string>();
    }
    if (conn.contains("echo")) {
      result.connection.echo = conn["echo"].get<bool>();
    }
    if (conn.contains("timeout_ms")) {
      result.connection.timeout =
          std::chrono::milliseconds(conn["timeout_ms"].get<int64_t>());
    }
  } catch (const nlohmann::json::exception &ex) {
    throw ConfigError(
        fmt::format("Invalid value in 'connection' section: {}", ex.what()));
  }

  if (result.connection.terminator.empty()) {
    throw ConfigError("'connection.terminator' must not be empty");
  }

  if (config.contains("verbosity")) {
    auto verbosity = parse_verbosity(scalar_text(config["verbosity"]));
    if (!verbosity) {
      throw ConfigError(fmt::format("Unknown verbosity '{}' (none|few|all)",
                                    scalar_text(config["verbosity"])));
    }
    result.verbosity = *verbosity;
  }

  if (config.contains("logging") && config["logging"].is_object()) {
    const auto &logging = config["logging"];
    if (logging.contains("file")) {
      result.log_file = scalar_text(logging["file"]);
    }
    if (logging.contains("level")) {
      auto level = spdlog::level::from_str(scalar_text(logging["level"]));
      // from_str maps unknown names to off
      if (level == spdlog::level::off &&
          scalar_text(logging["level"]) != "off") {
        throw ConfigError(fmt::format("Unknown log level '{}'",
                                      scalar_text(logging["level"])));
      }
      result.log_level = level;
    }
  }

  return result;
}

nlohmann::json SessionConfig::to_json() const {
  nlohmann::json j;
  j["name"] = name;
  j["driver"] = driver;
  j["connection"] = {{"resource", connection.resource},
                     {"baud_rate", connection.baud_rate},
                     {"terminator", connection.terminator},
                     {"echo", connection.echo},
                     {"timeout_ms", connection.timeout.count()}};
  j["verbosity"] = to_string(verbosity);
  j["logging"] = {
      {"file", log_file},
      {"level", std::string(spdlog::level::to_string_view(log_level).data(),
                            spdlog::level::to_string_view(log_level).size())}};
  return j;
}

} // namespace scpidrv
