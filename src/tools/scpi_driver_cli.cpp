#include "scpi-driver/Logger.hpp"
#include "scpi-driver/SessionConfig.hpp"
#include "scpi-driver/devices/LaserController.hpp"
#include "scpi-driver/devices/RotaryPlatform.hpp"
#include "scpi-driver/devices/SourceMeasureUnit.hpp"
#include "scpi-driver/transport/EchoingTransport.hpp"
#include "scpi-driver/transport/VisaTransport.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <type_traits>

using namespace scpidrv;

void print_usage(const char *prog) {
  std::cout << "Usage: " << prog << " --config <path> <command> [args]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  idn                       Print the instrument identity\n";
  std::cout << "  write <cmd>               Send a raw SCPI command\n";
  std::cout << "  query <cmd>               Send a raw SCPI query\n";
  std::cout << "  errors                    Drain the device error queue\n";
  std::cout << "  status                    Print the session status\n";
  std::cout << "  apply <name> <value> ...  Batch configuration\n";
  std::cout << "                            (laser: apply, SMU: source "
               "parameters)\n";
}

static ParamList to_param_list(const std::vector<std::string> &args) {
  ParamList params;
  for (size_t i = 0; i < args.size(); ++i) {
    // Names stay text, values become numbers where they parse as one
    if (i % 2 == 1) {
      char *end = nullptr;
      double number = std::strtod(args[i].c_str(), &end);
      if (!args[i].empty() && end && *end == '\0' && std::isfinite(number)) {
        params.emplace_back(number);
        continue;
      }
    }
    params.emplace_back(args[i]);
  }
  return params;
}

template <typename Device>
int run_command(Device &device, const std::string &command,
                const std::vector<std::string> &args) {
  ScpiSession &session = device.session();

  if (command == "idn") {
    std::cout << device.get_id() << "\n";

  } else if (command == "write") {
    if (args.empty()) {
      std::cerr << "Error: write needs a command\n";
      return 1;
    }
    int status = session.write(args[0]);
    if (status != 0) {
      std::cerr << "Write failed with status " << status << "\n";
      return 1;
    }

  } else if (command == "query") {
    if (args.empty()) {
      std::cerr << "Error: query needs a command\n";
      return 1;
    }
    QueryResult result = session.query(args[0]);
    if (!result.ok()) {
      std::cerr << "Query failed with status " << result.status << "\n";
      return 1;
    }
    std::cout << result.response << "\n";

  } else if (command == "errors") {
    auto entries = device.error_messages();
    nlohmann::json j = nlohmann::json::array();
    for (const auto &entry : entries) {
      j.push_back(entry.to_json());
    }
    std::cout << j.dump(2) << "\n";

  } else if (command == "status") {
    nlohmann::json j;
    j["driver"] = device.metadata().to_json();
    j["status"] = device.status().to_json();
    j["error_log_size"] = device.error_log().size();
    std::cout << j.dump(2) << "\n";

  } else if (command == "apply") {
    if (args.empty()) {
      std::cerr << "Error: apply needs name/value pairs\n";
      return 1;
    }
    SetStatus status = SetStatus::NotSent;
    if constexpr (std::is_same_v<Device, LaserController>) {
      status = device.apply(to_param_list(args));
    } else if constexpr (std::is_same_v<Device, SourceMeasureUnit>) {
      status = device.configure_source(to_param_list(args));
    } else {
      std::cerr << "Error: apply is not available for "
                << device.metadata().name << "\n";
      return 1;
    }
    std::cout << "apply: " << to_string(status) << "\n";
    return to_int(status);

  } else {
    std::cerr << "Unknown command: " << command << "\n";
    return 1;
  }

  return 0;
}

int main(int argc, char **argv) {
  std::string config_path;
  std::string command;
  std::vector<std::string> args;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (command.empty()) {
      command = arg;
    } else {
      args.push_back(arg);
    }
  }

  if (config_path.empty() || command.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  SessionConfig config;
  try {
    config = SessionConfig::load_file(config_path);
  } catch (const ConfigError &ex) {
    std::cerr << "Config error: " << ex.what() << "\n";
    return 1;
  }

  DriverLogger::instance().init(config.log_file, config.log_level);

  SessionOptions options;
  options.device_name = config.name;
  options.verbosity = config.verbosity;

  try {
    std::unique_ptr<Transport> transport =
        std::make_unique<VisaTransport>(config.connection);
    // The rotary driver wraps its transport itself
    if (config.connection.echo && config.driver != "RotaryPlatform") {
      transport = std::make_unique<EchoingTransport>(std::move(transport));
    }

    if (config.driver == "ComboSource6301") {
      LaserController device(std::move(transport), options);
      return run_command(device, command, args);
    }
    if (config.driver == "SMU2450") {
      SourceMeasureUnit device(std::move(transport), options);
      return run_command(device, command, args);
    }
    RotaryPlatform device(std::move(transport), options);
    return run_command(device, command, args);

  } catch (const TransportError &ex) {
    LOG_ERROR(config.name, "OPEN", "{} (status {})", ex.what(), ex.status());
    std::cerr << "Failed to open " << config.connection.resource << ": "
              << ex.what() << "\n";
    return 1;
  }
}
