#include "scpi-driver/SessionConfig.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace scpidrv;

TEST(SessionConfig, ParsesFullConfig) {
  auto node = YAML::Load(R"(
name: rotary_1
driver: RotaryPlatform
connection:
  resource: COM13
  baud_rate: 115200
  terminator: "\r\n"
  echo: true
  timeout_ms: 10000
verbosity: all
logging:
  file: rotary.log
  level: warn
)");

  SessionConfig config = SessionConfig::from_yaml(node);
  EXPECT_EQ(config.name, "rotary_1");
  EXPECT_EQ(config.driver, "RotaryPlatform");
  EXPECT_EQ(config.connection.resource, "COM13");
  EXPECT_EQ(config.connection.baud_rate, 115200u);
  EXPECT_EQ(config.connection.terminator, "\r\n");
  EXPECT_TRUE(config.connection.echo);
  EXPECT_EQ(config.connection.timeout.count(), 10000);
  EXPECT_EQ(config.verbosity, Verbosity::All);
  EXPECT_EQ(config.log_file, "rotary.log");
  EXPECT_EQ(config.log_level, spdlog::level::warn);
}

TEST(SessionConfig, Defaults) {
  auto node = YAML::Load(R"(
name: laser
driver: ComboSource6301
connection:
  resource: ASRL3::INSTR
)");

  SessionConfig config = SessionConfig::from_yaml(node);
  EXPECT_EQ(config.connection.baud_rate, 115200u);
  EXPECT_EQ(config.connection.terminator, "\n");
  EXPECT_FALSE(config.connection.echo);
  EXPECT_EQ(config.connection.timeout.count(), 5000);
  EXPECT_EQ(config.verbosity, Verbosity::Few);
  EXPECT_EQ(config.log_level, spdlog::level::info);
}

TEST(SessionConfig, MissingFieldsThrow) {
  EXPECT_THROW(SessionConfig::from_yaml(YAML::Load("driver: SMU2450")),
               ConfigError);
  EXPECT_THROW(SessionConfig::from_yaml(YAML::Load("name: a\n"
                                                   "driver: SMU2450\n")),
               ConfigError);
  EXPECT_THROW(SessionConfig::from_yaml(YAML::Load("name: a\n"
                                                   "driver: SMU2450\n"
                                                   "connection: {}\n")),
               ConfigError);
  EXPECT_THROW(SessionConfig::from_yaml(YAML::Load("- not a map")),
               ConfigError);
}

TEST(SessionConfig, InvalidValuesThrow) {
  const std::string base = "name: a\n"
                           "connection:\n"
                           "  resource: COM1\n";
  EXPECT_THROW(SessionConfig::from_yaml(YAML::Load(base + "driver: DMM\n")),
               ConfigError);
  EXPECT_THROW(SessionConfig::from_yaml(YAML::Load(
                   base + "driver: SMU2450\nverbosity: loud\n")),
               ConfigError);
  EXPECT_THROW(SessionConfig::from_yaml(YAML::Load(
                   base + "driver: SMU2450\nlogging:\n  level: chatty\n")),
               ConfigError);
}

TEST(SessionConfig, LoadFileErrors) {
  EXPECT_THROW(SessionConfig::load_file("/nonexistent/session.yaml"),
               ConfigError);
}

TEST(SessionConfig, LoadFileRoundTripsToJson) {
  auto path = std::filesystem::temp_directory_path() / "scpi_session.yaml";
  {
    std::ofstream out(path);
    out << "name: smu_1\n"
           "driver: SMU2450\n"
           "connection:\n"
           "  resource: TCPIP0::10.0.0.5::inst0::INSTR\n"
           "verbosity: none\n";
  }

  SessionConfig config = SessionConfig::load_file(path.string());
  auto j = config.to_json();
  EXPECT_EQ(j["name"], "smu_1");
  EXPECT_EQ(j["connection"]["resource"], "TCPIP0::10.0.0.5::inst0::INSTR");
  EXPECT_EQ(j["verbosity"], "none");
  EXPECT_EQ(j["logging"]["level"], "info");

  std::filesystem::remove(path);
}

TEST(YamlToJson, TypesScalars) {
  auto j = yaml_to_json(YAML::Load(R"(
count: 3
ratio: 0.5
flag: true
text: hello
quoted: "42"
list: [1, two]
)"));
  EXPECT_TRUE(j["count"].is_number_integer());
  EXPECT_TRUE(j["ratio"].is_number_float());
  EXPECT_TRUE(j["flag"].is_boolean());
  EXPECT_EQ(j["text"], "hello");
  EXPECT_EQ(j["quoted"], "42");
  EXPECT_EQ(j["list"][0], 1);
  EXPECT_EQ(j["list"][1], "two");
}
