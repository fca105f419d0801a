#include "TestFixtures.hpp"
#include "scpi-driver/devices/LaserController.hpp"

#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>

using namespace scpidrv;

class LaserControllerTest : public test::DriverTest {
protected:
  void SetUp() override {
    DriverTest::SetUp();
    mock_->set_response("*IDN?", "Arroyo,6301,12345,1.2.3");
    mock_->set_response("SYST:ERR?", "0,\"No error\"");
    laser_ = std::make_unique<LaserController>(take_transport(), options());
  }

  std::unique_ptr<LaserController> laser_;
};

TEST_F(LaserControllerTest, Identity) {
  EXPECT_EQ(laser_->get_id(), "Arroyo,6301,12345,1.2.3");
  EXPECT_EQ(laser_->metadata().name, "ComboSource6301");
  EXPECT_EQ(laser_->session().device_name(), "ComboSource6301");
}

TEST_F(LaserControllerTest, LimitThenCurrent) {
  EXPECT_EQ(laser_->set_current_limit(150.0), SetStatus::Applied);
  EXPECT_EQ(laser_->set_current(100.0), SetStatus::Applied);

  EXPECT_NEAR(laser_->get_current_limit(), 150.0, 1.5);
  EXPECT_NEAR(laser_->get_current(), 100.0, 1.0);

  auto history = mock_->get_command_history();
  EXPECT_NE(std::find(history.begin(), history.end(), "SOUR:CURR 0.100000"),
            history.end());
  EXPECT_NE(std::find(history.begin(), history.end(),
                      "SOUR:CURR:LIM 0.150000"),
            history.end());
}

TEST_F(LaserControllerTest, CurrentIsClippedBeforeTransmission) {
  EXPECT_EQ(laser_->set_current(5000.0), SetStatus::Applied);
  EXPECT_EQ(mock_->state("SOUR:CURR"), "1.000000");
  EXPECT_EQ(mock_->count_of("SOUR:CURR 5.000000"), 0u);
}

TEST_F(LaserControllerTest, PowerAndTemperature) {
  EXPECT_EQ(laser_->set_power(20.0), SetStatus::Applied);
  EXPECT_EQ(mock_->state("SOUR:POW"), "0.020000");
  EXPECT_NEAR(laser_->get_power(), 20.0, 0.2);

  EXPECT_EQ(laser_->set_temp_limit_high(45.0), SetStatus::Applied);
  EXPECT_EQ(mock_->state("SOUR:TEMP:LIM:HIGH"), "45.000");
  EXPECT_EQ(laser_->set_temp_limit_low(100.0), SetStatus::Applied);
  EXPECT_EQ(mock_->state("SOUR:TEMP:LIM:LOW"), "80.000");
}

TEST_F(LaserControllerTest, ReadbackMismatchReportsStatusTwo) {
  mock_->set_response("SOUR:CURR?", "0.090000");
  EXPECT_EQ(to_int(laser_->set_current(100.0)), 2);
  ASSERT_TRUE(laser_->status().last_error.has_value());
  EXPECT_NE(laser_->status().last_error->find("wanted 100"),
            std::string::npos);
}

TEST_F(LaserControllerTest, EnableDisable) {
  EXPECT_EQ(laser_->enable_laser(), SetStatus::Applied);
  EXPECT_EQ(mock_->state("OUTP"), "ON");
  EXPECT_TRUE(laser_->status().output_enabled);
  EXPECT_TRUE(laser_->is_laser_enabled());

  EXPECT_EQ(laser_->disable_laser(), SetStatus::Applied);
  EXPECT_FALSE(laser_->status().output_enabled);
  EXPECT_FALSE(laser_->is_laser_enabled());
}

TEST_F(LaserControllerTest, InterlockFailsSafeOnTransportError) {
  mock_->set_error("SYST:INTL?", -1073807339);
  EXPECT_FALSE(laser_->is_interlock_closed());

  mock_->clear_error("SYST:INTL?");
  mock_->set_response("SYST:INTL?", "CLOSED");
  EXPECT_TRUE(laser_->is_interlock_closed());
}

TEST_F(LaserControllerTest, ModeAliases) {
  EXPECT_EQ(laser_->set_mode("cp"), SetStatus::Applied);
  EXPECT_EQ(mock_->state("SOUR:FUNC:MODE"), "POW");
  EXPECT_EQ(laser_->status().mode, OperatingMode::PowerMode);
  EXPECT_EQ(laser_->get_mode(), "power");

  EXPECT_EQ(laser_->set_mode_constant_current(), SetStatus::Applied);
  EXPECT_EQ(laser_->get_mode(), "current");
  EXPECT_EQ(laser_->status().mode, OperatingMode::CurrentMode);
}

TEST_F(LaserControllerTest, BogusModeSendsNothing) {
  EXPECT_EQ(to_int(laser_->set_mode("bogus")), 1);
  EXPECT_EQ(mock_->command_count(), 0u);
}

TEST_F(LaserControllerTest, UnexpectedModeResponse) {
  mock_->set_response("SOUR:FUNC:MODE?", "TEMP");
  EXPECT_EQ(laser_->get_mode(), kUnexpectedResponse);
  EXPECT_EQ(laser_->status().mode, OperatingMode::Unknown);
}

TEST_F(LaserControllerTest, StatusByte) {
  mock_->set_response("*STB?", "16");
  EXPECT_EQ(laser_->get_status_byte(), 16);
  mock_->set_response("*STB?", "x");
  EXPECT_EQ(laser_->get_status_byte(), -1);
}

TEST_F(LaserControllerTest, StatusByteOutOfRange) {
  mock_->set_response("*STB?", "1e20");
  EXPECT_EQ(laser_->get_status_byte(), -1);
  mock_->set_response("*STB?", "-4");
  EXPECT_EQ(laser_->get_status_byte(), -1);
  mock_->set_response("*STB?", "255");
  EXPECT_EQ(laser_->get_status_byte(), 255);
}

TEST_F(LaserControllerTest, ApplyBatch) {
  SetStatus status = laser_->apply(
      {std::string("mode"), std::string("current"), std::string("limit"),
       150.0, std::string("i"), 100.0, std::string("enable"), true});

  EXPECT_EQ(status, SetStatus::Applied);
  EXPECT_EQ(mock_->state("SOUR:FUNC:MODE"), "CURR");
  EXPECT_EQ(mock_->state("SOUR:CURR:LIM"), "0.150000");
  EXPECT_EQ(mock_->state("SOUR:CURR"), "0.100000");
  EXPECT_EQ(mock_->state("OUTP"), "ON");
}

TEST_F(LaserControllerTest, ApplyLimitFollowsPowerMode) {
  mock_->set_state("SOUR:FUNC:MODE", "POW");
  EXPECT_EQ(laser_->apply({std::string("limit"), 30.0}), SetStatus::Applied);
  EXPECT_EQ(mock_->state("SOUR:POW:LIM"), "0.030000");
  EXPECT_FALSE(mock_->state("SOUR:CURR:LIM").has_value());
}

TEST_F(LaserControllerTest, ApplyUnknownNameDoesNotAbort) {
  SetStatus status = laser_->apply(
      {std::string("voltage"), 5.0, std::string("temperature"), 40.0});
  EXPECT_EQ(status, SetStatus::Applied);
  EXPECT_EQ(mock_->state("SOUR:TEMP:LIM:HIGH"), "40.000");
}

TEST_F(LaserControllerTest, ApplyNothingValid) {
  EXPECT_EQ(laser_->apply({std::string("voltage"), 5.0}), SetStatus::NotSent);
  EXPECT_EQ(laser_->apply({}), SetStatus::NotSent);
  EXPECT_EQ(mock_->command_count(), 0u);
}

TEST_F(LaserControllerTest, ApplyMismatchDominates) {
  mock_->set_response("SOUR:POW?", "0.001");
  SetStatus status = laser_->apply(
      {std::string("current"), 10.0, std::string("power"), 20.0});
  EXPECT_EQ(status, SetStatus::Mismatch);
}

TEST_F(LaserControllerTest, ErrorQueueDrain) {
  mock_->push_responses("SYST:ERR?", {"-222,\"Data out of range\""});

  auto fresh = laser_->error_messages();
  ASSERT_EQ(fresh.size(), 1u);
  EXPECT_EQ(fresh[0].code, -222);

  EXPECT_TRUE(laser_->error_messages().empty());
  EXPECT_TRUE(laser_->error_messages().empty());
  EXPECT_EQ(laser_->error_log().size(), 1u);

  EXPECT_TRUE(laser_->clear_error_messages());
  EXPECT_TRUE(laser_->error_log().empty());
}

TEST_F(LaserControllerTest, StuckErrorQueueIsBounded) {
  mock_->set_response("SYST:ERR?", "-300,\"Device-specific error\"");
  auto fresh = laser_->error_messages();
  EXPECT_EQ(fresh.size(), 10u);
  EXPECT_EQ(mock_->count_of("SYST:ERR?"), 10u);
}

TEST_F(LaserControllerTest, ResetClearsStatusCache) {
  laser_->enable_laser();
  laser_->set_mode("power");
  EXPECT_EQ(laser_->reset(), 0);
  EXPECT_FALSE(laser_->status().output_enabled);
  EXPECT_EQ(laser_->status().mode, OperatingMode::Unknown);
}

TEST_F(LaserControllerTest, GettersReturnNaNWithoutAnswer) {
  EXPECT_TRUE(std::isnan(laser_->get_temperature()));
  EXPECT_TRUE(std::isnan(laser_->get_measured_current()));
}
