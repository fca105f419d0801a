#pragma once
#include "MockTransport.hpp"
#include "scpi-driver/protocol/ScpiSession.hpp"

#include <gtest/gtest.h>
#include <memory>

namespace scpidrv {
namespace test {

/// Base fixture for driver tests: logger initialized, one simulated
/// instrument ready to be handed to a driver.
class DriverTest : public ::testing::Test {
protected:
  void SetUp() override;

  /// Hands over the simulated instrument; mock_ stays valid for as long as
  /// the driver that took it
  std::unique_ptr<Transport> take_transport();

  /// No settle pauses, verbosity Few
  SessionOptions options() const;

  MockTransport *mock_ = nullptr;

private:
  std::unique_ptr<MockTransport> transport_;
};

} // namespace test
} // namespace scpidrv
