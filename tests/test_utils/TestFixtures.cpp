#include "TestFixtures.hpp"
#include "scpi-driver/Logger.hpp"

namespace scpidrv {
namespace test {

void DriverTest::SetUp() {
  DriverLogger::instance().init("test.log", spdlog::level::debug);
  transport_ = std::make_unique<MockTransport>();
  mock_ = transport_.get();
}

std::unique_ptr<Transport> DriverTest::take_transport() {
  return std::move(transport_);
}

SessionOptions DriverTest::options() const {
  SessionOptions opts;
  opts.verbosity = Verbosity::Few;
  opts.settle_pauses = false;
  return opts;
}

} // namespace test
} // namespace scpidrv
