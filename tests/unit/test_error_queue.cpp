#include "MockTransport.hpp"
#include "scpi-driver/protocol/ErrorQueue.hpp"

#include <gtest/gtest.h>

using namespace scpidrv;
using scpidrv::test::MockTransport;

TEST(ErrorQueue, ParseStandardEntry) {
  auto entry = ErrorQueue::parse_standard("-113,\"Undefined header\"");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->code, -113);
  EXPECT_EQ(entry->severity, ErrorSeverity::Error);
  EXPECT_EQ(entry->description, "Undefined header");
}

TEST(ErrorQueue, ParseStandardNoError) {
  EXPECT_FALSE(ErrorQueue::parse_standard("0,\"No error\"").has_value());
  EXPECT_FALSE(ErrorQueue::parse_standard("+0, \"No Error\"").has_value());
  EXPECT_FALSE(ErrorQueue::parse_standard("0,\"\"").has_value());
}

TEST(ErrorQueue, ParseStandardMalformed) {
  auto entry = ErrorQueue::parse_standard("garbage");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->code, 0);
  EXPECT_EQ(entry->severity, ErrorSeverity::Unknown);
  EXPECT_EQ(entry->description, "unexpected response");
}

TEST(ErrorQueue, ParseEventEntry) {
  auto entry = ErrorQueue::parse_event(
      "-285,\"Program syntax error;1;2025/03/04 10:11:12.000\"");
  EXPECT_EQ(entry.code, -285);
  EXPECT_EQ(entry.severity, ErrorSeverity::Error);
  EXPECT_EQ(entry.description, "Program syntax error");
  EXPECT_EQ(entry.device_time, "2025/03/04 10:11:12.000");

  EXPECT_EQ(ErrorQueue::parse_event("4917,\"Reading buffer cleared;2;t\"")
                .severity,
            ErrorSeverity::Warning);
  EXPECT_EQ(ErrorQueue::parse_event("4915,\"Output on;4;t\"").severity,
            ErrorSeverity::Info);
  EXPECT_EQ(ErrorQueue::parse_event("1,\"Odd;8;t\"").severity,
            ErrorSeverity::Unknown);
}

TEST(ErrorQueue, ParseEventMalformed) {
  auto entry = ErrorQueue::parse_event("No events");
  EXPECT_EQ(entry.code, 0);
  EXPECT_EQ(entry.severity, ErrorSeverity::Unknown);
  EXPECT_EQ(entry.description, "unexpected response");
}

TEST(ErrorQueue, DrainStopsAtNoError) {
  MockTransport transport;
  transport.push_responses("SYST:ERR?", {"-113,\"Undefined header\"",
                                         "-222,\"Data out of range\""});
  transport.set_response("SYST:ERR?", "0,\"No error\"");

  ErrorQueue queue(ErrorQueueConfig{});
  auto fresh = queue.drain(transport, "test");

  ASSERT_EQ(fresh.size(), 2u);
  EXPECT_EQ(fresh[0].code, -113);
  EXPECT_EQ(fresh[1].code, -222);
  EXPECT_EQ(queue.size(), 2u);
  EXPECT_EQ(transport.count_of("SYST:ERR?"), 3u);
}

TEST(ErrorQueue, SecondDrainWithNothingPendingKeepsLog) {
  MockTransport transport;
  transport.push_responses("SYST:ERR?", {"-113,\"Undefined header\""});
  transport.set_response("SYST:ERR?", "0,\"No error\"");

  ErrorQueue queue(ErrorQueueConfig{});
  queue.drain(transport, "test");
  ASSERT_EQ(queue.size(), 1u);

  auto fresh = queue.drain(transport, "test");
  EXPECT_TRUE(fresh.empty());
  EXPECT_EQ(queue.size(), 1u);
}

TEST(ErrorQueue, DrainIsBounded) {
  MockTransport transport;
  transport.set_response("SYST:ERR?", "-100,\"Command error\"");

  ErrorQueue queue(ErrorQueueConfig{});
  auto fresh = queue.drain(transport, "test");

  EXPECT_EQ(fresh.size(), 10u);
  EXPECT_EQ(transport.count_of("SYST:ERR?"), 10u);
}

TEST(ErrorQueue, DrainBoundIsConfigurable) {
  MockTransport transport;
  transport.set_response("SYST:ERR?", "-100,\"Command error\"");

  ErrorQueueConfig config;
  config.max_iterations = 3;
  ErrorQueue queue(config);

  EXPECT_EQ(queue.drain(transport, "test").size(), 3u);
}

TEST(ErrorQueue, TransportFailureAppendsOneEntry) {
  MockTransport transport;
  transport.set_error("SYST:ERR?", -1073807339);

  ErrorQueue queue(ErrorQueueConfig{});
  auto fresh = queue.drain(transport, "test");

  ASSERT_EQ(fresh.size(), 1u);
  EXPECT_EQ(fresh[0].severity, ErrorSeverity::Unknown);
  EXPECT_EQ(fresh[0].description, "communication problem");
}

TEST(ErrorQueue, EventLogReadsCountFirst) {
  MockTransport transport;
  transport.set_response(":System:Eventlog:Count? All", "2");
  transport.push_responses(":System:Eventlog:Next?",
                           {"-285,\"Syntax error;1;t1\"",
                            "4915,\"Output on;4;t2\""});

  ErrorQueueConfig config;
  config.dialect = ErrorQueueDialect::EventLog;
  config.next_query = ":System:Eventlog:Next?";
  config.count_query = ":System:Eventlog:Count? All";
  config.clear_command = ":System:Clear";
  ErrorQueue queue(config);

  auto fresh = queue.drain(transport, "smu");
  ASSERT_EQ(fresh.size(), 2u);
  EXPECT_EQ(fresh[0].severity, ErrorSeverity::Error);
  EXPECT_EQ(fresh[1].severity, ErrorSeverity::Info);
  EXPECT_EQ(transport.count_of(":System:Eventlog:Next?"), 2u);
}

TEST(ErrorQueue, EventLogUnreadableCount) {
  MockTransport transport;
  transport.set_response(":System:Eventlog:Count? All", "n/a");

  ErrorQueueConfig config;
  config.dialect = ErrorQueueDialect::EventLog;
  config.next_query = ":System:Eventlog:Next?";
  config.count_query = ":System:Eventlog:Count? All";
  ErrorQueue queue(config);

  auto fresh = queue.drain(transport, "smu");
  ASSERT_EQ(fresh.size(), 1u);
  EXPECT_EQ(fresh[0].description, "could not read event buffer");
  EXPECT_EQ(transport.count_of(":System:Eventlog:Next?"), 0u);
}

TEST(ErrorQueue, EventLogInfiniteCount) {
  MockTransport transport;
  transport.set_response(":System:Eventlog:Count? All", "inf");

  ErrorQueueConfig config;
  config.dialect = ErrorQueueDialect::EventLog;
  config.next_query = ":System:Eventlog:Next?";
  config.count_query = ":System:Eventlog:Count? All";
  ErrorQueue queue(config);

  auto fresh = queue.drain(transport, "smu");
  ASSERT_EQ(fresh.size(), 1u);
  EXPECT_EQ(fresh[0].description, "could not read event buffer");
  EXPECT_EQ(queue.entries().size(), 1u);
}

TEST(ErrorQueue, EventLogHugeCountIsBounded) {
  MockTransport transport;
  transport.set_response(":System:Eventlog:Count? All", "1e30");
  transport.set_response(":System:Eventlog:Next?", "-285,\"Syntax error;1;t\"");

  ErrorQueueConfig config;
  config.dialect = ErrorQueueDialect::EventLog;
  config.next_query = ":System:Eventlog:Next?";
  config.count_query = ":System:Eventlog:Count? All";
  ErrorQueue queue(config);

  auto fresh = queue.drain(transport, "smu");
  EXPECT_EQ(fresh.size(), 10u);
  EXPECT_EQ(transport.count_of(":System:Eventlog:Next?"), 10u);
}

TEST(ErrorQueue, ClearEmptiesLogOnlyOnSuccess) {
  MockTransport transport;
  transport.push_responses("SYST:ERR?", {"-113,\"Undefined header\""});
  transport.set_response("SYST:ERR?", "0,\"No error\"");

  ErrorQueue queue(ErrorQueueConfig{});
  queue.drain(transport, "test");
  ASSERT_EQ(queue.size(), 1u);

  transport.set_error("*CLS", -1);
  EXPECT_FALSE(queue.clear(transport, "test"));
  EXPECT_EQ(queue.size(), 1u);

  transport.clear_error("*CLS");
  EXPECT_TRUE(queue.clear(transport, "test"));
  EXPECT_EQ(queue.size(), 0u);
}
