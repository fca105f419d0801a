#include "scpi-driver/protocol/ResponseParser.hpp"

#include <cmath>
#include <gtest/gtest.h>

using namespace scpidrv;

namespace {

const EnumTable kModes = {
    {"current", "CURR", {"curr", "current", "cc", "i"}},
    {"power", "POW", {"pow", "power", "cp", "p"}},
};

} // namespace

TEST(ResponseParser, BoolTrueTokens) {
  EXPECT_TRUE(ResponseParser::parse_bool("1"));
  EXPECT_TRUE(ResponseParser::parse_bool("on"));
  EXPECT_TRUE(ResponseParser::parse_bool(" ON\r\n"));
  EXPECT_TRUE(ResponseParser::parse_bool("Closed"));
}

TEST(ResponseParser, BoolEverythingElseIsFalse) {
  EXPECT_FALSE(ResponseParser::parse_bool("0"));
  EXPECT_FALSE(ResponseParser::parse_bool("OFF"));
  EXPECT_FALSE(ResponseParser::parse_bool("OPEN"));
  EXPECT_FALSE(ResponseParser::parse_bool(""));
  EXPECT_FALSE(ResponseParser::parse_bool("2"));
}

TEST(ResponseParser, BoolTransportFailureIsFalse) {
  QueryResult failed{-1, "1"};
  EXPECT_FALSE(ResponseParser::parse_bool(failed));
}

TEST(ResponseParser, DoubleParsing) {
  EXPECT_DOUBLE_EQ(ResponseParser::parse_double("0.150000"), 0.15);
  EXPECT_DOUBLE_EQ(ResponseParser::parse_double("+1.000000E-03\n"), 1e-3);
  EXPECT_DOUBLE_EQ(ResponseParser::parse_double("  -5 "), -5.0);
}

TEST(ResponseParser, DoubleFailuresAreNaN) {
  EXPECT_TRUE(std::isnan(ResponseParser::parse_double("")));
  EXPECT_TRUE(std::isnan(ResponseParser::parse_double("abc")));
  EXPECT_TRUE(std::isnan(ResponseParser::parse_double("1.5V")));
  EXPECT_TRUE(std::isnan(ResponseParser::parse_double("1e999")));
  EXPECT_TRUE(std::isnan(ResponseParser::parse_double(QueryResult{-1, "1"})));
}

TEST(ResponseParser, EnumMatchesAbbreviations) {
  EXPECT_EQ(ResponseParser::parse_enum("CURR", kModes), "current");
  EXPECT_EQ(ResponseParser::parse_enum("cc", kModes), "current");
  EXPECT_EQ(ResponseParser::parse_enum("Power", kModes), "power");
  EXPECT_EQ(ResponseParser::parse_enum("\"POW\"", kModes), "power");
}

TEST(ResponseParser, EnumMarkers) {
  EXPECT_EQ(ResponseParser::parse_enum("VOLT", kModes), kUnexpectedResponse);
  EXPECT_EQ(ResponseParser::parse_enum(QueryResult{-1, ""}, kModes),
            kCommunicationProblem);
  EXPECT_TRUE(ResponseParser::is_marker(kUnexpectedResponse));
  EXPECT_TRUE(ResponseParser::is_marker(kCommunicationProblem));
  EXPECT_FALSE(ResponseParser::is_marker("current"));
}

TEST(ResponseParser, FindAlias) {
  const EnumAlias *alias = ResponseParser::find_alias("P", kModes);
  ASSERT_NE(alias, nullptr);
  EXPECT_EQ(alias->wire, "POW");
  EXPECT_EQ(ResponseParser::find_alias("bogus", kModes), nullptr);
}

TEST(ResponseParser, TextHelpers) {
  EXPECT_EQ(ResponseParser::trim("\t abc \r\n"), "abc");
  EXPECT_EQ(ResponseParser::unquote(" \"defbuffer1\" "), "defbuffer1");
  EXPECT_EQ(ResponseParser::unquote("\""), "\"");
  EXPECT_EQ(ResponseParser::to_lower("AbC"), "abc");
  EXPECT_EQ(ResponseParser::to_upper("AbC"), "ABC");
}
