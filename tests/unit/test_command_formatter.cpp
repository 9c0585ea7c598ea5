#include "lab-instruments/Errors.hpp"
#include "lab-instruments/scpi/CommandFormatter.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace labinst;
using namespace labinst::scpi;

TEST(CommandFormatterTest, SetUsesFixedPointWithoutExponent) {
  Command cmd = format_set("FREQ", 5e9);
  EXPECT_EQ(cmd.text(), "FREQ 5000000000");
  EXPECT_FALSE(cmd.expects_reply());
}

TEST(CommandFormatterTest, TrailingZerosAreTrimmed) {
  EXPECT_EQ(format_number(2.5), "2.5");
  EXPECT_EQ(format_number(-38.0), "-38");
  EXPECT_EQ(format_number(0.0), "0");
  EXPECT_EQ(format_number(-0.0), "0");
  EXPECT_EQ(format_number(0.000125), "0.000125");
}

TEST(CommandFormatterTest, NoDigitsBeyondDoublePrecision) {
  EXPECT_EQ(format_set("FREQ", 1234567.1).text(), "FREQ 1234567.1");
  EXPECT_EQ(format_set("FREQ", 2400000000.1).text(), "FREQ 2400000000.1");
  EXPECT_EQ(format_number(0.1 + 0.2), "0.3");
  EXPECT_EQ(format_number(-2400000000.1), "-2400000000.1");
}

TEST(CommandFormatterTest, OutputIsDeterministic) {
  double value = 1234.5678;
  EXPECT_EQ(format_set("VOLT", value).text(), format_set("VOLT", value).text());
  EXPECT_EQ(format_set("VOLT", value), format_set("VOLT", value));
}

TEST(CommandFormatterTest, DecimalsAndSeparator) {
  NumberStyle style;
  style.decimals = 3;
  style.separator = "";
  EXPECT_EQ(format_set("F", 5000.0, style).text(), "F5000");
  EXPECT_EQ(format_set("F", 1234.5678, style).text(), "F1234.568");
}

TEST(CommandFormatterTest, ScientificFormat) {
  NumberStyle style;
  style.format = NumberFormat::Scientific;
  style.decimals = 3;
  EXPECT_EQ(format_number(12346.0, style), "1.235E+04");
}

TEST(CommandFormatterTest, RejectsUnrepresentableValues) {
  EXPECT_THROW(format_number(std::numeric_limits<double>::infinity()),
               ArgumentError);
  EXPECT_THROW(format_number(std::numeric_limits<double>::quiet_NaN()),
               ArgumentError);
  EXPECT_THROW(format_number(1e20), ArgumentError);

  NumberStyle coarse;
  coarse.decimals = 2;
  EXPECT_THROW(format_number(0.001, coarse), ArgumentError);
}

TEST(CommandFormatterTest, QueryAppendsQuestionMark) {
  Command cmd = format_query("MEAS:VOLT:DC");
  EXPECT_EQ(cmd.text(), "MEAS:VOLT:DC?");
  EXPECT_TRUE(cmd.expects_reply());

  EXPECT_EQ(format_query("C1:PAVA", "RMS").text(), "C1:PAVA? RMS");
  EXPECT_EQ(format_query("C1:PAVA? RMS").text(), "C1:PAVA? RMS");
  EXPECT_THROW(format_query(""), ArgumentError);
}

TEST(CommandFormatterTest, EnumEmitsCanonicalToken) {
  std::vector<std::string> allowed = {"ON", "OFF"};
  EXPECT_EQ(format_enum("OUTP", "on", allowed).text(), "OUTP ON");
  EXPECT_EQ(format_enum("OUTP", "Off", allowed).text(), "OUTP OFF");
}

TEST(CommandFormatterTest, EnumRejectsUnknownToken) {
  std::vector<std::string> allowed = {"VIDEO", "LINEAR", "POWER"};
  EXPECT_THROW(format_enum("AVER:TYPE", "LOG", allowed), ArgumentError);
  EXPECT_THROW(format_enum("AVER:TYPE", "", allowed), ArgumentError);
}

TEST(CommandFormatterTest, ActionIsBare) {
  Command cmd = format_action("*RST");
  EXPECT_EQ(cmd.text(), "*RST");
  EXPECT_FALSE(cmd.expects_reply());
  EXPECT_THROW(format_action(""), ArgumentError);
}

TEST(CommandFormatterTest, ChannelPlaceholder) {
  EXPECT_TRUE(needs_channel("C{ch}:PAVA? RMS"));
  EXPECT_FALSE(needs_channel("FREQ"));
  EXPECT_EQ(expand_verb("C{ch}:PAVA? RMS", 2), "C2:PAVA? RMS");
  EXPECT_EQ(expand_verb("PACU RMS,C{ch}", 4), "PACU RMS,C4");
  EXPECT_EQ(expand_verb("FREQ", std::nullopt), "FREQ");
  EXPECT_THROW(expand_verb("C{ch}:PAVA", std::nullopt), ArgumentError);
  EXPECT_THROW(expand_verb("C{ch}:PAVA", -1), ArgumentError);
}

TEST(CommandFormatterTest, RangeCheck) {
  EXPECT_NO_THROW(check_range("set_frequency", 5e9, 10e6, 40e9));
  EXPECT_NO_THROW(check_range("set_frequency", 10e6, 10e6, 40e9));
  EXPECT_THROW(check_range("set_frequency", 50e9, 10e6, 40e9), ArgumentError);
  EXPECT_THROW(check_range("set_frequency", 1e6, 10e6, std::nullopt),
               ArgumentError);
  EXPECT_NO_THROW(check_range("x", -1e9, std::nullopt, std::nullopt));
}
