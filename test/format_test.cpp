/*

Copyright (c) 2026, Elias Aebi
All rights reserved.

*/

#include <gtest/gtest.h>
#include "format.hpp"
#include <sstream>
#include <streambuf>

using namespace svgwrite;

TEST(FormatTest, NumbersUseShortestText) {
	EXPECT_EQ(format_number(0.0), "0");
	EXPECT_EQ(format_number(10.0), "10");
	EXPECT_EQ(format_number(100.0), "100");
	EXPECT_EQ(format_number(250000.0), "250000");
	EXPECT_EQ(format_number(100000.0), "100000");
	EXPECT_EQ(format_number(-0.0), "-0");
	EXPECT_EQ(format_number(1.5), "1.5");
	EXPECT_EQ(format_number(-2.25), "-2.25");
	EXPECT_EQ(format_number(0.1), "0.1");
	EXPECT_EQ(format_number(1.0 / 3.0), "0.3333333333333333");
	EXPECT_EQ(format_number(1e21), "1e+21");
}

TEST(FormatTest, ExponentFormOutsideFixedRange) {
	EXPECT_EQ(format_number(0.0001), "0.0001");
	EXPECT_EQ(format_number(0.00012), "0.00012");
	EXPECT_EQ(format_number(0.00001), "1e-05");
	EXPECT_EQ(format_number(-0.000015), "-1.5e-05");
	EXPECT_EQ(format_number(999999.0), "999999");
	EXPECT_EQ(format_number(1e6), "1e+06");
	EXPECT_EQ(format_number(1234567.0), "1.234567e+06");
	EXPECT_EQ(format_number(123456.5), "123456.5");
}

TEST(FormatTest, Attributes) {
	EXPECT_EQ(number_attribute("r", 2.5), "r=\"2.5\"");
	EXPECT_EQ(bool_attribute("externalResourcesRequired", true), "externalResourcesRequired=\"true\"");
	EXPECT_EQ(bool_attribute("externalResourcesRequired", false), "externalResourcesRequired=\"false\"");
	EXPECT_EQ(string_attribute("class", "a b"), "class=\"a b\"");
	EXPECT_EQ(string_attribute("class", ""), "");
}

TEST(FormatTest, StringAttributesAreNotEscaped) {
	EXPECT_EQ(string_attribute("class", "<&>"), "class=\"<&>\"");
}

TEST(FormatTest, JoinSkipsEmptyStrings) {
	EXPECT_EQ(join({"a", "", "b", "", "c"}, " "), "a b c");
	EXPECT_EQ(join({"", ""}, " "), "");
	EXPECT_EQ(join({}, ";"), "");
	EXPECT_EQ(join({"k:v", "x:y"}, ";"), "k:v;x:y");
}

TEST(FormatTest, WriteFailureThrows) {
	std::ostringstream out;
	out.setstate(std::ios::badbit);
	EXPECT_THROW(write(out, "text"), std::string);
	EXPECT_EQ(out.str(), "");
}

TEST(FormatTest, WriteAppendsText) {
	std::ostringstream out;
	write(out, "<a");
	write(out, "/>");
	EXPECT_EQ(out.str(), "<a/>");
}
