/*

Copyright (c) 2026, Elias Aebi
All rights reserved.

*/

#pragma once

#include <string>
#include <vector>
#include <ostream>

namespace svgwrite {

[[noreturn]] void error(std::string message);

// shortest digits that read back as the same double, laid out like %g:
// exponent form below 1e-4 and from 1e6 on
std::string format_number(double value);

// the attribute helpers return an empty string if there is nothing to write
std::string number_attribute(const char* name, double value);
std::string bool_attribute(const char* name, bool value);
std::string string_attribute(const char* name, const std::string& value);

// joins the non-empty strings
std::string join(const std::vector<std::string>& strings, const char* separator);

void write(std::ostream& out, const std::string& text);

}
