/*

Copyright (c) 2026, Elias Aebi
All rights reserved.

*/

#include "format.hpp"
#include <charconv>

namespace svgwrite {

void error(std::string message) {
	throw message;
}

std::string format_number(double value) {
	char buffer[32];
	const std::to_chars_result result = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::scientific);
	const std::string scientific(buffer, result.ptr);
	const std::string::size_type e = scientific.find('e');
	if (e == std::string::npos) {
		// nan and inf
		return scientific;
	}
	const int exponent = std::stoi(scientific.substr(e + 1));
	if (exponent < -4 || exponent >= 6) {
		return scientific;
	}
	std::string sign;
	std::string digits;
	for (std::string::size_type i = 0; i < e; ++i) {
		const char c = scientific[i];
		if (c == '-') sign = "-";
		else if (c != '.') digits += c;
	}
	if (exponent < 0) {
		return sign + "0." + std::string(-exponent - 1, '0') + digits;
	}
	const std::string::size_type integer_digits = exponent + 1;
	if (digits.size() <= integer_digits) {
		return sign + digits + std::string(integer_digits - digits.size(), '0');
	}
	return sign + digits.substr(0, integer_digits) + "." + digits.substr(integer_digits);
}

std::string number_attribute(const char* name, double value) {
	return std::string(name) + "=\"" + format_number(value) + "\"";
}

std::string bool_attribute(const char* name, bool value) {
	return std::string(name) + "=\"" + (value ? "true" : "false") + "\"";
}

std::string string_attribute(const char* name, const std::string& value) {
	if (value.empty()) {
		return std::string();
	}
	return std::string(name) + "=\"" + value + "\"";
}

std::string join(const std::vector<std::string>& strings, const char* separator) {
	std::string result;
	for (const std::string& s: strings) {
		if (s.empty()) continue;
		if (!result.empty()) result += separator;
		result += s;
	}
	return result;
}

void write(std::ostream& out, const std::string& text) {
	out << text;
	if (!out) error("write failed");
}

}
