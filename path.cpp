/*

Copyright (c) 2026, Elias Aebi
All rights reserved.

*/

#include "path.hpp"
#include "format.hpp"
#include <cstddef>

namespace svgwrite {

namespace {

// separators are not counted
constexpr std::size_t max_line_length = 255;

class TokenCollector {
	std::vector<std::string>& tokens;
	void add(double value) {
		tokens.push_back(format_number(value));
	}
	void add(const std::vector<Point>& points) {
		for (const Point& p: points) {
			add(p.x);
			add(p.y);
		}
	}
	void add(const std::vector<double>& values) {
		for (double value: values) {
			add(value);
		}
	}
public:
	TokenCollector(std::vector<std::string>& tokens): tokens(tokens) {}
	void operator ()(const MoveCommand& command) {
		add(command.points);
	}
	void operator ()(const CloseCommand& command) {

	}
	void operator ()(const LineCommand& command) {
		add(command.points);
	}
	void operator ()(const HorizontalLineCommand& command) {
		add(command.xs);
	}
	void operator ()(const VerticalLineCommand& command) {
		add(command.ys);
	}
	void operator ()(const CubicCurveCommand& command) {
		for (const CubicCurve& c: command.curves) {
			add(c.x1);
			add(c.y1);
			add(c.x2);
			add(c.y2);
			add(c.x);
			add(c.y);
		}
	}
	void operator ()(const ShorthandCubicCurveCommand& command) {
		for (const ShorthandCubicCurve& c: command.curves) {
			add(c.x2);
			add(c.y2);
			add(c.x);
			add(c.y);
		}
	}
	void operator ()(const QuadraticCurveCommand& command) {
		for (const QuadraticCurve& c: command.curves) {
			add(c.x1);
			add(c.y1);
			add(c.x);
			add(c.y);
		}
	}
	void operator ()(const ShorthandQuadraticCurveCommand& command) {
		add(command.points);
	}
};

class LineWrapper {
	std::string text;
	std::size_t line_length = 0;
public:
	void append(const std::string& token) {
		if (text.empty()) {
			line_length = token.size();
		}
		else if (line_length + token.size() > max_line_length) {
			text += '\n';
			line_length = token.size();
		}
		else {
			text += ' ';
			line_length += token.size();
		}
		text += token;
	}
	const std::string& get_text() const {
		return text;
	}
};

}

std::string Point::to_string() const {
	return format_number(x) + "," + format_number(y);
}

std::vector<std::string> PathCommand::tokens() const {
	std::vector<std::string> result;
	result.push_back(std::string(1, code));
	std::visit(TokenCollector(result), body);
	return result;
}

std::string Path::get_data() const {
	LineWrapper wrapper;
	for (const PathCommand& command: commands) {
		for (const std::string& token: command.tokens()) {
			wrapper.append(token);
		}
	}
	return wrapper.get_text();
}

std::vector<std::string> Path::attributes() const {
	std::vector<std::string> result = shape.attributes();
	result.push_back(string_attribute("d", get_data()));
	if (has_path_length) {
		result.push_back(number_attribute("pathLength", path_length));
	}
	return result;
}

}
