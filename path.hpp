/*

Copyright (c) 2026, Elias Aebi
All rights reserved.

*/

#pragma once

#include "attributes.hpp"
#include <string>
#include <vector>
#include <variant>
#include <utility>

namespace svgwrite {

struct Point {
	double x, y;
	constexpr Point(double x, double y): x(x), y(y) {}
	std::string to_string() const;
};

struct CubicCurve {
	double x1, y1, x2, y2, x, y;
};

struct ShorthandCubicCurve {
	double x2, y2, x, y;
};

struct QuadraticCurve {
	double x1, y1, x, y;
};

struct MoveCommand {
	std::vector<Point> points;
};

struct CloseCommand {
};

struct LineCommand {
	std::vector<Point> points;
};

struct HorizontalLineCommand {
	std::vector<double> xs;
};

struct VerticalLineCommand {
	std::vector<double> ys;
};

struct CubicCurveCommand {
	std::vector<CubicCurve> curves;
};

struct ShorthandCubicCurveCommand {
	std::vector<ShorthandCubicCurve> curves;
};

struct QuadraticCurveCommand {
	std::vector<QuadraticCurve> curves;
};

// the control point is the reflection of the previous one, only end points are given
struct ShorthandQuadraticCurveCommand {
	std::vector<Point> points;
};

using PathCommandBody = std::variant<
	MoveCommand,
	CloseCommand,
	LineCommand,
	HorizontalLineCommand,
	VerticalLineCommand,
	CubicCurveCommand,
	ShorthandCubicCurveCommand,
	QuadraticCurveCommand,
	ShorthandQuadraticCurveCommand
>;

struct PathCommand {
	// upper case for absolute, lower case for relative coordinates
	char code;
	PathCommandBody body;
	std::vector<std::string> tokens() const;
};

class Path {
	std::vector<PathCommand> commands;
	double path_length = 0.0;
	bool has_path_length = false;
	Path& add(char code, PathCommandBody&& body) {
		commands.push_back(PathCommand{code, std::move(body)});
		return *this;
	}
public:
	static constexpr const char* name = "path";
	ShapeAttrs shape;
	Path& move_to(const std::vector<Point>& points) {
		return add('M', MoveCommand{points});
	}
	Path& move_to_relative(const std::vector<Point>& points) {
		return add('m', MoveCommand{points});
	}
	Path& close() {
		return add('z', CloseCommand{});
	}
	Path& line_to(const std::vector<Point>& points) {
		return add('L', LineCommand{points});
	}
	Path& line_to_relative(const std::vector<Point>& points) {
		return add('l', LineCommand{points});
	}
	Path& horizontal_line_to(const std::vector<double>& xs) {
		return add('H', HorizontalLineCommand{xs});
	}
	Path& horizontal_line_to_relative(const std::vector<double>& xs) {
		return add('h', HorizontalLineCommand{xs});
	}
	Path& vertical_line_to(const std::vector<double>& ys) {
		return add('V', VerticalLineCommand{ys});
	}
	Path& vertical_line_to_relative(const std::vector<double>& ys) {
		return add('v', VerticalLineCommand{ys});
	}
	Path& curve_to(const std::vector<CubicCurve>& curves) {
		return add('C', CubicCurveCommand{curves});
	}
	Path& curve_to_relative(const std::vector<CubicCurve>& curves) {
		return add('c', CubicCurveCommand{curves});
	}
	Path& smooth_curve_to(const std::vector<ShorthandCubicCurve>& curves) {
		return add('S', ShorthandCubicCurveCommand{curves});
	}
	Path& smooth_curve_to_relative(const std::vector<ShorthandCubicCurve>& curves) {
		return add('s', ShorthandCubicCurveCommand{curves});
	}
	Path& quadratic_curve_to(const std::vector<QuadraticCurve>& curves) {
		return add('Q', QuadraticCurveCommand{curves});
	}
	Path& quadratic_curve_to_relative(const std::vector<QuadraticCurve>& curves) {
		return add('q', QuadraticCurveCommand{curves});
	}
	Path& smooth_quadratic_curve_to(const std::vector<Point>& points) {
		return add('T', ShorthandQuadraticCurveCommand{points});
	}
	Path& smooth_quadratic_curve_to_relative(const std::vector<Point>& points) {
		return add('t', ShorthandQuadraticCurveCommand{points});
	}
	const std::vector<PathCommand>& get_commands() const {
		return commands;
	}
	void set_path_length(double length) {
		path_length = length;
		has_path_length = true;
	}
	// the value of the d attribute, wrapped so that no line holds more than 255 token characters
	std::string get_data() const;
	std::vector<std::string> attributes() const;
};

}
