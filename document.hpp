/*

Copyright (c) 2026, Elias Aebi
All rights reserved.

*/

#pragma once

#include "attributes.hpp"
#include "path.hpp"
#include <string>
#include <vector>
#include <variant>
#include <memory>
#include <ostream>

namespace svgwrite {

class Node;
class Svg;
class Group;
struct Circle;
struct Ellipse;
struct Rect;
struct Polygon;
struct Polyline;
struct Line;

// owns the children of an element in insertion order
class Container {
	std::vector<std::unique_ptr<Node>> children;
	template <class T> T& add(T&& node);
protected:
	void render(std::ostream& out, const char* name, const std::vector<std::string>& attributes) const;
public:
	Container();
	Container(Container&& container) noexcept;
	Container& operator =(Container&& container) noexcept;
	~Container();
	Svg& svg(double x, double y, double width, double height);
	Group& group();
	Circle& circle(double cx, double cy, double r);
	Ellipse& ellipse(double cx, double cy, double rx, double ry);
	Rect& rect(double x, double y, double width, double height);
	Polygon& polygon(const std::vector<Point>& points);
	Polyline& polyline(const std::vector<Point>& points);
	Line& line(double x1, double y1, double x2, double y2);
	Path& path();
	const std::vector<std::unique_ptr<Node>>& get_children() const {
		return children;
	}
};

class Svg: public Container {
public:
	static constexpr const char* name = "svg";
	BaseAttrs base;
	ViewBox view_box;
	double width;
	double height;
	double x = 0.0;
	double y = 0.0;
	Svg(double width, double height): width(width), height(height) {}
	Svg(double x, double y, double width, double height): width(width), height(height), x(x), y(y) {}
	std::vector<std::string> attributes() const;
	// writes a complete document including the XML declaration
	void render(std::ostream& out) const;
	void render_fragment(std::ostream& out) const;
};

class Group: public Container {
public:
	static constexpr const char* name = "g";
	ShapeAttrs shape;
	std::vector<std::string> attributes() const {
		return shape.attributes();
	}
	void render(std::ostream& out) const;
};

struct Circle {
	static constexpr const char* name = "circle";
	ShapeAttrs shape;
	double cx, cy, r;
	Circle(double cx, double cy, double r): cx(cx), cy(cy), r(r) {}
	std::vector<std::string> attributes() const;
};

struct Ellipse {
	static constexpr const char* name = "ellipse";
	ShapeAttrs shape;
	double cx, cy, rx, ry;
	Ellipse(double cx, double cy, double rx, double ry): cx(cx), cy(cy), rx(rx), ry(ry) {}
	std::vector<std::string> attributes() const;
};

struct Rect {
	static constexpr const char* name = "rect";
	ShapeAttrs shape;
	double width, height, x, y;
	Rect(double x, double y, double width, double height): width(width), height(height), x(x), y(y) {}
	std::vector<std::string> attributes() const;
};

struct Polygon {
	static constexpr const char* name = "polygon";
	ShapeAttrs shape;
	std::vector<Point> points;
	Polygon(const std::vector<Point>& points): points(points) {}
	std::vector<std::string> attributes() const;
};

struct Polyline {
	static constexpr const char* name = "polyline";
	ShapeAttrs shape;
	std::vector<Point> points;
	Polyline(const std::vector<Point>& points): points(points) {}
	std::vector<std::string> attributes() const;
};

struct Line {
	static constexpr const char* name = "line";
	ShapeAttrs shape;
	double x1, y1, x2, y2;
	Line(double x1, double y1, double x2, double y2): x1(x1), y1(y1), x2(x2), y2(y2) {}
	std::vector<std::string> attributes() const;
};

class Node {
public:
	using Kind = std::variant<Svg, Group, Circle, Ellipse, Rect, Polygon, Polyline, Line, Path>;
private:
	Kind kind;
public:
	Node(Kind&& kind): kind(std::move(kind)) {}
	Kind& get_kind() {
		return kind;
	}
	const Kind& get_kind() const {
		return kind;
	}
	void render(std::ostream& out) const;
};

}
