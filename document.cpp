/*

Copyright (c) 2026, Elias Aebi
All rights reserved.

*/

#include "document.hpp"
#include "format.hpp"

namespace svgwrite {

namespace {

constexpr const char* xml_declaration = "<?xml version=\"1.0\"?>";
constexpr const char* svg_namespace = "http://www.w3.org/2000/svg";

std::string points_string(const std::vector<Point>& points) {
	std::vector<std::string> coordinates;
	for (const Point& p: points) {
		coordinates.push_back(p.to_string());
	}
	return join(coordinates, " ");
}

template <class T> std::vector<std::string> shape_attributes(const T& node, std::initializer_list<std::string> own) {
	std::vector<std::string> result = node.shape.attributes();
	result.insert(result.end(), own);
	return result;
}

void write_empty_element(std::ostream& out, const char* name, const std::vector<std::string>& attributes) {
	write(out, std::string("<") + name + " " + join(attributes, " ") + "/>");
}

struct NodeRenderer {
	std::ostream& out;
	void operator ()(const Svg& svg) const {
		svg.render_fragment(out);
	}
	void operator ()(const Group& group) const {
		group.render(out);
	}
	template <class T> void operator ()(const T& shape) const {
		write_empty_element(out, T::name, shape.attributes());
	}
};

}

Container::Container() = default;
Container::Container(Container&& container) noexcept = default;
Container& Container::operator =(Container&& container) noexcept = default;
Container::~Container() = default;

template <class T> T& Container::add(T&& node) {
	children.push_back(std::unique_ptr<Node>(new Node(std::move(node))));
	return std::get<T>(children.back()->get_kind());
}

void Container::render(std::ostream& out, const char* name, const std::vector<std::string>& attributes) const {
	write(out, std::string("<") + name + " " + join(attributes, " ") + ">");
	for (const std::unique_ptr<Node>& child: children) {
		child->render(out);
	}
	write(out, std::string("</") + name + ">");
}

Svg& Container::svg(double x, double y, double width, double height) {
	return add(Svg(x, y, width, height));
}

Group& Container::group() {
	return add(Group());
}

Circle& Container::circle(double cx, double cy, double r) {
	return add(Circle(cx, cy, r));
}

Ellipse& Container::ellipse(double cx, double cy, double rx, double ry) {
	return add(Ellipse(cx, cy, rx, ry));
}

Rect& Container::rect(double x, double y, double width, double height) {
	return add(Rect(x, y, width, height));
}

Polygon& Container::polygon(const std::vector<Point>& points) {
	return add(Polygon(points));
}

Polyline& Container::polyline(const std::vector<Point>& points) {
	return add(Polyline(points));
}

Line& Container::line(double x1, double y1, double x2, double y2) {
	return add(Line(x1, y1, x2, y2));
}

Path& Container::path() {
	return add(Path());
}

std::vector<std::string> Svg::attributes() const {
	std::vector<std::string> result = base.attributes();
	result.push_back(view_box.attribute());
	result.push_back(number_attribute("width", width));
	result.push_back(number_attribute("height", height));
	result.push_back(number_attribute("x", x));
	result.push_back(number_attribute("y", y));
	result.push_back(string_attribute("xmlns", svg_namespace));
	return result;
}

void Svg::render(std::ostream& out) const {
	write(out, xml_declaration);
	render_fragment(out);
}

void Svg::render_fragment(std::ostream& out) const {
	Container::render(out, name, attributes());
}

void Group::render(std::ostream& out) const {
	Container::render(out, name, attributes());
}

std::vector<std::string> Circle::attributes() const {
	return shape_attributes(*this, {
		number_attribute("cx", cx),
		number_attribute("cy", cy),
		number_attribute("r", r)
	});
}

std::vector<std::string> Ellipse::attributes() const {
	return shape_attributes(*this, {
		number_attribute("cx", cx),
		number_attribute("cy", cy),
		number_attribute("rx", rx),
		number_attribute("ry", ry)
	});
}

std::vector<std::string> Rect::attributes() const {
	return shape_attributes(*this, {
		number_attribute("width", width),
		number_attribute("height", height),
		number_attribute("x", x),
		number_attribute("y", y)
	});
}

std::vector<std::string> Polygon::attributes() const {
	return shape_attributes(*this, {string_attribute("points", points_string(points))});
}

std::vector<std::string> Polyline::attributes() const {
	return shape_attributes(*this, {string_attribute("points", points_string(points))});
}

std::vector<std::string> Line::attributes() const {
	return shape_attributes(*this, {
		number_attribute("x1", x1),
		number_attribute("y1", y1),
		number_attribute("x2", x2),
		number_attribute("y2", y2)
	});
}

void Node::render(std::ostream& out) const {
	std::visit(NodeRenderer{out}, kind);
}

}
