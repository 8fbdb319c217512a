/*

Copyright (c) 2026, Elias Aebi
All rights reserved.

*/

#include "document.hpp"
#include "format.hpp"
#include <string>
#include <fstream>
#include <iostream>
#include <cmath>

namespace {

void draw_sample(svgwrite::Svg& svg) {
	using namespace svgwrite;
	svg.view_box.set(0.0, 0.0, 400.0, 300.0);

	Rect& background = svg.rect(0.0, 0.0, 400.0, 300.0);
	background.shape.base.style.set("fill", "#f4f1ea");

	Group& shapes = svg.group();
	shapes.shape.base.class_name = "shapes";
	shapes.shape.base.style.set("stroke", "#333");
	shapes.shape.base.style.set("stroke-width", "2");
	shapes.shape.transform.translate(20.0, 20.0);

	shapes.circle(40.0, 40.0, 30.0).shape.base.style.set("fill", "tomato");
	shapes.ellipse(130.0, 40.0, 45.0, 25.0).shape.base.style.set("fill", "gold");
	Polygon& triangle = shapes.polygon({{200.0, 70.0}, {240.0, 10.0}, {280.0, 70.0}});
	triangle.shape.base.style.set("fill", "teal");
	Polyline& zigzag = shapes.polyline({{300.0, 70.0}, {315.0, 10.0}, {330.0, 70.0}, {345.0, 10.0}});
	zigzag.shape.base.style.set("fill", "none");
	shapes.line(0.0, 100.0, 360.0, 100.0).shape.transform.skew_x(10.0);

	Path& curves = shapes.path();
	curves.shape.base.style.set("fill", "none");
	curves.move_to({{0.0, 160.0}})
		.curve_to({{40.0, 120.0, 80.0, 200.0, 120.0, 160.0}})
		.smooth_curve_to({{200.0, 200.0, 240.0, 160.0}})
		.quadratic_curve_to({{280.0, 120.0, 320.0, 160.0}})
		.smooth_quadratic_curve_to({{360.0, 160.0}});

	// long enough to be wrapped over several lines
	Path& spiral = svg.path();
	spiral.shape.base.style.set("fill", "none");
	spiral.shape.base.style.set("stroke", "steelblue");
	spiral.shape.transform.translate(200.0, 240.0).scale(0.5, 0.5);
	std::vector<Point> points;
	for (int i = 0; i < 120; ++i) {
		const double angle = i * 0.25;
		const double radius = i * 0.5;
		points.push_back(Point(std::round(radius * std::cos(angle) * 100.0) / 100.0, std::round(radius * std::sin(angle) * 100.0) / 100.0));
	}
	spiral.move_to({{0.0, 0.0}}).line_to(points).close();

	Svg& inset = svg.svg(300.0, 200.0, 80.0, 80.0);
	inset.view_box.set(0.0, 0.0, 10.0, 10.0);
	Group& frame = inset.group();
	frame.shape.transform.rotate(45.0, 5.0, 5.0);
	frame.rect(2.0, 2.0, 6.0, 6.0).shape.base.style.set("fill", "indigo");
}

void write_document(const svgwrite::Svg& svg, std::ostream& out, bool fragment) {
	if (fragment) {
		svg.render_fragment(out);
	}
	else {
		svg.render(out);
	}
}

}

int main(int argc, char** argv) {
	if (argc <= 1) {
		std::cout << "usage: svgwrite <output> [fragment]" << std::endl;
		return 0;
	}
	const std::string output = argv[1];
	const bool fragment = argc > 2 && std::string(argv[2]) == "fragment";
	svgwrite::Svg svg(400.0, 300.0);
	draw_sample(svg);
	try {
		if (output == "-") {
			write_document(svg, std::cout, fragment);
			std::cout << std::endl;
		}
		else {
			std::ofstream file(output);
			if (!file) svgwrite::error("could not open " + output);
			write_document(svg, file, fragment);
			file.close();
			if (!file) svgwrite::error("could not write " + output);
		}
	} catch (const std::string& error) {
		std::cerr << "error: " << error << std::endl;
		return 1;
	}
}
