/*

Copyright (c) 2026, Elias Aebi
All rights reserved.

*/

#include "attributes.hpp"
#include "format.hpp"

namespace svgwrite {

std::string Style::attribute() const {
	std::vector<std::string> pairs;
	for (auto& pair: values) {
		pairs.push_back(pair.first + ":" + pair.second);
	}
	return string_attribute("style", join(pairs, ";"));
}

std::string TransformOperation::to_string() const {
	const char* name = "";
	switch (type) {
		case Type::matrix: name = "matrix"; break;
		case Type::translate: name = "translate"; break;
		case Type::scale: name = "scale"; break;
		case Type::rotate: name = "rotate"; break;
		case Type::skew_x: name = "skewX"; break;
		case Type::skew_y: name = "skewY"; break;
	}
	std::vector<std::string> arguments;
	for (double value: values) {
		arguments.push_back(format_number(value));
	}
	return std::string(name) + "(" + join(arguments, ",") + ")";
}

std::string Transform::attribute() const {
	std::vector<std::string> tokens;
	for (const TransformOperation& operation: operations) {
		tokens.push_back(operation.to_string());
	}
	return string_attribute("transform", join(tokens, " "));
}

std::string ViewBox::attribute() const {
	if (!is_set) {
		return std::string();
	}
	const std::vector<std::string> values = {
		format_number(min_x),
		format_number(min_y),
		format_number(width),
		format_number(height)
	};
	return string_attribute("viewBox", join(values, " "));
}

std::vector<std::string> BaseAttrs::attributes() const {
	return {
		style.attribute(),
		external_resources_required ? bool_attribute("externalResourcesRequired", true) : std::string(),
		string_attribute("class", class_name)
	};
}

std::vector<std::string> ShapeAttrs::attributes() const {
	std::vector<std::string> result = base.attributes();
	result.push_back(transform.attribute());
	return result;
}

}
