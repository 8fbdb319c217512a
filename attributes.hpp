/*

Copyright (c) 2026, Elias Aebi
All rights reserved.

*/

#pragma once

#include <string>
#include <vector>
#include <map>
#include <utility>

namespace svgwrite {

class Style {
	std::map<std::string, std::string> values;
public:
	std::string get(const std::string& key) const {
		auto i = values.find(key);
		return i != values.end() ? i->second : std::string();
	}
	void set(const std::string& key, const std::string& value) {
		values[key] = value;
	}
	void unset(const std::string& key) {
		values.erase(key);
	}
	bool empty() const {
		return values.empty();
	}
	std::string attribute() const;
};

struct TransformOperation {
	enum class Type {
		matrix,
		translate,
		scale,
		rotate,
		skew_x,
		skew_y
	};
	Type type;
	std::vector<double> values;
	std::string to_string() const;
};

// operations are written in the order they were added
class Transform {
	std::vector<TransformOperation> operations;
	Transform& add(TransformOperation::Type type, std::vector<double> values) {
		operations.push_back(TransformOperation{type, std::move(values)});
		return *this;
	}
public:
	Transform& matrix(double a, double b, double c, double d, double e, double f) {
		return add(TransformOperation::Type::matrix, {a, b, c, d, e, f});
	}
	Transform& translate(double tx, double ty) {
		return add(TransformOperation::Type::translate, {tx, ty});
	}
	Transform& scale(double sx, double sy) {
		return add(TransformOperation::Type::scale, {sx, sy});
	}
	// angle in degrees around (cx, cy)
	Transform& rotate(double angle, double cx = 0.0, double cy = 0.0) {
		return add(TransformOperation::Type::rotate, {angle, cx, cy});
	}
	Transform& skew_x(double angle) {
		return add(TransformOperation::Type::skew_x, {angle});
	}
	Transform& skew_y(double angle) {
		return add(TransformOperation::Type::skew_y, {angle});
	}
	bool empty() const {
		return operations.empty();
	}
	const std::vector<TransformOperation>& get_operations() const {
		return operations;
	}
	std::string attribute() const;
};

class ViewBox {
	double min_x = 0.0;
	double min_y = 0.0;
	double width = 0.0;
	double height = 0.0;
	bool is_set = false;
public:
	void set(double min_x, double min_y, double width, double height) {
		this->min_x = min_x;
		this->min_y = min_y;
		this->width = width;
		this->height = height;
		is_set = true;
	}
	bool get_is_set() const {
		return is_set;
	}
	std::string attribute() const;
};

// attributes shared by every element
struct BaseAttrs {
	Style style;
	bool external_resources_required = false;
	std::string class_name;
	std::vector<std::string> attributes() const;
};

// attributes shared by the shape and group elements
struct ShapeAttrs {
	BaseAttrs base;
	Transform transform;
	std::vector<std::string> attributes() const;
};

}
