// File: src/behavioral/visitor.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <string>
#include <variant>
#include <vector>

namespace patcat {

struct Circle {
    int radius;
};

struct Rectangle {
    int width;
    int height;
};

/// Closed set of visitable shapes
using Shape = std::variant<Circle, Rectangle>;

/// Visitor computing "<Shape> area: <value>" with two decimals
struct AreaVisitor {
    std::string operator()(const Circle& c) const;
    std::string operator()(const Rectangle& r) const;
};

/// Visitor describing how a shape is drawn
struct DrawVisitor {
    std::string operator()(const Circle& c) const;
    std::string operator()(const Rectangle& r) const;
};

/// Numeric area of a shape
double AreaOf(const Shape& shape);

/// Apply the area visitor, then the draw visitor, to a circle of radius 2
/// and a 3x4 rectangle. Input is ignored.
void RunVisitorDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
