// File: src/behavioral/visitor.cpp
#include "behavioral/visitor.hpp"
#include <iomanip>
#include <sstream>

namespace patcat {

namespace {

constexpr double kPi = 3.14159265358979323846;

std::string FormatArea(const char* label, double area) {
    std::ostringstream oss;
    oss << label << " area: " << std::fixed << std::setprecision(2) << area;
    return oss.str();
}

struct AreaValue {
    double operator()(const Circle& c) const { return kPi * c.radius * c.radius; }
    double operator()(const Rectangle& r) const {
        return static_cast<double>(r.width) * r.height;
    }
};

} // namespace

std::string AreaVisitor::operator()(const Circle& c) const {
    return FormatArea("Circle", AreaValue{}(c));
}

std::string AreaVisitor::operator()(const Rectangle& r) const {
    return FormatArea("Rectangle", AreaValue{}(r));
}

std::string DrawVisitor::operator()(const Circle& c) const {
    return "Drawing circle with radius " + std::to_string(c.radius);
}

std::string DrawVisitor::operator()(const Rectangle& r) const {
    return "Drawing rectangle " + std::to_string(r.width) + "x" + std::to_string(r.height);
}

double AreaOf(const Shape& shape) {
    return std::visit(AreaValue{}, shape);
}

void RunVisitorDemo(const DemoInput& /*input*/, OutputSink& out) {
    const std::vector<Shape> shapes = {Circle{2}, Rectangle{3, 4}};

    for (const auto& shape : shapes) {
        out.WriteLine(std::visit(AreaVisitor{}, shape));
    }
    for (const auto& shape : shapes) {
        out.WriteLine(std::visit(DrawVisitor{}, shape));
    }
}

} // namespace patcat
