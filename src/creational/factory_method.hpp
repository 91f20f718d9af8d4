// File: src/creational/factory_method.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>

namespace patcat {

/// Product interface
class Drawable {
public:
    virtual ~Drawable() = default;
    virtual std::string Draw() const = 0;
};

class CircleShape : public Drawable {
public:
    std::string Draw() const override { return "Drawing a Circle."; }
};

class SquareShape : public Drawable {
public:
    std::string Draw() const override { return "Drawing a Square."; }
};

class TriangleShape : public Drawable {
public:
    std::string Draw() const override { return "Drawing a Triangle."; }
};

/// Creator: subclasses decide which product to instantiate
class ShapeCreator {
public:
    virtual ~ShapeCreator() = default;

    /// Factory method
    virtual std::unique_ptr<Drawable> CreateShape() const = 0;

    /// Operation built on top of the factory method
    std::string Render() const { return CreateShape()->Draw(); }
};

class CircleCreator : public ShapeCreator {
public:
    std::unique_ptr<Drawable> CreateShape() const override {
        return std::make_unique<CircleShape>();
    }
};

class SquareCreator : public ShapeCreator {
public:
    std::unique_ptr<Drawable> CreateShape() const override {
        return std::make_unique<SquareShape>();
    }
};

class TriangleCreator : public ShapeCreator {
public:
    std::unique_ptr<Drawable> CreateShape() const override {
        return std::make_unique<TriangleShape>();
    }
};

/// Creator for "circle", "square" or "triangle"
/// @return nullptr for any other name
std::unique_ptr<ShapeCreator> MakeShapeCreator(const std::string& name);

/// Render each shape named in input.Values()
void RunFactoryMethodDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
