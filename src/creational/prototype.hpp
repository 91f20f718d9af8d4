// File: src/creational/prototype.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <utility>

namespace patcat {

/// Prototype interface: objects that can copy themselves
class ShapePrototype {
public:
    virtual ~ShapePrototype() = default;

    /// Deep copy; the clone shares no state with this object
    virtual std::unique_ptr<ShapePrototype> Clone() const = 0;

    virtual std::string ToString() const = 0;

    const std::string& GetColor() const { return color_; }
    void SetColor(const std::string& color) { color_ = color; }

protected:
    explicit ShapePrototype(std::string color) : color_(std::move(color)) {}

private:
    std::string color_;
};

class CirclePrototype : public ShapePrototype {
public:
    explicit CirclePrototype(std::string color) : ShapePrototype(std::move(color)) {}

    std::unique_ptr<ShapePrototype> Clone() const override {
        return std::make_unique<CirclePrototype>(*this);
    }

    std::string ToString() const override { return "Circle [color=" + GetColor() + "]"; }
};

/// Clone a red circle and recolor the clone to input.Text()
void RunPrototypeDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
