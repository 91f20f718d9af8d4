// File: src/structural/decorator.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <utility>

namespace patcat {

/// Component interface; prices are kept in cents
class Beverage {
public:
    virtual ~Beverage() = default;

    virtual std::string GetDescription() const = 0;
    virtual int GetCostCents() const = 0;

    /// "<description>: $<cost>"
    std::string ToString() const;
};

class SimpleCoffee : public Beverage {
public:
    std::string GetDescription() const override { return "Simple Coffee"; }
    int GetCostCents() const override { return 200; }
};

/// Base decorator: wraps a beverage and appends one add-on
class AddOnDecorator : public Beverage {
public:
    AddOnDecorator(std::unique_ptr<Beverage> inner, std::string name, int cost_cents);

    std::string GetDescription() const override;
    int GetCostCents() const override;

private:
    std::unique_ptr<Beverage> inner_;
    std::string name_;
    int cost_cents_;
};

class MilkDecorator : public AddOnDecorator {
public:
    explicit MilkDecorator(std::unique_ptr<Beverage> inner)
        : AddOnDecorator(std::move(inner), "Milk", 50) {}
};

class SugarDecorator : public AddOnDecorator {
public:
    explicit SugarDecorator(std::unique_ptr<Beverage> inner)
        : AddOnDecorator(std::move(inner), "Sugar", 20) {}
};

class WhipDecorator : public AddOnDecorator {
public:
    explicit WhipDecorator(std::unique_ptr<Beverage> inner)
        : AddOnDecorator(std::move(inner), "Whip", 70) {}
};

/// Wrap beverage with the add-on named ("milk", "sugar", "whip")
/// @return The decorated beverage, or nullptr if the name is unknown
///         (beverage is left untouched in that case)
std::unique_ptr<Beverage> AddOn(std::unique_ptr<Beverage>& beverage, const std::string& name);

/// Start from a simple coffee and add each of input.Values()
void RunDecoratorDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
