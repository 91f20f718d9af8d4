// File: src/structural/decorator.cpp
#include "structural/decorator.hpp"
#include <iomanip>
#include <sstream>

namespace patcat {

std::string Beverage::ToString() const {
    int cents = GetCostCents();
    std::ostringstream oss;
    oss << GetDescription() << ": $" << (cents / 100) << "."
        << std::setw(2) << std::setfill('0') << (cents % 100);
    return oss.str();
}

AddOnDecorator::AddOnDecorator(std::unique_ptr<Beverage> inner, std::string name, int cost_cents)
    : inner_(std::move(inner)), name_(std::move(name)), cost_cents_(cost_cents) {}

std::string AddOnDecorator::GetDescription() const {
    return inner_->GetDescription() + ", " + name_;
}

int AddOnDecorator::GetCostCents() const {
    return inner_->GetCostCents() + cost_cents_;
}

std::unique_ptr<Beverage> AddOn(std::unique_ptr<Beverage>& beverage, const std::string& name) {
    if (name == "milk") return std::make_unique<MilkDecorator>(std::move(beverage));
    if (name == "sugar") return std::make_unique<SugarDecorator>(std::move(beverage));
    if (name == "whip") return std::make_unique<WhipDecorator>(std::move(beverage));
    return nullptr;
}

void RunDecoratorDemo(const DemoInput& input, OutputSink& out) {
    std::unique_ptr<Beverage> coffee = std::make_unique<SimpleCoffee>();
    out.WriteLine(coffee->ToString());

    for (const auto& name : input.Values()) {
        auto decorated = AddOn(coffee, name);
        if (!decorated) {
            out.WriteLine("Unknown add-on: " + name);
            continue;
        }
        coffee = std::move(decorated);
        out.WriteLine(coffee->ToString());
    }
}

} // namespace patcat
