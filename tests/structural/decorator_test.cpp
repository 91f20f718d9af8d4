// File: tests/structural/decorator_test.cpp
#include "structural/decorator.hpp"
#include <gtest/gtest.h>

namespace patcat {
namespace {

TEST(BeverageTest, SimpleCoffee) {
    SimpleCoffee coffee;
    EXPECT_EQ(200, coffee.GetCostCents());
    EXPECT_EQ("Simple Coffee: $2.00", coffee.ToString());
}

TEST(BeverageTest, DecoratorsStack) {
    std::unique_ptr<Beverage> drink = std::make_unique<SimpleCoffee>();
    drink = std::make_unique<MilkDecorator>(std::move(drink));
    drink = std::make_unique<WhipDecorator>(std::move(drink));

    EXPECT_EQ("Simple Coffee, Milk, Whip", drink->GetDescription());
    EXPECT_EQ(320, drink->GetCostCents());
    EXPECT_EQ("Simple Coffee, Milk, Whip: $3.20", drink->ToString());
}

TEST(BeverageTest, UnknownAddOnLeavesBeverageInPlace) {
    std::unique_ptr<Beverage> drink = std::make_unique<SimpleCoffee>();
    auto result = AddOn(drink, "caramel");

    EXPECT_EQ(nullptr, result);
    ASSERT_NE(nullptr, drink);
    EXPECT_EQ("Simple Coffee", drink->GetDescription());
}

TEST(DecoratorDemoTest, Trace) {
    TraceSink sink;
    RunDecoratorDemo(DemoInput{"milk", "sugar"}, sink);

    Trace expected = {
        "Simple Coffee: $2.00",
        "Simple Coffee, Milk: $2.50",
        "Simple Coffee, Milk, Sugar: $2.70",
    };
    EXPECT_EQ(expected, sink.GetTrace());
}

TEST(DecoratorDemoTest, UnknownAddOnIsReported) {
    TraceSink sink;
    RunDecoratorDemo(DemoInput{"caramel", "milk"}, sink);

    Trace expected = {
        "Simple Coffee: $2.00",
        "Unknown add-on: caramel",
        "Simple Coffee, Milk: $2.50",
    };
    EXPECT_EQ(expected, sink.GetTrace());
}

} // namespace
} // namespace patcat
