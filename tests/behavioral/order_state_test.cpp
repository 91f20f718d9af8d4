// File: tests/behavioral/order_state_test.cpp
#include "behavioral/order_state.hpp"
#include <gtest/gtest.h>

namespace patcat {
namespace {

TEST(OrderTest, StartsPlaced) {
    Order order;
    EXPECT_EQ(OrderStatus::PLACED, order.GetStatus());
    EXPECT_EQ("Order placed.", order.Describe());
}

TEST(OrderTest, ForwardTransitions) {
    Order order;
    EXPECT_EQ("Order shipped.", order.Next());
    EXPECT_EQ(OrderStatus::SHIPPED, order.GetStatus());

    EXPECT_EQ("Order delivered.", order.Next());
    EXPECT_EQ(OrderStatus::DELIVERED, order.GetStatus());
}

TEST(OrderTest, DeliveredIsTerminalGoingForward) {
    Order order(OrderStatus::DELIVERED);
    EXPECT_EQ("Order already delivered.", order.Next());
    EXPECT_EQ(OrderStatus::DELIVERED, order.GetStatus());
}

TEST(OrderTest, BackwardTransitions) {
    Order order(OrderStatus::DELIVERED);
    EXPECT_EQ("Order shipped.", order.Previous());
    EXPECT_EQ("Order placed.", order.Previous());
    EXPECT_EQ(OrderStatus::PLACED, order.GetStatus());
}

TEST(OrderTest, PlacedIsTerminalGoingBackward) {
    Order order;
    EXPECT_EQ("Order not yet shipped.", order.Previous());
    EXPECT_EQ(OrderStatus::PLACED, order.GetStatus());
}

TEST(OrderStatusTest, ToString) {
    EXPECT_STREQ("PLACED", ToString(OrderStatus::PLACED));
    EXPECT_STREQ("SHIPPED", ToString(OrderStatus::SHIPPED));
    EXPECT_STREQ("DELIVERED", ToString(OrderStatus::DELIVERED));
}

TEST(OrderStateDemoTest, FullForwardTrace) {
    TraceSink sink;
    RunOrderStateDemo(DemoInput{"next", "next", "next"}, sink);

    Trace expected = {
        "Order placed.",
        "Order shipped.",
        "Order delivered.",
        "Order already delivered.",
    };
    EXPECT_EQ(expected, sink.GetTrace());
}

TEST(OrderStateDemoTest, UnknownTransitionLeavesStateUnchanged) {
    TraceSink sink;
    RunOrderStateDemo(DemoInput{"cancel", "next"}, sink);

    Trace expected = {"Order placed.", "Unknown transition: cancel", "Order shipped."};
    EXPECT_EQ(expected, sink.GetTrace());
}

} // namespace
} // namespace patcat
