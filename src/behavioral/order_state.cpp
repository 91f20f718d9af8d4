// File: src/behavioral/order_state.cpp
#include "behavioral/order_state.hpp"

namespace patcat {

const char* ToString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PLACED: return "PLACED";
        case OrderStatus::SHIPPED: return "SHIPPED";
        case OrderStatus::DELIVERED: return "DELIVERED";
        default: return "UNKNOWN";
    }
}

std::string Order::Describe() const {
    switch (status_) {
        case OrderStatus::PLACED: return "Order placed.";
        case OrderStatus::SHIPPED: return "Order shipped.";
        case OrderStatus::DELIVERED: return "Order delivered.";
    }
    return "Order status unknown.";
}

std::string Order::Next() {
    switch (status_) {
        case OrderStatus::PLACED:
            status_ = OrderStatus::SHIPPED;
            break;
        case OrderStatus::SHIPPED:
            status_ = OrderStatus::DELIVERED;
            break;
        case OrderStatus::DELIVERED:
            return "Order already delivered.";
    }
    return Describe();
}

std::string Order::Previous() {
    switch (status_) {
        case OrderStatus::PLACED:
            return "Order not yet shipped.";
        case OrderStatus::SHIPPED:
            status_ = OrderStatus::PLACED;
            break;
        case OrderStatus::DELIVERED:
            status_ = OrderStatus::SHIPPED;
            break;
    }
    return Describe();
}

void RunOrderStateDemo(const DemoInput& input, OutputSink& out) {
    Order order;
    out.WriteLine(order.Describe());

    for (const auto& step : input.Values()) {
        if (step == "next") {
            out.WriteLine(order.Next());
        } else if (step == "prev") {
            out.WriteLine(order.Previous());
        } else {
            out.WriteLine("Unknown transition: " + step);
        }
    }
}

} // namespace patcat
