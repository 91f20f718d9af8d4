// File: src/behavioral/order_state.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <string>

namespace patcat {

/// Lifecycle of an order: PLACED -> SHIPPED -> DELIVERED
enum class OrderStatus : uint8_t {
    PLACED = 0,
    SHIPPED = 1,
    DELIVERED = 2,
};

const char* ToString(OrderStatus status);

/// Order whose behaviour depends on its current status
///
/// Transitions are total: moving forward from DELIVERED or backward from
/// PLACED leaves the status unchanged and reports why.
class Order {
public:
    Order() = default;
    explicit Order(OrderStatus status) : status_(status) {}

    OrderStatus GetStatus() const { return status_; }

    /// Line describing the current status ("Order placed." etc.)
    std::string Describe() const;

    /// Advance one step
    /// @return Line describing the outcome
    std::string Next();

    /// Step back one status
    /// @return Line describing the outcome
    std::string Previous();

private:
    OrderStatus status_{OrderStatus::PLACED};
};

/// Print the starting status, then apply each "next" / "prev" in input.Values()
void RunOrderStateDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
