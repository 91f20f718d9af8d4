// File: src/behavioral/strategy.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <utility>

namespace patcat {

/// Interchangeable payment algorithm
class PaymentStrategy {
public:
    virtual ~PaymentStrategy() = default;

    /// Human-readable method name ("Credit Card", ...)
    virtual std::string GetMethodName() const = 0;

    /// Pay amount and describe the outcome
    virtual std::string Pay(int amount) const;
};

class CreditCardPayment : public PaymentStrategy {
public:
    std::string GetMethodName() const override { return "Credit Card"; }
};

class PayPalPayment : public PaymentStrategy {
public:
    std::string GetMethodName() const override { return "PayPal"; }
};

class BankTransferPayment : public PaymentStrategy {
public:
    std::string GetMethodName() const override { return "Bank Transfer"; }
};

/// Create a strategy from its identifier ("credit_card", "paypal", "bank_transfer")
/// @return nullptr if the identifier is not supported
std::unique_ptr<PaymentStrategy> MakePaymentStrategy(const std::string& name);

/// Context that delegates payment to the configured strategy
class ShoppingCart {
public:
    explicit ShoppingCart(int total) : total_(total) {}

    void SetPaymentStrategy(std::unique_ptr<PaymentStrategy> strategy) {
        strategy_ = std::move(strategy);
    }

    bool HasPaymentStrategy() const { return strategy_ != nullptr; }

    /// Pay the cart total with the current strategy
    /// @throws std::logic_error if no strategy is set
    std::string Checkout() const;

    int GetTotal() const { return total_; }

private:
    int total_;
    std::unique_ptr<PaymentStrategy> strategy_;
};

/// Check out a cart of 100 with each method named in input.Values()
void RunStrategyDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
