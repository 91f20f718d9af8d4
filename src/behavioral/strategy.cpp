// File: src/behavioral/strategy.cpp
#include "behavioral/strategy.hpp"
#include <stdexcept>

namespace patcat {

std::string PaymentStrategy::Pay(int amount) const {
    return "Paid " + std::to_string(amount) + " using " + GetMethodName() + ".";
}

std::unique_ptr<PaymentStrategy> MakePaymentStrategy(const std::string& name) {
    if (name == "credit_card") return std::make_unique<CreditCardPayment>();
    if (name == "paypal") return std::make_unique<PayPalPayment>();
    if (name == "bank_transfer") return std::make_unique<BankTransferPayment>();
    return nullptr;
}

std::string ShoppingCart::Checkout() const {
    if (!strategy_) {
        throw std::logic_error("ShoppingCart::Checkout called without a payment strategy");
    }
    return strategy_->Pay(total_);
}

void RunStrategyDemo(const DemoInput& input, OutputSink& out) {
    ShoppingCart cart(100);

    for (const auto& name : input.Values()) {
        auto strategy = MakePaymentStrategy(name);
        if (!strategy) {
            out.WriteLine("Unsupported payment method: " + name);
            continue;
        }
        cart.SetPaymentStrategy(std::move(strategy));
        out.WriteLine(cart.Checkout());
    }
}

} // namespace patcat
