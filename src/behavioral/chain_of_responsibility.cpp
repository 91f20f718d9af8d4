// File: src/behavioral/chain_of_responsibility.cpp
#include "behavioral/chain_of_responsibility.hpp"

namespace patcat {

const char* ToString(HandlerKind kind) {
    switch (kind) {
        case HandlerKind::ADMIN: return "Admin";
        case HandlerKind::MODERATOR: return "Moderator";
        default: return "Unknown";
    }
}

// Keyword a handler accepts
static const char* KeywordFor(HandlerKind kind) {
    switch (kind) {
        case HandlerKind::ADMIN: return "admin";
        case HandlerKind::MODERATOR: return "moderator";
        default: return "";
    }
}

HandlerChain& HandlerChain::Then(HandlerKind kind) {
    handlers_.push_back(kind);
    return *this;
}

std::optional<std::string> HandlerChain::Handle(const std::string& request) const {
    for (HandlerKind kind : handlers_) {
        if (request == KeywordFor(kind)) {
            return std::string("Request handled by ") + ToString(kind) + ".";
        }
    }
    return std::nullopt;
}

HandlerChain HandlerChain::Default() {
    HandlerChain chain;
    chain.Then(HandlerKind::ADMIN).Then(HandlerKind::MODERATOR);
    return chain;
}

void RunChainOfResponsibilityDemo(const DemoInput& input, OutputSink& out) {
    auto handled = HandlerChain::Default().Handle(input.Text());
    if (handled) {
        out.WriteLine(*handled);
    }
}

} // namespace patcat
