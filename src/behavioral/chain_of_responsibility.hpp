// File: src/behavioral/chain_of_responsibility.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace patcat {

/// Kinds of request handlers that can appear in a chain
enum class HandlerKind : uint8_t {
    ADMIN = 0,
    MODERATOR = 1,
};

const char* ToString(HandlerKind kind);

/// Ordered chain of handlers
///
/// A request is offered to each handler in turn; the first one whose
/// keyword matches handles it. A request nobody accepts falls off the end.
class HandlerChain {
public:
    HandlerChain() = default;
    explicit HandlerChain(std::vector<HandlerKind> handlers)
        : handlers_(std::move(handlers)) {}

    /// Append a handler to the end of the chain
    HandlerChain& Then(HandlerKind kind);

    /// Pass a request down the chain
    /// @return The handling message, or std::nullopt if nobody handled it
    std::optional<std::string> Handle(const std::string& request) const;

    size_t Length() const { return handlers_.size(); }

    /// Admin followed by Moderator
    static HandlerChain Default();

private:
    std::vector<HandlerKind> handlers_;
};

/// Pass input.Text() through the default chain
void RunChainOfResponsibilityDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
