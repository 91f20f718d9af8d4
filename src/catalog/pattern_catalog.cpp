// File: src/catalog/pattern_catalog.cpp
#include "catalog/pattern_catalog.hpp"
#include "behavioral/chain_of_responsibility.hpp"
#include "behavioral/command.hpp"
#include "behavioral/observer.hpp"
#include "behavioral/order_state.hpp"
#include "behavioral/strategy.hpp"
#include "behavioral/template_method.hpp"
#include "behavioral/visitor.hpp"
#include "creational/abstract_factory.hpp"
#include "creational/builder.hpp"
#include "creational/factory_method.hpp"
#include "creational/prototype.hpp"
#include "creational/singleton.hpp"
#include "structural/adapter.hpp"
#include "structural/decorator.hpp"
#include "structural/facade.hpp"
#include "structural/proxy.hpp"
#include <utility>

namespace patcat {

// ============================================================================
// Registration
// ============================================================================

PatternCatalog::PatternCatalog() {
    // Behavioral
    Register(PatternKind::CHAIN_OF_RESPONSIBILITY, "Chain of Responsibility",
             "Passes a request along Admin -> Moderator until one handles it",
             DemoInput{"admin"});
    Register(PatternKind::COMMAND, "Command",
             "Remote control issuing undoable light commands",
             DemoInput{"on", "off"});
    Register(PatternKind::OBSERVER, "Observer",
             "Publisher broadcasting messages to User1 and User2",
             DemoInput{"New update available!"});
    Register(PatternKind::STATE, "State",
             "Order moving through Placed, Shipped and Delivered",
             DemoInput{"next", "next", "next"});
    Register(PatternKind::STRATEGY, "Strategy",
             "Shopping cart paying with interchangeable payment methods",
             DemoInput{"credit_card", "paypal"});
    Register(PatternKind::TEMPLATE_METHOD, "Template Method",
             "Document miner with a fixed open/extract/parse/close skeleton",
             DemoInput{"csv"});
    Register(PatternKind::VISITOR, "Visitor",
             "Area and drawing operations over a closed set of shapes",
             DemoInput());

    // Creational
    Register(PatternKind::SINGLETON, "Singleton",
             "One logger owned by an explicitly constructed application context",
             DemoInput{"Application started", "Processing request"});
    Register(PatternKind::FACTORY_METHOD, "Factory Method",
             "Shape creators deciding which shape to instantiate",
             DemoInput{"circle", "square"});
    Register(PatternKind::ABSTRACT_FACTORY, "Abstract Factory",
             "Matching button and checkbox families per platform",
             DemoInput{"windows"});
    Register(PatternKind::BUILDER, "Builder",
             "Computer assembled part by part with overridable defaults",
             DemoInput());
    Register(PatternKind::PROTOTYPE, "Prototype",
             "Cloning a shape and recoloring the independent copy",
             DemoInput{"Blue"});

    // Structural
    Register(PatternKind::ADAPTER, "Adapter",
             "Legacy printer exposed through a modern printer interface",
             DemoInput{"Hello, Adapter!"});
    Register(PatternKind::DECORATOR, "Decorator",
             "Coffee wrapped with priced add-ons",
             DemoInput{"milk", "sugar"});
    Register(PatternKind::FACADE, "Facade",
             "Home theater started through a single call",
             DemoInput{"Inception"});
    Register(PatternKind::PROXY, "Proxy",
             "Image proxy that loads its file on first display only",
             DemoInput{"photo.png", "photo.png"});
}

void PatternCatalog::Register(PatternKind kind, std::string name, std::string summary,
                              DemoInput default_input) {
    CatalogEntry entry;
    entry.kind = kind;
    entry.name = std::move(name);
    entry.summary = std::move(summary);
    entry.default_input = std::move(default_input);
    entries_[kind] = std::move(entry);
}

// ============================================================================
// Running Demonstrations
// ============================================================================

Trace PatternCatalog::Run(const std::string& pattern_id, const DemoInput& input) const {
    return Run(ParsePatternKind(pattern_id), input);
}

Trace PatternCatalog::Run(PatternKind kind, const DemoInput& input) const {
    TraceSink sink;
    Run(kind, input, sink);
    return sink.TakeTrace();
}

void PatternCatalog::Run(const std::string& pattern_id, const DemoInput& input,
                         OutputSink& out) const {
    // Resolve first so an unknown id writes nothing
    PatternKind kind = ParsePatternKind(pattern_id);
    Run(kind, input, out);
}

void PatternCatalog::Run(PatternKind kind, const DemoInput& input, OutputSink& out) const {
    Dispatch(kind, ResolveInput(kind, input), out);
}

const DemoInput& PatternCatalog::ResolveInput(PatternKind kind, const DemoInput& input) const {
    if (!input.IsEmpty()) {
        return input;
    }
    return Describe(kind).default_input;
}

void PatternCatalog::Dispatch(PatternKind kind, const DemoInput& input, OutputSink& out) {
    switch (kind) {
        case PatternKind::CHAIN_OF_RESPONSIBILITY: RunChainOfResponsibilityDemo(input, out); return;
        case PatternKind::COMMAND: RunCommandDemo(input, out); return;
        case PatternKind::OBSERVER: RunObserverDemo(input, out); return;
        case PatternKind::STATE: RunOrderStateDemo(input, out); return;
        case PatternKind::STRATEGY: RunStrategyDemo(input, out); return;
        case PatternKind::TEMPLATE_METHOD: RunTemplateMethodDemo(input, out); return;
        case PatternKind::VISITOR: RunVisitorDemo(input, out); return;
        case PatternKind::SINGLETON: RunSingletonDemo(input, out); return;
        case PatternKind::FACTORY_METHOD: RunFactoryMethodDemo(input, out); return;
        case PatternKind::ABSTRACT_FACTORY: RunAbstractFactoryDemo(input, out); return;
        case PatternKind::BUILDER: RunBuilderDemo(input, out); return;
        case PatternKind::PROTOTYPE: RunPrototypeDemo(input, out); return;
        case PatternKind::ADAPTER: RunAdapterDemo(input, out); return;
        case PatternKind::DECORATOR: RunDecoratorDemo(input, out); return;
        case PatternKind::FACADE: RunFacadeDemo(input, out); return;
        case PatternKind::PROXY: RunProxyDemo(input, out); return;
    }
    throw UnknownPatternError(std::to_string(static_cast<int>(kind)));
}

// ============================================================================
// Introspection
// ============================================================================

bool PatternCatalog::Contains(const std::string& pattern_id) const {
    for (const auto& [kind, entry] : entries_) {
        if (pattern_id == ToString(kind)) {
            return true;
        }
    }
    return false;
}

const CatalogEntry& PatternCatalog::Describe(const std::string& pattern_id) const {
    return Describe(ParsePatternKind(pattern_id));
}

const CatalogEntry& PatternCatalog::Describe(PatternKind kind) const {
    auto it = entries_.find(kind);
    if (it == entries_.end()) {
        throw UnknownPatternError(ToString(kind));
    }
    return it->second;
}

std::vector<CatalogEntry> PatternCatalog::List() const {
    std::vector<CatalogEntry> result;
    result.reserve(entries_.size());
    for (const auto& [kind, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

std::vector<CatalogEntry> PatternCatalog::List(PatternCategory category) const {
    std::vector<CatalogEntry> result;
    for (const auto& [kind, entry] : entries_) {
        if (entry.Category() == category) {
            result.push_back(entry);
        }
    }
    return result;
}

} // namespace patcat
