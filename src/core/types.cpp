// File: src/core/types.cpp
#include "core/types.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace patcat {

// PatternKind implementations

const char* ToString(PatternKind kind) {
    switch (kind) {
        case PatternKind::CHAIN_OF_RESPONSIBILITY: return "chain_of_responsibility";
        case PatternKind::COMMAND: return "command";
        case PatternKind::OBSERVER: return "observer";
        case PatternKind::STATE: return "state";
        case PatternKind::STRATEGY: return "strategy";
        case PatternKind::TEMPLATE_METHOD: return "template_method";
        case PatternKind::VISITOR: return "visitor";
        case PatternKind::SINGLETON: return "singleton";
        case PatternKind::FACTORY_METHOD: return "factory_method";
        case PatternKind::ABSTRACT_FACTORY: return "abstract_factory";
        case PatternKind::BUILDER: return "builder";
        case PatternKind::PROTOTYPE: return "prototype";
        case PatternKind::ADAPTER: return "adapter";
        case PatternKind::DECORATOR: return "decorator";
        case PatternKind::FACADE: return "facade";
        case PatternKind::PROXY: return "proxy";
        default: return "unknown";
    }
}

PatternKind ParsePatternKind(const std::string& str) {
    for (size_t i = 0; i < kPatternKindCount; ++i) {
        auto kind = static_cast<PatternKind>(i);
        if (str == ToString(kind)) {
            return kind;
        }
    }
    throw UnknownPatternError(str);
}

// PatternCategory implementations

const char* ToString(PatternCategory category) {
    switch (category) {
        case PatternCategory::BEHAVIORAL: return "BEHAVIORAL";
        case PatternCategory::CREATIONAL: return "CREATIONAL";
        case PatternCategory::STRUCTURAL: return "STRUCTURAL";
        default: return "UNKNOWN";
    }
}

PatternCategory ParsePatternCategory(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "BEHAVIORAL") return PatternCategory::BEHAVIORAL;
    if (upper == "CREATIONAL") return PatternCategory::CREATIONAL;
    if (upper == "STRUCTURAL") return PatternCategory::STRUCTURAL;
    throw std::invalid_argument("Unknown PatternCategory: " + str);
}

PatternCategory CategoryOf(PatternKind kind) {
    switch (kind) {
        case PatternKind::CHAIN_OF_RESPONSIBILITY:
        case PatternKind::COMMAND:
        case PatternKind::OBSERVER:
        case PatternKind::STATE:
        case PatternKind::STRATEGY:
        case PatternKind::TEMPLATE_METHOD:
        case PatternKind::VISITOR:
            return PatternCategory::BEHAVIORAL;

        case PatternKind::SINGLETON:
        case PatternKind::FACTORY_METHOD:
        case PatternKind::ABSTRACT_FACTORY:
        case PatternKind::BUILDER:
        case PatternKind::PROTOTYPE:
            return PatternCategory::CREATIONAL;

        case PatternKind::ADAPTER:
        case PatternKind::DECORATOR:
        case PatternKind::FACADE:
        case PatternKind::PROXY:
            return PatternCategory::STRUCTURAL;
    }
    throw std::invalid_argument("PatternKind out of range");
}

// DemoInput implementations

std::string DemoInput::ToString() const {
    std::ostringstream oss;
    for (size_t i = 0; i < values_.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << values_[i];
    }
    return oss.str();
}

} // namespace patcat
