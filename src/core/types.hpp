// File: src/core/types.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace patcat {

// PatternKind: Closed set of demonstrable design patterns
enum class PatternKind : uint8_t {
    // Behavioral
    CHAIN_OF_RESPONSIBILITY = 0,
    COMMAND = 1,
    OBSERVER = 2,
    STATE = 3,
    STRATEGY = 4,
    TEMPLATE_METHOD = 5,
    VISITOR = 6,

    // Creational
    SINGLETON = 7,
    FACTORY_METHOD = 8,
    ABSTRACT_FACTORY = 9,
    BUILDER = 10,
    PROTOTYPE = 11,

    // Structural
    ADAPTER = 12,
    DECORATOR = 13,
    FACADE = 14,
    PROXY = 15,
};

// Number of entries in PatternKind
constexpr size_t kPatternKindCount = 16;

// Convert PatternKind to its identifier ("chain_of_responsibility", ...)
const char* ToString(PatternKind kind);

// Parse PatternKind from identifier
// Throws UnknownPatternError if the identifier is not recognized
PatternKind ParsePatternKind(const std::string& str);

// PatternCategory: Family a pattern belongs to
enum class PatternCategory : uint8_t {
    BEHAVIORAL = 0,
    CREATIONAL = 1,
    STRUCTURAL = 2,
};

// Convert PatternCategory to string
const char* ToString(PatternCategory category);

// Parse PatternCategory from string (case-insensitive)
PatternCategory ParsePatternCategory(const std::string& str);

// Category of a given pattern
PatternCategory CategoryOf(PatternKind kind);

// Trace: Ordered lines printed by a demonstration
using Trace = std::vector<std::string>;

// DemoInput: Payload handed to a demonstration
// Text-shaped demos read the first value, list-shaped demos read all values.
class DemoInput {
public:
    DemoInput() = default;
    explicit DemoInput(const std::string& text) : values_{text} {}
    explicit DemoInput(std::vector<std::string> values) : values_(std::move(values)) {}
    DemoInput(std::initializer_list<std::string> values) : values_(values) {}

    // All values joined with single spaces, so unquoted words form one text
    std::string Text() const { return ToString(); }

    // All values in order
    const std::vector<std::string>& Values() const { return values_; }

    bool IsEmpty() const { return values_.empty(); }
    size_t Size() const { return values_.size(); }

    // Values joined with single spaces
    std::string ToString() const;

    bool operator==(const DemoInput& other) const { return values_ == other.values_; }
    bool operator!=(const DemoInput& other) const { return values_ != other.values_; }

private:
    std::vector<std::string> values_;
};

} // namespace patcat
