// File: examples/basic_example.cpp
//
// Basic usage of the PatCat catalog as a library.
// Demonstrates:
// - Listing the registered patterns by category
// - Running a demonstration with its default input
// - Running a demonstration with custom input
// - Streaming a trace into a custom sink
// - Handling an unknown pattern id

#include "catalog/pattern_catalog.hpp"
#include "core/errors.hpp"
#include <iostream>

using namespace patcat;

int main() {
    std::cout << "=== PatCat Basic Example ===\n\n";

    PatternCatalog catalog;

    // Step 1: List patterns per category
    std::cout << "Step 1: Registered patterns (" << catalog.Size() << ")\n";
    for (PatternCategory category : {PatternCategory::BEHAVIORAL,
                                     PatternCategory::CREATIONAL,
                                     PatternCategory::STRUCTURAL}) {
        std::cout << "  " << ToString(category) << ":\n";
        for (const auto& entry : catalog.List(category)) {
            std::cout << "    " << entry.Id() << " - " << entry.summary << "\n";
        }
    }
    std::cout << "\n";

    // Step 2: Default input
    std::cout << "Step 2: Running 'state' with its default input...\n";
    for (const auto& line : catalog.Run("state")) {
        std::cout << "  " << line << "\n";
    }
    std::cout << "\n";

    // Step 3: Custom input
    std::cout << "Step 3: Running 'decorator' with milk and whip...\n";
    for (const auto& line : catalog.Run("decorator", DemoInput{"milk", "whip"})) {
        std::cout << "  " << line << "\n";
    }
    std::cout << "\n";

    // Step 4: Streaming into a sink
    std::cout << "Step 4: Streaming 'proxy' directly to stdout...\n";
    StreamSink sink(std::cout, "  | ");
    catalog.Run("proxy", DemoInput{"photo.png", "photo.png"}, sink);
    std::cout << "  (" << sink.LineCount() << " lines written)\n\n";

    // Step 5: Unknown pattern
    std::cout << "Step 5: Running an unknown pattern...\n";
    try {
        catalog.Run("flyweight");
    } catch (const UnknownPatternError& e) {
        std::cout << "  Caught: " << e.what() << "\n";
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
