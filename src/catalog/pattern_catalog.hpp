// File: src/catalog/pattern_catalog.hpp
#pragma once

#include "core/errors.hpp"
#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <map>
#include <string>
#include <vector>

namespace patcat {

/// Metadata describing one registered demonstration
struct CatalogEntry {
    /// Pattern this entry demonstrates
    PatternKind kind{PatternKind::CHAIN_OF_RESPONSIBILITY};

    /// Display name ("Chain of Responsibility")
    std::string name;

    /// One-line description of what the demonstration shows
    std::string summary;

    /// Input used when the caller supplies none
    DemoInput default_input;

    /// Identifier used on the command line
    std::string Id() const { return ToString(kind); }

    PatternCategory Category() const { return CategoryOf(kind); }
};

/// Registry mapping pattern identifiers to runnable demonstrations
///
/// Every demonstration is a pure function of its input: running the same
/// pattern with the same input always yields the same trace. Dispatch is a
/// single switch over the closed PatternKind set.
///
/// Usage:
///   PatternCatalog catalog;
///   Trace lines = catalog.Run("observer", DemoInput{"New update available!"});
class PatternCatalog {
public:
    /// Construct a catalog with every known pattern registered
    PatternCatalog();

    // ========================================================================
    // Running Demonstrations
    // ========================================================================

    /// Run a demonstration and collect its trace
    /// @param pattern_id Identifier such as "observer"
    /// @param input Demonstration input; empty means the entry's default input
    /// @return The ordered output lines
    /// @throws UnknownPatternError if pattern_id is not registered
    Trace Run(const std::string& pattern_id, const DemoInput& input = DemoInput()) const;

    /// Run a demonstration by kind and collect its trace
    Trace Run(PatternKind kind, const DemoInput& input = DemoInput()) const;

    /// Run a demonstration, streaming its lines into out
    /// @throws UnknownPatternError before writing anything if pattern_id is
    ///         not registered
    void Run(const std::string& pattern_id, const DemoInput& input, OutputSink& out) const;

    /// Run a demonstration by kind, streaming its lines into out
    void Run(PatternKind kind, const DemoInput& input, OutputSink& out) const;

    // ========================================================================
    // Introspection
    // ========================================================================

    /// Check whether pattern_id names a registered demonstration
    bool Contains(const std::string& pattern_id) const;

    /// Look up metadata for a pattern
    /// @throws UnknownPatternError if pattern_id is not registered
    const CatalogEntry& Describe(const std::string& pattern_id) const;

    /// Look up metadata by kind
    const CatalogEntry& Describe(PatternKind kind) const;

    /// All entries in catalog order (behavioral, creational, structural)
    std::vector<CatalogEntry> List() const;

    /// Entries of a single category in catalog order
    std::vector<CatalogEntry> List(PatternCategory category) const;

    /// Number of registered demonstrations
    size_t Size() const { return entries_.size(); }

private:
    std::map<PatternKind, CatalogEntry> entries_;

    void Register(PatternKind kind, std::string name, std::string summary,
                  DemoInput default_input);

    /// Input actually handed to the demonstration
    const DemoInput& ResolveInput(PatternKind kind, const DemoInput& input) const;

    /// Invoke the demonstration for kind
    static void Dispatch(PatternKind kind, const DemoInput& input, OutputSink& out);
};

} // namespace patcat
