// File: src/structural/adapter.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <string>

namespace patcat {

/// Existing component with an incompatible interface
class LegacyPrinter {
public:
    std::string PrintOld(const std::string& text) const {
        return "Legacy printer: " + text;
    }
};

/// Interface clients expect
class Printer {
public:
    virtual ~Printer() = default;
    virtual std::string Print(const std::string& text) const = 0;
};

/// Adapts LegacyPrinter to the Printer interface
class PrinterAdapter : public Printer {
public:
    explicit PrinterAdapter(const LegacyPrinter& legacy) : legacy_(legacy) {}

    std::string Print(const std::string& text) const override {
        return legacy_.PrintOld(text);
    }

private:
    const LegacyPrinter& legacy_;
};

/// Print input.Text() through the adapter
void RunAdapterDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
