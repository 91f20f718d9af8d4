// File: src/structural/adapter.cpp
#include "structural/adapter.hpp"

namespace patcat {

void RunAdapterDemo(const DemoInput& input, OutputSink& out) {
    LegacyPrinter legacy;
    PrinterAdapter adapter(legacy);

    const Printer& printer = adapter;
    out.WriteLine(printer.Print(input.Text()));
}

} // namespace patcat
