// File: src/creational/prototype.cpp
#include "creational/prototype.hpp"

namespace patcat {

void RunPrototypeDemo(const DemoInput& input, OutputSink& out) {
    CirclePrototype original("Red");

    auto copy = original.Clone();
    copy->SetColor(input.Text());

    out.WriteLine("Original: " + original.ToString());
    out.WriteLine("Clone: " + copy->ToString());
}

} // namespace patcat
