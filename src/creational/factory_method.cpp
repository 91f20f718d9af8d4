// File: src/creational/factory_method.cpp
#include "creational/factory_method.hpp"

namespace patcat {

std::unique_ptr<ShapeCreator> MakeShapeCreator(const std::string& name) {
    if (name == "circle") return std::make_unique<CircleCreator>();
    if (name == "square") return std::make_unique<SquareCreator>();
    if (name == "triangle") return std::make_unique<TriangleCreator>();
    return nullptr;
}

void RunFactoryMethodDemo(const DemoInput& input, OutputSink& out) {
    for (const auto& name : input.Values()) {
        auto creator = MakeShapeCreator(name);
        if (!creator) {
            out.WriteLine("Unknown shape: " + name);
            continue;
        }
        out.WriteLine(creator->Render());
    }
}

} // namespace patcat
