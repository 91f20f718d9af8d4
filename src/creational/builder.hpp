// File: src/creational/builder.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <string>

namespace patcat {

/// Product assembled by ComputerBuilder
struct Computer {
    std::string cpu;
    std::string ram;
    std::string storage;

    /// "Computer [CPU=..., RAM=..., Storage=...]"
    std::string ToString() const;
};

/// Step-by-step builder with defaults for every part
class ComputerBuilder {
public:
    ComputerBuilder& SetCpu(const std::string& cpu);
    ComputerBuilder& SetRam(const std::string& ram);
    ComputerBuilder& SetStorage(const std::string& storage);

    /// Set a part by key ("cpu", "ram", "storage")
    /// @return false if key names no part
    bool SetPart(const std::string& key, const std::string& value);

    Computer Build() const { return computer_; }

private:
    Computer computer_{"Intel i7", "16GB", "512GB SSD"};
};

/// Build a computer, applying each "key=value" override in input.Values()
void RunBuilderDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
