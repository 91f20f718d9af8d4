// File: src/creational/builder.cpp
#include "creational/builder.hpp"

namespace patcat {

std::string Computer::ToString() const {
    return "Computer [CPU=" + cpu + ", RAM=" + ram + ", Storage=" + storage + "]";
}

ComputerBuilder& ComputerBuilder::SetCpu(const std::string& cpu) {
    computer_.cpu = cpu;
    return *this;
}

ComputerBuilder& ComputerBuilder::SetRam(const std::string& ram) {
    computer_.ram = ram;
    return *this;
}

ComputerBuilder& ComputerBuilder::SetStorage(const std::string& storage) {
    computer_.storage = storage;
    return *this;
}

bool ComputerBuilder::SetPart(const std::string& key, const std::string& value) {
    if (key == "cpu") {
        SetCpu(value);
    } else if (key == "ram") {
        SetRam(value);
    } else if (key == "storage") {
        SetStorage(value);
    } else {
        return false;
    }
    return true;
}

void RunBuilderDemo(const DemoInput& input, OutputSink& out) {
    ComputerBuilder builder;

    for (const auto& item : input.Values()) {
        auto eq = item.find('=');
        std::string key = item.substr(0, eq);
        std::string value = (eq == std::string::npos) ? "" : item.substr(eq + 1);

        if (eq == std::string::npos || !builder.SetPart(key, value)) {
            out.WriteLine("Ignoring unknown part: " + key);
        }
    }

    out.WriteLine(builder.Build().ToString());
}

} // namespace patcat
