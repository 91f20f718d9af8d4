// File: src/creational/singleton.cpp
#include "creational/singleton.hpp"

namespace patcat {

Logger::Logger(OutputSink& out) : out_(out) {
    out_.WriteLine("Logger instance created.");
}

void Logger::Log(const std::string& message) {
    ++message_count_;
    out_.WriteLine("Log: " + message);
}

Logger& AppContext::GetLogger() {
    if (!logger_) {
        logger_ = std::make_unique<Logger>(out_);
    }
    return *logger_;
}

void RunSingletonDemo(const DemoInput& input, OutputSink& out) {
    AppContext context(out);

    Logger& first = context.GetLogger();
    for (const auto& message : input.Values()) {
        first.Log(message);
    }

    Logger& second = context.GetLogger();
    out.WriteLine(std::string("Same instance: ") + (&first == &second ? "true" : "false"));
}

} // namespace patcat
