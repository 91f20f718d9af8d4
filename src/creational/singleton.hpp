// File: src/creational/singleton.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>

namespace patcat {

/// The single shared logger of an application context
class Logger {
public:
    explicit Logger(OutputSink& out);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void Log(const std::string& message);

    size_t MessageCount() const { return message_count_; }

private:
    OutputSink& out_;
    size_t message_count_{0};
};

/// Explicitly constructed owner of the one Logger instance
///
/// Replaces process-wide static state: whoever constructs the context
/// decides the lifetime, and every caller that needs the logger is handed
/// the context. The logger is created on the first GetLogger() call.
class AppContext {
public:
    explicit AppContext(OutputSink& out) : out_(out) {}

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    Logger& GetLogger();

    bool HasLogger() const { return logger_ != nullptr; }

private:
    OutputSink& out_;
    std::unique_ptr<Logger> logger_;
};

/// Log each of input.Values() through the context's logger, then show that
/// a second lookup yields the same instance
void RunSingletonDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
