// File: src/core/output_sink.hpp
#pragma once

#include "core/types.hpp"
#include <ostream>
#include <string>

namespace patcat {

/// Abstract destination for the lines a demonstration prints
///
/// Demonstrations never write to std::cout directly; they emit whole lines
/// into a sink so the same code can feed a test, a trace, or a terminal.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    /// Emit one line (without trailing newline)
    virtual void WriteLine(const std::string& line) = 0;

    /// Number of lines written so far
    virtual size_t LineCount() const = 0;
};

/// Sink that collects lines into a Trace
class TraceSink : public OutputSink {
public:
    void WriteLine(const std::string& line) override;
    size_t LineCount() const override { return lines_.size(); }

    const Trace& GetTrace() const { return lines_; }

    /// Move the collected lines out, leaving the sink empty
    Trace TakeTrace();

private:
    Trace lines_;
};

/// Sink that forwards lines to an output stream
class StreamSink : public OutputSink {
public:
    /// @param out Destination stream (must outlive the sink)
    /// @param prefix Text prepended to every line
    explicit StreamSink(std::ostream& out, std::string prefix = "");

    void WriteLine(const std::string& line) override;
    size_t LineCount() const override { return count_; }

private:
    std::ostream& out_;
    std::string prefix_;
    size_t count_{0};
};

} // namespace patcat
