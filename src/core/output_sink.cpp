// File: src/core/output_sink.cpp
#include "core/output_sink.hpp"
#include <utility>

namespace patcat {

// ============================================================================
// TraceSink
// ============================================================================

void TraceSink::WriteLine(const std::string& line) {
    lines_.push_back(line);
}

Trace TraceSink::TakeTrace() {
    Trace result = std::move(lines_);
    lines_.clear();
    return result;
}

// ============================================================================
// StreamSink
// ============================================================================

StreamSink::StreamSink(std::ostream& out, std::string prefix)
    : out_(out), prefix_(std::move(prefix)) {}

void StreamSink::WriteLine(const std::string& line) {
    out_ << prefix_ << line << "\n";
    ++count_;
}

} // namespace patcat
