// File: src/core/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace patcat {

/// Raised when a pattern identifier is not part of the catalog
class UnknownPatternError : public std::invalid_argument {
public:
    explicit UnknownPatternError(const std::string& pattern_id)
        : std::invalid_argument("unknown pattern: " + pattern_id),
          pattern_id_(pattern_id) {}

    /// The identifier that failed to resolve
    const std::string& pattern_id() const { return pattern_id_; }

private:
    std::string pattern_id_;
};

} // namespace patcat
