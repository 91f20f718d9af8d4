// File: include/cli/cli_config.hpp
//
// YAML Configuration Support for the PatCat CLI
// Allows loading CLI settings from YAML configuration files

#ifndef PATCAT_CLI_CONFIG_HPP
#define PATCAT_CLI_CONFIG_HPP

#include <string>
#include <optional>
#include <vector>

namespace patcat {

/// Configuration structure for the PatCat CLI
struct CliConfig {
    // === Interface Settings ===
    struct Interface {
        std::string prompt = "patcat> ";
        bool colors_enabled = true;
        bool verbose = false;
    } interface;

    // === Trace Output Settings ===
    struct Output {
        bool show_header = false;     // Print "== <id> ==" before a trace
        std::string line_prefix;      // Prepended to every trace line
    } output;

    // === Run Journal Settings ===
    struct Journal {
        bool enabled = false;                     // Persist runs to path
        std::string path = "patcat_history.db";
        size_t history_limit = 10;                // Entries shown by "history"
    } journal;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    /// @return YAML representation of configuration
    std::string ToYamlString() const;

    /// Validate configuration values
    /// @return true if configuration is valid, false otherwise
    bool Validate() const;

    /// Get validation errors (if any)
    /// @return Vector of error messages
    std::vector<std::string> GetValidationErrors() const;

    /// Path the journal should open: the configured file when enabled,
    /// ":memory:" otherwise
    std::string JournalPath() const;

    /// Create default configuration
    static CliConfig Default();
};

} // namespace patcat

#endif // PATCAT_CLI_CONFIG_HPP
