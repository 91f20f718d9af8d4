// File: src/cli/catalog_cli.hpp
//
// PatCat CLI class definition
// Extracted for testability

#ifndef PATCAT_CATALOG_CLI_HPP
#define PATCAT_CATALOG_CLI_HPP

#include "catalog/pattern_catalog.hpp"
#include "cli/cli_config.hpp"
#include "storage/run_journal.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace patcat {

/// ANSI color codes for terminal output
namespace Color {
    inline const char* RESET = "\033[0m";

    inline const char* RED = "\033[31m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";

    inline const char* BOLD_RED = "\033[1;31m";
    inline const char* BOLD_CYAN = "\033[1;36m";

    inline const char* DIM = "\033[2m";
}

/// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

/// Command-line and interactive front end for the pattern catalog
///
/// One-shot use:   patcat [options] run observer "New update available!"
/// Interactive:    patcat [options] shell
class CatalogCli {
public:
    /// @param config Initial configuration (may be replaced by --config)
    /// @param out Stream receiving traces and listings
    /// @param err Stream receiving diagnostics and errors
    explicit CatalogCli(const CliConfig& config = CliConfig::Default(),
                        std::ostream& out = std::cout,
                        std::ostream& err = std::cerr);
    ~CatalogCli();

    /// Execute a full command line (program name excluded)
    /// @return Process exit code
    int Execute(const std::vector<std::string>& args);

    /// Interactive loop reading commands from in until EOF or exit
    void Run(std::istream& in);

    /// Process a single shell line (for testing)
    /// @return Exit code of the command
    int ProcessCommand(const std::string& line);

    /// Split a line into tokens, honoring double quotes
    static std::vector<std::string> Tokenize(const std::string& line);

    /// Get state for verification
    bool IsRunning() const { return running_; }
    bool IsVerboseEnabled() const { return config_.interface.verbose; }
    bool IsColorEnabled() const { return config_.interface.colors_enabled; }
    size_t GetRunCount() const { return run_count_; }
    const CliConfig& GetConfig() const { return config_; }
    const PatternCatalog& GetCatalog() const { return catalog_; }

    /// Journal used for history (opened on first use)
    RunJournal& GetJournal();

private:
    PatternCatalog catalog_;
    CliConfig config_;
    std::ostream& out_;
    std::ostream& err_;
    std::unique_ptr<RunJournal> journal_;

    bool running_ = true;
    size_t run_count_ = 0;

    // Argument handling
    int ApplyOptions(const std::vector<std::string>& args, std::vector<std::string>& positional);
    int Dispatch(const std::vector<std::string>& tokens, bool interactive);

    // Commands
    int RunPattern(const std::vector<std::string>& tokens);
    int ListPatterns(const std::vector<std::string>& tokens);
    int DescribePattern(const std::vector<std::string>& tokens);
    int ShowHistory(const std::vector<std::string>& tokens);
    void ShowHelp();
    void ShowUsage();
    void PrintWelcome();

    // Diagnostics
    void ReportError(const std::string& message);
    void LogVerbose(const std::string& message);

    // Color helpers
    const char* C(const char* color) const { return config_.interface.colors_enabled ? color : ""; }
};

} // namespace patcat

#endif // PATCAT_CATALOG_CLI_HPP
