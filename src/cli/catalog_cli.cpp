// File: src/cli/catalog_cli.cpp
//
// Command-line front end for the pattern catalog
//
// Features:
// - One-shot subcommands (run, list, describe, history)
// - Interactive shell with the same commands
// - YAML configuration and command-line overrides
// - Run history kept in an SQLite journal

#include "cli/catalog_cli.hpp"
#include <iomanip>
#include <stdexcept>

namespace patcat {

// Parse a strictly positive decimal count (no sign, no trailing text)
static bool ParsePositiveCount(const std::string& text, size_t& value) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        value = std::stoul(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return value > 0;
}

CatalogCli::CatalogCli(const CliConfig& config, std::ostream& out, std::ostream& err)
    : config_(config), out_(out), err_(err) {}

CatalogCli::~CatalogCli() = default;

RunJournal& CatalogCli::GetJournal() {
    if (!journal_) {
        RunJournal::Config journal_config;
        journal_config.db_path = config_.JournalPath();
        journal_ = std::make_unique<RunJournal>(journal_config);
    }
    return *journal_;
}

// ============================================================================
// Argument Handling
// ============================================================================

int CatalogCli::Execute(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    int rc = ApplyOptions(args, positional);
    if (rc != kExitOk) {
        return rc;
    }

    if (positional.empty() || positional[0] == "shell") {
        Run(std::cin);
        return kExitOk;
    }

    return Dispatch(positional, false);
}

int CatalogCli::ApplyOptions(const std::vector<std::string>& args,
                             std::vector<std::string>& positional) {
    // --config is applied first so that other flags override the file
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] != "--config") continue;

        if (i + 1 >= args.size()) {
            ReportError("--config requires a file path");
            ShowUsage();
            return kExitUsage;
        }
        auto loaded = CliConfig::LoadFromFile(args[i + 1]);
        if (!loaded) {
            ReportError("could not load configuration from " + args[i + 1]);
            return kExitUsage;
        }
        config_ = *loaded;
        journal_.reset();
    }

    bool options_done = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Options are only recognized before the subcommand
        if (options_done || arg.size() < 2 || arg.compare(0, 2, "--") != 0) {
            options_done = true;
            positional.push_back(arg);
            continue;
        }

        if (arg == "--config") {
            ++i;
        } else if (arg == "--verbose") {
            config_.interface.verbose = true;
        } else if (arg == "--no-color") {
            config_.interface.colors_enabled = false;
        } else if (arg == "--journal") {
            if (i + 1 >= args.size()) {
                ReportError("--journal requires a database path");
                ShowUsage();
                return kExitUsage;
            }
            config_.journal.enabled = true;
            config_.journal.path = args[++i];
            journal_.reset();
        } else if (arg == "--help") {
            positional.assign(1, "help");
            return kExitOk;
        } else {
            ReportError("unrecognized option: " + arg);
            ShowUsage();
            return kExitUsage;
        }
    }

    return kExitOk;
}

std::vector<std::string> CatalogCli::Tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;
    bool has_token = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
            has_token = true;
        } else if (!in_quotes && (c == ' ' || c == '\t')) {
            if (has_token) {
                tokens.push_back(current);
                current.clear();
                has_token = false;
            }
        } else {
            current += c;
            has_token = true;
        }
    }

    if (has_token) {
        tokens.push_back(current);
    }
    return tokens;
}

// ============================================================================
// Interactive Shell
// ============================================================================

void CatalogCli::Run(std::istream& in) {
    PrintWelcome();

    std::string line;
    while (running_) {
        out_ << config_.interface.prompt;
        out_.flush();

        if (!std::getline(in, line)) {
            break;
        }

        ProcessCommand(line);
    }

    out_ << "\nRuns this session: " << run_count_ << "\n";
}

int CatalogCli::ProcessCommand(const std::string& line) {
    auto tokens = Tokenize(line);
    if (tokens.empty()) {
        return kExitOk;
    }
    return Dispatch(tokens, true);
}

void CatalogCli::PrintWelcome() {
    out_ << C(Color::BOLD_CYAN) << "PatCat - Design Pattern Demonstration Catalog"
         << C(Color::RESET) << "\n";
    out_ << catalog_.Size() << " patterns available. Type 'help' for commands.\n\n";
}

// ============================================================================
// Command Dispatch
// ============================================================================

int CatalogCli::Dispatch(const std::vector<std::string>& tokens, bool interactive) {
    const std::string& command = tokens[0];

    if (command == "run") {
        return RunPattern(tokens);
    } else if (command == "list") {
        return ListPatterns(tokens);
    } else if (command == "describe") {
        return DescribePattern(tokens);
    } else if (command == "history") {
        return ShowHistory(tokens);
    } else if (command == "help") {
        ShowHelp();
        return kExitOk;
    } else if (interactive && command == "verbose") {
        config_.interface.verbose = !config_.interface.verbose;
        out_ << "Verbose mode: " << (config_.interface.verbose ? "ON" : "OFF") << "\n";
        return kExitOk;
    } else if (interactive && (command == "exit" || command == "quit")) {
        running_ = false;
        return kExitOk;
    }

    ReportError("unknown command: " + command);
    if (interactive) {
        err_ << "Type 'help' for available commands.\n";
    } else {
        ShowUsage();
    }
    return kExitUsage;
}

// ============================================================================
// Commands
// ============================================================================

int CatalogCli::RunPattern(const std::vector<std::string>& tokens) {
    if (tokens.size() < 2) {
        ReportError("run requires a pattern id");
        return kExitUsage;
    }

    const std::string& pattern_id = tokens[1];
    DemoInput input(std::vector<std::string>(tokens.begin() + 2, tokens.end()));

    Trace trace;
    try {
        LogVerbose("[Running: " + pattern_id + "]");
        trace = catalog_.Run(pattern_id, input);
    } catch (const UnknownPatternError& e) {
        ReportError(e.what());
        return kExitFailure;
    }

    ++run_count_;

    if (config_.output.show_header) {
        out_ << C(Color::BOLD_CYAN) << "== " << pattern_id << " ==" << C(Color::RESET) << "\n";
    }
    StreamSink sink(out_, config_.output.line_prefix);
    for (const auto& line : trace) {
        sink.WriteLine(line);
    }

    // The trace is already printed; a journal failure only costs the history entry
    try {
        int64_t row = GetJournal().Record(pattern_id, input, trace);
        if (row == 0) {
            err_ << C(Color::YELLOW) << "Warning: " << C(Color::RESET)
                 << "run was not recorded in the journal\n";
        } else {
            LogVerbose("[Journal: recorded run #" + std::to_string(row) + "]");
        }
    } catch (const std::runtime_error& e) {
        err_ << C(Color::YELLOW) << "Warning: " << C(Color::RESET)
             << "run was not recorded in the journal: " << e.what() << "\n";
    }

    return kExitOk;
}

int CatalogCli::ListPatterns(const std::vector<std::string>& tokens) {
    std::vector<CatalogEntry> entries;

    if (tokens.size() >= 2) {
        try {
            entries = catalog_.List(ParsePatternCategory(tokens[1]));
        } catch (const std::invalid_argument& e) {
            ReportError(e.what());
            return kExitFailure;
        }
    } else {
        entries = catalog_.List();
    }

    for (const auto& entry : entries) {
        out_ << std::left << std::setw(26) << entry.Id()
             << std::setw(14) << ("(" + std::string(ToString(entry.Category())) + ")")
             << entry.summary << "\n";
    }
    out_ << std::right;
    return kExitOk;
}

int CatalogCli::DescribePattern(const std::vector<std::string>& tokens) {
    if (tokens.size() < 2) {
        ReportError("describe requires a pattern id");
        return kExitUsage;
    }

    try {
        const CatalogEntry& entry = catalog_.Describe(tokens[1]);
        out_ << C(Color::BOLD_CYAN) << entry.name << C(Color::RESET) << "\n";
        out_ << "  Id:            " << entry.Id() << "\n";
        out_ << "  Category:      " << ToString(entry.Category()) << "\n";
        out_ << "  Summary:       " << entry.summary << "\n";
        out_ << "  Default input: "
             << (entry.default_input.IsEmpty() ? "(none)" : entry.default_input.ToString())
             << "\n";
    } catch (const UnknownPatternError& e) {
        ReportError(e.what());
        return kExitFailure;
    }
    return kExitOk;
}

int CatalogCli::ShowHistory(const std::vector<std::string>& tokens) {
    size_t limit = config_.journal.history_limit;
    if (tokens.size() >= 2 && !ParsePositiveCount(tokens[1], limit)) {
        ReportError("history expects a positive number, got: " + tokens[1]);
        return kExitUsage;
    }

    std::vector<JournalEntry> entries;
    try {
        entries = GetJournal().Recent(limit);
    } catch (const std::runtime_error& e) {
        ReportError(e.what());
        return kExitFailure;
    }
    if (entries.empty()) {
        out_ << "No runs recorded.\n";
        return kExitOk;
    }

    for (const auto& entry : entries) {
        out_ << "#" << entry.id << " " << entry.pattern;
        if (!entry.input.empty()) {
            out_ << " " << entry.input;
        }
        out_ << " " << C(Color::DIM) << "(" << entry.trace.size() << " lines)"
             << C(Color::RESET) << "\n";
    }
    return kExitOk;
}

void CatalogCli::ShowHelp() {
    out_ << R"(
Available Commands:
===================

  run <pattern-id> [input...]   Run a demonstration and print its trace
  list [category]               List patterns (behavioral, creational, structural)
  describe <pattern-id>         Show details and default input of a pattern
  history [N]                   Show the N most recent runs
  help                          Show this help

Shell only:
  verbose                       Toggle verbose diagnostics
  exit, quit                    Leave the shell

Examples:
  run observer "New update available!"
  run chain_of_responsibility moderator
  run state next next next
  list creational

)";
}

void CatalogCli::ShowUsage() {
    err_ << "Usage: patcat [--config <file>] [--verbose] [--no-color] [--journal <db>]\n"
         << "              <run|list|describe|history|shell|help> [arguments...]\n";
}

// ============================================================================
// Diagnostics
// ============================================================================

void CatalogCli::ReportError(const std::string& message) {
    err_ << C(Color::BOLD_RED) << "Error: " << C(Color::RESET) << message << "\n";
}

void CatalogCli::LogVerbose(const std::string& message) {
    if (config_.interface.verbose) {
        err_ << message << "\n";
    }
}

} // namespace patcat
