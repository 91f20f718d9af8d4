// File: tests/cli/catalog_cli_test.cpp
//
// Test suite for the PatCat command-line front end

#include "cli/catalog_cli.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <sstream>

namespace patcat {
namespace {

// Test fixture capturing both output streams
class CatalogCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        CliConfig config = CliConfig::Default();
        config.interface.colors_enabled = false;
        cli_ = std::make_unique<CatalogCli>(config, out_, err_);
    }

    void TearDown() override {
        for (const auto& path : temp_files_) {
            std::filesystem::remove(path);
        }
    }

    std::string TempPath(const std::string& suffix) {
        std::string path = (std::filesystem::temp_directory_path() /
            ("patcat_cli_" + std::to_string(
                std::chrono::system_clock::now().time_since_epoch().count()) + suffix)).string();
        temp_files_.push_back(path);
        return path;
    }

    std::ostringstream out_;
    std::ostringstream err_;
    std::unique_ptr<CatalogCli> cli_;
    std::vector<std::string> temp_files_;
};

// ============================================================================
// Tokenizer
// ============================================================================

TEST(CatalogCliTokenizeTest, SplitsOnWhitespace) {
    auto tokens = CatalogCli::Tokenize("run  state\tnext next");
    EXPECT_EQ((std::vector<std::string>{"run", "state", "next", "next"}), tokens);
}

TEST(CatalogCliTokenizeTest, QuotesGroupWords) {
    auto tokens = CatalogCli::Tokenize("run observer \"New update available!\"");
    ASSERT_EQ(3u, tokens.size());
    EXPECT_EQ("New update available!", tokens[2]);
}

TEST(CatalogCliTokenizeTest, EmptyQuotesYieldEmptyToken) {
    auto tokens = CatalogCli::Tokenize("run adapter \"\"");
    ASSERT_EQ(3u, tokens.size());
    EXPECT_EQ("", tokens[2]);
}

TEST(CatalogCliTokenizeTest, BlankLineHasNoTokens) {
    EXPECT_TRUE(CatalogCli::Tokenize("   ").empty());
}

// ============================================================================
// One-shot Commands
// ============================================================================

TEST_F(CatalogCliTest, RunPrintsTraceAndSucceeds) {
    int rc = cli_->Execute({"run", "observer", "New update available!"});

    EXPECT_EQ(kExitOk, rc);
    EXPECT_EQ("User1 received message: New update available!\n"
              "User2 received message: New update available!\n",
              out_.str());
    EXPECT_EQ(1u, cli_->GetRunCount());
}

TEST_F(CatalogCliTest, RunWithoutInputUsesDefault) {
    EXPECT_EQ(kExitOk, cli_->Execute({"run", "chain_of_responsibility"}));
    EXPECT_EQ("Request handled by Admin.\n", out_.str());
}

TEST_F(CatalogCliTest, UnquotedWordsFormOneText) {
    EXPECT_EQ(kExitOk, cli_->Execute({"run", "adapter", "Hello,", "Adapter!"}));
    EXPECT_EQ("Legacy printer: Hello, Adapter!\n", out_.str());
}

TEST_F(CatalogCliTest, UnquotedMovieTitle) {
    EXPECT_EQ(kExitOk, cli_->Execute({"run", "facade", "The", "Matrix"}));
    EXPECT_NE(std::string::npos, out_.str().find("Playing movie: The Matrix\n"));
}

TEST_F(CatalogCliTest, UnmatchedChainRequestPrintsNothing) {
    EXPECT_EQ(kExitOk, cli_->Execute({"run", "chain_of_responsibility", "guest"}));
    EXPECT_EQ("", out_.str());
}

TEST_F(CatalogCliTest, UnknownPatternFailsWithoutOutput) {
    int rc = cli_->Execute({"run", "flyweight"});

    EXPECT_EQ(kExitFailure, rc);
    EXPECT_EQ("", out_.str());
    EXPECT_NE(std::string::npos, err_.str().find("Error: unknown pattern: flyweight"));
    EXPECT_EQ(0u, cli_->GetRunCount());
}

TEST_F(CatalogCliTest, RunWithoutPatternIsUsageError) {
    EXPECT_EQ(kExitUsage, cli_->Execute({"run"}));
}

TEST_F(CatalogCliTest, UnknownSubcommandIsUsageError) {
    EXPECT_EQ(kExitUsage, cli_->Execute({"frobnicate"}));
    EXPECT_NE(std::string::npos, err_.str().find("Usage:"));
}

TEST_F(CatalogCliTest, UnknownOptionIsUsageError) {
    EXPECT_EQ(kExitUsage, cli_->Execute({"--bogus", "list"}));
}

TEST_F(CatalogCliTest, ListShowsEveryPattern) {
    EXPECT_EQ(kExitOk, cli_->Execute({"list"}));

    std::string output = out_.str();
    for (const auto& entry : cli_->GetCatalog().List()) {
        EXPECT_NE(std::string::npos, output.find(entry.Id())) << entry.Id();
    }
}

TEST_F(CatalogCliTest, ListFiltersByCategory) {
    EXPECT_EQ(kExitOk, cli_->Execute({"list", "structural"}));

    std::string output = out_.str();
    EXPECT_NE(std::string::npos, output.find("adapter"));
    EXPECT_EQ(std::string::npos, output.find("observer"));
}

TEST_F(CatalogCliTest, ListUnknownCategoryFails) {
    EXPECT_EQ(kExitFailure, cli_->Execute({"list", "concurrency"}));
}

TEST_F(CatalogCliTest, DescribeShowsDefaultInput) {
    EXPECT_EQ(kExitOk, cli_->Execute({"describe", "state"}));

    std::string output = out_.str();
    EXPECT_NE(std::string::npos, output.find("State"));
    EXPECT_NE(std::string::npos, output.find("BEHAVIORAL"));
    EXPECT_NE(std::string::npos, output.find("next next next"));
}

TEST_F(CatalogCliTest, DescribeUnknownFails) {
    EXPECT_EQ(kExitFailure, cli_->Execute({"describe", "flyweight"}));
}

TEST_F(CatalogCliTest, NoColorOptionDisablesColor) {
    CatalogCli cli(CliConfig::Default(), out_, err_);
    EXPECT_TRUE(cli.IsColorEnabled());

    cli.Execute({"--no-color", "list"});
    EXPECT_FALSE(cli.IsColorEnabled());
    EXPECT_EQ(std::string::npos, out_.str().find("\033["));
}

TEST_F(CatalogCliTest, VerboseOptionLogsToErr) {
    cli_->Execute({"--verbose", "run", "adapter", "hi"});

    EXPECT_TRUE(cli_->IsVerboseEnabled());
    EXPECT_EQ("Legacy printer: hi\n", out_.str());
    EXPECT_NE(std::string::npos, err_.str().find("[Running: adapter]"));
    EXPECT_NE(std::string::npos, err_.str().find("[Journal: recorded run #1]"));
}

TEST_F(CatalogCliTest, OptionsAfterSubcommandAreInput) {
    EXPECT_EQ(kExitOk, cli_->Execute({"run", "adapter", "--verbose"}));
    EXPECT_EQ("Legacy printer: --verbose\n", out_.str());
    EXPECT_FALSE(cli_->IsVerboseEnabled());
}

// ============================================================================
// Configuration
// ============================================================================

TEST_F(CatalogCliTest, ConfigFileAppliesHeaderAndPrefix) {
    std::string path = TempPath(".yaml");
    CliConfig config = CliConfig::Default();
    config.interface.colors_enabled = false;
    config.output.show_header = true;
    config.output.line_prefix = "> ";
    ASSERT_TRUE(config.SaveToFile(path));

    EXPECT_EQ(kExitOk, cli_->Execute({"--config", path, "run", "facade", "Alien"}));
    EXPECT_EQ("== facade ==\n"
              "> Lights dimmed.\n"
              "> Projector on.\n"
              "> Sound system on.\n"
              "> Playing movie: Alien\n",
              out_.str());
}

TEST_F(CatalogCliTest, MissingConfigFileIsUsageError) {
    EXPECT_EQ(kExitUsage, cli_->Execute({"--config", "/nonexistent/patcat.yaml", "list"}));
}

TEST_F(CatalogCliTest, ConfigOptionWithoutPathIsUsageError) {
    EXPECT_EQ(kExitUsage, cli_->Execute({"--config"}));
}

// ============================================================================
// Journal and History
// ============================================================================

TEST_F(CatalogCliTest, HistoryListsRunsNewestFirst) {
    cli_->Execute({"run", "adapter", "first"});
    cli_->Execute({"run", "facade", "second"});
    out_.str("");

    EXPECT_EQ(kExitOk, cli_->Execute({"history"}));

    std::string output = out_.str();
    auto facade_pos = output.find("#2 facade second");
    auto adapter_pos = output.find("#1 adapter first");
    ASSERT_NE(std::string::npos, facade_pos);
    ASSERT_NE(std::string::npos, adapter_pos);
    EXPECT_LT(facade_pos, adapter_pos);
}

TEST_F(CatalogCliTest, HistoryOmitsEmptyInput) {
    cli_->Execute({"run", "state"});
    out_.str("");

    EXPECT_EQ(kExitOk, cli_->Execute({"history"}));
    EXPECT_EQ("#1 state (4 lines)\n", out_.str());
}

TEST_F(CatalogCliTest, HistoryWithoutRuns) {
    EXPECT_EQ(kExitOk, cli_->Execute({"history"}));
    EXPECT_EQ("No runs recorded.\n", out_.str());
}

TEST_F(CatalogCliTest, HistoryRejectsNonNumericLimit) {
    EXPECT_EQ(kExitUsage, cli_->Execute({"history", "many"}));
    EXPECT_EQ(kExitUsage, cli_->Execute({"history", "3x"}));
}

TEST_F(CatalogCliTest, HistoryRejectsNegativeLimit) {
    cli_->Execute({"run", "adapter", "first"});
    out_.str("");

    EXPECT_EQ(kExitUsage, cli_->Execute({"history", "-3"}));
    EXPECT_EQ(kExitUsage, cli_->Execute({"history", "+3"}));
    EXPECT_EQ("", out_.str());
}

TEST_F(CatalogCliTest, HistoryRejectsZeroLimit) {
    cli_->Execute({"run", "adapter", "first"});
    out_.str("");

    EXPECT_EQ(kExitUsage, cli_->Execute({"history", "0"}));
    EXPECT_EQ("", out_.str());
}

TEST_F(CatalogCliTest, HistoryLimitTruncates) {
    cli_->Execute({"run", "adapter", "first"});
    cli_->Execute({"run", "adapter", "second"});
    out_.str("");

    EXPECT_EQ(kExitOk, cli_->Execute({"history", "1"}));
    EXPECT_EQ("#2 adapter second (1 lines)\n", out_.str());
}

TEST_F(CatalogCliTest, UnknownPatternIsNotJournaled) {
    cli_->Execute({"run", "flyweight"});
    EXPECT_EQ(0u, cli_->GetJournal().Count());
}

TEST_F(CatalogCliTest, JournalOptionPersistsRuns) {
    std::string path = TempPath(".db");

    EXPECT_EQ(kExitOk, cli_->Execute({"--journal", path, "run", "state"}));
    EXPECT_TRUE(std::filesystem::exists(path));

    RunJournal::Config journal_config;
    journal_config.db_path = path;
    RunJournal journal(journal_config);
    ASSERT_EQ(1u, journal.Count());
    EXPECT_EQ("state", journal.Recent(1)[0].pattern);
}

TEST_F(CatalogCliTest, UnopenableJournalStillSucceeds) {
    int rc = cli_->Execute({"--journal", "/nonexistent_dir/patcat/history.db",
                            "run", "adapter", "hi"});

    EXPECT_EQ(kExitOk, rc);
    EXPECT_EQ("Legacy printer: hi\n", out_.str());
    EXPECT_NE(std::string::npos, err_.str().find("Warning: run was not recorded"));
    EXPECT_EQ(1u, cli_->GetRunCount());
}

TEST_F(CatalogCliTest, HistoryWithUnopenableJournalFails) {
    EXPECT_EQ(kExitFailure, cli_->Execute({"--journal", "/nonexistent_dir/patcat/history.db",
                                           "history"}));
    EXPECT_NE(std::string::npos, err_.str().find("Error: "));
    EXPECT_EQ("", out_.str());
}

// ============================================================================
// Interactive Shell
// ============================================================================

TEST_F(CatalogCliTest, ShellProcessesCommandsUntilExit) {
    std::istringstream in("run state next\n\nrun observer \"hello there\"\nexit\nrun adapter never\n");
    cli_->Run(in);

    std::string output = out_.str();
    EXPECT_NE(std::string::npos, output.find("Order placed.\nOrder shipped.\n"));
    EXPECT_NE(std::string::npos, output.find("User2 received message: hello there\n"));
    EXPECT_EQ(std::string::npos, output.find("Legacy printer: never"));
    EXPECT_FALSE(cli_->IsRunning());
    EXPECT_EQ(2u, cli_->GetRunCount());
}

TEST_F(CatalogCliTest, ShellSurvivesUnopenableJournal) {
    CliConfig config = CliConfig::Default();
    config.interface.colors_enabled = false;
    config.journal.enabled = true;
    config.journal.path = "/nonexistent_dir/patcat/history.db";
    CatalogCli cli(config, out_, err_);

    std::istringstream in("run facade Alien\nhistory\nlist\nexit\n");
    EXPECT_NO_THROW(cli.Run(in));

    std::string output = out_.str();
    EXPECT_NE(std::string::npos, output.find("Playing movie: Alien\n"));
    EXPECT_NE(std::string::npos, output.find("abstract_factory"));
    EXPECT_NE(std::string::npos, err_.str().find("Warning: run was not recorded"));
    EXPECT_FALSE(cli.IsRunning());
    EXPECT_EQ(1u, cli.GetRunCount());
}

TEST_F(CatalogCliTest, ShellStopsAtEndOfInput) {
    std::istringstream in("run builder\n");
    cli_->Run(in);

    EXPECT_EQ(1u, cli_->GetRunCount());
    EXPECT_NE(std::string::npos, out_.str().find("patcat> "));
}

TEST_F(CatalogCliTest, ShellVerboseToggle) {
    EXPECT_FALSE(cli_->IsVerboseEnabled());
    cli_->ProcessCommand("verbose");
    EXPECT_TRUE(cli_->IsVerboseEnabled());
    cli_->ProcessCommand("verbose");
    EXPECT_FALSE(cli_->IsVerboseEnabled());
}

TEST_F(CatalogCliTest, ShellUnknownCommandDoesNotStop) {
    EXPECT_EQ(kExitUsage, cli_->ProcessCommand("dance"));
    EXPECT_TRUE(cli_->IsRunning());
}

TEST_F(CatalogCliTest, ShellOnlyCommandsRejectedOneShot) {
    EXPECT_EQ(kExitUsage, cli_->Execute({"verbose"}));
    EXPECT_EQ(kExitUsage, cli_->Execute({"exit"}));
}

TEST_F(CatalogCliTest, HelpCommandExecutesWithoutError) {
    EXPECT_EQ(kExitOk, cli_->ProcessCommand("help"));
    EXPECT_NE(std::string::npos, out_.str().find("Available Commands"));
}

TEST_F(CatalogCliTest, BlankLineIsIgnored) {
    EXPECT_EQ(kExitOk, cli_->ProcessCommand(""));
    EXPECT_EQ(0u, cli_->GetRunCount());
}

} // namespace
} // namespace patcat
