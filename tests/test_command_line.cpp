#include <gtest/gtest.h>
#include "CommandExecutor.hpp"
#include "CommandLineParser.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <memory>

using namespace settlement;

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Functions
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<ParsedCommand, std::string> parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "settlement");

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    CommandLineParser parser;
    return parser.parse(static_cast<int>(argv.size()), argv.data());
}

class MockFileReader : public IFileReader {
public:
    void setLines(const std::vector<std::string>& lines) {
        lines_ = lines;
    }

    std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view /*filePath*/) override {

        if (lines_.empty()) {
            return std::unexpected("File is empty");
        }
        return lines_;
    }

private:
    std::vector<std::string> lines_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Command Line Parser
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CommandLineParserTest, NoCommand) {
    auto result = parseArgs({});

    EXPECT_FALSE(result.has_value());
}

TEST(CommandLineParserTest, UnknownCommand) {
    auto result = parseArgs({"frobnicate"});

    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Unknown command"), std::string::npos);
}

TEST(CommandLineParserTest, CalculateOptions) {
    auto result = parseArgs({"calculate", "-s", "TWITTER", "-f", "trades.csv",
                             "--format", "json", "--detailed"});

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->command, "calculate");
    EXPECT_EQ(result->options.at("settlement").as<std::string>(), "TWITTER");
    EXPECT_EQ(result->options.at("file").as<std::string>(), "trades.csv");
    EXPECT_EQ(result->options.at("format").as<std::string>(), "json");
    EXPECT_TRUE(result->options.at("detailed").as<bool>());
}

TEST(CommandLineParserTest, CalculateRequiresFile) {
    auto result = parseArgs({"calculate", "-s", "TWITTER"});

    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Command line parsing error"), std::string::npos);
}

TEST(CommandLineParserTest, CommandHelpRedirectsToHelp) {
    auto result = parseArgs({"single", "--help"});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->command, "help");
    ASSERT_EQ(result->positional.size(), 1u);
    EXPECT_EQ(result->positional[0], "single");
}

TEST(CommandLineParserTest, SettlementSubcommand) {
    auto result = parseArgs({"settlement", "show", "-s", "KRAFT_HEINZ"});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->subcommand, "show");
    EXPECT_EQ(result->options.at("settlement").as<std::string>(), "KRAFT_HEINZ");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class CommandExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockReader = std::make_shared<MockFileReader>();
        executor = std::make_unique<CommandExecutor>(mockReader);
        outputPath = std::filesystem::temp_directory_path() / "settlement_report_test.json";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(outputPath, ec);
    }

    std::expected<void, std::string> run(const std::vector<std::string>& args) {
        auto cmd = parseArgs(args);
        if (!cmd) {
            return std::unexpected(cmd.error());
        }
        return executor->execute(*cmd);
    }

    std::shared_ptr<MockFileReader> mockReader;
    std::unique_ptr<CommandExecutor> executor;
    std::filesystem::path outputPath;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Help & Version
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CommandExecutorTest, ExecuteHelpCommand) {
    EXPECT_TRUE(run({"help"}));
    EXPECT_TRUE(run({"help", "calculate"}));
}

TEST_F(CommandExecutorTest, ExecuteVersionCommand) {
    EXPECT_TRUE(run({"version"}));
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: calculate
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CommandExecutorTest, CalculateWritesJsonReport) {
    mockReader->setLines({
        "id,date,type,quantity,price,entity",
        "P1,2015-03-01,purchase,100,60,Alpha",
        "S1,2015-04-28 15:10,sale,100,45,Alpha",
    });

    auto result = run({"calculate", "-s", "TWITTER", "-f", "trades.csv",
                       "--format", "json", "--detailed", "-o", outputPath.string()});
    ASSERT_TRUE(result) << result.error();

    std::ifstream file(outputPath);
    auto report = nlohmann::json::parse(file);

    EXPECT_DOUBLE_EQ(report["summary"]["total_recognized_loss"].get<double>(), 897.0);
    EXPECT_EQ(report["transactions_loaded"].get<std::size_t>(), 2u);
    EXPECT_EQ(report["matches"].size(), 1u);
}

TEST_F(CommandExecutorTest, CalculateJsonOnStdoutIsParseable) {
    mockReader->setLines({
        "id,date,type,quantity,price,entity",
        "P1,2015-03-01,purchase,100,60,Alpha",
        "P2,2015-06-10,purchase,10,20,Alpha",
        "S1,2015-04-28 15:10,sale,150,45,Alpha",
        "bad,not-a-date,purchase,1,1,Alpha",
    });

    testing::internal::CaptureStdout();
    auto result = run({"calculate", "-s", "TWITTER", "-f", "trades.csv", "--format", "json"});
    std::string output = testing::internal::GetCapturedStdout();

    ASSERT_TRUE(result) << result.error();

    // Предупреждения загрузчика и сопоставления не попадают в stdout
    auto report = nlohmann::json::parse(output);
    EXPECT_DOUBLE_EQ(report["summary"]["total_recognized_loss"].get<double>(), 897.0);
    EXPECT_EQ(report["load_errors"].size(), 1u);
    EXPECT_EQ(report["anomalies"].size(), 1u);
}

TEST_F(CommandExecutorTest, CalculateCsvOnStdoutStartsWithHeader) {
    mockReader->setLines({
        "id,date,type,quantity,price,entity",
        "P1,2015-03-01,purchase,100,60,Alpha",
        "S1,2015-04-28 15:10,sale,100,45,Alpha",
    });

    testing::internal::CaptureStdout();
    auto result = run({"calculate", "-s", "TWITTER", "-f", "trades.csv", "--format", "csv"});
    std::string output = testing::internal::GetCapturedStdout();

    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(output.rfind("match_id,purchase_id,sale_id,", 0), 0u);
    EXPECT_NE(output.find("\nP1_S1_0,P1,S1,100,897.00,"), std::string::npos);
}

TEST_F(CommandExecutorTest, CalculateRejectsUnknownFormat) {
    mockReader->setLines({"date,type,quantity,price", "2015-03-01,purchase,1,60"});

    auto result = run({"calculate", "-s", "TWITTER", "-f", "trades.csv", "--format", "xml"});

    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("Unsupported format"), std::string::npos);
}

TEST_F(CommandExecutorTest, CalculateRejectsUnknownSettlement) {
    mockReader->setLines({"date,type,quantity,price", "2015-03-01,purchase,1,60"});

    auto result = run({"calculate", "-s", "ACME", "-f", "trades.csv"});

    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("Unknown settlement type"), std::string::npos);
}

TEST_F(CommandExecutorTest, CalculateReportsUnreadableFile) {
    auto result = run({"calculate", "-s", "TWITTER", "-f", "trades.csv"});

    EXPECT_FALSE(result);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: single
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CommandExecutorTest, SingleWithSale) {
    auto result = run({"single", "-s", "KRAFT_HEINZ",
                       "--purchase-date", "2016-01-15", "--purchase-price", "50",
                       "--sale-date", "2019-03-15", "--sale-price", "45",
                       "--quantity", "100", "--format", "json"});

    EXPECT_TRUE(result) << result.error();
}

TEST_F(CommandExecutorTest, SingleBeginningHoldingsNeedsNoPurchase) {
    auto result = run({"single", "-s", "TWITTER", "--beginning-holdings"});

    EXPECT_TRUE(result) << result.error();
}

TEST_F(CommandExecutorTest, SingleRequiresPurchaseDate) {
    auto result = run({"single", "-s", "TWITTER", "--purchase-price", "50"});

    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("purchase-date"), std::string::npos);
}

TEST_F(CommandExecutorTest, SingleRequiresBothSaleFields) {
    auto result = run({"single", "-s", "TWITTER",
                       "--purchase-date", "2015-03-01", "--purchase-price", "60",
                       "--sale-date", "2015-06-01"});

    EXPECT_FALSE(result);
}

TEST_F(CommandExecutorTest, SingleRejectsInvalidDate) {
    auto result = run({"single", "-s", "TWITTER",
                       "--purchase-date", "2015-13-45", "--purchase-price", "60"});

    EXPECT_FALSE(result);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: settlement
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CommandExecutorTest, SettlementShowAndList) {
    EXPECT_TRUE(run({"settlement", "show", "-s", "TWITTER"}));
    EXPECT_TRUE(run({"settlement", "list"}));
}

TEST_F(CommandExecutorTest, SettlementShowRequiresType) {
    EXPECT_FALSE(run({"settlement", "show"}));
    EXPECT_FALSE(run({"settlement", "show", "-s", "ACME"}));
}

TEST_F(CommandExecutorTest, UnknownSettlementSubcommand) {
    EXPECT_FALSE(run({"settlement", "purge"}));
}
