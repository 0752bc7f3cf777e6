#include <gtest/gtest.h>
#include "TransactionCsvSource.hpp"
#include "DateUtils.hpp"
#include <memory>
#include <vector>

using namespace settlement;

// ═══════════════════════════════════════════════════════════════════════════════
// Mock File Reader для тестирования
// ═══════════════════════════════════════════════════════════════════════════════

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
// Test Fixture
// ═══════════════════════════════════════════════════════════════════════════════

class TransactionCsvSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockReader_ = std::make_shared<MockFileReader>();

        auto configResult = SettlementConfiguration::create(SettlementType::Twitter);
        ASSERT_TRUE(configResult.has_value());
        config_ = *configResult;
    }

    LoadReport load(const std::vector<std::string>& lines) {
        mockReader_->setLines(lines);
        TransactionCsvSource source(mockReader_);
        auto result = source.load("trades.csv", *config_);
        EXPECT_TRUE(result.has_value()) << result.error();
        return result.value_or(LoadReport{});
    }

    std::shared_ptr<MockFileReader> mockReader_;
    ConfigurationPtr config_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Разбор строк
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TransactionCsvSourceTest, LoadsPurchasesAndSales) {
    auto report = load({
        "id,date,type,quantity,price,entity,fund_name,security_id,comment",
        "P1,2015-03-01,Purchase,100,60.00,Entity A,Fund 1,TWTR,first buy",
        "S1,2015-04-28 15:10,Sale,100,45.00,Entity A,Fund 1,TWTR,",
    });

    ASSERT_EQ(report.transactions.size(), 2u);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(report.totalRows, 2u);

    const auto& purchase = report.transactions[0];
    EXPECT_EQ(purchase.id, "P1");
    EXPECT_EQ(purchase.type, TransactionType::Purchase);
    EXPECT_EQ(purchase.date, makeDate(2015, 3, 1));
    EXPECT_DOUBLE_EQ(purchase.quantity, 100.0);
    EXPECT_DOUBLE_EQ(purchase.price, 60.0);
    EXPECT_EQ(purchase.entity, "Entity A");
    EXPECT_EQ(purchase.fundName, "Fund 1");
    EXPECT_EQ(purchase.securityId, "TWTR");
    EXPECT_EQ(purchase.comment, "first buy");

    const auto& sale = report.transactions[1];
    EXPECT_EQ(sale.type, TransactionType::Sale);
    EXPECT_EQ(sale.date, makeDate(2015, 4, 28, 15, 10));
}

TEST_F(TransactionCsvSourceTest, ResolvesHeaderAliases) {
    auto report = load({
        "Trade Date,Transaction Type,Shares,Price Per Share,Client,Fund,Ticker,Notes",
        "03/01/2015,BUY,25,61.5,Alpha,Growth,TWTR,via broker",
    });

    ASSERT_EQ(report.transactions.size(), 1u);
    const auto& txn = report.transactions[0];
    EXPECT_EQ(txn.type, TransactionType::Purchase);
    EXPECT_EQ(txn.date, makeDate(2015, 3, 1));
    EXPECT_DOUBLE_EQ(txn.quantity, 25.0);
    EXPECT_DOUBLE_EQ(txn.price, 61.5);
    EXPECT_EQ(txn.entity, "Alpha");
    EXPECT_EQ(txn.fundName, "Growth");
    EXPECT_EQ(txn.securityId, "TWTR");
    EXPECT_EQ(txn.comment, "via broker");
}

TEST_F(TransactionCsvSourceTest, BeginningHoldingsDefaultDateAndZeroPrice) {
    auto report = load({
        "type,quantity,price,entity",
        "Beginning Holdings,500,42.00,Alpha",
    });

    ASSERT_EQ(report.transactions.size(), 1u);
    const auto& txn = report.transactions[0];
    EXPECT_EQ(txn.type, TransactionType::BeginningHoldings);
    EXPECT_EQ(txn.date, makeDate(2015, 2, 5));
    EXPECT_DOUBLE_EQ(txn.price, 0.0);
    EXPECT_DOUBLE_EQ(txn.quantity, 500.0);
}

TEST_F(TransactionCsvSourceTest, InfersTypeFromQuantityColumns) {
    auto report = load({
        "date,purchases,sales,holdings,price",
        "2015-03-01,100,,,60",
        "2015-06-01,,40,,35",
        ",,,30,",
        "2015-06-02,,,,35",
    });

    ASSERT_EQ(report.transactions.size(), 3u);
    EXPECT_EQ(report.transactions[0].type, TransactionType::Purchase);
    EXPECT_EQ(report.transactions[1].type, TransactionType::Sale);
    EXPECT_DOUBLE_EQ(report.transactions[1].quantity, 40.0);
    EXPECT_EQ(report.transactions[2].type, TransactionType::BeginningHoldings);
    EXPECT_EQ(report.skippedRows, 1u);
}

TEST_F(TransactionCsvSourceTest, NonPositiveQuantitySkipped) {
    auto report = load({
        "date,type,quantity,price",
        "2015-03-01,purchase,0,60",
        "2015-03-02,purchase,-5,60",
        "2015-03-03,purchase,10,60",
    });

    EXPECT_EQ(report.transactions.size(), 1u);
    EXPECT_EQ(report.skippedRows, 2u);
    EXPECT_TRUE(report.errors.empty());
}

TEST_F(TransactionCsvSourceTest, BadRowsReportedWithoutAbortingBatch) {
    auto report = load({
        "date,type,quantity,price",
        "2015-03-01,purchase,10,60",
        "not-a-date,purchase,10,60",
        "2015-03-03,sale,abc,60",
        "2015-03-04,purchase,10,",
        "2015-03-05,sale,10,35",
    });

    EXPECT_EQ(report.transactions.size(), 2u);
    ASSERT_EQ(report.errors.size(), 3u);
    EXPECT_EQ(report.errors[0].rfind("Row 2:", 0), 0u);
    EXPECT_EQ(report.errors[1].rfind("Row 3:", 0), 0u);
    EXPECT_NE(report.errors[2].find("Missing price"), std::string::npos);
}

TEST_F(TransactionCsvSourceTest, NonFiniteNumbersRejected) {
    auto report = load({
        "date,type,quantity,price",
        "2015-03-01,purchase,nan,60",
        "2015-03-02,purchase,10,inf",
        "2015-03-03,purchase,Infinity,60",
        "2015-03-04,sale,10,-inf",
        "2015-03-05,purchase,10,58",
    });

    ASSERT_EQ(report.transactions.size(), 1u);
    EXPECT_DOUBLE_EQ(report.transactions[0].quantity, 10.0);
    EXPECT_DOUBLE_EQ(report.transactions[0].price, 58.0);

    ASSERT_EQ(report.errors.size(), 4u);
    EXPECT_EQ(report.errors[0].rfind("Row 1:", 0), 0u);
    EXPECT_EQ(report.errors[1].rfind("Row 2:", 0), 0u);
    for (const auto& error : report.errors) {
        EXPECT_NE(error.find("Non-finite"), std::string::npos) << error;
    }
}

TEST_F(TransactionCsvSourceTest, QuotedFieldKeepsDelimiter) {
    auto report = load({
        "date,type,quantity,price,fund_name,entity",
        "2015-03-01,purchase,10,60,\"Acme Capital, LLC\",Alpha",
        "2015-03-02,purchase,5,58,\"The \"\"Core\"\" Fund\",Beta",
    });

    ASSERT_EQ(report.transactions.size(), 2u);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(report.transactions[0].fundName, "Acme Capital, LLC");
    EXPECT_EQ(report.transactions[0].entity, "Alpha");
    EXPECT_EQ(report.transactions[1].fundName, "The \"Core\" Fund");
    EXPECT_EQ(report.transactions[1].entity, "Beta");
}

TEST_F(TransactionCsvSourceTest, GeneratesIdsAndDefaultsEntity) {
    auto report = load({
        "date,type,quantity,price",
        "2015-03-01,purchase,10,60",
        "2015-03-02,purchase,5,58",
    });

    ASSERT_EQ(report.transactions.size(), 2u);
    EXPECT_EQ(report.transactions[0].id, "txn_1_0");
    EXPECT_EQ(report.transactions[1].id, "txn_2_1");
    EXPECT_EQ(report.transactions[0].entity, "Unknown");
    EXPECT_EQ(report.transactions[0].fundName, "Unknown");
}

TEST_F(TransactionCsvSourceTest, FundNameFallsBackToEntity) {
    auto report = load({
        "date,type,quantity,price,entity",
        "2015-03-01,purchase,10,60,Alpha",
    });

    ASSERT_EQ(report.transactions.size(), 1u);
    EXPECT_EQ(report.transactions[0].fundName, "Alpha");
}

TEST_F(TransactionCsvSourceTest, CustomDelimiter) {
    mockReader_->setLines({
        "date;type;quantity;price",
        "2015-03-01;purchase;10;60",
    });

    TransactionCsvSource source(mockReader_, ';');
    auto result = source.load("trades.csv", *config_);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->transactions.size(), 1u);
}

TEST_F(TransactionCsvSourceTest, ReaderFailurePropagated) {
    TransactionCsvSource source(mockReader_);
    auto result = source.load("missing.csv", *config_);

    EXPECT_FALSE(result.has_value());
}
