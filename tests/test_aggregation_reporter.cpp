#include <gtest/gtest.h>
#include "AggregationReporter.hpp"
#include "DateUtils.hpp"

using namespace settlement;

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Functions
// ═══════════════════════════════════════════════════════════════════════════════

MatchResult makeMatch(const std::string& id, const std::string& entity, const std::string& fund,
                      RuleCode code, double quantity, double loss, TimePoint purchaseDate) {
    MatchResult match;
    match.matchId = id;
    match.purchaseId = id + "_p";
    match.saleId = id + "_s";
    match.entity = entity;
    match.fundName = fund;
    match.ruleCode = code;
    match.quantity = quantity;
    match.recognizedLoss = loss;
    match.purchaseDate = purchaseDate;
    return match;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class AggregationReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        matches = {
            makeMatch("m1", "Entity A", "Fund 1", RuleCode::B, 100, 897.0, makeDate(2015, 3, 1)),
            makeMatch("m2", "Entity A", "Fund 2", RuleCode::C, 50, 250.5, makeDate(2015, 3, 20)),
            makeMatch("m3", "Entity B", "Fund 1", RuleCode::B, 10, 12.20, makeDate(2015, 5, 4)),
        };
        auto held = makeMatch("h1", "Entity B", "Fund 3", RuleCode::D, 40, 77.6, makeDate(2015, 5, 10));
        held.saleId.reset();
        matches.push_back(held);
    }

    AggregationReporter reporter;
    std::vector<MatchResult> matches;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Итоги
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(AggregationReporterTest, TotalsAcrossAllMatches) {
    auto summary = reporter.summarize(matches);

    EXPECT_DOUBLE_EQ(summary.totalRecognizedLoss, 1237.3);
    EXPECT_DOUBLE_EQ(summary.totalQuantity, 200.0);
    EXPECT_EQ(summary.matchCount, 4u);
    EXPECT_NEAR(summary.averageLossPerShare, 6.1865, 1e-9);
}

TEST_F(AggregationReporterTest, EmptyInputGivesZeroSummary) {
    auto summary = reporter.summarize({});

    EXPECT_DOUBLE_EQ(summary.totalRecognizedLoss, 0.0);
    EXPECT_EQ(summary.matchCount, 0u);
    EXPECT_DOUBLE_EQ(summary.averageLossPerShare, 0.0);
    EXPECT_TRUE(summary.byEntity.empty());
    EXPECT_TRUE(summary.byRule.empty());
}

TEST_F(AggregationReporterTest, RoundsAfterSummation) {
    std::vector<MatchResult> thirds;
    for (int i = 0; i < 3; ++i) {
        thirds.push_back(makeMatch("t" + std::to_string(i), "E", "F", RuleCode::B,
                                   1, 0.333, makeDate(2015, 3, 1)));
    }

    auto summary = reporter.summarize(thirds);

    // 0.999 -> 1.00, а не 3 * 0.33
    EXPECT_DOUBLE_EQ(summary.totalRecognizedLoss, 1.0);
    EXPECT_DOUBLE_EQ(summary.byEntity.at("E").totalRecognizedLoss, 1.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Группировки
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(AggregationReporterTest, GroupsByEntity) {
    auto summary = reporter.summarize(matches);

    ASSERT_EQ(summary.byEntity.size(), 2u);

    const auto& entityA = summary.byEntity.at("Entity A");
    EXPECT_DOUBLE_EQ(entityA.totalRecognizedLoss, 1147.5);
    EXPECT_DOUBLE_EQ(entityA.totalQuantity, 150.0);
    EXPECT_EQ(entityA.matchCount, 2u);
    EXPECT_EQ(entityA.funds, (std::set<std::string>{"Fund 1", "Fund 2"}));
    EXPECT_DOUBLE_EQ(entityA.lossByRule.at("B"), 897.0);
    EXPECT_DOUBLE_EQ(entityA.lossByRule.at("C"), 250.5);

    const auto& entityB = summary.byEntity.at("Entity B");
    EXPECT_DOUBLE_EQ(entityB.totalRecognizedLoss, 89.8);
    EXPECT_EQ(entityB.funds.size(), 2u);
}

TEST_F(AggregationReporterTest, GroupsByFund) {
    auto summary = reporter.summarize(matches);

    ASSERT_EQ(summary.byFund.size(), 3u);

    const auto& fund1 = summary.byFund.at("Fund 1");
    EXPECT_DOUBLE_EQ(fund1.totalRecognizedLoss, 909.2);
    EXPECT_EQ(fund1.entities, (std::set<std::string>{"Entity A", "Entity B"}));
    EXPECT_EQ(fund1.matchCount, 2u);
}

TEST_F(AggregationReporterTest, GroupsByRule) {
    auto summary = reporter.summarize(matches);

    ASSERT_EQ(summary.byRule.size(), 3u);
    EXPECT_DOUBLE_EQ(summary.byRule.at("B").totalRecognizedLoss, 909.2);
    EXPECT_EQ(summary.byRule.at("B").matchCount, 2u);
    EXPECT_DOUBLE_EQ(summary.byRule.at("C").totalQuantity, 50.0);
    EXPECT_DOUBLE_EQ(summary.byRule.at("D").totalRecognizedLoss, 77.6);
}

TEST_F(AggregationReporterTest, GroupsByPurchaseMonth) {
    auto summary = reporter.summarize(matches);

    ASSERT_EQ(summary.byMonth.size(), 2u);
    EXPECT_DOUBLE_EQ(summary.byMonth.at("2015-03").totalRecognizedLoss, 1147.5);
    EXPECT_EQ(summary.byMonth.at("2015-05").matchCount, 2u);
}

TEST_F(AggregationReporterTest, GroupKeysAreExactStrings) {
    matches.push_back(makeMatch("m5", "entity a", "Fund 1", RuleCode::B, 1, 1.0,
                                makeDate(2015, 3, 1)));

    auto summary = reporter.summarize(matches);

    EXPECT_EQ(summary.byEntity.size(), 3u);
    EXPECT_TRUE(summary.byEntity.contains("entity a"));
}
