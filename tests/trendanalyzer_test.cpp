#include <gtest/gtest.h>

#include "analysis/trendanalyzer.h"

#include <limits>

namespace {

TEST(TrendAnalyzerTest, EmptyInputGivesEmptyTrend) {
    EXPECT_TRUE(TrendAnalyzer::computeTrend(QVector<double>()).isEmpty());
}

TEST(TrendAnalyzerTest, SinglePointIsFlat) {
    QVector<double> trend = TrendAnalyzer::computeTrend(QVector<double>{181.4});
    ASSERT_EQ(trend.size(), 1);
    EXPECT_DOUBLE_EQ(trend[0], 181.4);
}

TEST(TrendAnalyzerTest, PerfectLineIsReproducedExactly) {
    QVector<WeightPoint> points = {
        {QDate(2024, 1, 1), 70},
        {QDate(2024, 1, 2), 72},
        {QDate(2024, 1, 3), 74},
    };

    QVector<double> trend = TrendAnalyzer::computeTrend(points);
    ASSERT_EQ(trend.size(), 3);
    EXPECT_DOUBLE_EQ(trend[0], 70.0);
    EXPECT_DOUBLE_EQ(trend[1], 72.0);
    EXPECT_DOUBLE_EQ(trend[2], 74.0);
}

TEST(TrendAnalyzerTest, FitsOverIndexNotDate) {
    // Dates are far apart but the fit only sees indices 0..2
    QVector<WeightPoint> points = {
        {QDate(2024, 1, 1), 180},
        {QDate(2024, 1, 2), 178},
        {QDate(2024, 6, 1), 176},
    };

    QVector<double> trend = TrendAnalyzer::computeTrend(points);
    ASSERT_EQ(trend.size(), 3);
    EXPECT_DOUBLE_EQ(trend[0], 180.0);
    EXPECT_DOUBLE_EQ(trend[1], 178.0);
    EXPECT_DOUBLE_EQ(trend[2], 176.0);
}

TEST(TrendAnalyzerTest, NoisyDataGivesLeastSquaresLine) {
    // x = 0..3, y = 10, 12, 11, 15: slope 1.4, intercept 9.9
    QVector<double> trend = TrendAnalyzer::computeTrend(QVector<double>{10, 12, 11, 15});
    ASSERT_EQ(trend.size(), 4);
    EXPECT_NEAR(trend[0], 9.9, 1e-9);
    EXPECT_NEAR(trend[1], 11.3, 1e-9);
    EXPECT_NEAR(trend[2], 12.7, 1e-9);
    EXPECT_NEAR(trend[3], 14.1, 1e-9);
}

TEST(TrendAnalyzerTest, ExtractPointsSortsAndKeepsLastEntryPerDay) {
    WeightRecordList records = {
        {"01/03/2024", "178", "1900"},
        {"1/1/2024", "181", "2000"},
        {"2024-01-03", "177.5", "1800"},  // Same day as the first record, entered later
        {"01/02/2024", "179", "2100"},
    };

    QVector<WeightPoint> points = TrendAnalyzer::extractPoints(records);
    ASSERT_EQ(points.size(), 3);
    EXPECT_EQ(points[0].date, QDate(2024, 1, 1));
    EXPECT_EQ(points[1].date, QDate(2024, 1, 2));
    EXPECT_EQ(points[2].date, QDate(2024, 1, 3));
    EXPECT_DOUBLE_EQ(points[2].weight, 177.5);
}

TEST(TrendAnalyzerTest, ExtractPointsSkipsUnparseableRecords) {
    WeightRecordList records = {
        {"not a date", "180", "2000"},
        {"1/2/2024", "heavy", "2000"},
        {"", "180", "2000"},
        {"1/3/2024", "179", "abc"},  // Calories are not charted
    };

    QVector<WeightPoint> points = TrendAnalyzer::extractPoints(records);
    ASSERT_EQ(points.size(), 1);
    EXPECT_EQ(points[0].date, QDate(2024, 1, 3));
}

TEST(TrendAnalyzerTest, TwoDigitYearsLandInThisCentury) {
    QDate date;
    ASSERT_TRUE(TrendAnalyzer::parseDate("3/5/24", date));
    EXPECT_EQ(date, QDate(2024, 3, 5));

    ASSERT_TRUE(TrendAnalyzer::parseDate("12/31/99", date));
    EXPECT_EQ(date, QDate(1999, 12, 31));
}

TEST(TrendAnalyzerTest, ParseWeightTrimsWhitespace) {
    double value = 0;
    ASSERT_TRUE(TrendAnalyzer::parseWeight(" 180.5 ", value));
    EXPECT_DOUBLE_EQ(value, 180.5);
    EXPECT_FALSE(TrendAnalyzer::parseWeight("  ", value));
}

TEST(TrendAnalyzerTest, PlottableRequiresMatchingLengthAndFiniteValues) {
    EXPECT_TRUE(TrendAnalyzer::isPlottable({1.0, 2.0}, 2));
    EXPECT_FALSE(TrendAnalyzer::isPlottable({1.0}, 2));
    EXPECT_FALSE(TrendAnalyzer::isPlottable({1.0, std::numeric_limits<double>::quiet_NaN()}, 2));
    EXPECT_FALSE(TrendAnalyzer::isPlottable({1.0, std::numeric_limits<double>::infinity()}, 2));
}

}  // namespace
