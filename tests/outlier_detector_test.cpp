// outlier_detector_test.cpp: IQR / z-score flagging, identifier exclusion, drop action.

#include <gtest/gtest.h>

#include "CleaningStages.h"
#include "test_helpers.hpp"

#include <limits>
#include <vector>

using namespace test_helpers;

namespace {

std::vector<std::optional<double>> tens_with(double outlier, size_t count = 20) {
    std::vector<std::optional<double>> values(count, 10.0);
    values.push_back(outlier);
    return values;
}

}  // namespace

class OutlierDetectorTest : public ::testing::Test {
protected:
    CleaningConfig config_ = [] {
        CleaningConfig c;
        c.detectOutliers = true;
        return c;
    }();
    CleaningReport report_;
};

// ===========================================================================
// Identifier detection
// ===========================================================================
TEST_F(OutlierDetectorTest, IdentifierNames) {
    EXPECT_TRUE(CleaningStages::isIdentifierColumn("id"));
    EXPECT_TRUE(CleaningStages::isIdentifierColumn("ID"));
    EXPECT_TRUE(CleaningStages::isIdentifierColumn("user_id"));
    EXPECT_TRUE(CleaningStages::isIdentifierColumn("id_number"));
    EXPECT_TRUE(CleaningStages::isIdentifierColumn("Customer_ID"));
    EXPECT_FALSE(CleaningStages::isIdentifierColumn("idea"));
    EXPECT_FALSE(CleaningStages::isIdentifierColumn("paid"));
    EXPECT_FALSE(CleaningStages::isIdentifierColumn("width"));
}

// ===========================================================================
// z-score
// ===========================================================================
TEST_F(OutlierDetectorTest, ZScoreDropRemovesSingleOutlier) {
    config_.outlierMethod = "zscore";
    config_.outlierAction = "drop";
    DataTable table = make_table({makeNumericColumn("v", tens_with(1000.0))});

    CleaningStages::detectOutliers(table, config_, report_);

    EXPECT_EQ(report_.outliers.at("v").count, 1u);
    EXPECT_DOUBLE_EQ(report_.outliers.at("v").percent, 1.0 / 21.0);
    EXPECT_EQ(report_.outliersRemoved, 1u);
    EXPECT_EQ(table.rowCount(), 20u);
}

TEST_F(OutlierDetectorTest, ZScoreConstantColumnFlagsNothing) {
    config_.outlierMethod = "zscore";
    DataTable table = make_table({makeNumericColumn("v", {5.0, 5.0, 5.0})});

    CleaningStages::detectOutliers(table, config_, report_);

    EXPECT_EQ(report_.outliers.at("v").count, 0u);
}

// ===========================================================================
// IQR
// ===========================================================================
TEST_F(OutlierDetectorTest, IqrUsesInterpolatedQuartiles) {
    // Q1 = 2, Q3 = 4, IQR = 2, bounds [-1, 7]
    DataTable table = make_table({makeNumericColumn("v", {1.0, 2.0, 2.0, 3.0, 3.0, 4.0, 4.0, 5.0, 7.0})});

    CleaningStages::detectOutliers(table, config_, report_);

    EXPECT_EQ(report_.outliers.at("v").count, 0u) << "7.0 sits on the fence";
}

TEST_F(OutlierDetectorTest, IqrReportOnlyKeepsRows) {
    DataTable table = make_table({makeNumericColumn("v", {1.0, 2.0, 3.0, 4.0, 100.0})});

    CleaningStages::detectOutliers(table, config_, report_);

    EXPECT_EQ(report_.outliers.at("v").count, 1u);
    EXPECT_DOUBLE_EQ(report_.outliers.at("v").percent, 0.2);
    EXPECT_EQ(report_.outliersRemoved, 0u);
    EXPECT_EQ(table.rowCount(), 5u);
}

TEST_F(OutlierDetectorTest, CustomThreshold) {
    config_.outlierThreshold = 100.0;
    DataTable table = make_table({makeNumericColumn("v", {1.0, 2.0, 3.0, 4.0, 100.0})});

    CleaningStages::detectOutliers(table, config_, report_);

    EXPECT_EQ(report_.outliers.at("v").count, 0u);
}

TEST_F(OutlierDetectorTest, MissingAndNonFiniteNeverFlagged) {
    DataTable table = make_table({makeNumericColumn("v", {
        1.0, 2.0, std::nullopt, 3.0, std::numeric_limits<double>::infinity(), 4.0})});

    CleaningStages::detectOutliers(table, config_, report_);

    EXPECT_EQ(report_.outliers.at("v").count, 0u);
}

// ===========================================================================
// Eligibility and drop union
// ===========================================================================
TEST_F(OutlierDetectorTest, IdentifierColumnsAreExcluded) {
    config_.outlierMethod = "zscore";
    config_.outlierAction = "drop";
    DataTable table = make_table({
        makeNumericColumn("id", {1.0, 2.0, 3.0}),
        makeNumericColumn("value", {10.0, 12.0, 11.0}),
        makeNumericColumn("user_id", {1000000.0, 2.0, 3.0}),
    });

    CleaningStages::detectOutliers(table, config_, report_);

    EXPECT_EQ(report_.outliers.count("id"), 0u);
    EXPECT_EQ(report_.outliers.count("user_id"), 0u);
    EXPECT_EQ(report_.outliers.count("value"), 1u);
    EXPECT_EQ(table.rowCount(), 3u);
}

TEST_F(OutlierDetectorTest, DropUnionsAcrossColumns) {
    config_.outlierAction = "drop";
    DataTable table = make_table({
        makeNumericColumn("a", {1.0, 2.0, 3.0, 4.0, 100.0, 2.5}),
        makeNumericColumn("b", {-100.0, 2.0, 3.0, 4.0, 3.0, 2.5}),
        makeTextColumn("label", {std::string("p"), std::string("q"), std::string("r"),
                                 std::string("s"), std::string("t"), std::string("u")}),
    });

    CleaningStages::detectOutliers(table, config_, report_);

    EXPECT_EQ(report_.outliers.at("a").count, 1u);
    EXPECT_EQ(report_.outliers.at("b").count, 1u);
    EXPECT_EQ(report_.outliers.count("label"), 0u);
    EXPECT_EQ(report_.outliersRemoved, 2u);
    EXPECT_EQ(table.rowCount(), 4u);
    EXPECT_EQ(table.cellText(2, 0).value(), "q");
}

TEST_F(OutlierDetectorTest, EmptyTableReportsZeroPercent) {
    DataTable table = make_table({makeNumericColumn("v", {})});

    CleaningStages::detectOutliers(table, config_, report_);

    EXPECT_EQ(report_.outliers.at("v").count, 0u);
    EXPECT_DOUBLE_EQ(report_.outliers.at("v").percent, 0.0);
}

TEST_F(OutlierDetectorTest, DisabledWritesZeroValuedKeys) {
    DataTable table = make_table({makeNumericColumn("v", {1.0, 2.0, 3.0, 4.0, 100.0})});

    CleaningStages::detectOutliers(table, CleaningConfig{}, report_);

    EXPECT_TRUE(report_.outliers.empty());
    EXPECT_EQ(report_.outliersRemoved, 0u);
}
