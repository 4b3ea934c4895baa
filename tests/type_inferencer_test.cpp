// type_inferencer_test.cpp: numeric/datetime inference and the always-on finalizer.

#include <gtest/gtest.h>

#include "CleaningStages.h"
#include "test_helpers.hpp"

#include <string>
#include <vector>

using namespace test_helpers;

namespace {

std::vector<OptionalCell> texts(const std::vector<const char*>& values) {
    std::vector<OptionalCell> cells;
    for (const char* v : values) cells.push_back(v == nullptr ? na() : text(v));
    return cells;
}

}  // namespace

class TypeInferencerTest : public ::testing::Test {
protected:
    CleaningConfig config_ = [] {
        CleaningConfig c;
        c.inferTypes = true;
        return c;
    }();
    CleaningReport report_;
};

// ===========================================================================
// Numeric attempt
// ===========================================================================
TEST_F(TypeInferencerTest, CommitsNumericText) {
    DataTable table = make_table({mixed("age", texts({"30", "40", "50"}))});

    CleaningStages::inferTypes(table, config_, report_);

    ASSERT_EQ(table.column("age").type, ColumnType::NUMERIC);
    EXPECT_EQ(numeric_values(table, "age"), (std::vector<double>{30.0, 40.0, 50.0}));
    ASSERT_EQ(report_.dtypeChanges.count("age"), 1u);
    EXPECT_EQ(report_.dtypeChanges.at("age").from, "mixed");
    EXPECT_EQ(report_.dtypeChanges.at("age").to, "numeric");
}

TEST_F(TypeInferencerTest, NinetyPercentIsEnoughAndBadCellsBecomeMissing) {
    DataTable table = make_table({makeTextColumn("x", {
        std::string("1"), std::string("2"), std::string("3"), std::string("4"), std::string("5"),
        std::string("6"), std::string("7"), std::string("8"), std::string("9"), std::string("oops")})});

    CleaningStages::inferTypes(table, config_, report_);

    ASSERT_EQ(table.column("x").type, ColumnType::NUMERIC);
    EXPECT_EQ(table.column("x").missing[9], 1);
    EXPECT_EQ(report_.dtypeChanges.at("x").from, "text");
}

TEST_F(TypeInferencerTest, MissingCellsCountAgainstNumericRatio) {
    DataTable table = make_table({mixed("x", texts({"1", "2", "3", "4", "5", "6", "7", "8", nullptr, nullptr}))});

    CleaningStages::inferTypes(table, config_, report_);

    EXPECT_EQ(table.column("x").type, ColumnType::MIXED);
    EXPECT_EQ(report_.dtypeChanges.count("x"), 0u);
}

TEST_F(TypeInferencerTest, ThousandsSeparatorsStayText) {
    DataTable table = make_table({makeTextColumn("amount", {std::string("1,234"), std::string("2,500")})});

    CleaningStages::inferTypes(table, config_, report_);

    EXPECT_EQ(table.column("amount").type, ColumnType::TEXT);
    EXPECT_TRUE(report_.dtypeChanges.empty());
}

TEST_F(TypeInferencerTest, NumericColumnIsRecordedAsNumeric) {
    DataTable table = make_table({makeNumericColumn("n", {1.0, 2.0})});

    CleaningStages::inferTypes(table, config_, report_);

    EXPECT_EQ(report_.dtypeChanges.at("n").from, "numeric");
    EXPECT_EQ(report_.dtypeChanges.at("n").to, "numeric");
}

TEST_F(TypeInferencerTest, SkipsDatetimeAndEmptyColumns) {
    DataTable table = make_table({
        makeDatetimeColumn("d", {0, 1}),
        mixed("empty", {na(), na()}),
    });

    CleaningStages::inferTypes(table, config_, report_);

    EXPECT_EQ(table.column("d").type, ColumnType::DATETIME);
    EXPECT_EQ(table.column("empty").type, ColumnType::MIXED);
    EXPECT_TRUE(report_.dtypeChanges.empty());
}

// ===========================================================================
// Datetime attempt
// ===========================================================================
TEST_F(TypeInferencerTest, DetectsDatesAtDefaultThreshold) {
    DataTable table = make_table({mixed("when", texts({"2020-01-01", "2020/02/02", "not a date", ""}))});

    CleaningStages::inferTypes(table, config_, report_);

    const auto& col = table.column("when");
    ASSERT_EQ(col.type, ColumnType::DATETIME);
    EXPECT_EQ(col.missing, (MissingMask{0, 0, 1, 1}));
    EXPECT_EQ(report_.dtypeChanges.at("when").to, "datetime");
}

TEST_F(TypeInferencerTest, HigherThresholdRejectsPartialDates) {
    config_.dateDetectThresh = 0.8;
    DataTable table = make_table({mixed("when", texts({"2020-01-01", "2020/02/02", "not a date", ""}))});

    CleaningStages::inferTypes(table, config_, report_);

    EXPECT_EQ(table.column("when").type, ColumnType::MIXED);
}

TEST_F(TypeInferencerTest, DateLikeGateSkipsPlainWords) {
    DataTable table = make_table({mixed("w", texts({"ab", "cd", "ef", "2020-01-01"}))});

    CleaningStages::inferTypes(table, config_, report_);

    EXPECT_EQ(table.column("w").type, ColumnType::MIXED);
}

TEST_F(TypeInferencerTest, LocaleHintResolvesSlashDates) {
    config_.dateLocaleHint = "dmy";
    DataTable table = make_table({mixed("d", texts({"01/02/2020", "03/04/2020"}))});

    CleaningStages::inferTypes(table, config_, report_);

    ASSERT_EQ(table.column("d").type, ColumnType::DATETIME);
    EXPECT_EQ(table.cellText(0, 0).value(), "2020-02-01 00:00:00");
}

TEST_F(TypeInferencerTest, DisabledDoesNothing) {
    DataTable table = make_table({mixed("age", texts({"30", "40"}))});
    CleaningStages::inferTypes(table, CleaningConfig{}, report_);
    EXPECT_EQ(table.column("age").type, ColumnType::MIXED);
    EXPECT_TRUE(report_.dtypeChanges.empty());
}

// ===========================================================================
// Finalizer
// ===========================================================================
class TypeFinalizerTest : public ::testing::Test {
protected:
    CleaningReport report_;
};

TEST_F(TypeFinalizerTest, NumericNeedsNinetyFivePercent) {
    std::vector<OptionalCell> almost;
    for (int i = 0; i < 19; ++i) almost.push_back(integer(i));
    almost.push_back(text("x"));
    std::vector<OptionalCell> notQuite(almost);
    notQuite[18] = text("y");

    DataTable table = make_table({mixed("almost", almost), mixed("not_quite", notQuite)});

    CleaningStages::finalizeTypes(table, CleaningConfig{}, report_);

    EXPECT_EQ(table.column("almost").type, ColumnType::NUMERIC);
    EXPECT_EQ(table.column("almost").missing[19], 1);
    ASSERT_EQ(table.column("not_quite").type, ColumnType::TEXT);
    EXPECT_EQ(text_values(table, "not_quite")[0], "0");
    EXPECT_EQ(text_values(table, "not_quite")[18], "y");
}

TEST_F(TypeFinalizerTest, GappyLoaderNumbersStayNumeric) {
    // 2 of 4 rows observed: far below 0.95 of rows, but every observed cell is a number
    DataTable table = make_table({mixed("x", {integer(1), na(), num(2.5), na()})});

    CleaningStages::finalizeTypes(table, CleaningConfig{}, report_);

    const auto& col = table.column("x");
    ASSERT_EQ(col.type, ColumnType::NUMERIC);
    EXPECT_EQ(col.missing, (MissingMask{0, 1, 0, 1}));
    EXPECT_DOUBLE_EQ(numeric_values(table, "x")[0], 1.0);
    EXPECT_DOUBLE_EQ(numeric_values(table, "x")[2], 2.5);
    EXPECT_TRUE(report_.dtypeChanges.empty());
}

TEST_F(TypeFinalizerTest, CommitsCleanDates) {
    DataTable table = make_table({mixed("d", texts({"2021-05-01", "2021-05-02", nullptr}))});

    CleaningStages::finalizeTypes(table, CleaningConfig{}, report_);

    // 2 of 3 rows parse: below 0.95 of rows, so the column ends up as text
    EXPECT_EQ(table.column("d").type, ColumnType::TEXT);

    DataTable full = make_table({mixed("d", texts({"2021-05-01", "2021-05-02"}))});
    CleaningStages::finalizeTypes(full, CleaningConfig{}, report_);
    EXPECT_EQ(full.column("d").type, ColumnType::DATETIME);
}

TEST_F(TypeFinalizerTest, LeavesNoMixedColumnAndWritesNoDtypeChanges) {
    DataTable table = make_table({
        mixed("m", {flag(true), text("x"), na()}),
        mixed("blank", {na(), na(), na()}),
        makeNumericColumn("n", {1.0, 2.0, 3.0}),
    });

    CleaningStages::finalizeTypes(table, CleaningConfig{}, report_);

    for (const auto& col : table.columns()) {
        EXPECT_NE(col.type, ColumnType::MIXED) << col.name;
    }
    EXPECT_EQ(text_values(table, "m")[0], "True");
    EXPECT_EQ(table.column("m").missing[2], 1);
    EXPECT_EQ(table.column("blank").missingCount(), 3u);
    EXPECT_TRUE(report_.dtypeChanges.empty());
}
