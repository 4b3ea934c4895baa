// column_name_normalizer_test.cpp: name normalization and rename reporting.

#include <gtest/gtest.h>

#include "CleaningStages.h"
#include "test_helpers.hpp"

#include <string>

using namespace test_helpers;

class ColumnNameNormalizerTest : public ::testing::Test {
protected:
    CleaningConfig config_ = [] {
        CleaningConfig c;
        c.normalizeColumns = true;
        return c;
    }();
    CleaningReport report_;
};

TEST_F(ColumnNameNormalizerTest, NormalizesSingleNames) {
    EXPECT_EQ(CleaningStages::normalizeColumnName(" Name "), "name");
    EXPECT_EQ(CleaningStages::normalizeColumnName("Age!"), "age");
    EXPECT_EQ(CleaningStages::normalizeColumnName("First   Name"), "first_name");
    EXPECT_EQ(CleaningStages::normalizeColumnName("Price ($)"), "price_");
    EXPECT_EQ(CleaningStages::normalizeColumnName("already_ok_1"), "already_ok_1");
    EXPECT_EQ(CleaningStages::normalizeColumnName("\tTab\nSeparated"), "tab_separated");
    EXPECT_EQ(CleaningStages::normalizeColumnName("!!!"), "");
}

TEST_F(ColumnNameNormalizerTest, RecordsOnlyChangedNamesInOrder) {
    DataTable table = make_table({
        mixed(" Name ", {text("a")}),
        mixed("ok", {text("b")}),
        mixed("Age!", {text("c")}),
    });

    CleaningStages::normalizeColumnNames(table, config_, report_);

    ASSERT_EQ(report_.colRenames.size(), 2u);
    EXPECT_EQ(report_.colRenames[0].first, " Name ");
    EXPECT_EQ(report_.colRenames[0].second, "name");
    EXPECT_EQ(report_.colRenames[1].first, "Age!");
    EXPECT_EQ(report_.colRenames[1].second, "age");
    EXPECT_EQ(table.columns()[0].name, "name");
    EXPECT_EQ(table.columns()[1].name, "ok");
    EXPECT_EQ(table.columns()[2].name, "age");
}

TEST_F(ColumnNameNormalizerTest, CollidingNamesCoexist) {
    DataTable table = make_table({mixed("A b", {integer(1)}), mixed("a_b", {integer(2)})});

    CleaningStages::normalizeColumnNames(table, config_, report_);

    ASSERT_EQ(table.colCount(), 2u);
    EXPECT_EQ(table.columns()[0].name, "a_b");
    EXPECT_EQ(table.columns()[1].name, "a_b");
}

TEST_F(ColumnNameNormalizerTest, DisabledLeavesNamesAndRecordsSkip) {
    DataTable table = make_table({mixed(" Name ", {text("a")})});
    CleaningConfig off;

    CleaningStages::normalizeColumnNames(table, off, report_);

    EXPECT_EQ(table.columns()[0].name, " Name ");
    EXPECT_TRUE(report_.colRenames.empty());
    ASSERT_EQ(report_.outcomes.size(), 1u);
    EXPECT_EQ(report_.outcomes[0].status, OutcomeStatus::SKIPPED);
    EXPECT_EQ(report_.outcomes[0].reason, "disabled");
}
