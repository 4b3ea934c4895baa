#include "CleaningReport.h"

#include <algorithm>
#include <iterator>

const char* outcomeStatusName(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::SUCCESS: return "success";
        case OutcomeStatus::SKIPPED: return "skipped";
        case OutcomeStatus::FAILED: return "failed";
    }
    return "unknown";
}

const std::vector<std::string>& CleaningReport::keys() {
    static const std::vector<std::string> kKeys = {
        "original_shape",
        "col_renames",
        "nulls_dropped",
        "nulls_filled",
        "blank_rows_dropped",
        "blank_cols_dropped",
        "duplicates_dropped",
        "dtype_changes",
        "outliers",
        "outliers_removed",
        "cleaned_shape",
        "rows_removed",
        "cols_removed"
    };
    return kKeys;
}

bool CleaningReport::hasKey(const std::string& name) {
    const auto& all = keys();
    return std::find(all.begin(), all.end(), name) != all.end();
}

void CleaningReport::addOutcome(const std::string& stage, const std::string& column, OutcomeStatus status, const std::string& reason) {
    outcomes.push_back(StageOutcome{stage, column, status, reason});
}

std::vector<StageOutcome> CleaningReport::outcomesFor(const std::string& stage) const {
    std::vector<StageOutcome> out;
    std::copy_if(outcomes.begin(), outcomes.end(), std::back_inserter(out),
                 [&](const StageOutcome& o) { return o.stage == stage; });
    return out;
}
