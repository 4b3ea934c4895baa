#include "Cleaner.h"
#include "CleaningStages.h"

#include <exception>

namespace {
using StageFn = void (*)(DataTable&, const CleaningConfig&, CleaningReport&);

struct StageEntry {
    const char* name;
    StageFn fn;
};

void runStage(const StageEntry& stage, DataTable& table, const CleaningConfig& config, CleaningReport& report) {
    try {
        stage.fn(table, config, report);
    } catch (const std::exception& ex) {
        report.addOutcome(stage.name, "", OutcomeStatus::FAILED, ex.what());
        CleaningStages::logWarning(config, std::string("Stage ") + stage.name + " failed: " + ex.what());
    }
}
}

CleaningReport Cleaner::run(DataTable& table, const CleaningConfig& config) {
    config.validate();

    CleaningReport report;
    report.originalShape = TableShape{table.rowCount(), table.colCount()};
    CleaningStages::logStage(config, "Cleaner", "Starting on " + std::to_string(table.rowCount()) + " row(s) x " +
                                                std::to_string(table.colCount()) + " column(s)");

    // Order matters: trimming before inference, null handling before pruning/dedup,
    // inference and finalization before outlier detection.
    static const StageEntry kStages[] = {
        {CleaningStages::kNormalizeStage, &CleaningStages::normalizeColumnNames},
        {CleaningStages::kTrimStage, &CleaningStages::trimWhitespace},
        {CleaningStages::kNullStage, &CleaningStages::handleNulls},
        {CleaningStages::kBlankStage, &CleaningStages::pruneBlankRowsAndColumns},
        {CleaningStages::kDuplicateStage, &CleaningStages::removeDuplicateRows},
        {CleaningStages::kInferStage, &CleaningStages::inferTypes},
        {CleaningStages::kFinalizeStage, &CleaningStages::finalizeTypes},
        {CleaningStages::kOutlierStage, &CleaningStages::detectOutliers}
    };
    for (const auto& stage : kStages) {
        runStage(stage, table, config, report);
    }

    report.cleanedShape = TableShape{table.rowCount(), table.colCount()};
    report.rowsRemoved = report.originalShape.rows - report.cleanedShape.rows;
    report.colsRemoved = report.originalShape.cols - report.cleanedShape.cols;

    CleaningStages::logStage(config, "Cleaner", "Done: " + std::to_string(report.cleanedShape.rows) + " row(s) x " +
                                                std::to_string(report.cleanedShape.cols) + " column(s), " +
                                                std::to_string(report.rowsRemoved) + " row(s) and " +
                                                std::to_string(report.colsRemoved) + " column(s) removed");
    return report;
}
