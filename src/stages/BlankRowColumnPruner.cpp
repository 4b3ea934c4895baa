#include "CleaningStages.h"

namespace CleaningStages {

void pruneBlankRowsAndColumns(DataTable& table, const CleaningConfig& config, CleaningReport& report) {
    report.blankRowsDropped = 0;
    report.blankColsDropped = 0;
    if (!config.dropBlankRows && !config.dropBlankCols) {
        report.addOutcome(kBlankStage, "", OutcomeStatus::SKIPPED, "disabled");
        return;
    }

    // Rows first, then columns; a table without columns has no blank rows.
    if (config.dropBlankRows && table.colCount() > 0) {
        MissingMask keep(table.rowCount(), static_cast<uint8_t>(0));
        for (const auto& col : table.columns()) {
            for (size_t r = 0; r < keep.size(); ++r) {
                if (!col.missing[r]) keep[r] = static_cast<uint8_t>(1);
            }
        }
        const size_t before = table.rowCount();
        table.removeRows(keep);
        report.blankRowsDropped = before - table.rowCount();
    }

    if (config.dropBlankCols) {
        std::vector<uint8_t> keep(table.colCount(), static_cast<uint8_t>(1));
        for (size_t c = 0; c < table.colCount(); ++c) {
            if (table.columns()[c].allMissing()) {
                keep[c] = static_cast<uint8_t>(0);
                logStage(config, "Prune", "dropping blank column '" + table.columns()[c].name + "'");
            }
        }
        const size_t before = table.colCount();
        table.removeColumns(keep);
        report.blankColsDropped = before - table.colCount();
    }

    report.addOutcome(kBlankStage, "", OutcomeStatus::SUCCESS,
                      std::to_string(report.blankRowsDropped) + " row(s), " +
                      std::to_string(report.blankColsDropped) + " column(s) dropped");
    logStage(config, "Prune", "dropped " + std::to_string(report.blankRowsDropped) + " blank row(s) and " +
                              std::to_string(report.blankColsDropped) + " blank column(s)");
}

} // namespace CleaningStages
