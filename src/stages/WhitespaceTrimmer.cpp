#include "CleaningStages.h"
#include "CommonUtils.h"
#include "ValueParsing.h"

#include <exception>

namespace {
std::vector<std::string> renderTrimmed(const TypedColumn& col) {
    std::vector<std::string> out(col.size());
    if (col.type == ColumnType::TEXT) {
        const auto& values = std::get<std::vector<std::string>>(col.values);
        for (size_t r = 0; r < out.size(); ++r) {
            if (!col.missing[r]) out[r] = CommonUtils::trim(values[r]);
        }
        return out;
    }

    const auto& values = std::get<std::vector<CellValue>>(col.values);
    for (size_t r = 0; r < out.size(); ++r) {
        if (!col.missing[r]) out[r] = CommonUtils::trim(ValueParsing::cellToText(values[r]));
    }
    return out;
}
}

namespace CleaningStages {

void trimWhitespace(DataTable& table, const CleaningConfig& config, CleaningReport& report) {
    if (!config.trimWhitespace) {
        report.addOutcome(kTrimStage, "", OutcomeStatus::SKIPPED, "disabled");
        return;
    }

    size_t trimmedColumns = 0;
    for (auto& col : table.columns()) {
        if (col.type != ColumnType::MIXED && col.type != ColumnType::TEXT) {
            report.addOutcome(kTrimStage, col.name, OutcomeStatus::SKIPPED,
                              std::string("column is ") + columnTypeName(col.type));
            continue;
        }
        if (col.holdsOnlyNumbers()) {
            report.addOutcome(kTrimStage, col.name, OutcomeStatus::SKIPPED, "column holds numbers");
            continue;
        }
        try {
            std::vector<std::string> trimmed = renderTrimmed(col);
            col.values = std::move(trimmed);
            col.type = ColumnType::TEXT;
            ++trimmedColumns;
            report.addOutcome(kTrimStage, col.name, OutcomeStatus::SUCCESS);
        } catch (const std::exception& ex) {
            logWarning(config, "Could not trim column '" + col.name + "': " + ex.what());
            report.addOutcome(kTrimStage, col.name, OutcomeStatus::FAILED, ex.what());
        }
    }

    logStage(config, "Trim", "trimmed " + std::to_string(trimmedColumns) + " text column(s)");
}

} // namespace CleaningStages
