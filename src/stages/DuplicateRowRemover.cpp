#include "CleaningStages.h"
#include "ValueParsing.h"

#include <functional>
#include <unordered_map>

namespace {
// Equal cells (per DataTable::rowsEqual) must hash equal, so MIXED numbers hash by value.
size_t cellHash(const TypedColumn& col, size_t row) {
    if (col.missing[row]) return 0x9e3779b9u;
    switch (col.type) {
        case ColumnType::NUMERIC: {
            const double v = std::get<std::vector<double>>(col.values)[row];
            return std::hash<double>{}(v == 0.0 ? 0.0 : v);
        }
        case ColumnType::TEXT:
            return std::hash<std::string>{}(std::get<std::vector<std::string>>(col.values)[row]);
        case ColumnType::DATETIME:
            return std::hash<int64_t>{}(std::get<std::vector<int64_t>>(col.values)[row]);
        case ColumnType::MIXED: {
            const CellValue& cell = std::get<std::vector<CellValue>>(col.values)[row];
            if (const auto* s = std::get_if<std::string>(&cell)) return std::hash<std::string>{}(*s) ^ 0x5bd1e995u;
            double v = 0.0;
            if (ValueParsing::cellToNumber(cell, v)) return std::hash<double>{}(v == 0.0 ? 0.0 : v);
            return 0;
        }
    }
    return 0;
}

size_t rowHash(const DataTable& table, size_t row) {
    size_t seed = 0;
    for (const auto& col : table.columns()) {
        seed ^= cellHash(col, row) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}
}

namespace CleaningStages {

void removeDuplicateRows(DataTable& table, const CleaningConfig& config, CleaningReport& report) {
    report.duplicatesDropped = 0;
    if (!config.dropDuplicates) {
        report.addOutcome(kDuplicateStage, "", OutcomeStatus::SKIPPED, "disabled");
        return;
    }

    const size_t rows = table.rowCount();
    MissingMask keep(rows, static_cast<uint8_t>(1));
    std::unordered_map<size_t, std::vector<size_t>> firstRowsByHash;
    firstRowsByHash.reserve(rows);

    for (size_t r = 0; r < rows; ++r) {
        auto& bucket = firstRowsByHash[rowHash(table, r)];
        bool duplicate = false;
        for (size_t earlier : bucket) {
            if (table.rowsEqual(earlier, r)) {
                duplicate = true;
                break;
            }
        }
        if (duplicate) {
            keep[r] = static_cast<uint8_t>(0);
        } else {
            bucket.push_back(r);
        }
    }

    table.removeRows(keep);
    report.duplicatesDropped = rows - table.rowCount();
    report.addOutcome(kDuplicateStage, "", OutcomeStatus::SUCCESS,
                      "dropped " + std::to_string(report.duplicatesDropped) + " row(s)");
    logStage(config, "Duplicates", "dropped " + std::to_string(report.duplicatesDropped) + " duplicate row(s)");
}

} // namespace CleaningStages
