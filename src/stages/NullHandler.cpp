#include "CleaningStages.h"
#include "CommonUtils.h"
#include "ValueParsing.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <optional>
#include <unordered_map>

namespace {
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;

struct FillResult {
    OutcomeStatus status = OutcomeStatus::SUCCESS;
    std::string reason;
};

bool isNumericLike(const TypedColumn& col) {
    return col.type == ColumnType::NUMERIC || col.holdsOnlyNumbers();
}

NumVec observedNumbers(const TypedColumn& col) {
    NumVec valid;
    valid.reserve(col.size());
    if (col.type == ColumnType::NUMERIC) {
        const auto& values = std::get<NumVec>(col.values);
        for (size_t i = 0; i < values.size(); ++i) {
            if (!col.missing[i] && std::isfinite(values[i])) valid.push_back(values[i]);
        }
        return valid;
    }
    const auto& values = std::get<std::vector<CellValue>>(col.values);
    for (size_t i = 0; i < values.size(); ++i) {
        double v = 0.0;
        if (!col.missing[i] && ValueParsing::cellToNumber(values[i], v) && std::isfinite(v)) valid.push_back(v);
    }
    return valid;
}

template <typename T>
void fillMissing(std::vector<T>& values, MissingMask& missing, const T& fill) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (!missing[i]) continue;
        values[i] = fill;
        missing[i] = static_cast<uint8_t>(0);
    }
}

FillResult imputeNumeric(TypedColumn& col, const std::string& strategy) {
    if (!isNumericLike(col)) {
        return {OutcomeStatus::SKIPPED, strategy + " fill applies to numeric columns only"};
    }
    NumVec valid = observedNumbers(col);
    if (valid.empty()) {
        return {OutcomeStatus::FAILED, "no observed values to compute " + strategy};
    }

    double fill = 0.0;
    if (strategy == "median") {
        fill = CommonUtils::medianByNth(std::move(valid));
    } else {
        long double sum = 0.0L;
        for (double v : valid) sum += v;
        fill = static_cast<double>(sum / static_cast<long double>(valid.size()));
    }

    if (col.type == ColumnType::NUMERIC) {
        fillMissing(std::get<NumVec>(col.values), col.missing, fill);
    } else {
        fillMissing(std::get<std::vector<CellValue>>(col.values), col.missing, CellValue(fill));
    }
    return {};
}

// Row of the most frequent observed value; ties go to the value seen first.
template <typename T, typename KeyFn>
std::optional<size_t> modeRow(const std::vector<T>& values, const MissingMask& missing, KeyFn keyOf) {
    using Key = decltype(keyOf(values[0]));
    struct Tally {
        size_t count = 0;
        size_t firstRow = 0;
    };
    std::unordered_map<Key, Tally> freq;
    std::optional<size_t> bestRow;
    size_t bestCount = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (missing[i]) continue;
        auto [it, inserted] = freq.emplace(keyOf(values[i]), Tally{0, i});
        const size_t count = ++it->second.count;
        if (count > bestCount || (count == bestCount && it->second.firstRow < *bestRow)) {
            bestCount = count;
            bestRow = it->second.firstRow;
        }
    }
    return bestRow;
}

std::string mixedModeKey(const CellValue& cell) {
    double v = 0.0;
    if (!std::holds_alternative<std::string>(cell) && ValueParsing::cellToNumber(cell, v)) {
        return "n:" + ValueParsing::formatNumber(v);
    }
    return "t:" + ValueParsing::cellToText(cell);
}

FillResult imputeMode(TypedColumn& col) {
    switch (col.type) {
        case ColumnType::NUMERIC: {
            auto& values = std::get<NumVec>(col.values);
            const auto row = modeRow(values, col.missing, [](double v) { return v; });
            fillMissing(values, col.missing, row ? values[*row] : 0.0);
            break;
        }
        case ColumnType::DATETIME: {
            auto& values = std::get<std::vector<int64_t>>(col.values);
            const auto row = modeRow(values, col.missing, [](int64_t v) { return v; });
            fillMissing(values, col.missing, row ? values[*row] : int64_t{0});
            break;
        }
        case ColumnType::TEXT: {
            auto& values = std::get<StrVec>(col.values);
            const auto row = modeRow(values, col.missing, [](const std::string& v) { return v; });
            const std::string fill = row ? values[*row] : std::string();
            fillMissing(values, col.missing, fill);
            break;
        }
        case ColumnType::MIXED: {
            auto& values = std::get<std::vector<CellValue>>(col.values);
            const auto row = modeRow(values, col.missing, mixedModeKey);
            const CellValue fill = row ? values[*row] : CellValue(std::string());
            fillMissing(values, col.missing, fill);
            break;
        }
    }
    return {};
}

FillResult imputeConstant(TypedColumn& col, const std::optional<std::string>& constant) {
    if (!constant) {
        return {OutcomeStatus::FAILED, "fill_constant is not set"};
    }

    if (col.type == ColumnType::TEXT) {
        fillMissing(std::get<StrVec>(col.values), col.missing, *constant);
        return {};
    }
    if (col.type == ColumnType::MIXED) {
        fillMissing(std::get<std::vector<CellValue>>(col.values), col.missing, CellValue(*constant));
        return {};
    }

    // Typed storage cannot hold a text literal: demote to MIXED first.
    std::vector<CellValue> demoted;
    demoted.reserve(col.size());
    for (size_t i = 0; i < col.size(); ++i) {
        if (col.missing[i]) {
            demoted.emplace_back(*constant);
        } else if (col.type == ColumnType::NUMERIC) {
            demoted.emplace_back(std::get<NumVec>(col.values)[i]);
        } else {
            demoted.emplace_back(ValueParsing::formatTimestamp(std::get<std::vector<int64_t>>(col.values)[i]));
        }
    }
    col.values = std::move(demoted);
    col.type = ColumnType::MIXED;
    std::fill(col.missing.begin(), col.missing.end(), static_cast<uint8_t>(0));
    return {};
}

void dropRowsWithMissing(DataTable& table, const CleaningConfig& config, CleaningReport& report) {
    MissingMask keep(table.rowCount(), static_cast<uint8_t>(1));
    for (const auto& col : table.columns()) {
        for (size_t r = 0; r < keep.size(); ++r) {
            if (col.missing[r]) keep[r] = static_cast<uint8_t>(0);
        }
    }

    const size_t before = table.rowCount();
    table.removeRows(keep);
    report.nullsDropped = before - table.rowCount();
    report.addOutcome(CleaningStages::kNullStage, "", OutcomeStatus::SUCCESS,
                      "dropped " + std::to_string(report.nullsDropped) + " row(s)");
    CleaningStages::logStage(config, "Nulls", "dropped " + std::to_string(report.nullsDropped) + " row(s) with missing values");
}

void fillColumns(DataTable& table, const CleaningConfig& config, CleaningReport& report) {
    if (!config.fillStrategy) {
        report.addOutcome(CleaningStages::kNullStage, "", OutcomeStatus::FAILED, "fill requires fill_strategy");
        CleaningStages::logWarning(config, "null_handling=fill without fill_strategy; nothing filled");
        return;
    }
    const std::string& strategy = *config.fillStrategy;

    for (auto& col : table.columns()) {
        const size_t naCount = col.missingCount();
        if (naCount == 0) {
            report.addOutcome(CleaningStages::kNullStage, col.name, OutcomeStatus::SKIPPED, "no missing values");
            continue;
        }

        FillResult result;
        try {
            if (strategy == "mean" || strategy == "median") {
                result = imputeNumeric(col, strategy);
            } else if (strategy == "mode") {
                result = imputeMode(col);
            } else {
                result = imputeConstant(col, config.fillConstant);
            }
        } catch (const std::exception& ex) {
            result = {OutcomeStatus::FAILED, ex.what()};
        }

        report.addOutcome(CleaningStages::kNullStage, col.name, result.status, result.reason);
        if (result.status == OutcomeStatus::SUCCESS) {
            report.nullsFilled[col.name] = naCount;
            CleaningStages::logStage(config, "Nulls", "filled " + std::to_string(naCount) + " cell(s) in '" + col.name + "'");
        } else if (result.status == OutcomeStatus::FAILED) {
            CleaningStages::logWarning(config, "Could not fill '" + col.name + "': " + result.reason);
        }
    }
}
}

namespace CleaningStages {

void handleNulls(DataTable& table, const CleaningConfig& config, CleaningReport& report) {
    report.nullsDropped = 0;
    report.nullsFilled.clear();

    if (config.nullHandling == "drop_rows") {
        dropRowsWithMissing(table, config, report);
    } else if (config.nullHandling == "fill") {
        fillColumns(table, config, report);
    } else {
        report.addOutcome(kNullStage, "", OutcomeStatus::SKIPPED, "disabled");
    }
}

} // namespace CleaningStages
