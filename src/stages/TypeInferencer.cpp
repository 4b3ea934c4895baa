#include "CleaningStages.h"
#include "ValueParsing.h"

#include <algorithm>
#include <cmath>
#include <exception>

namespace {
struct NumericAttempt {
    std::vector<double> values;
    MissingMask missing;
    size_t parsed = 0;
};

struct DatetimeAttempt {
    std::vector<int64_t> values;
    MissingMask missing;
    size_t parsed = 0;
};

double ratioOver(size_t count, size_t total) {
    return static_cast<double>(count) / static_cast<double>(std::max<size_t>(1, total));
}

NumericAttempt tryNumeric(const TypedColumn& col) {
    NumericAttempt out;
    const size_t n = col.size();
    out.values.assign(n, 0.0);
    out.missing.assign(n, static_cast<uint8_t>(1));

    for (size_t r = 0; r < n; ++r) {
        if (col.missing[r]) continue;
        double v = 0.0;
        bool ok = false;
        if (col.type == ColumnType::NUMERIC) {
            v = std::get<std::vector<double>>(col.values)[r];
            ok = !std::isnan(v);
        } else if (col.type == ColumnType::TEXT) {
            ok = ValueParsing::parseNumber(std::get<std::vector<std::string>>(col.values)[r], v);
        } else if (col.type == ColumnType::MIXED) {
            ok = ValueParsing::cellToNumber(std::get<std::vector<CellValue>>(col.values)[r], v);
        }
        if (!ok) continue;
        out.values[r] = v;
        out.missing[r] = static_cast<uint8_t>(0);
        ++out.parsed;
    }
    return out;
}

std::string observedText(const TypedColumn& col, size_t row) {
    if (col.type == ColumnType::TEXT) return std::get<std::vector<std::string>>(col.values)[row];
    return ValueParsing::cellToText(std::get<std::vector<CellValue>>(col.values)[row]);
}

// Share of non-missing values that look like dates; 0 when nothing is observed.
double dateLikeRatio(const TypedColumn& col) {
    size_t observed = 0;
    size_t dateLike = 0;
    for (size_t r = 0; r < col.size(); ++r) {
        if (col.missing[r]) continue;
        ++observed;
        if (ValueParsing::isDateLike(observedText(col, r))) ++dateLike;
    }
    return ratioOver(dateLike, observed);
}

DatetimeAttempt tryDatetime(const TypedColumn& col, ValueParsing::DateLocaleHint hint) {
    DatetimeAttempt out;
    const size_t n = col.size();
    out.values.assign(n, 0);
    out.missing.assign(n, static_cast<uint8_t>(1));

    for (size_t r = 0; r < n; ++r) {
        if (col.missing[r]) continue;
        int64_t ts = 0;
        bool ok = false;
        if (col.type == ColumnType::TEXT) {
            ok = ValueParsing::parseDateTime(std::get<std::vector<std::string>>(col.values)[r], hint, ts);
        } else {
            ok = ValueParsing::cellToDateTime(std::get<std::vector<CellValue>>(col.values)[r], hint, ts);
        }
        if (!ok) continue;
        out.values[r] = ts;
        out.missing[r] = static_cast<uint8_t>(0);
        ++out.parsed;
    }
    return out;
}

void commitNumeric(TypedColumn& col, NumericAttempt attempt) {
    col.values = std::move(attempt.values);
    col.missing = std::move(attempt.missing);
    col.type = ColumnType::NUMERIC;
}

void commitDatetime(TypedColumn& col, DatetimeAttempt attempt) {
    col.values = std::move(attempt.values);
    col.missing = std::move(attempt.missing);
    col.type = ColumnType::DATETIME;
}

void commitText(TypedColumn& col) {
    if (col.type == ColumnType::TEXT) return;
    const auto& values = std::get<std::vector<CellValue>>(col.values);
    std::vector<std::string> text(values.size());
    for (size_t r = 0; r < values.size(); ++r) {
        if (!col.missing[r]) text[r] = ValueParsing::cellToText(values[r]);
    }
    col.values = std::move(text);
    col.type = ColumnType::TEXT;
}

void recordChange(CleaningReport& report, const CleaningConfig& config, const std::string& name, ColumnType from, ColumnType to) {
    report.dtypeChanges[name] = DtypeChange{columnTypeName(from), columnTypeName(to)};
    report.addOutcome(CleaningStages::kInferStage, name, OutcomeStatus::SUCCESS,
                      std::string(columnTypeName(from)) + " -> " + columnTypeName(to));
    CleaningStages::logStage(config, "Types", "'" + name + "' " + columnTypeName(from) + " -> " + columnTypeName(to));
}

void inferColumn(TypedColumn& col, const CleaningConfig& config, CleaningReport& report) {
    const ColumnType original = col.type;
    const size_t rows = col.size();

    NumericAttempt numeric = tryNumeric(col);
    if (ratioOver(numeric.parsed, rows) >= CleaningStages::kNumericInferRatio) {
        commitNumeric(col, std::move(numeric));
        recordChange(report, config, col.name, original, ColumnType::NUMERIC);
        return;
    }
    if (original == ColumnType::NUMERIC) {
        report.addOutcome(CleaningStages::kInferStage, col.name, OutcomeStatus::SKIPPED, "kept numeric");
        return;
    }

    if (dateLikeRatio(col) < config.dateDetectThresh) {
        report.addOutcome(CleaningStages::kInferStage, col.name, OutcomeStatus::SKIPPED, "not enough date-like values");
        return;
    }

    DatetimeAttempt dates = tryDatetime(col, config.dateHint());
    if (ratioOver(dates.parsed, rows) >= config.dateDetectThresh) {
        commitDatetime(col, std::move(dates));
        recordChange(report, config, col.name, original, ColumnType::DATETIME);
        return;
    }
    report.addOutcome(CleaningStages::kInferStage, col.name, OutcomeStatus::SKIPPED, "no type matched");
}

void finalizeColumn(TypedColumn& col, const CleaningConfig& config) {
    const size_t rows = col.size();

    NumericAttempt numeric = tryNumeric(col);
    // Loader numbers with gaps stay numeric; missing cells stay missing.
    if (col.holdsOnlyNumbers() || ratioOver(numeric.parsed, rows) >= CleaningStages::kFinalizeParseRatio) {
        commitNumeric(col, std::move(numeric));
        return;
    }

    if (dateLikeRatio(col) >= CleaningStages::kFinalizeParseRatio) {
        DatetimeAttempt dates = tryDatetime(col, config.dateHint());
        if (ratioOver(dates.parsed, rows) >= CleaningStages::kFinalizeParseRatio) {
            commitDatetime(col, std::move(dates));
            return;
        }
    }

    commitText(col);
}
}

namespace CleaningStages {

void inferTypes(DataTable& table, const CleaningConfig& config, CleaningReport& report) {
    report.dtypeChanges.clear();
    if (!config.inferTypes) {
        report.addOutcome(kInferStage, "", OutcomeStatus::SKIPPED, "disabled");
        return;
    }

    for (auto& col : table.columns()) {
        if (col.type == ColumnType::DATETIME) {
            report.addOutcome(kInferStage, col.name, OutcomeStatus::SKIPPED, "already datetime");
            continue;
        }
        if (col.allMissing()) {
            report.addOutcome(kInferStage, col.name, OutcomeStatus::SKIPPED, "no observed values");
            continue;
        }
        try {
            inferColumn(col, config, report);
        } catch (const std::exception& ex) {
            report.addOutcome(kInferStage, col.name, OutcomeStatus::FAILED, ex.what());
            logWarning(config, "Type inference failed for '" + col.name + "': " + ex.what());
        }
    }
}

void finalizeTypes(DataTable& table, const CleaningConfig& config, CleaningReport& report) {
    for (auto& col : table.columns()) {
        if (col.type != ColumnType::MIXED && col.type != ColumnType::TEXT) continue;
        const ColumnType before = col.type;
        try {
            finalizeColumn(col, config);
            report.addOutcome(kFinalizeStage, col.name, OutcomeStatus::SUCCESS,
                              std::string(columnTypeName(before)) + " -> " + columnTypeName(col.type));
        } catch (const std::exception& ex) {
            report.addOutcome(kFinalizeStage, col.name, OutcomeStatus::FAILED, ex.what());
            logWarning(config, "Could not finalize '" + col.name + "': " + ex.what());
        }
    }
}

} // namespace CleaningStages
