#include "CleaningStages.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <regex>
#ifdef SCRUB_USE_OPENMP
#include <omp.h>
#endif

namespace {
using NumVec = std::vector<double>;

struct ObservedValues {
    NumVec values;
    std::vector<size_t> rows;
};

ObservedValues collectObserved(const NumVec& values, const MissingMask& missing) {
    ObservedValues out;
    out.values.reserve(values.size());
    out.rows.reserve(values.size());
    for (size_t i = 0; i < values.size() && i < missing.size(); ++i) {
        if (missing[i]) continue;
        if (!std::isfinite(values[i])) continue;
        out.values.push_back(values[i]);
        out.rows.push_back(i);
    }
    return out;
}

MissingMask detectOutliersIQRObserved(const NumVec& values, const MissingMask& missing, double iqrMultiplier) {
    MissingMask flags(values.size(), static_cast<uint8_t>(0));
    const ObservedValues observed = collectObserved(values, missing);
    if (observed.values.empty()) return flags;

    const double q1 = CommonUtils::quantileByNth(observed.values, 0.25);
    const double q3 = CommonUtils::quantileByNth(observed.values, 0.75);
    const double iqr = q3 - q1;
    const double lower = q1 - iqrMultiplier * iqr;
    const double upper = q3 + iqrMultiplier * iqr;

    for (size_t i = 0; i < observed.values.size(); ++i) {
        const double v = observed.values[i];
        if (v < lower || v > upper) flags[observed.rows[i]] = static_cast<uint8_t>(1);
    }
    return flags;
}

// Population standard deviation (ddof = 0).
MissingMask detectOutliersZObserved(const NumVec& values, const MissingMask& missing, double zThreshold) {
    MissingMask flags(values.size(), static_cast<uint8_t>(0));
    const ObservedValues observed = collectObserved(values, missing);
    if (observed.values.empty()) return flags;

    long double mean = 0.0L;
    for (double v : observed.values) mean += v;
    mean /= static_cast<long double>(observed.values.size());

    long double var = 0.0L;
    for (double v : observed.values) {
        const long double d = v - mean;
        var += d * d;
    }
    var /= static_cast<long double>(observed.values.size());
    const double sd = static_cast<double>(std::sqrt(var));
    if (!(sd > 0.0) || !std::isfinite(sd)) return flags;

    for (size_t i = 0; i < observed.values.size(); ++i) {
        const double z = std::abs((observed.values[i] - static_cast<double>(mean)) / sd);
        if (z > zThreshold) flags[observed.rows[i]] = static_cast<uint8_t>(1);
    }
    return flags;
}

MissingMask detectColumn(const TypedColumn& col, const std::string& method, double threshold) {
    const auto& values = std::get<NumVec>(col.values);
    if (method == "zscore") return detectOutliersZObserved(values, col.missing, threshold);
    return detectOutliersIQRObserved(values, col.missing, threshold);
}
}

namespace CleaningStages {

bool isIdentifierColumn(const std::string& name) {
    static const std::regex kIdPattern("^id$|_id$|^id_", std::regex::icase);
    return std::regex_search(name, kIdPattern);
}

void detectOutliers(DataTable& table, const CleaningConfig& config, CleaningReport& report) {
    report.outliers.clear();
    report.outliersRemoved = 0;
    if (!config.detectOutliers) {
        report.addOutcome(kOutlierStage, "", OutcomeStatus::SKIPPED, "disabled");
        return;
    }

    const std::string& method = config.outlierMethod;
    const double threshold = config.effectiveOutlierThreshold();

    std::vector<size_t> eligible;
    for (size_t idx : table.numericColumnIndices()) {
        const auto& col = table.columns()[idx];
        if (isIdentifierColumn(col.name)) {
            report.addOutcome(kOutlierStage, col.name, OutcomeStatus::SKIPPED, "identifier column");
            continue;
        }
        eligible.push_back(idx);
    }

    std::vector<MissingMask> flagsByColumn(eligible.size());
    #ifdef SCRUB_USE_OPENMP
    #pragma omp parallel for schedule(dynamic) if(eligible.size() > 1)
    for (long long pos = 0; pos < static_cast<long long>(eligible.size()); ++pos) {
        const size_t p = static_cast<size_t>(pos);
        flagsByColumn[p] = detectColumn(table.columns()[eligible[p]], method, threshold);
    }
    #else
    for (size_t pos = 0; pos < eligible.size(); ++pos) {
        flagsByColumn[pos] = detectColumn(table.columns()[eligible[pos]], method, threshold);
    }
    #endif

    const size_t rows = table.rowCount();
    MissingMask removal(rows, static_cast<uint8_t>(0));
    for (size_t pos = 0; pos < eligible.size(); ++pos) {
        const auto& col = table.columns()[eligible[pos]];
        const MissingMask& flags = flagsByColumn[pos];
        const size_t count = static_cast<size_t>(std::count(flags.begin(), flags.end(), static_cast<uint8_t>(1)));
        const double percent = rows == 0 ? 0.0 : static_cast<double>(count) / static_cast<double>(rows);
        report.outliers[col.name] = OutlierSummary{count, percent};
        report.addOutcome(kOutlierStage, col.name, OutcomeStatus::SUCCESS, std::to_string(count) + " outlier(s)");
        logStage(config, "Outliers", "'" + col.name + "': " + std::to_string(count) + " outlier(s) via " + method);

        if (config.outlierAction == "drop") {
            for (size_t r = 0; r < rows; ++r) {
                if (flags[r]) removal[r] = static_cast<uint8_t>(1);
            }
        }
    }

    if (config.outlierAction == "drop") {
        MissingMask keep(rows, static_cast<uint8_t>(1));
        for (size_t r = 0; r < rows; ++r) {
            if (removal[r]) keep[r] = static_cast<uint8_t>(0);
        }
        table.removeRows(keep);
        report.outliersRemoved = rows - table.rowCount();
        logStage(config, "Outliers", "removed " + std::to_string(report.outliersRemoved) + " row(s)");
    }

    for (auto it = report.outliers.begin(); it != report.outliers.end();) {
        if (isIdentifierColumn(it->first)) {
            it = report.outliers.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace CleaningStages
