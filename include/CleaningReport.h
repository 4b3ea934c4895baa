#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

enum class OutcomeStatus { SUCCESS, SKIPPED, FAILED };

const char* outcomeStatusName(OutcomeStatus status);

struct StageOutcome {
    std::string stage;
    std::string column; // empty for a table-level entry
    OutcomeStatus status = OutcomeStatus::SUCCESS;
    std::string reason;
};

struct TableShape {
    size_t rows = 0;
    size_t cols = 0;
};

struct DtypeChange {
    std::string from;
    std::string to;
};

struct OutlierSummary {
    size_t count = 0;
    double percent = 0.0; // count / rows
};

struct CleaningReport {
    TableShape originalShape;
    std::vector<std::pair<std::string, std::string>> colRenames; // old -> new, in column order
    size_t nullsDropped = 0;
    std::map<std::string, size_t> nullsFilled;
    size_t blankRowsDropped = 0;
    size_t blankColsDropped = 0;
    size_t duplicatesDropped = 0;
    std::map<std::string, DtypeChange> dtypeChanges;
    std::map<std::string, OutlierSummary> outliers;
    size_t outliersRemoved = 0;
    TableShape cleanedShape;
    size_t rowsRemoved = 0;
    size_t colsRemoved = 0;

    std::vector<StageOutcome> outcomes;

    /**
     * @brief Report keys every run is guaranteed to populate, in pipeline order.
     */
    static const std::vector<std::string>& keys();
    static bool hasKey(const std::string& name);

    void addOutcome(const std::string& stage, const std::string& column, OutcomeStatus status, const std::string& reason = "");
    std::vector<StageOutcome> outcomesFor(const std::string& stage) const;
};
