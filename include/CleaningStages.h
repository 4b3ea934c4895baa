#pragma once

#include "CleaningConfig.h"
#include "CleaningReport.h"
#include "DataTable.h"

#include <string>

// Individual pipeline stages. Each one mutates the table in place, writes its own report
// keys (zero-valued when disabled) and records per-column outcomes. Cleaner::run fixes
// the order; the stages are exposed separately so they can be exercised in isolation.
namespace CleaningStages {

inline constexpr const char* kNormalizeStage = "normalize_columns";
inline constexpr const char* kTrimStage = "trim_whitespace";
inline constexpr const char* kNullStage = "null_handling";
inline constexpr const char* kBlankStage = "blank_pruning";
inline constexpr const char* kDuplicateStage = "drop_duplicates";
inline constexpr const char* kInferStage = "infer_types";
inline constexpr const char* kFinalizeStage = "finalize_types";
inline constexpr const char* kOutlierStage = "detect_outliers";

// Share of rows that must parse before the finalizer commits a numeric/datetime column.
inline constexpr double kFinalizeParseRatio = 0.95;
// Share of rows that must parse before inference commits a numeric column.
inline constexpr double kNumericInferRatio = 0.9;

/**
 * @brief Trims, replaces whitespace runs with '_', drops characters outside [0-9a-zA-Z_]
 *        and lowercases.
 */
std::string normalizeColumnName(const std::string& name);

/**
 * @brief True for names matching (case-insensitive) ^id$, _id$ or ^id_.
 */
bool isIdentifierColumn(const std::string& name);

void normalizeColumnNames(DataTable& table, const CleaningConfig& config, CleaningReport& report);
void trimWhitespace(DataTable& table, const CleaningConfig& config, CleaningReport& report);

/**
 * @brief Applies null_handling (none|drop_rows|fill).
 * @post nulls_dropped / nulls_filled reflect the cells actually removed or filled.
 */
void handleNulls(DataTable& table, const CleaningConfig& config, CleaningReport& report);

void pruneBlankRowsAndColumns(DataTable& table, const CleaningConfig& config, CleaningReport& report);
void removeDuplicateRows(DataTable& table, const CleaningConfig& config, CleaningReport& report);

/**
 * @brief Commits MIXED/TEXT/NUMERIC columns to numeric or datetime storage when enough
 *        values parse. DATETIME columns are left alone.
 */
void inferTypes(DataTable& table, const CleaningConfig& config, CleaningReport& report);

/**
 * @brief Always runs. Leaves no MIXED column behind: each MIXED/TEXT column ends up
 *        NUMERIC, DATETIME or TEXT. Writes no report keys.
 */
void finalizeTypes(DataTable& table, const CleaningConfig& config, CleaningReport& report);

void detectOutliers(DataTable& table, const CleaningConfig& config, CleaningReport& report);

// Console logging, silent unless config.verbose.
void logStage(const CleaningConfig& config, const std::string& tag, const std::string& message);
void logWarning(const CleaningConfig& config, const std::string& message);

} // namespace CleaningStages
