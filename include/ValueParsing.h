#pragma once

#include "DataTable.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace ValueParsing {
// Cell-level parsing and rendering shared by the cleaning stages.
// Nothing here touches a table; callers decide what a failed parse means.

enum class DateLocaleHint {
    AUTO,
    DMY,
    MDY
};

/**
 * @brief Strict number parse: optional surrounding whitespace, sign, digits, decimal point,
 *        exponent, or inf/infinity. Thousands separators, currency and percent are rejected.
 * @return false for unparsable text and for textual NaN.
 */
bool parseNumber(std::string_view text, double& out);

/**
 * @brief Numeric view of a raw cell. bool -> 1/0, integers and doubles as themselves
 *        (non-finite doubles other than +/-inf count as unparsable), text via parseNumber.
 */
bool cellToNumber(const CellValue& cell, double& out);

/**
 * @brief Parses a date or date-time into Unix seconds (UTC).
 * @details Accepts ISO dates, slash/dot/dash day-month orders, ISO week dates and month-name
 *          dates, optionally followed by HH:MM[:SS] (space or 'T' separated) and a trailing 'Z'.
 */
bool parseDateTime(std::string_view text, DateLocaleHint hint, int64_t& outUnixSeconds);

bool cellToDateTime(const CellValue& cell, DateLocaleHint hint, int64_t& outUnixSeconds);

/**
 * @brief Cheap gate before full date parsing: a '/', '-' or '.' separator, or a run of at
 *        least three ASCII letters.
 */
bool isDateLike(std::string_view text);

std::string formatNumber(double value);
std::string formatTimestamp(int64_t unixSeconds);
std::string cellToText(const CellValue& cell);

/**
 * @brief Equality used for duplicate detection. Integers, doubles and bools compare
 *        numerically with each other; text only equals text.
 */
bool cellsEqual(const CellValue& a, const CellValue& b);
} // namespace ValueParsing
