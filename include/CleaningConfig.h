#pragma once
#include "ValueParsing.h"

#include <optional>
#include <string>
#include <unordered_map>

using OptionMap = std::unordered_map<std::string, std::string>;

struct CleaningConfig {
    bool normalizeColumns = false;
    bool trimWhitespace = false;
    bool dropBlankRows = false;
    bool dropBlankCols = false;
    bool dropDuplicates = false;
    bool inferTypes = false;
    bool detectOutliers = false;
    bool verbose = false;

    // Share of values that must look like (and parse as) dates before a column is committed.
    double dateDetectThresh = 0.5;
    std::string dateLocaleHint = "auto";    // auto|dmy|mdy

    std::string nullHandling = "none";      // none|drop_rows|fill
    std::optional<std::string> fillStrategy; // mean|median|mode|constant
    std::optional<std::string> fillConstant;

    std::string outlierMethod = "iqr";      // iqr|zscore
    std::string outlierAction = "report";   // report|drop
    std::optional<double> outlierThreshold; // unset => method default

    /**
     * @brief Builds a validated config from a flat option map.
     * @details Keys are trimmed, lowercased and '-' becomes '_'. Unknown keys are ignored.
     * @throws Scrub::ConfigurationException on invalid values.
     */
    static CleaningConfig fromOptions(const OptionMap& options);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Scrub::IOException when the file cannot be opened.
     * @throws Scrub::ConfigurationException on parse/validation failures.
     */
    static CleaningConfig fromFile(const std::string& configPath, const CleaningConfig& base);

    /**
     * @brief Validates enum-like fields and threshold ranges.
     * @throws Scrub::ConfigurationException on invalid values.
     */
    void validate() const;

    double effectiveOutlierThreshold() const;
    ValueParsing::DateLocaleHint dateHint() const;
};
