#include "CleaningConfig.h"
#include "CommonUtils.h"
#include "ScrubExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>
#include <vector>

namespace {
double parseDoubleStrict(const std::string& value, const std::string& key) {
    const std::string trimmed = CommonUtils::trim(value);
    double parsed = 0.0;
    size_t pos = 0;
    try {
        parsed = std::stod(trimmed, &pos);
    } catch (const std::exception& ex) {
        throw Scrub::ConfigurationException("Invalid number for " + key + ": " + value + " (" + ex.what() + ")");
    }
    if (pos != trimmed.size()) {
        throw Scrub::ConfigurationException("Invalid number for " + key + ": " + value);
    }
    if (!std::isfinite(parsed)) {
        throw Scrub::ConfigurationException("Value for " + key + " must be finite");
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Scrub::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

struct ConfigEntry {
    std::string key;
    std::string value;
};

// Strips one pair of matching ' or " quotes and resolves backslash escapes inside them.
std::string unquote(const std::string& raw) {
    const std::string text = CommonUtils::trim(raw);
    if (text.size() < 2 || (text.front() != '"' && text.front() != '\'') || text.back() != text.front()) {
        return text;
    }
    std::string out;
    out.reserve(text.size() - 2);
    for (size_t i = 1; i + 1 < text.size(); ++i) {
        if (text[i] == '\\' && i + 2 < text.size()) ++i;
        out.push_back(text[i]);
    }
    return out;
}

// Splits a loose YAML (key: value) or JSON-ish ("key": "value",) line at its first
// unquoted ':'. Braces and the trailing comma outside quotes are dropped.
std::optional<ConfigEntry> splitConfigLine(const std::string& line) {
    std::string kept;
    kept.reserve(line.size());
    size_t sep = std::string::npos;
    char quote = 0;
    bool escaped = false;

    for (char c : line) {
        if (escaped) {
            escaped = false;
        } else if (quote != 0) {
            if (c == '\\') escaped = true;
            else if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{' || c == '}') {
            continue;
        } else if (c == ':' && sep == std::string::npos) {
            sep = kept.size();
        }
        kept.push_back(c);
    }
    if (sep == std::string::npos) return std::nullopt;

    std::string value = CommonUtils::trim(kept.substr(sep + 1));
    if (!value.empty() && value.back() == ',') value.pop_back();
    return ConfigEntry{unquote(kept.substr(0, sep)), unquote(value)};
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void assignKeyValue(CleaningConfig& config, const std::string& key, const std::string& value) {
    static const std::unordered_map<std::string, bool CleaningConfig::*> boolFields = {
        {"normalize_columns", &CleaningConfig::normalizeColumns},
        {"trim_whitespace", &CleaningConfig::trimWhitespace},
        {"drop_blank_rows", &CleaningConfig::dropBlankRows},
        {"drop_blank_cols", &CleaningConfig::dropBlankCols},
        {"drop_duplicates", &CleaningConfig::dropDuplicates},
        {"infer_types", &CleaningConfig::inferTypes},
        {"detect_outliers", &CleaningConfig::detectOutliers},
        {"verbose", &CleaningConfig::verbose}
    };
    static const std::unordered_map<std::string, std::string CleaningConfig::*> lowerStringFields = {
        {"outlier_method", &CleaningConfig::outlierMethod},
        {"outlier_action", &CleaningConfig::outlierAction},
        {"date_locale_hint", &CleaningConfig::dateLocaleHint}
    };

    if (auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(CommonUtils::trim(value));
        return;
    }
    if (key == "null_handling") {
        const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
        config.nullHandling = v.empty() ? "none" : v;
        return;
    }
    if (key == "fill_strategy") {
        const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
        if (v.empty()) {
            config.fillStrategy.reset();
        } else {
            config.fillStrategy = v;
        }
        return;
    }
    if (key == "fill_constant") {
        config.fillConstant = value;
        return;
    }
    if (key == "date_detect_thresh") {
        config.dateDetectThresh = parseDoubleStrict(value, key);
        return;
    }
    if (key == "outlier_threshold") {
        if (CommonUtils::trim(value).empty()) {
            config.outlierThreshold.reset();
        } else {
            config.outlierThreshold = parseDoubleStrict(value, key);
        }
        return;
    }
}
} // namespace

CleaningConfig CleaningConfig::fromOptions(const OptionMap& options) {
    CleaningConfig config;
    for (const auto& kv : options) {
        assignKeyValue(config, normalizeConfigKey(kv.first), kv.second);
    }
    config.validate();
    return config;
}

CleaningConfig CleaningConfig::fromFile(const std::string& configPath, const CleaningConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Scrub::IOException("Could not open config file: " + configPath);

    CleaningConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        const auto entry = splitConfigLine(line);
        if (!entry) continue;
        const std::string key = normalizeConfigKey(entry->key);
        const std::string& value = entry->value;

        try {
            assignKeyValue(config, key, value);
        } catch (const Scrub::ScrubException& ex) {
            throw Scrub::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void CleaningConfig::validate() const {
    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(nullHandling, {"none", "drop_rows", "fill"})) {
        throw Scrub::ConfigurationException("null_handling must be one of: none, drop_rows, fill");
    }
    if (fillStrategy && !isIn(*fillStrategy, {"mean", "median", "mode", "constant"})) {
        throw Scrub::ConfigurationException("fill_strategy must be one of: mean, median, mode, constant");
    }
    if (nullHandling == "fill" && !fillStrategy) {
        throw Scrub::ConfigurationException("null_handling=fill requires fill_strategy");
    }
    if (!isIn(outlierMethod, {"iqr", "zscore"})) {
        throw Scrub::ConfigurationException("outlier_method must be one of: iqr, zscore");
    }
    if (!isIn(outlierAction, {"report", "drop"})) {
        throw Scrub::ConfigurationException("outlier_action must be one of: report, drop");
    }
    if (!isIn(dateLocaleHint, {"auto", "dmy", "mdy"})) {
        throw Scrub::ConfigurationException("date_locale_hint must be one of: auto, dmy, mdy");
    }
    if (!std::isfinite(dateDetectThresh) || dateDetectThresh < 0.0 || dateDetectThresh > 1.0) {
        throw Scrub::ConfigurationException("date_detect_thresh must be within [0,1]");
    }
    if (outlierThreshold && (!std::isfinite(*outlierThreshold) || *outlierThreshold <= 0.0)) {
        throw Scrub::ConfigurationException("outlier_threshold must be > 0");
    }
}

double CleaningConfig::effectiveOutlierThreshold() const {
    if (outlierThreshold) return *outlierThreshold;
    return outlierMethod == "zscore" ? 3.0 : 1.5;
}

ValueParsing::DateLocaleHint CleaningConfig::dateHint() const {
    if (dateLocaleHint == "dmy") return ValueParsing::DateLocaleHint::DMY;
    if (dateLocaleHint == "mdy") return ValueParsing::DateLocaleHint::MDY;
    return ValueParsing::DateLocaleHint::AUTO;
}
