#include "CleaningStages.h"
#include "CommonUtils.h"

#include <cctype>
#include <unordered_map>

namespace CleaningStages {

std::string normalizeColumnName(const std::string& name) {
    const std::string trimmed = CommonUtils::trim(name);

    std::string out;
    out.reserve(trimmed.size());
    bool inSpaceRun = false;
    for (char c : trimmed) {
        if (CommonUtils::isSpace(c)) {
            if (!inSpaceRun) out.push_back('_');
            inSpaceRun = true;
            continue;
        }
        inSpaceRun = false;
        const unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && (std::isalnum(uc) || c == '_')) {
            out.push_back(static_cast<char>(std::tolower(uc)));
        }
    }
    return out;
}

void normalizeColumnNames(DataTable& table, const CleaningConfig& config, CleaningReport& report) {
    report.colRenames.clear();
    if (!config.normalizeColumns) {
        report.addOutcome(kNormalizeStage, "", OutcomeStatus::SKIPPED, "disabled");
        return;
    }

    std::unordered_map<std::string, std::string> firstOwner;
    for (size_t c = 0; c < table.colCount(); ++c) {
        const std::string oldName = table.columns()[c].name;
        const std::string newName = normalizeColumnName(oldName);

        if (newName != oldName) {
            table.renameColumn(c, newName);
            report.colRenames.emplace_back(oldName, newName);
            report.addOutcome(kNormalizeStage, newName, OutcomeStatus::SUCCESS, "renamed from '" + oldName + "'");
        } else {
            report.addOutcome(kNormalizeStage, newName, OutcomeStatus::SKIPPED, "already normalized");
        }

        auto [it, inserted] = firstOwner.emplace(newName, oldName);
        if (!inserted) {
            logWarning(config, "Column '" + oldName + "' normalizes to '" + newName +
                               "', already used by '" + it->second + "'; both columns are kept");
        }
    }

    logStage(config, "Columns", "renamed " + std::to_string(report.colRenames.size()) + " column(s)");
}

} // namespace CleaningStages
