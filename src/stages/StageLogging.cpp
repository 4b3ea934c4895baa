#include "CleaningStages.h"

#include <iostream>

namespace CleaningStages {

void logStage(const CleaningConfig& config, const std::string& tag, const std::string& message) {
    if (!config.verbose) return;
    std::cout << "[Scrub][" << tag << "] " << message << "\n";
}

void logWarning(const CleaningConfig& config, const std::string& message) {
    if (!config.verbose) return;
    std::cerr << "[Scrub][Warning] " << message << "\n";
}

} // namespace CleaningStages
