#include "ProgressTracker.hpp"
#include "../utils/Formatters.hpp"
#include "../utils/ILogger.hpp"
#include <algorithm>

ProgressTracker::ProgressTracker(uint64_t total, ILogger* log)
    : expectedTotal(total), interval(std::max(MIN_INTERVAL, total / MILESTONES)), current(0), logger(log) {}

bool ProgressTracker::update(uint64_t processed) {
    current = processed;
    if (processed == 0 || processed % interval != 0) {
        return false;
    }
    if (logger) {
        logger->info("Progress: " + formatProgress(processed, expectedTotal) + " (" +
                     formatNumber(processed) + "/" + formatNumber(expectedTotal) + " files)");
    }
    return true;
}

void ProgressTracker::finish() {
    if (logger) {
        logger->info("Processed " + formatNumber(current) + " files");
    }
}
