#pragma once

#include <chrono>
#include <cstdint>
#include <limits>

namespace mazepath {

/// Optional guard on search effort: node expansions and wall-clock time.
/// The defaults never run out, so an unconfigured search is unbounded.
class BudgetManager {
public:
    BudgetManager(int64_t max_expansions = std::numeric_limits<int64_t>::max(),
                  double max_seconds = std::numeric_limits<double>::infinity())
        : max_expansions_(max_expansions), max_seconds_(max_seconds) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        expansions_ = 0;
    }

    void recordExpansion() { expansions_++; }

    bool canContinue() const {
        return !isExpansionExhausted() && !isTimeExhausted();
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int64_t expansions() const { return expansions_; }
    int64_t maxExpansions() const { return max_expansions_; }
    bool isExpansionExhausted() const { return expansions_ >= max_expansions_; }
    bool isTimeExhausted() const { return elapsedSeconds() >= max_seconds_; }

private:
    int64_t max_expansions_;
    double max_seconds_;
    int64_t expansions_ = 0;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace mazepath
