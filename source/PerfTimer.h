#ifndef TOKENMATCHER_PERFTIMER_H
#define TOKENMATCHER_PERFTIMER_H

#include <chrono>
#include <string>
#include <vector>
#include <utility>

/**
 * Utility for timing things. Each milestone records the time since the timer was created;
 * durations() gives the time between consecutive milestones.
 */
class PerfTimer {
    using clock = std::chrono::steady_clock;

    clock::time_point start_instant;
    std::vector<std::pair<std::string, clock::duration>> milestones;

public:
    PerfTimer() : start_instant(clock::now()) {};

    void add_milestone(std::string name);

    std::vector<std::pair<std::string, std::chrono::microseconds>> durations() const;

    // "name: 12us, name: 3us"
    std::string as_string() const;
};

#endif //TOKENMATCHER_PERFTIMER_H
