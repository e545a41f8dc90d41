#include "PerfTimer.h"
#include <fmt/format.h>

void PerfTimer::add_milestone(std::string name) {
    milestones.emplace_back(std::move(name), clock::now() - start_instant);
}

std::vector<std::pair<std::string, std::chrono::microseconds>> PerfTimer::durations() const {
    using namespace std::chrono;

    std::vector<std::pair<std::string, microseconds>> result;
    result.reserve(milestones.size());

    clock::duration prev{0};
    for (auto &[name, elapsed] : milestones) {
        result.emplace_back(name, duration_cast<microseconds>(elapsed - prev));
        prev = elapsed;
    }
    return result;
}

std::string PerfTimer::as_string() const {
    std::vector<std::string> parts;
    for (auto &[name, duration] : durations()) {
        parts.push_back(fmt::format("{}: {}us", name, duration.count()));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}
