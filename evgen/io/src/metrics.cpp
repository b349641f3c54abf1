#include <evgen/io/metrics.hpp>

#include <algorithm>
#include <limits>
#include <unordered_map>
#include <utility>

namespace evgen::io {

namespace {

// Add without overflowing, clamping at the Tick range
core::Tick saturating_add(core::Tick lhs, core::Tick rhs) {
    constexpr core::Tick MAX_TICK = std::numeric_limits<core::Tick>::max();
    constexpr core::Tick MIN_TICK = std::numeric_limits<core::Tick>::min();
    if (rhs > 0 && lhs > MAX_TICK - rhs) {
        return MAX_TICK;
    }
    if (rhs < 0 && lhs < MIN_TICK - rhs) {
        return MIN_TICK;
    }
    return lhs + rhs;
}

} // anonymous namespace

std::vector<ProcessSummary> summarize(const std::vector<core::Event>& events) {
    std::vector<ProcessSummary> summaries;
    std::unordered_map<std::string, std::size_t> index_of;
    // Exact totals may saturate; means are taken from unclamped sums
    std::vector<double> duration_sums;

    for (const auto& event : events) {
        auto [iter, inserted] = index_of.try_emplace(event.process_name(), summaries.size());
        if (inserted) {
            ProcessSummary summary;
            summary.name = event.process_name();
            summary.first_arrival = event.arrival_time();
            summary.last_arrival = event.arrival_time();
            summaries.push_back(std::move(summary));
            duration_sums.push_back(0.0);
        }

        auto& summary = summaries[iter->second];
        ++summary.event_count;
        summary.total_duration = saturating_add(summary.total_duration, event.duration());
        duration_sums[iter->second] += static_cast<double>(event.duration());
        summary.first_arrival = std::min(summary.first_arrival, event.arrival_time());
        summary.last_arrival = std::max(summary.last_arrival, event.arrival_time());
    }

    for (std::size_t idx = 0; idx < summaries.size(); ++idx) {
        auto& summary = summaries[idx];
        summary.mean_duration = duration_sums[idx] / static_cast<double>(summary.event_count);
        if (summary.event_count > 1) {
            summary.mean_interarrival =
                (static_cast<double>(summary.last_arrival) - static_cast<double>(summary.first_arrival))
                / static_cast<double>(summary.event_count - 1);
        }
    }

    return summaries;
}

} // namespace evgen::io
