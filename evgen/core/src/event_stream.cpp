#include <evgen/core/event_stream.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>

namespace evgen::core {

std::vector<Event> merge_event_streams(std::vector<std::vector<Event>> streams) {
    std::size_t total = 0;
    for (const auto& stream : streams) {
        total += stream.size();
    }

    std::vector<Event> merged;
    merged.reserve(total);
    for (auto& stream : streams) {
        std::move(stream.begin(), stream.end(), std::back_inserter(merged));
    }

    std::stable_sort(merged.begin(), merged.end(), [](const Event& lhs, const Event& rhs) {
        return lhs.arrival_time() < rhs.arrival_time();
    });
    return merged;
}

std::vector<Event> generate_all(const std::vector<Process>& processes) {
    std::vector<std::vector<Event>> streams;
    streams.reserve(processes.size());
    for (const auto& process : processes) {
        streams.push_back(generate_events(process));
    }
    return merge_event_streams(std::move(streams));
}

} // namespace evgen::core
