#include <evgen/core/event.hpp>

namespace evgen::core {

std::vector<ScheduledEvent> annotate(const std::vector<Event>& events) {
    std::vector<ScheduledEvent> result;
    result.reserve(events.size());
    for (const auto& event : events) {
        result.push_back(ScheduledEvent{event, EventTiming{}});
    }
    return result;
}

} // namespace evgen::core
