#include <evgen/io/event_writers.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <string>

namespace evgen::io {

namespace {

constexpr int NUMBER_WIDTH = 12;

// Column width for process names: the longest name, at least the header
template<typename Range, typename NameOf>
int name_width(const Range& items, NameOf name_of, std::size_t header_len) {
    std::size_t width = header_len;
    for (const auto& item : items) {
        width = std::max(width, name_of(item).size());
    }
    return static_cast<int>(width);
}

} // anonymous namespace

void write_events_json(const std::vector<core::Event>& events, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("events");
    writer.StartArray();

    for (const auto& event : events) {
        writer.StartObject();

        writer.Key("process");
        writer.String(event.process_name().c_str(),
                      static_cast<rapidjson::SizeType>(event.process_name().size()));

        writer.Key("arrival");
        writer.Int64(event.arrival_time());

        writer.Key("duration");
        writer.Int64(event.duration());

        writer.EndObject();
    }

    writer.EndArray();
    writer.EndObject();

    out << buffer.GetString() << '\n';
}

void write_events_text(const std::vector<core::Event>& events, std::ostream& out) {
    int width = name_width(events, [](const core::Event& e) -> const std::string& {
        return e.process_name();
    }, std::string("process").size());

    out << std::left << std::setw(width) << "process"
        << std::right << std::setw(NUMBER_WIDTH) << "arrival"
        << std::setw(NUMBER_WIDTH) << "duration" << '\n';

    for (const auto& event : events) {
        out << std::left << std::setw(width) << event.process_name()
            << std::right << std::setw(NUMBER_WIDTH) << event.arrival_time()
            << std::setw(NUMBER_WIDTH) << event.duration() << '\n';
    }
}

void write_summary_text(const std::vector<ProcessSummary>& summaries, std::ostream& out) {
    int width = name_width(summaries, [](const ProcessSummary& s) -> const std::string& {
        return s.name;
    }, std::string("process").size());

    out << std::left << std::setw(width) << "process"
        << std::right << std::setw(NUMBER_WIDTH) << "events"
        << std::setw(NUMBER_WIDTH) << "first"
        << std::setw(NUMBER_WIDTH) << "last"
        << std::setw(NUMBER_WIDTH) << "mean_dur"
        << std::setw(NUMBER_WIDTH) << "mean_gap" << '\n';

    const auto saved_flags = out.flags();
    const auto saved_precision = out.precision();

    out << std::fixed << std::setprecision(2);
    for (const auto& summary : summaries) {
        out << std::left << std::setw(width) << summary.name
            << std::right << std::setw(NUMBER_WIDTH) << summary.event_count
            << std::setw(NUMBER_WIDTH) << summary.first_arrival
            << std::setw(NUMBER_WIDTH) << summary.last_arrival
            << std::setw(NUMBER_WIDTH) << summary.mean_duration
            << std::setw(NUMBER_WIDTH) << summary.mean_interarrival << '\n';
    }
    out.flags(saved_flags);
    out.precision(saved_precision);
}

} // namespace evgen::io
