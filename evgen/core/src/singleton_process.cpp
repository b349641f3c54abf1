#include <evgen/core/singleton_process.hpp>
#include <evgen/core/checks.hpp>

#include <utility>

namespace evgen::core {

SingletonProcess::SingletonProcess(std::string name, Tick duration, Tick arrival)
    : name_(std::move(name))
    , duration_(duration)
    , arrival_(arrival) {
    require_non_negative(duration_, "duration");
    require_non_negative(arrival_, "arrival");
}

std::vector<Event> SingletonProcess::generate_events() const {
    return {Event{name_, arrival_, duration_}};
}

} // namespace evgen::core
