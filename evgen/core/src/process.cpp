#include <evgen/core/process.hpp>

namespace evgen::core {

std::vector<Event> generate_events(const Process& process) {
    return std::visit([](const auto& proc) { return proc.generate_events(); }, process);
}

const std::string& process_name(const Process& process) {
    return std::visit(
        [](const auto& proc) -> const std::string& { return proc.name(); }, process);
}

} // namespace evgen::core
