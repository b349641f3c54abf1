#include <evgen/core/core.hpp>
#include <evgen/io/io.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace core = evgen::core;
namespace io = evgen::io;

enum class OutputFormat { Text, Json };

struct Config {
    std::string config_file;
    std::optional<uint64_t> seed;
    OutputFormat format{OutputFormat::Text};
    std::string output_file{"-"};
    bool summary{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("evgen", "Arrival event stream generator for discrete-event simulation");

    // clang-format off
    options.add_options()
        ("c,config", "Process definitions (JSON, required)", cxxopts::value<std::string>())
        ("seed", "Base seed for stochastic processes without their own seed",
            cxxopts::value<uint64_t>())
        ("f,format", "Output format: 'text' or 'json' (default: text)",
            cxxopts::value<std::string>()->default_value("text"))
        ("o,output", "Output file (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("summary", "Print per-process statistics to stderr")
        ("h,help", "Show help");
    // clang-format on

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    Config config;

    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
    } else {
        std::cerr << "Error: --config (-c) is required" << std::endl;
        std::exit(64);
    }

    if (result.count("seed") != 0U) {
        config.seed = result["seed"].as<uint64_t>();
    }

    std::string format_str = result["format"].as<std::string>();
    if (format_str == "text") {
        config.format = OutputFormat::Text;
    } else if (format_str == "json") {
        config.format = OutputFormat::Json;
    } else {
        std::cerr << "Error: --format must be 'text' or 'json'" << std::endl;
        std::exit(64);
    }

    config.output_file = result["output"].as<std::string>();
    config.summary = result.count("summary") != 0U;

    return config;
}

void write_events(const Config& config, const std::vector<core::Event>& events, std::ostream& out) {
    if (config.format == OutputFormat::Json) {
        io::write_events_json(events, out);
    } else {
        io::write_events_text(events, out);
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        auto processes = io::load_processes(config.config_file, config.seed);
        auto events = core::generate_all(processes);

        if (config.output_file == "-") {
            write_events(config, events, std::cout);
        } else {
            std::ofstream outfile(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open file: " << config.output_file << std::endl;
                return 1;
            }
            write_events(config, events, outfile);
        }

        if (config.summary) {
            io::write_summary_text(io::summarize(events), std::cerr);
        }

        std::cerr << "Generated " << events.size() << " events from " << processes.size()
                  << " processes" << std::endl;
        return 0;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
