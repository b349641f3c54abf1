#include <evgen/io/process_loader.hpp>
#include <evgen/io/error.hpp>

#include <evgen/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <utility>

namespace evgen::io {

namespace {

using namespace evgen::core;

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name, const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

Tick get_tick(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsInt64()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", context);
    }
    return member.GetInt64();
}

double get_double(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return std::string(member.GetString(), member.GetStringLength());
}

std::optional<std::uint64_t> get_seed_or(const rapidjson::Value& val, const std::string& context) {
    if (!val.HasMember("seed")) {
        return std::nullopt;
    }
    const auto& member = val["seed"];
    if (!member.IsUint64()) {
        throw LoaderError("field 'seed' must be a non-negative integer", context);
    }
    return member.GetUint64();
}

Process parse_process(const rapidjson::Value& obj,
                      const std::string& context,
                      std::optional<std::mt19937_64>& seeder) {
    if (!obj.IsObject()) {
        throw LoaderError("process entry must be an object", context);
    }

    std::string name = get_string(obj, "name", context);
    std::string type = get_string(obj, "type", context);

    if (type == "singleton") {
        return SingletonProcess(std::move(name),
                                get_tick(obj, "duration", context),
                                get_tick(obj, "arrival", context));
    }

    if (type == "periodic") {
        return PeriodicProcess(std::move(name),
                               get_tick(obj, "duration", context),
                               get_tick(obj, "interarrival_time", context),
                               get_tick(obj, "first_arrival", context),
                               get_tick(obj, "num_repetitions", context));
    }

    if (type == "stochastic") {
        auto seed = get_seed_or(obj, context);
        if (!seed.has_value() && seeder.has_value()) {
            seed = (*seeder)();
        }
        return StochasticProcess(std::move(name),
                                 get_double(obj, "mean_duration", context),
                                 get_double(obj, "mean_interarrival_time", context),
                                 get_tick(obj, "first_arrival", context),
                                 get_tick(obj, "end_time", context),
                                 seed);
    }

    throw LoaderError("unknown process type '" + type + "'", context);
}

std::vector<Process> parse_processes_impl(const rapidjson::Document& doc,
                                          std::optional<std::uint64_t> base_seed) {
    std::vector<Process> result;

    if (!doc.HasMember("processes")) {
        // No processes is a valid, empty configuration
        return result;
    }

    const auto& processes = doc["processes"];
    if (!processes.IsArray()) {
        throw LoaderError("field 'processes' must be an array", "config");
    }

    std::optional<std::mt19937_64> seeder;
    if (base_seed.has_value()) {
        seeder.emplace(base_seed.value());
    }

    std::set<std::string> names;
    result.reserve(processes.Size());

    for (rapidjson::SizeType pidx = 0; pidx < processes.Size(); ++pidx) {
        std::string ctx = "processes[" + std::to_string(pidx) + "]";

        try {
            result.push_back(parse_process(processes[pidx], ctx, seeder));
        } catch (const core::InvalidParameterError& e) {
            throw LoaderError(e.what(), ctx);
        }

        const auto& name = core::process_name(result.back());
        if (!names.insert(name).second) {
            throw LoaderError("duplicate process name '" + name + "'", ctx);
        }
    }

    return result;
}

} // anonymous namespace

std::vector<core::Process> load_processes(const std::filesystem::path& path,
                                          std::optional<std::uint64_t> base_seed) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_processes_from_string(oss.str(), base_seed);
}

std::vector<core::Process> load_processes_from_string(std::string_view json,
                                                      std::optional<std::uint64_t> base_seed) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "config");
    }

    return parse_processes_impl(doc, base_seed);
}

} // namespace evgen::io
