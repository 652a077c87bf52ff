#include "eqpp/config.hpp"

#include "eqpp/errors.hpp"
#include "eqpp/serialization.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <vector>

namespace eqpp {

namespace {

void
read_size(const nlohmann::json &j, const char *key, std::size_t &out, std::size_t minimum) {
    auto it = j.find(key);
    if (it == j.end()) { return; }
    if (!it->is_number_integer() || it->get<std::int64_t>() < static_cast<std::int64_t>(minimum)) {
        throw ConfigError(std::string("config: '") + key + "' must be an integer >= " + std::to_string(minimum));
    }
    out = static_cast<std::size_t>(it->get<std::int64_t>());
}

} // namespace

EngineConfig
config_from_json(const nlohmann::json &j) {
    if (!j.is_object()) { throw ConfigError("config: top level must be a JSON object"); }

    EngineConfig config;
    OrchestratorConfig &orch = config.orchestrator;
    read_size(j, "worker_threads", orch.worker_threads, 1);
    read_size(j, "max_pending_requests", orch.max_pending_requests, 0);
    read_size(j, "system_cache_capacity", orch.system_cache_capacity, 1);

    if (j.contains("verbose")) {
        if (!j.at("verbose").is_boolean()) { throw ConfigError("config: 'verbose' must be a boolean"); }
        orch.verbose = j.at("verbose").get<bool>();
    }

    if (j.contains("store_directory") && !j.at("store_directory").is_null()) {
        if (!j.at("store_directory").is_string()) { throw ConfigError("config: 'store_directory' must be a string"); }
        config.store_directory = j.at("store_directory").get<std::string>();
    }

    if (j.contains("defaults")) {
        std::vector<FieldError> errors;
        orch.default_options = parse_solver_options(j.at("defaults"), orch.default_options, "defaults", errors);
        if (!errors.empty()) {
            std::ostringstream oss;
            oss << "config:";
            for (const FieldError &e : errors) { oss << " " << e.field << ": " << e.message << ";"; }
            throw ConfigError(oss.str());
        }
    }
    return config;
}

EngineConfig
load_config(const std::string &path) {
    std::ifstream in(path);
    if (!in.is_open()) { throw ConfigError("Could not open config file: " + path); }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error &e) {
        throw ConfigError("JSON parsing error in config file '" + path + "': " + std::string(e.what()));
    }
    return config_from_json(j);
}

nlohmann::json
config_to_json(const EngineConfig &config) {
    const OrchestratorConfig &orch = config.orchestrator;
    return nlohmann::json{ { "worker_threads", orch.worker_threads },
                           { "max_pending_requests", orch.max_pending_requests },
                           { "system_cache_capacity", orch.system_cache_capacity },
                           { "verbose", orch.verbose },
                           { "store_directory", config.store_directory },
                           { "defaults", orch.default_options } };
}

} // namespace eqpp
