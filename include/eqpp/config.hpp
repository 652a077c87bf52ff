#ifndef EQPP_CONFIG_HPP
#define EQPP_CONFIG_HPP

#include "eqpp/solver_options.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace eqpp {

struct OrchestratorConfig {
    std::size_t worker_threads = 4;
    std::size_t max_pending_requests = 0; // 0 = unbounded
    std::size_t system_cache_capacity = 64;
    bool verbose = false;
    SolverOptions default_options; // request "integrator" fields override these
};

struct EngineConfig {
    OrchestratorConfig orchestrator;
    std::string store_directory; // empty = in-memory store
};

/**
 * @brief Reads configuration from a JSON object. Missing keys keep their
 * defaults.
 * @throws ConfigError on wrong types or out-of-range values.
 */
EngineConfig
config_from_json(const nlohmann::json &j);

/**
 * @throws ConfigError if the file cannot be read or parsed.
 */
EngineConfig
load_config(const std::string &path);

nlohmann::json
config_to_json(const EngineConfig &config);

} // namespace eqpp

#endif // EQPP_CONFIG_HPP
