// Runs one job request file and prints its event stream as JSON lines,
// followed by the final record.
//
//   eqpp_run request.json [--config engine.json] [--store DIR] [--verbose]

#include "eqpp/config.hpp"
#include "eqpp/errors.hpp"
#include "eqpp/job_orchestrator.hpp"
#include "eqpp/serialization.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace eqpp;

namespace {

void
print_usage() {
    std::cerr << "usage: eqpp_run REQUEST.json [--config CONFIG.json] [--store DIR] [--verbose]" << std::endl;
}

nlohmann::json
read_json_file(const std::string &path) {
    std::ifstream in(path);
    if (!in.is_open()) { throw std::runtime_error("Could not open file: " + path); }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error("JSON parsing error in file '" + path + "': " + std::string(e.what()));
    }
}

void
print_invalid_request(const InvalidRequestError &e) {
    nlohmann::json problem = { { "title", "Invalid request payload" }, { "errors", e.errors() } };
    std::cout << problem.dump() << std::endl;
}

} // namespace

int
main(int argc, char **argv) {
    std::string request_path;
    std::string config_path;
    std::string store_override;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--store" && i + 1 < argc) {
            store_override = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (request_path.empty() && arg.rfind("--", 0) != 0) {
            request_path = arg;
        } else {
            print_usage();
            return 1;
        }
    }
    if (request_path.empty()) {
        print_usage();
        return 1;
    }

    EngineConfig config;
    try {
        if (!config_path.empty()) { config = load_config(config_path); }
    } catch (const ConfigError &e) {
        std::cerr << "[eqpp_run] ERROR: " << e.what() << std::endl;
        return 1;
    }
    if (!store_override.empty()) { config.store_directory = store_override; }
    if (verbose) { config.orchestrator.verbose = true; }

    std::shared_ptr<JobStore> store;
    try {
        if (config.store_directory.empty()) {
            store = std::make_shared<InMemoryJobStore>();
        } else {
            store = std::make_shared<FileJobStore>(config.store_directory);
        }
    } catch (const StoreError &e) {
        std::cerr << "[eqpp_run] ERROR: " << e.what() << std::endl;
        return 1;
    }

    JobOrchestrator orchestrator(config.orchestrator, store);

    JobHandle handle;
    try {
        JobRequest request = parse_request(read_json_file(request_path), config.orchestrator.default_options);
        handle = orchestrator.submit(request);
    } catch (const InvalidRequestError &e) {
        print_invalid_request(e);
        return 1;
    } catch (const DimensionMismatchError &e) {
        std::cerr << "[eqpp_run] ERROR: " << e.what() << std::endl;
        return 1;
    } catch (const ParseError &e) {
        std::cerr << "[eqpp_run] ERROR: parse error: " << e.what() << std::endl;
        return 1;
    } catch (const BindError &e) {
        std::cerr << "[eqpp_run] ERROR: " << e.what() << std::endl;
        return 1;
    } catch (const ResourceError &e) {
        std::cerr << "[eqpp_run] ERROR (retryable): " << e.what() << std::endl;
        return 3;
    } catch (const std::runtime_error &e) {
        std::cerr << "[eqpp_run] ERROR: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "[eqpp_run] job " << handle.id << " (dimension " << handle.dimension << ")" << std::endl;

    // Anything published before this point is already reflected in the record.
    Subscription events = orchestrator.subscribe(handle.id);
    while (auto event = events.next()) { std::cout << nlohmann::json(*event).dump() << std::endl; }

    orchestrator.wait(handle.id, std::chrono::hours(24));
    const JobRecord record = orchestrator.get_record(handle.id);
    std::cout << nlohmann::json(record).dump() << std::endl;
    return record.state == JobState::Finished ? 0 : 2;
}
