#include "eqpp/compiled_system.hpp"
#include "eqpp/example_systems.hpp"
#include "eqpp/solver_backend.hpp"

#include <iostream>
#include <string>

using namespace eqpp;

int
main(int argc, char **argv) {
    examples::ExampleSystem lv = examples::lotka_volterra_system();

    // Optional method name, e.g. "rk4" or "rosenbrock4"
    SolverOptions options;
    options.num_points = 501;
    if (argc > 1) {
        auto kind = parse_backend_kind(argv[1]);
        if (!kind) {
            std::cerr << "Unknown method '" << argv[1] << "'" << std::endl;
            return 1;
        }
        options.backend = *kind;
    }

    BindOptions bind_options;
    bind_options.parameters = lv.parameters;
    CompiledSystemPtr system;
    try {
        system = compile_source(lv.equations, bind_options);
    } catch (const std::exception &e) {
        std::cerr << "Could not compile equations: " << e.what() << std::endl;
        return 1;
    }

    auto backend = make_backend(options.backend);
    IntegrationOutcome outcome = backend->integrate(*system, lv.initial_conditions.front(), lv.span, options);

    // Print header for output
    std::cout << "t";
    for (const auto &name : system->state_variables()) { std::cout << ", " << name; }
    std::cout << '\n';

    for (std::size_t k = 0; k < outcome.trajectory.size(); ++k) {
        std::cout << outcome.trajectory.times[k];
        for (double v : outcome.trajectory.states[k]) { std::cout << ", " << v; }
        std::cout << '\n';
    }

    std::cerr << "[lotka_volterra] " << backend->name() << ": " << outcome.steps << " accepted steps, "
              << outcome.rejected << " rejected" << std::endl;
    if (outcome.failure) {
        std::cerr << "[lotka_volterra] integration failed: " << outcome.failure->message << std::endl;
        return 2;
    }
    return 0;
}
