#include "eqpp/example_systems.hpp"

namespace eqpp {
namespace examples {

ExampleSystem
lotka_volterra_system() {
    ExampleSystem system;
    system.name = "lotka_volterra";
    system.equations = "{x'[t], y'[t]} == {alpha*x[t] - beta*x[t]*y[t], delta*x[t]*y[t] - gamma*y[t]}";
    system.parameters = { { "alpha", 1.1 }, { "beta", 0.4 }, { "delta", 0.4 }, { "gamma", 0.1 } };
    system.initial_conditions = { { 10.0, 10.0 }, { 5.0, 2.0 } };
    system.span = TimeSpan{ 0.0, 50.0 };
    return system;
}

ExampleSystem
exponential_decay_system(double k) {
    ExampleSystem system;
    system.name = "exponential_decay";
    system.equations = "D(x) == -k*x";
    system.parameters = { { "k", k } };
    system.initial_conditions = { { 1.0 }, { 2.5 } };
    system.span = TimeSpan{ 0.0, 5.0 };
    return system;
}

ExampleSystem
harmonic_oscillator_system(double omega) {
    ExampleSystem system;
    system.name = "harmonic_oscillator";
    system.equations = "D(x) == v; D(v) == -omega^2*x";
    system.parameters = { { "omega", omega } };
    system.initial_conditions = { { 1.0, 0.0 } };
    system.span = TimeSpan{ 0.0, 10.0 };
    return system;
}

ExampleSystem
van_der_pol_system(double mu) {
    ExampleSystem system;
    system.name = "van_der_pol";
    system.equations = "{D[x[t], t], D[y[t], t]} == {y[t], mu*(1 - x[t]^2)*y[t] - x[t]}";
    system.parameters = { { "mu", mu } };
    system.initial_conditions = { { 2.0, 0.0 } };
    system.span = TimeSpan{ 0.0, 20.0 };
    return system;
}

ExampleSystem
coupled_growth_system() {
    ExampleSystem system;
    system.name = "coupled_growth";
    system.equations = "{D(x), D(y)} == {x - y, x*y}";
    system.initial_conditions = { { 1.0, 0.0 }, { 0.5, 0.5 } };
    system.span = TimeSpan{ 0.0, 10.0 };
    return system;
}

std::vector<ExampleSystem>
all_example_systems() {
    return { lotka_volterra_system(),
             exponential_decay_system(),
             harmonic_oscillator_system(),
             van_der_pol_system(),
             coupled_growth_system() };
}

JobRequest
make_request(const ExampleSystem &system, const SolverOptions &options) {
    JobRequest request;
    request.equations = system.equations;
    request.name = system.name;
    request.parameters = system.parameters;
    request.initial_conditions = system.initial_conditions;
    request.time_span = system.span;
    request.options = options;
    return request;
}

} // namespace examples
} // namespace eqpp
