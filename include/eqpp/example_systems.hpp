#ifndef EQPP_EXAMPLE_SYSTEMS_HPP
#define EQPP_EXAMPLE_SYSTEMS_HPP

#include "eqpp/job.hpp"

#include <map>
#include <string>
#include <vector>

namespace eqpp {
namespace examples {

/**
 * @brief A ready-to-submit equation set with its usual parameters and initial
 * conditions.
 */
struct ExampleSystem {
    std::string name;
    std::string equations;
    std::map<std::string, double> parameters;
    std::vector<State> initial_conditions;
    TimeSpan span;
};

/**
 * @brief Lotka-Volterra predator/prey.
 *
 * Equations:
 *   dx/dt = alpha*x - beta*x*y
 *   dy/dt = delta*x*y - gamma*y
 * Parameters: alpha, beta, delta, gamma
 */
ExampleSystem
lotka_volterra_system();

// dx/dt = -k*x, analytic solution x0*exp(-k*t)
ExampleSystem
exponential_decay_system(double k = 0.5);

// x'' = -omega^2 x written as a first order pair; energy is conserved.
ExampleSystem
harmonic_oscillator_system(double omega = 1.0);

// Van der Pol oscillator; stiff for large mu.
ExampleSystem
van_der_pol_system(double mu = 1.0);

// {D(x), D(y)} == {x - y, x*y} from two starting points over [0, 10]
ExampleSystem
coupled_growth_system();

std::vector<ExampleSystem>
all_example_systems();

JobRequest
make_request(const ExampleSystem &system, const SolverOptions &options = {});

} // namespace examples
} // namespace eqpp

#endif // EQPP_EXAMPLE_SYSTEMS_HPP
