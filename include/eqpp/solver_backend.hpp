#ifndef EQPP_SOLVER_BACKEND_HPP
#define EQPP_SOLVER_BACKEND_HPP

#include "eqpp/compiled_system.hpp"
#include "eqpp/solver_options.hpp"

#include <functional>
#include <memory>
#include <string>

namespace eqpp {

/**
 * @brief Abstract base class for numerical integrators.
 *
 * A backend integrates one compiled system from one initial state and reports
 * samples on the grid given by sample_times(span, options.num_points).
 * Numerical trouble is returned as IntegrationOutcome::failure together with
 * the samples gathered so far; backends never throw for it.
 */
class SolverBackend {
  public:
    virtual ~SolverBackend() = default;

    /**
     * @brief Integrates `system` from `initial` over `span`.
     *
     * @throws DimensionMismatchError if initial.size() != system.dimension()
     */
    virtual IntegrationOutcome integrate(const CompiledSystem &system,
                                         const State &initial,
                                         const TimeSpan &span,
                                         const SolverOptions &options) const = 0;

    virtual BackendKind kind() const = 0;

    virtual std::string name() const { return to_string(kind()); }
};

/**
 * @brief Explicit embedded Runge-Kutta pair with odeint's standard step size
 * controller (dopri5, cash_karp54 or fehlberg78).
 */
class AdaptiveRungeKuttaBackend : public SolverBackend {
  public:
    explicit AdaptiveRungeKuttaBackend(BackendKind kind);

    IntegrationOutcome integrate(const CompiledSystem &system,
                                 const State &initial,
                                 const TimeSpan &span,
                                 const SolverOptions &options) const override;

    BackendKind kind() const override { return kind_; }

  private:
    BackendKind kind_;
};

/**
 * @brief Linearly implicit Rosenbrock method for stiff systems. The Jacobian
 * and the explicit time derivative come from forward differences of the
 * compiled right-hand side.
 */
class RosenbrockBackend : public SolverBackend {
  public:
    IntegrationOutcome integrate(const CompiledSystem &system,
                                 const State &initial,
                                 const TimeSpan &span,
                                 const SolverOptions &options) const override;

    BackendKind kind() const override { return BackendKind::Rosenbrock4; }
};

/**
 * @brief Classic fixed-step RK4. Takes one step per reporting interval, or as
 * many equal sub-steps as needed to respect options.max_step.
 */
class FixedStepRk4Backend : public SolverBackend {
  public:
    IntegrationOutcome integrate(const CompiledSystem &system,
                                 const State &initial,
                                 const TimeSpan &span,
                                 const SolverOptions &options) const override;

    BackendKind kind() const override { return BackendKind::FixedRk4; }
};

std::unique_ptr<SolverBackend>
make_backend(BackendKind kind);

using BackendFactory = std::function<std::unique_ptr<SolverBackend>(BackendKind)>;

} // namespace eqpp

#endif // EQPP_SOLVER_BACKEND_HPP
