#ifndef HJBFD_SOLVER_H
#define HJBFD_SOLVER_H

#include <hjbfd/pde/Grid.h>
#include <hjbfd/pde/HJBModel.h>
#include <vector>

/**
 * =============================================================================
 * BACKWARD TIME INTEGRATION
 * =============================================================================
 * Integrates the semi-discrete system
 *
 *   dv/dt = (rho*I - L) v - r(.,t),    v(T) = vT
 *
 * from t = T down to t = 0 with an error-controlled Dormand-Prince 5(4)
 * dense-output stepper (Boost.Odeint). The time step is negative: the interval
 * runs T -> 0 and the right-hand side keeps its sign. The last step may pass
 * t = 0; the state at 0 comes from the stepper's continuous extension.
 *
 * Forward in t, A = rho*I - L has eigenvalues with positive real part, so the
 * backward direction is the stable one.
 */

/**
 * Error-control and step-budget settings
 */
struct SolverSettings
{
    double absTol = 1e-8;       // absolute error tolerance per step
    double relTol = 1e-8;       // relative error tolerance per step
    double initialStep = 1e-3;  // |dt| of the first attempted step
    double minStep = 1e-12;     // a proposed |dt| below this is a failure
    size_t maxSteps = 100000;   // accepted steps
    size_t denseSubdivisions = 8;  // dense-output nodes stored per accepted step

    void validate() const;
};

/**
 * @class HJBSolution
 * @brief Continuous-in-time solution v(t) on [0, T]
 *
 * Stores nodes (t_k, v_k, dv/dt_k) in increasing time and evaluates between
 * them with cubic Hermite interpolation, so v(t) can be queried at any t in
 * [0, T]. The solver fills every accepted step with several nodes taken from
 * the stepper's continuous extension, which keeps the Hermite error below the
 * step tolerance. Spatial queries use a natural cubic spline of v(., t).
 */
class HJBSolution
{
public:
    HJBSolution(const Grid& grid,
                std::vector<double> times,
                std::vector<std::vector<double>> values,
                std::vector<std::vector<double>> derivatives,
                size_t acceptedSteps = 0);

    /**
     * Value vector at time t (M components)
     * @throws std::out_of_range if t is outside [0, T]
     */
    std::vector<double> operator()(double t) const;
    std::vector<double> valueAt(double t) const { return (*this)(t); }

    // v(x, t) for any x in the grid range
    double valueAt(double x, double t) const;

    // ∂v/∂x (x, t) from the spline
    double gradientAt(double x, double t) const;

    const Grid& grid() const { return _grid; }
    size_t size() const { return _grid.size(); }

    double initialTime() const { return _times.front(); }
    double terminalTime() const { return _times.back(); }

    size_t numSteps() const { return _acceptedSteps; }  // accepted integrator steps
    size_t numNodes() const { return _times.size(); }
    const std::vector<double>& times() const { return _times; }

private:
    Grid _grid;
    std::vector<double> _times;                     // ascending, t_0 = 0, t_K = T
    std::vector<std::vector<double>> _values;       // v(t_k)
    std::vector<std::vector<double>> _derivatives;  // dv/dt(t_k)
    size_t _acceptedSteps;

    size_t findInterval(double t) const;
};

/**
 * @class BackwardSolver
 * @brief Terminal solve followed by backward integration to t = 0
 *
 * Holds a reference to the model: the model must outlive the solver.
 */
class BackwardSolver
{
public:
    /**
     * @param model Discretised HJB equation
     * @param T Terminal time (must be > 0)
     * @param settings Error control and step budget
     */
    BackwardSolver(const HJBModel& model, double T, const SolverSettings& settings = SolverSettings());

    BackwardSolver(const BackwardSolver&) = delete;
    BackwardSolver& operator=(const BackwardSolver&) = delete;

    /**
     * v(T) from HJBModel::terminalValue, then integrate to 0
     * @throws SingularSystemError from the terminal solve
     * @throws IntegrationError if a step cannot be completed
     */
    HJBSolution solve() const;

    /**
     * Integrate from a given terminal vector (size M)
     */
    HJBSolution solve(const std::vector<double>& vT) const;

    double terminalTime() const { return _T; }
    const SolverSettings& settings() const { return _settings; }
    const HJBModel& model() const { return _model; }

private:
    const HJBModel& _model;
    double _T;
    SolverSettings _settings;
};

#endif // HJBFD_SOLVER_H
