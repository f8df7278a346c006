#include <hjbfd/pde/Solver.h>
#include <hjbfd/pde/Errors.h>
#include <hjbfd/utils/InterpolationSchemes.h>
#include <boost/numeric/odeint.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace odeint = boost::numeric::odeint;

using state_type = std::vector<double>;

// ============================================================================
// SolverSettings
// ============================================================================

void SolverSettings::validate() const
{
    if (!(absTol >= 0.0) || !(relTol >= 0.0) || (absTol == 0.0 && relTol == 0.0)) {
        throw std::invalid_argument("SolverSettings: Tolerances must be non-negative and not both zero");
    }
    if (!(initialStep > 0.0)) {
        throw std::invalid_argument("SolverSettings: initialStep must be positive");
    }
    if (!(minStep > 0.0) || minStep > initialStep) {
        throw std::invalid_argument("SolverSettings: minStep must be positive and not exceed initialStep");
    }
    if (maxSteps == 0) {
        throw std::invalid_argument("SolverSettings: maxSteps must be at least 1");
    }
    if (denseSubdivisions == 0) {
        throw std::invalid_argument("SolverSettings: denseSubdivisions must be at least 1");
    }
}

// ============================================================================
// HJBSolution
// ============================================================================

HJBSolution::HJBSolution(const Grid& grid,
                         std::vector<double> times,
                         std::vector<std::vector<double>> values,
                         std::vector<std::vector<double>> derivatives,
                         size_t acceptedSteps)
    : _grid(grid),
      _times(std::move(times)),
      _values(std::move(values)),
      _derivatives(std::move(derivatives)),
      _acceptedSteps(acceptedSteps)
{
    if (_times.size() < 2) {
        throw std::invalid_argument("HJBSolution: Need at least 2 time nodes");
    }
    if (_acceptedSteps == 0) {
        _acceptedSteps = _times.size() - 1;
    }
    if (_values.size() != _times.size() || _derivatives.size() != _times.size()) {
        throw std::invalid_argument("HJBSolution: times, values and derivatives must have same size");
    }
    for (size_t k = 0; k < _times.size(); ++k) {
        if (_values[k].size() != _grid.size() || _derivatives[k].size() != _grid.size()) {
            throw std::invalid_argument("HJBSolution: Node " + std::to_string(k) + " does not match grid size");
        }
        if (k > 0 && !(_times[k] > _times[k-1])) {
            throw std::invalid_argument("HJBSolution: times must be strictly increasing");
        }
    }
}

size_t HJBSolution::findInterval(double t) const
{
    if (t < _times.front() || t > _times.back()) {
        throw std::out_of_range("HJBSolution: t = " + std::to_string(t) + " outside ["
                                + std::to_string(_times.front()) + ", " + std::to_string(_times.back()) + "]");
    }

    auto it = std::upper_bound(_times.begin(), _times.end(), t);
    if (it == _times.end()) {
        return _times.size() - 2;
    }
    if (it == _times.begin()) {
        return 0;
    }
    return std::distance(_times.begin(), it) - 1;
}

std::vector<double> HJBSolution::operator()(double t) const
{
    size_t k = findInterval(t);

    double h = _times[k+1] - _times[k];
    double s = (t - _times[k]) / h;
    double s2 = s * s;
    double s3 = s2 * s;

    // Cubic Hermite basis on [t_k, t_{k+1}]
    double h00 = 2.0 * s3 - 3.0 * s2 + 1.0;
    double h10 = s3 - 2.0 * s2 + s;
    double h01 = -2.0 * s3 + 3.0 * s2;
    double h11 = s3 - s2;

    const auto& v0 = _values[k];
    const auto& v1 = _values[k+1];
    const auto& f0 = _derivatives[k];
    const auto& f1 = _derivatives[k+1];

    std::vector<double> v(_grid.size());
    for (size_t i = 0; i < v.size(); ++i) {
        v[i] = h00 * v0[i] + h10 * h * f0[i] + h01 * v1[i] + h11 * h * f1[i];
    }
    return v;
}

double HJBSolution::valueAt(double x, double t) const
{
    CubicSplineInterpolation spline(_grid.points(), (*this)(t));
    return spline.interpolate(x);
}

double HJBSolution::gradientAt(double x, double t) const
{
    CubicSplineInterpolation spline(_grid.points(), (*this)(t));
    return spline.derivative(x);
}

// ============================================================================
// BackwardSolver
// ============================================================================

BackwardSolver::BackwardSolver(const HJBModel& model, double T, const SolverSettings& settings)
    : _model(model), _T(T), _settings(settings)
{
    if (!std::isfinite(_T) || _T <= 0.0) {
        throw std::invalid_argument("BackwardSolver: T must be positive and finite");
    }
    _settings.validate();
}

HJBSolution BackwardSolver::solve() const
{
    return solve(_model.terminalValue(_T));
}

HJBSolution BackwardSolver::solve(const std::vector<double>& vT) const
{
    const size_t M = _model.size();
    if (vT.size() != M) {
        throw std::invalid_argument("BackwardSolver::solve: Terminal vector has size " + std::to_string(vT.size())
                                    + ", expected " + std::to_string(M));
    }

    const HJBModel& model = _model;
    auto system = [&model](const state_type& v, state_type& dvdt, double t) {
        model(v, dvdt, t);
    };

    auto stepper = odeint::make_dense_output(_settings.absTol, _settings.relTol,
                                             odeint::runge_kutta_dopri5<state_type>());

    // Nodes are recorded from T downwards, reversed at the end
    std::vector<double> times;
    std::vector<std::vector<double>> values;
    std::vector<std::vector<double>> derivatives;

    const size_t nSub = _settings.denseSubdivisions;

    times.push_back(_T);
    values.push_back(vT);
    derivatives.push_back(model.rhs(vT, _T));

    // negative: T -> 0
    stepper.initialize(vT, _T, -std::min(_settings.initialStep, _T));

    size_t accepted = 0;
    state_type v(M);
    try {
        while (stepper.current_time() > 0.0) {
            if (accepted == _settings.maxSteps) {
                throw IntegrationError("BackwardSolver::solve: Exceeded " + std::to_string(_settings.maxSteps)
                                       + " steps at t = " + std::to_string(stepper.current_time()));
            }

            std::pair<double, double> step = stepper.do_step(system);
            ++accepted;

            const double tOld = step.first;
            const double tNew = step.second;
            const double tEnd = std::max(tNew, 0.0);  // the last step may overshoot 0

            for (size_t k = 1; k <= nSub; ++k) {
                double t = (k == nSub) ? tEnd : tOld + (tEnd - tOld) * static_cast<double>(k) / static_cast<double>(nSub);
                if (k == nSub && tEnd == tNew) {
                    v = stepper.current_state();
                } else {
                    stepper.calc_state(t, v);
                }

                for (size_t i = 0; i < M; ++i) {
                    if (!std::isfinite(v[i])) {
                        throw IntegrationError("BackwardSolver::solve: Non-finite value at t = " + std::to_string(t));
                    }
                }
                times.push_back(t);
                values.push_back(v);
                derivatives.push_back(model.rhs(v, t));
            }

            if (tNew > 0.0 && std::abs(stepper.current_time_step()) < _settings.minStep) {
                throw IntegrationError("BackwardSolver::solve: Step size "
                                       + std::to_string(std::abs(stepper.current_time_step()))
                                       + " below minimum at t = " + std::to_string(tNew));
            }
        }
    } catch (const odeint::odeint_error& e) {
        throw IntegrationError(std::string("BackwardSolver::solve: ") + e.what());
    }

    std::reverse(times.begin(), times.end());
    std::reverse(values.begin(), values.end());
    std::reverse(derivatives.begin(), derivatives.end());

    return HJBSolution(_model.grid(), std::move(times), std::move(values), std::move(derivatives), accepted);
}
