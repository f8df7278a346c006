#include <hjbfd/pde/HJBModel.h>
#include <hjbfd/pde/Errors.h>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

// ============================================================================
// ModelParameters
// ============================================================================

ModelParameters::ModelParameters(double mu, double sigma, double rho, const Grid& grid,
                                 const BoundaryConditions& bc, UpwindDirection upwind)
    : _mu(mu), _sigma(sigma), _rho(rho), _grid(grid), _bc(bc), _upwind(upwind)
{
    if (!std::isfinite(_mu) || !std::isfinite(_sigma) || !std::isfinite(_rho)) {
        throw std::invalid_argument("ModelParameters: mu, sigma and rho must be finite");
    }
    if (_sigma < 0.0) {
        throw std::invalid_argument("ModelParameters: sigma must be non-negative");
    }
}

// ============================================================================
// HJBModel
// ============================================================================

HJBModel::HJBModel(const ModelParameters& params, const Payoff& payoff)
    : _params(params),
      _payoff(payoff.clone()),
      _ops(FiniteDifference::assemble(params.grid(), params.boundaryConditions(), params.upwind()))
{
    // L = mu*D1 + (sigma²/2)*D2,  A = rho*I - L
    _L = FiniteDifference::combine(_params.mu(), _params.sigma(), _ops.D1, _ops.D2);
    _A = MatrixOps::add(_params.rho(), MatrixOps::identity(size()), -1.0, _L);
}

const LUResult& HJBModel::getFactorization() const
{
    if (!_lu) {
        // throws SingularSystemError, nothing is cached on failure
        _lu = std::make_unique<LUResult>(LU::decompose(_A));

        double rcond = LU::reciprocalCondition(*_lu);
        if (rcond < 1e-12) {
            std::cerr << "WARNING [HJBModel]: rho*I - L is nearly singular (rcond = "
                      << rcond << "), terminal value may be inaccurate\n";
        }
    }
    return *_lu;
}

std::vector<double> HJBModel::terminalValue(double T) const
{
    if (!std::isfinite(T)) {
        throw std::invalid_argument("HJBModel::terminalValue: T must be finite");
    }

    std::vector<double> r = _payoff->evaluate(grid(), T);
    std::vector<double> vT = LU::solve(getFactorization(), r);

    for (size_t i = 0; i < vT.size(); ++i) {
        if (!std::isfinite(vT[i])) {
            throw SingularSystemError("HJBModel::terminalValue: Non-finite solution at grid point "
                                      + std::to_string(i));
        }
    }
    return vT;
}

void HJBModel::operator()(const std::vector<double>& v, std::vector<double>& dvdt, double t) const
{
    const size_t M = size();
    if (v.size() != M) {
        throw std::invalid_argument("HJBModel: State size " + std::to_string(v.size())
                                    + " does not match grid size " + std::to_string(M));
    }
    dvdt.resize(M);

    // dv/dt = A*v - r(x,t)
    for (size_t i = 0; i < M; ++i) {
        double Av = 0.0;
        for (size_t j = 0; j < M; ++j) {
            Av += _A[i][j] * v[j];
        }
        dvdt[i] = Av - _payoff->value(grid().point(i), t);
    }
}

std::vector<double> HJBModel::rhs(const std::vector<double>& v, double t) const
{
    std::vector<double> dvdt;
    (*this)(v, dvdt, t);
    return dvdt;
}
