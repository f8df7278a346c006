#ifndef HJBFD_HJBMODEL_H
#define HJBFD_HJBMODEL_H

#include <hjbfd/math/LinearAlgebra.h>
#include <hjbfd/pde/Grid.h>
#include <hjbfd/pde/BoundaryConditions.h>
#include <hjbfd/pde/DifferenceOperators.h>
#include <hjbfd/pde/Payoff.h>
#include <memory>
#include <vector>

/**
 * =============================================================================
 * LINEAR HJB EQUATION
 * =============================================================================
 * Value function of a diffusion dX = mu dt + sigma dW on [x_min, x_max]:
 *
 *   rho*v = r(x,t) + mu*∂v/∂x + (sigma²/2)*∂²v/∂x² + ∂v/∂t
 *
 * After spatial discretisation with L = mu*D1 + (sigma²/2)*D2:
 *
 *   dv/dt = (rho*I - L)*v - r(.,t) = A*v - r(.,t)
 *
 * Terminal condition: ∂v/∂t = 0 at t = T, i.e. A*v(T) = r(.,T).
 */

/**
 * @class ModelParameters
 * @brief Immutable parameter record {mu, sigma, rho, grid, boundary conditions}
 */
class ModelParameters
{
public:
    /**
     * @param mu Drift
     * @param sigma Volatility (must be >= 0)
     * @param rho Discount rate
     * @param grid Spatial grid
     * @param bc Boundary conditions (default: reflecting on both sides)
     * @param upwind Stencil of the first derivative (default: Backward, for mu <= 0)
     */
    ModelParameters(double mu, double sigma, double rho, const Grid& grid,
                    const BoundaryConditions& bc = BoundaryConditions::reflecting(),
                    UpwindDirection upwind = UpwindDirection::Backward);

    double mu() const { return _mu; }
    double sigma() const { return _sigma; }
    double rho() const { return _rho; }
    const Grid& grid() const { return _grid; }
    const BoundaryConditions& boundaryConditions() const { return _bc; }
    UpwindDirection upwind() const { return _upwind; }

private:
    double _mu, _sigma, _rho;
    Grid _grid;
    BoundaryConditions _bc;
    UpwindDirection _upwind;
};

/**
 * @class HJBModel
 * @brief Discretised HJB equation: operators, terminal solve and ODE right-hand side
 *
 * D1, D2, L and A do not depend on t and are assembled once in the constructor.
 */
class HJBModel
{
public:
    HJBModel(const ModelParameters& params, const Payoff& payoff);

    // Prevent copying (owns the payoff and a cached factorisation)
    HJBModel(const HJBModel&) = delete;
    HJBModel& operator=(const HJBModel&) = delete;

    const ModelParameters& parameters() const { return _params; }
    const Grid& grid() const { return _params.grid(); }
    const Payoff& payoff() const { return *_payoff; }
    size_t size() const { return _params.grid().size(); }

    const Matrix& firstDerivative() const { return _ops.D1; }
    const Matrix& secondDerivative() const { return _ops.D2; }
    const Matrix& generator() const { return _L; }      // L
    const Matrix& systemMatrix() const { return _A; }   // rho*I - L

    /**
     * Stationary value at the terminal time: solves (rho*I - L) v = r(.,T)
     * @throws SingularSystemError if rho*I - L cannot be inverted
     */
    std::vector<double> terminalValue(double T) const;

    /**
     * ODE right-hand side: dvdt = (rho*I - L) v - r(.,t)
     * Signature matches the Boost.Odeint system concept.
     */
    void operator()(const std::vector<double>& v, std::vector<double>& dvdt, double t) const;

    std::vector<double> rhs(const std::vector<double>& v, double t) const;

private:
    ModelParameters _params;
    std::unique_ptr<Payoff> _payoff;

    DifferenceOperators _ops;
    Matrix _L;
    Matrix _A;

    // LU of A, built on the first terminal solve
    mutable std::unique_ptr<LUResult> _lu;

    const LUResult& getFactorization() const;
};

#endif // HJBFD_HJBMODEL_H
