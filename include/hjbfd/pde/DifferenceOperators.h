#ifndef HJBFD_DIFFERENCEOPERATORS_H
#define HJBFD_DIFFERENCEOPERATORS_H

#include <hjbfd/math/LinearAlgebra.h>
#include <hjbfd/pde/Grid.h>
#include <hjbfd/pde/BoundaryConditions.h>

/**
 * =============================================================================
 * FINITE DIFFERENCE OPERATORS
 * =============================================================================
 * Dense M x M matrices on a uniform grid x_0 < ... < x_{M-1}, spacing h.
 *
 *   D1 (backward):  (D1 v)_i = (v_i - v_{i-1}) / h
 *   D1 (forward):   (D1 v)_i = (v_{i+1} - v_i) / h
 *   D2 (central):   (D2 v)_i = (v_{i-1} - 2 v_i + v_{i+1}) / h²
 *
 * Stencil points that fall outside the grid are ghost nodes v_{-1}, v_M,
 * folded back onto the boundary node through the boundary condition:
 *   v_{-1} = w_lower * v_0,   v_M = w_upper * v_{M-1}
 *
 * Reflecting boundaries (w = 1) give:
 *   backward D1 row 0 = 0, forward D1 row M-1 = 0
 *   D2 row 0   = (-v_0 + v_1) / h²
 *   D2 row M-1 = (v_{M-2} - v_{M-1}) / h²
 * so every row of D1 and D2 sums to zero (no flux through the boundary).
 */

/**
 * Upwind direction of the first derivative stencil
 * Backward is the upwind choice for negative drift, Forward for positive drift.
 */
enum class UpwindDirection { Backward, Forward };

struct DifferenceOperators
{
    Matrix D1;  // first derivative
    Matrix D2;  // second derivative
};

class FiniteDifference
{
public:
    static Matrix firstDerivative(const Grid& grid, const BoundaryConditions& bc,
                                  UpwindDirection direction = UpwindDirection::Backward);

    static Matrix secondDerivative(const Grid& grid, const BoundaryConditions& bc);

    static DifferenceOperators assemble(const Grid& grid, const BoundaryConditions& bc,
                                        UpwindDirection direction = UpwindDirection::Backward);

    /**
     * Generator of dX = mu dt + sigma dW
     * @return L = mu * D1 + (sigma² / 2) * D2
     */
    static Matrix combine(double mu, double sigma, const Matrix& D1, const Matrix& D2);

private:
    FiniteDifference() = delete;

    // first stencil offset of D1, throws std::invalid_argument for an unknown direction
    static long upwindOffset(UpwindDirection direction);

    // add coeff * v_{i+offset} to row i, folding ghost nodes onto the boundary node
    static void addStencilEntry(Matrix& A, size_t i, long offset, double coeff,
                                double wLower, double wUpper);
};

#endif // HJBFD_DIFFERENCEOPERATORS_H
