#include <hjbfd/pde/DifferenceOperators.h>
#include <stdexcept>
#include <string>

void FiniteDifference::addStencilEntry(Matrix& A, size_t i, long offset, double coeff,
                                       double wLower, double wUpper)
{
    const long M = static_cast<long>(A.size());
    const long j = static_cast<long>(i) + offset;

    if (j < 0) {
        // v_{-1} = w_lower * v_0
        A[i][0] += wLower * coeff;
    } else if (j >= M) {
        // v_M = w_upper * v_{M-1}
        A[i][static_cast<size_t>(M - 1)] += wUpper * coeff;
    } else {
        A[i][static_cast<size_t>(j)] += coeff;
    }
}

long FiniteDifference::upwindOffset(UpwindDirection direction)
{
    switch (direction) {
        case UpwindDirection::Backward:
            return -1;
        case UpwindDirection::Forward:
            return 0;
    }
    throw std::invalid_argument("FiniteDifference::firstDerivative: Unrecognized upwind direction "
                                + std::to_string(static_cast<int>(direction)));
}

Matrix FiniteDifference::firstDerivative(const Grid& grid, const BoundaryConditions& bc,
                                         UpwindDirection direction)
{
    // (v_{i+k+1} - v_{i+k}) / h with k = -1 (backward) or k = 0 (forward)
    const long k = upwindOffset(direction);

    const size_t M = grid.size();
    const double h = grid.dx();
    const double wLower = bc.lower().ghostCoefficient();
    const double wUpper = bc.upper().ghostCoefficient();

    Matrix D1 = MatrixOps::zeros(M, M);

    for (size_t i = 0; i < M; ++i) {
        addStencilEntry(D1, i, k,     -1.0 / h, wLower, wUpper);
        addStencilEntry(D1, i, k + 1,  1.0 / h, wLower, wUpper);
    }
    return D1;
}

Matrix FiniteDifference::secondDerivative(const Grid& grid, const BoundaryConditions& bc)
{
    const size_t M = grid.size();
    const double h2 = grid.dx() * grid.dx();
    const double wLower = bc.lower().ghostCoefficient();
    const double wUpper = bc.upper().ghostCoefficient();

    Matrix D2 = MatrixOps::zeros(M, M);

    for (size_t i = 0; i < M; ++i) {
        addStencilEntry(D2, i, -1,  1.0 / h2, wLower, wUpper);
        addStencilEntry(D2, i,  0, -2.0 / h2, wLower, wUpper);
        addStencilEntry(D2, i,  1,  1.0 / h2, wLower, wUpper);
    }
    return D2;
}

DifferenceOperators FiniteDifference::assemble(const Grid& grid, const BoundaryConditions& bc,
                                               UpwindDirection direction)
{
    return {firstDerivative(grid, bc, direction), secondDerivative(grid, bc)};
}

Matrix FiniteDifference::combine(double mu, double sigma, const Matrix& D1, const Matrix& D2)
{
    return MatrixOps::add(mu, D1, 0.5 * sigma * sigma, D2);
}
