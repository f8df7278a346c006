#include <hjbfd/math/LinearAlgebra.h>
#include <hjbfd/pde/Errors.h>
#include <algorithm>
#include <string>
#include <utility>

// ===========================================================================
// Matrix Operations
// ===========================================================================

std::vector<double> MatrixOps::multiply(const Matrix &A, const std::vector<double> &x)
{
    size_t m = A.size();
    if (m == 0)
        return {};
    size_t n = A[0].size();
    if (n != x.size())
        throw std::invalid_argument("MatrixOps::multiply: Dimension mismatch");

    std::vector<double> y(m, 0.0);
    for (size_t i = 0; i < m; ++i)
        for (size_t j = 0; j < n; ++j)
            y[i] += A[i][j] * x[j];
    return y;
}

Matrix MatrixOps::add(double alpha, const Matrix &A, double beta, const Matrix &B)
{
    if (A.size() != B.size())
        throw std::invalid_argument("MatrixOps::add: Dimension mismatch");

    Matrix C = A;
    for (size_t i = 0; i < A.size(); ++i)
    {
        if (A[i].size() != B[i].size())
            throw std::invalid_argument("MatrixOps::add: Dimension mismatch");
        for (size_t j = 0; j < A[i].size(); ++j)
            C[i][j] = alpha * A[i][j] + beta * B[i][j];
    }
    return C;
}

double MatrixOps::normInf(const std::vector<double> &x)
{
    double maxVal = 0.0;
    for (double xi : x)
        maxVal = std::max(maxVal, std::abs(xi));
    return maxVal;
}

double MatrixOps::normInf(const Matrix &A)
{
    double maxRow = 0.0;
    for (const auto &row : A)
    {
        double sum = 0.0;
        for (double aij : row)
            sum += std::abs(aij);
        maxRow = std::max(maxRow, sum);
    }
    return maxRow;
}

void MatrixOps::axpy(double alpha, const std::vector<double> &x, std::vector<double> &y)
{
    if (x.size() != y.size())
        throw std::invalid_argument("MatrixOps::axpy: Dimension mismatch");
    for (size_t i = 0; i < x.size(); ++i)
        y[i] += alpha * x[i];
}

void MatrixOps::scale(double alpha, std::vector<double> &x)
{
    for (double &xi : x)
        xi *= alpha;
}

std::vector<double> MatrixOps::rowSums(const Matrix &A)
{
    std::vector<double> sums(A.size(), 0.0);
    for (size_t i = 0; i < A.size(); ++i)
        for (double aij : A[i])
            sums[i] += aij;
    return sums;
}

Matrix MatrixOps::identity(size_t n)
{
    Matrix I = zeros(n, n);
    for (size_t i = 0; i < n; ++i)
        I[i][i] = 1.0;
    return I;
}

Matrix MatrixOps::zeros(size_t m, size_t n)
{
    return Matrix(m, std::vector<double>(n, 0.0));
}

// ===========================================================================
// LU (Doolittle, partial pivoting)
// ===========================================================================

LUResult LU::decompose(const Matrix &A)
{
    size_t n = A.size();
    if (n == 0)
        throw std::invalid_argument("LU::decompose: Cannot factorize empty matrix");
    for (const auto &row : A)
        if (row.size() != n)
            throw std::invalid_argument("LU::decompose: Matrix must be square");

    LUResult result{A, std::vector<size_t>(n), MatrixOps::normInf(A)};
    Matrix &F = result.factors;
    for (size_t i = 0; i < n; ++i)
        result.pivot[i] = i;

    // zero matrix or pivot below round-off of the matrix scale -> singular
    const double tol = 1e-14 * result.normA;
    if (result.normA == 0.0)
        throw SingularSystemError("LU::decompose: Matrix is identically zero");

    for (size_t k = 0; k < n; ++k)
    {
        // pick largest pivot in column k
        size_t p = k;
        double maxVal = std::abs(F[k][k]);
        for (size_t i = k + 1; i < n; ++i)
        {
            if (std::abs(F[i][k]) > maxVal)
            {
                maxVal = std::abs(F[i][k]);
                p = i;
            }
        }

        if (maxVal <= tol)
            throw SingularSystemError("LU::decompose: Matrix is singular at column " + std::to_string(k));

        if (p != k)
        {
            std::swap(F[p], F[k]);
            std::swap(result.pivot[p], result.pivot[k]);
        }

        for (size_t i = k + 1; i < n; ++i)
        {
            double l_ik = F[i][k] / F[k][k];
            F[i][k] = l_ik;
            if (l_ik == 0.0)
                continue;
            for (size_t j = k + 1; j < n; ++j)
                F[i][j] -= l_ik * F[k][j];
        }
    }
    return result;
}

std::vector<double> LU::solve(const LUResult &lu, const std::vector<double> &b)
{
    const Matrix &F = lu.factors;
    size_t n = F.size();
    if (b.size() != n)
        throw std::invalid_argument("LU::solve: Dimension mismatch");

    // forward substitution with permuted rhs: L * y = P * b
    std::vector<double> y(n);
    for (size_t i = 0; i < n; ++i)
    {
        double sum = b[lu.pivot[i]];
        for (size_t j = 0; j < i; ++j)
            sum -= F[i][j] * y[j];
        y[i] = sum;
    }

    // back substitution: U * x = y
    std::vector<double> x(n);
    for (int i = static_cast<int>(n) - 1; i >= 0; --i)
    {
        double sum = y[i];
        for (size_t j = i + 1; j < n; ++j)
            sum -= F[i][j] * x[j];
        x[i] = sum / F[i][i];
    }
    return x;
}

double LU::reciprocalCondition(const LUResult &lu)
{
    size_t n = lu.factors.size();

    // ||A^-1||_inf = max row sum of |A^-1|, accumulate column by column
    std::vector<double> rowAbsSums(n, 0.0);
    std::vector<double> e(n, 0.0);
    for (size_t j = 0; j < n; ++j)
    {
        e[j] = 1.0;
        auto col = solve(lu, e);
        for (size_t i = 0; i < n; ++i)
            rowAbsSums[i] += std::abs(col[i]);
        e[j] = 0.0;
    }

    double normInv = MatrixOps::normInf(rowAbsSums);
    if (normInv == 0.0 || !std::isfinite(normInv))
        return 0.0;
    return 1.0 / (lu.normA * normInv);
}
