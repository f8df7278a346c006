#ifndef HJBFD_LINEARALGEBRA_H
#define HJBFD_LINEARALGEBRA_H

#include <cstddef>
#include <vector>
#include <cmath>
#include <stdexcept>

// Matrix = row-major 2D vector
using Matrix = std::vector<std::vector<double>>;

// Basic matrix/vector operations
class MatrixOps
{
public:
    // y = A * x
    static std::vector<double> multiply(const Matrix &A, const std::vector<double> &x);
    // C = alpha * A + beta * B
    static Matrix add(double alpha, const Matrix &A, double beta, const Matrix &B);
    // ||x||_inf
    static double normInf(const std::vector<double> &x);
    // max absolute row sum
    static double normInf(const Matrix &A);
    // y = alpha * x + y
    static void axpy(double alpha, const std::vector<double> &x, std::vector<double> &y);
    // x = alpha * x
    static void scale(double alpha, std::vector<double> &x);
    // sum of each row
    static std::vector<double> rowSums(const Matrix &A);
    // identity matrix
    static Matrix identity(size_t n);
    // zero matrix
    static Matrix zeros(size_t m, size_t n);

private:
    MatrixOps() = delete;
};

// LU with partial pivoting: P * A = L * U
// Unit lower triangle of L and U share storage in factors, pivot holds the row permutation
struct LUResult
{
    Matrix factors;
    std::vector<size_t> pivot;
    double normA;  // ||A||_inf, kept for the condition estimate
};

class LU
{
public:
    // throws SingularSystemError when a pivot vanishes relative to ||A||_inf
    static LUResult decompose(const Matrix &A);
    // solve A * x = b using the factorization
    static std::vector<double> solve(const LUResult &lu, const std::vector<double> &b);
    // 1 / (||A||_inf * ||A^-1||_inf), A^-1 formed column by column (O(n^3))
    static double reciprocalCondition(const LUResult &lu);

private:
    LU() = delete;
};

#endif // HJBFD_LINEARALGEBRA_H
