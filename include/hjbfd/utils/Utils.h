#ifndef HJBFD_UTILS_H
#define HJBFD_UTILS_H

#include <cstddef>
#include <vector>

/**
 * Tridiagonal solver (Thomas algorithm), O(n)
 *
 *   lower[i]*x[i-1] + diag[i]*x[i] + upper[i]*x[i+1] = rhs[i],  i = 0..n-1
 *
 * lower[0] and upper[n-1] are ignored. No pivoting: intended for the
 * diagonally dominant systems of the natural cubic spline.
 * @throws std::invalid_argument on empty or mismatched input
 * @throws std::runtime_error on a zero pivot
 */
class ThomasAlgorithm
{
public:
    static std::vector<double> solve(
        const std::vector<double>& lower,
        const std::vector<double>& diag,
        const std::vector<double>& upper,
        const std::vector<double>& rhs
    );

private:
    ThomasAlgorithm() = delete; // everything is static
};

/**
 * Uniform sequence of n points from a to b (both included), n >= 2
 */
std::vector<double> linspace(double a, double b, size_t n);

#endif // HJBFD_UTILS_H
