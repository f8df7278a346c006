#include <hjbfd/utils/Utils.h>
#include <cmath>
#include <stdexcept>
#include <string>

// ============================================================================
// Thomas Algorithm
// ============================================================================

std::vector<double> ThomasAlgorithm::solve(const std::vector<double>& lower,
                                           const std::vector<double>& diag,
                                           const std::vector<double>& upper,
                                           const std::vector<double>& rhs)
{
    const size_t n = rhs.size();
    if (n == 0) {
        throw std::invalid_argument("ThomasAlgorithm::solve: Cannot solve empty system");
    }
    if (lower.size() != n || diag.size() != n || upper.size() != n) {
        throw std::invalid_argument("ThomasAlgorithm::solve: Diagonals have sizes "
                                    + std::to_string(lower.size()) + "/" + std::to_string(diag.size()) + "/"
                                    + std::to_string(upper.size()) + ", expected " + std::to_string(n));
    }

    // Row i after elimination: x_i + w_i * x_{i+1} = g_i
    std::vector<double> w(n, 0.0);
    std::vector<double> g(n, 0.0);

    for (size_t i = 0; i < n; ++i) {
        const double pivot = (i == 0) ? diag[0] : diag[i] - lower[i] * w[i-1];
        if (std::abs(pivot) < 1e-14) {
            throw std::runtime_error("ThomasAlgorithm::solve: Zero pivot at row " + std::to_string(i));
        }
        w[i] = (i + 1 < n) ? upper[i] / pivot : 0.0;
        g[i] = ((i == 0) ? rhs[0] : rhs[i] - lower[i] * g[i-1]) / pivot;
    }

    std::vector<double> x(g);
    for (size_t i = n - 1; i-- > 0;) {
        x[i] -= w[i] * x[i+1];
    }
    return x;
}

std::vector<double> linspace(double a, double b, size_t n)
{
    if (n < 2) {
        throw std::invalid_argument("linspace: Need at least 2 points");
    }

    std::vector<double> points(n);
    double step = (b - a) / static_cast<double>(n - 1);
    for (size_t i = 0; i < n; ++i) {
        points[i] = a + static_cast<double>(i) * step;
    }
    points[n - 1] = b; // exact endpoint
    return points;
}
