#ifndef HJBFD_INTERPOLATIONSCHEMES_H
#define HJBFD_INTERPOLATIONSCHEMES_H

#include <cstddef>
#include <vector>
#include <utility>

// ============================================================================
// CUBIC SPLINE INTERPOLATION
// ============================================================================

/**
 * Natural cubic spline with Thomas algorithm
 * On [x_j, x_{j+1}]: S(x) = α_j(x-x_j)³ + β_j(x-x_j)² + γ_j(x-x_j) + δ_j
 * First derivative: S'(x) = 3α_j(x-x_j)² + 2β_j(x-x_j) + γ_j
 * Second derivative: S''(x) = 6α_j(x-x_j) + 2β_j
 *
 * No extrapolation: queries outside [x_0, x_{n-1}] throw std::out_of_range.
 */
class CubicSplineInterpolation
{
public:
    CubicSplineInterpolation(const std::vector<double>& xData,
                             const std::vector<double>& yData);

    double interpolate(double x) const;
    double derivative(double x) const;
    double secondDerivative(double x) const;

    double operator()(double x) const { return interpolate(x); }
    std::pair<double, double> getRange() const { return {_xData.front(), _xData.back()}; }

private:
    std::vector<double> _xData;
    std::vector<double> _yData;

    std::vector<double> _alpha;
    std::vector<double> _beta;
    std::vector<double> _gamma;
    std::vector<double> _delta;

    void validateData() const;
    void computeSplineCoefficients();
    size_t findInterval(double x) const;
};

#endif // HJBFD_INTERPOLATIONSCHEMES_H
