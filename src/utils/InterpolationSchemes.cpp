#include <hjbfd/utils/InterpolationSchemes.h>
#include <hjbfd/utils/Utils.h>
#include <algorithm>
#include <stdexcept>
#include <cmath>

CubicSplineInterpolation::CubicSplineInterpolation(const std::vector<double>& xData,
                                                   const std::vector<double>& yData)
    : _xData(xData), _yData(yData)
{
    validateData();
    computeSplineCoefficients();
}

void CubicSplineInterpolation::validateData() const
{
    if (_xData.size() != _yData.size()) {
        throw std::invalid_argument("CubicSplineInterpolation: xData and yData must have same size");
    }

    if (_xData.size() < 2) {
        throw std::invalid_argument("CubicSplineInterpolation: At least 2 data points required");
    }

    for (size_t i = 1; i < _xData.size(); ++i) {
        if (!(_xData[i] > _xData[i-1])) {
            throw std::invalid_argument("CubicSplineInterpolation: xData must be strictly increasing");
        }
    }
}

void CubicSplineInterpolation::computeSplineCoefficients()
{
    size_t n = _xData.size();

    _alpha.assign(n-1, 0.0);
    _beta.assign(n-1, 0.0);
    _gamma.assign(n-1, 0.0);
    _delta.assign(n-1, 0.0);

    if (n == 2) {
        // straight line through both points
        _gamma[0] = (_yData[1] - _yData[0]) / (_xData[1] - _xData[0]);
        _delta[0] = _yData[0];
        return;
    }

    // Natural spline: β_0 = β_{n-1} = 0, solve for interior β (half second derivatives)
    // β_{j-1}Δx_{j-1} + 2β_j(Δx_{j-1} + Δx_j) + β_{j+1}Δx_j = 3(slope_j - slope_{j-1})
    size_t num_unknowns = n - 2;
    std::vector<double> lower(num_unknowns, 0.0);
    std::vector<double> diag(num_unknowns, 0.0);
    std::vector<double> upper(num_unknowns, 0.0);
    std::vector<double> rhs(num_unknowns, 0.0);

    for (size_t i = 0; i < num_unknowns; ++i) {
        size_t j = i + 1;

        double dx_j = _xData[j+1] - _xData[j];
        double dx_j_prev = _xData[j] - _xData[j-1];

        lower[i] = dx_j_prev;
        diag[i] = 2.0 * (dx_j_prev + dx_j);
        upper[i] = dx_j;

        double slope_j = (_yData[j+1] - _yData[j]) / dx_j;
        double slope_j_prev = (_yData[j] - _yData[j-1]) / dx_j_prev;
        rhs[i] = 3.0 * (slope_j - slope_j_prev);
    }

    std::vector<double> beta_interior = ThomasAlgorithm::solve(lower, diag, upper, rhs);

    std::vector<double> beta(n, 0.0);
    for (size_t i = 0; i < num_unknowns; ++i) {
        beta[i+1] = beta_interior[i];
    }

    for (size_t j = 0; j < n-1; ++j) {
        double dx_j = _xData[j+1] - _xData[j];

        _alpha[j] = (beta[j+1] - beta[j]) / (3.0 * dx_j);
        _gamma[j] = (_yData[j+1] - _yData[j]) / dx_j - _alpha[j] * dx_j * dx_j - beta[j] * dx_j;
        _delta[j] = _yData[j];
        _beta[j] = beta[j];
    }
}

size_t CubicSplineInterpolation::findInterval(double x) const
{
    if (x < _xData.front() || x > _xData.back()) {
        throw std::out_of_range("CubicSplineInterpolation: x outside data range");
    }

    auto it = std::upper_bound(_xData.begin(), _xData.end(), x);
    if (it == _xData.begin()) {
        return 0;
    }

    size_t idx = std::distance(_xData.begin(), it) - 1;
    if (idx >= _xData.size() - 1) {
        idx = _xData.size() - 2;  // x == x_{n-1} belongs to the last interval
    }
    return idx;
}

double CubicSplineInterpolation::interpolate(double x) const
{
    size_t idx = findInterval(x);
    double dx = x - _xData[idx];
    return ((_alpha[idx] * dx + _beta[idx]) * dx + _gamma[idx]) * dx + _delta[idx];
}

double CubicSplineInterpolation::derivative(double x) const
{
    size_t idx = findInterval(x);
    double dx = x - _xData[idx];
    return _gamma[idx] + 2.0 * _beta[idx] * dx + 3.0 * _alpha[idx] * dx * dx;
}

double CubicSplineInterpolation::secondDerivative(double x) const
{
    size_t idx = findInterval(x);
    double dx = x - _xData[idx];
    return 2.0 * _beta[idx] + 6.0 * _alpha[idx] * dx;
}
