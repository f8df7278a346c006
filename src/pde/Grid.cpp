#include <hjbfd/pde/Grid.h>
#include <cmath>
#include <stdexcept>
#include <algorithm>

// ============================================================================
// Constructor
// ============================================================================
Grid::Grid(double xMin, double xMax, size_t N)
    : _xMin(xMin), _xMax(xMax), _N(N), _dx(0.0)
{
    validateParameters();

    _dx = (_xMax - _xMin) / static_cast<double>(_N - 1);
    constructUniformGrid();
}

Grid::Grid(size_t N)
    : Grid(0.0, 1.0, N)
{
}

// ============================================================================
// Grid Construction
// ============================================================================

void Grid::validateParameters() const
{
    if (!std::isfinite(_xMin) || !std::isfinite(_xMax)) {
        throw std::invalid_argument("Grid: Bounds must be finite");
    }
    if (_xMax <= _xMin) {
        throw std::invalid_argument("Grid: x_max must be greater than x_min");
    }
    // two points is the smallest grid on which a boundary row has a neighbour
    if (_N < 2) {
        throw std::invalid_argument("Grid: Need at least 2 points for finite differences");
    }
}

void Grid::constructUniformGrid()
{
    _points.reserve(_N);

    // x_i = x_min + i * Δx for i = 0, 1, ..., N-1
    for (size_t i = 0; i < _N; ++i) {
        _points.push_back(_xMin + static_cast<double>(i) * _dx);
    }

    // Ensure exact boundary value (avoid round-off at the top end)
    _points[_N - 1] = _xMax;
}

size_t Grid::findInterval(double x) const
{
    if (x < _xMin || x > _xMax) {
        throw std::out_of_range("Grid::findInterval: x outside grid bounds");
    }

    auto it = std::upper_bound(_points.begin(), _points.end(), x);
    if (it == _points.end()) {
        return _N - 2;
    }
    if (it == _points.begin()) {
        return 0;
    }
    return std::distance(_points.begin(), it) - 1;
}
