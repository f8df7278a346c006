#ifndef HJBFD_GRID_H
#define HJBFD_GRID_H

#include <vector>
#include <utility>
#include <cstddef>

/**
 * @class Grid
 * @brief Uniform 1D spatial grid for finite difference operators
 *
 * x in [x_min, x_max] discretised into N points, x_i = x_min + i*h, h = (x_max - x_min)/(N-1).
 * Immutable once constructed.
 */
class Grid
{
public:
    /**
     * Constructor
     * @param xMin Lower boundary
     * @param xMax Upper boundary (must be > xMin)
     * @param N Number of grid points (must be >= 2)
     */
    Grid(double xMin, double xMax, size_t N);

    /**
     * Unit interval [0, 1] with N points
     */
    explicit Grid(size_t N);

    Grid(const Grid& other) = default;
    Grid& operator=(const Grid& other) = default;
    ~Grid() = default;

    double lower() const { return _xMin; }
    double upper() const { return _xMax; }
    size_t size() const { return _N; }
    double dx() const { return _dx; }

    const std::vector<double>& points() const { return _points; }
    double point(size_t i) const { return _points[i]; } // x_i, no bounds check
    double operator[](size_t i) const { return _points[i]; }

    /**
     * Interval containing x
     * @return i with x_i <= x <= x_{i+1} (last interval for x == x_max)
     * @throws std::out_of_range if x lies outside [x_min, x_max]
     */
    size_t findInterval(double x) const;

    std::pair<double, double> bounds() const { return {_xMin, _xMax}; }

private:
    double _xMin, _xMax;
    size_t _N;
    double _dx;
    std::vector<double> _points;

    void validateParameters() const;
    void constructUniformGrid();
};

#endif // HJBFD_GRID_H
