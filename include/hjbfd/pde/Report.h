#ifndef HJBFD_REPORT_H
#define HJBFD_REPORT_H

#include <hjbfd/pde/Solver.h>
#include <iosfwd>
#include <vector>

/**
 * Boundary trajectories v(x_min, t) and v(x_max, t) on uniform report times
 */
struct BoundaryReport
{
    std::vector<double> times;  // t_k, uniform in [0, T]
    std::vector<double> lower;  // v(x_min, t_k)
    std::vector<double> upper;  // v(x_max, t_k)
};

/**
 * Sample the first and last grid point of the solution at n uniform times
 * @throws std::invalid_argument if n < 2
 */
BoundaryReport sampleBoundaries(const HJBSolution& solution, size_t n);

// Fixed-precision table: t, v(x_min,t), v(x_max,t)
void printReport(const BoundaryReport& report, std::ostream& os);

#endif // HJBFD_REPORT_H
