#include <hjbfd/pde/Report.h>
#include <hjbfd/utils/Utils.h>
#include <iomanip>
#include <ostream>
#include <stdexcept>

BoundaryReport sampleBoundaries(const HJBSolution& solution, size_t n)
{
    if (n < 2) {
        throw std::invalid_argument("sampleBoundaries: Need at least 2 report times");
    }

    BoundaryReport report;
    report.times = linspace(solution.initialTime(), solution.terminalTime(), n);
    report.lower.reserve(n);
    report.upper.reserve(n);

    for (double t : report.times) {
        std::vector<double> v = solution(t);
        report.lower.push_back(v.front());
        report.upper.push_back(v.back());
    }
    return report;
}

void printReport(const BoundaryReport& report, std::ostream& os)
{
    os << std::setw(10) << "t"
       << std::setw(16) << "v(x_min,t)"
       << std::setw(16) << "v(x_max,t)" << "\n";

    os << std::fixed << std::setprecision(6);
    for (size_t k = 0; k < report.times.size(); ++k) {
        os << std::setw(10) << report.times[k]
           << std::setw(16) << report.lower[k]
           << std::setw(16) << report.upper[k] << "\n";
    }
    os << std::defaultfloat;
}
