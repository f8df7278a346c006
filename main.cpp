#include <hjbfd/pde/Grid.h>
#include <hjbfd/pde/BoundaryConditions.h>
#include <hjbfd/pde/Payoff.h>
#include <hjbfd/pde/HJBModel.h>
#include <hjbfd/pde/Solver.h>
#include <hjbfd/pde/Report.h>

#include <iostream>
#include <iomanip>
#include <vector>

// rho*v = x*exp(-t) + mu*∂v/∂x + (sigma²/2)*∂²v/∂x² + ∂v/∂t  on [0,1], reflecting at both ends
int main()
{
    // Model parameters
    const double T = 1.0;
    const double mu = -0.1;
    const double sigma = 0.1;
    const double rho = 0.05;
    const size_t M = 20;
    const size_t numReportTimes = 11;

    Grid grid(0.0, 1.0, M);
    ModelParameters params(mu, sigma, rho, grid, BoundaryConditions::reflecting());
    DecayingLinearPayoff payoff(1.0);  // r(x,t) = x*exp(-t)

    HJBModel model(params, payoff);

    // Terminal condition: (rho*I - L) v(T) = r(.,T)
    std::vector<double> vT = model.terminalValue(T);

    std::cout << "Terminal value v(x,T):" << std::endl;
    std::cout << std::fixed << std::setprecision(6);
    for (size_t i = 0; i < grid.size(); ++i) {
        std::cout << "  x = " << std::setw(8) << grid.point(i)
                  << "  v = " << std::setw(12) << vT[i] << std::endl;
    }

    // Backward integration T -> 0
    BackwardSolver solver(model, T);
    HJBSolution solution = solver.solve(vT);

    std::cout << "\nAccepted steps: " << solution.numSteps() << std::endl;

    std::cout << "\nBoundary trajectories:" << std::endl;
    BoundaryReport report = sampleBoundaries(solution, numReportTimes);
    printReport(report, std::cout);

    std::cout << "\nMarginal value at t = 0, x = 0.5: " << solution.gradientAt(0.5, 0.0) << std::endl;

    return 0;
}
