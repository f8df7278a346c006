// bindings for terminal solve, backward integration and boundary report
#include "bindings_common.h"
#include <hjbfd/pde/Errors.h>
#include <hjbfd/pde/HJBModel.h>
#include <hjbfd/pde/Payoff.h>
#include <hjbfd/pde/Report.h>
#include <hjbfd/pde/Solver.h>
#include <functional>
#include <utility>
#include <vector>

void bind_solver(py::module_ &m)
{
    py::register_exception<SingularSystemError>(m, "SingularSystemError");
    py::register_exception<IntegrationError>(m, "IntegrationError");

    py::class_<SolverSettings>(m, "SolverSettings", "Error control and step budget")
        .def(py::init<>())
        .def_readwrite("abs_tol", &SolverSettings::absTol)
        .def_readwrite("rel_tol", &SolverSettings::relTol)
        .def_readwrite("initial_step", &SolverSettings::initialStep)
        .def_readwrite("min_step", &SolverSettings::minStep)
        .def_readwrite("max_steps", &SolverSettings::maxSteps)
        .def_readwrite("dense_subdivisions", &SolverSettings::denseSubdivisions);

    m.def("terminal_value",
          [](const ModelParameters &params, std::function<double(double, double)> payoff, double T)
          {
              HJBModel model(params, FunctionPayoff(std::move(payoff)));
              return model.terminalValue(T);
          },
          py::arg("params"), py::arg("payoff"), py::arg("T"),
          "Solve (rho*I - L) v = r(., T)");

    // Python callables are invoked at every right-hand side evaluation
    m.def("solve_hjb",
          [](const ModelParameters &params, std::function<double(double, double)> payoff, double T,
             size_t num_report_times, const SolverSettings &settings)
          {
              HJBModel model(params, FunctionPayoff(std::move(payoff)));
              BackwardSolver solver(model, T, settings);
              HJBSolution solution = solver.solve();
              BoundaryReport report = sampleBoundaries(solution, num_report_times);

              py::dict result;
              result["times"] = report.times;
              result["lower"] = report.lower;
              result["upper"] = report.upper;
              result["v0"] = solution(0.0);
              result["num_steps"] = solution.numSteps();
              return result;
          },
          py::arg("params"), py::arg("payoff"), py::arg("T"),
          py::arg("num_report_times") = 101,
          py::arg("settings") = SolverSettings(),
          "Terminal solve + backward integration, returns boundary trajectories");
}
