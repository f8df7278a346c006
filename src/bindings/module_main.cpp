// pybind11 module entry point
#include "bindings_common.h"

PYBIND11_MODULE(_hjbfd, m)
{
    m.doc() = R"pbdoc(
        hjbfd Python Bindings
        ---------------------

        Finite difference solver for the linear HJB equation
            rho*v = r(x,t) + mu*v_x + (sigma^2/2)*v_xx + v_t
        on a uniform grid with reflecting (or absorbing) boundaries.

        Example:
            import _hjbfd as hjbfd
            import math

            grid = hjbfd.Grid(0.0, 1.0, 20)
            params = hjbfd.ModelParameters(mu=-0.1, sigma=0.1, rho=0.05, grid=grid)
            report = hjbfd.solve_hjb(params, lambda x, t: x * math.exp(-t), T=1.0)
            # plot report["times"] against report["lower"] and report["upper"]
    )pbdoc";

    bind_grid(m);
    bind_solver(m);

    m.attr("__version__") = "0.1.0";
}
