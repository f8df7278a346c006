// bindings for Grid, boundary conditions and model parameters
#include "bindings_common.h"
#include <hjbfd/pde/Grid.h>
#include <hjbfd/pde/BoundaryConditions.h>
#include <hjbfd/pde/DifferenceOperators.h>
#include <hjbfd/pde/HJBModel.h>
#include <string>

void bind_grid(py::module_ &m)
{
    py::class_<Grid>(m, "Grid", "Uniform 1D spatial grid x_i = x_min + i*h")
        .def(py::init<double, double, size_t>(),
             py::arg("x_min"), py::arg("x_max"), py::arg("n"))
        .def_property_readonly("lower", &Grid::lower, "Lower boundary x_min")
        .def_property_readonly("upper", &Grid::upper, "Upper boundary x_max")
        .def_property_readonly("dx", &Grid::dx, "Grid spacing h")
        .def_property_readonly("points", &Grid::points, "Grid points")
        .def("__len__", &Grid::size)
        .def("__repr__", [](const Grid &g)
             { return "<Grid [" + std::to_string(g.lower()) + ", " + std::to_string(g.upper()) +
                      "] n=" + std::to_string(g.size()) + ">"; });

    py::enum_<BoundaryType>(m, "BoundaryType", "Boundary variant")
        .value("Reflecting", BoundaryType::Reflecting)
        .value("Absorbing", BoundaryType::Absorbing)
        .export_values();

    py::enum_<UpwindDirection>(m, "UpwindDirection", "First derivative stencil")
        .value("Backward", UpwindDirection::Backward)
        .value("Forward", UpwindDirection::Forward)
        .export_values();

    py::class_<ModelParameters>(m, "ModelParameters", "Immutable {mu, sigma, rho, grid, boundary conditions}")
        .def(py::init([](double mu, double sigma, double rho, const Grid &grid,
                         BoundaryType lower, BoundaryType upper, UpwindDirection upwind)
                      { return ModelParameters(mu, sigma, rho, grid, BoundaryConditions(lower, upper), upwind); }),
             py::arg("mu"), py::arg("sigma"), py::arg("rho"), py::arg("grid"),
             py::arg("lower") = BoundaryType::Reflecting,
             py::arg("upper") = BoundaryType::Reflecting,
             py::arg("upwind") = UpwindDirection::Backward)
        .def_property_readonly("mu", &ModelParameters::mu)
        .def_property_readonly("sigma", &ModelParameters::sigma)
        .def_property_readonly("rho", &ModelParameters::rho)
        .def_property_readonly("grid", &ModelParameters::grid);
}
