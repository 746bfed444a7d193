#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include "libnumerics/math/interpolation.hpp"
#include "libnumerics/root/builder.hpp"

#include <optional>
#include <utility>

namespace py = pybind11;

PYBIND11_MODULE(numerics_py, m) {
    m.doc() = "Scalar root finding and spline interpolation";

    // --- root finding types ---
    py::enum_<num::root::Method>(m, "Method")
        .value("Bisection",     num::root::Method::Bisection)
        .value("Secant",        num::root::Method::Secant)
        .value("NewtonRaphson", num::root::Method::NewtonRaphson)
        .value("Brent",         num::root::Method::Brent)
        .value("InverseQuadraticInterpolation", num::root::Method::InverseQuadraticInterpolation);

    py::enum_<num::root::Status>(m, "Status")
        .value("Converged",           num::root::Status::Converged)
        .value("InvalidBracket",      num::root::Status::InvalidBracket)
        .value("DerivativeTooSmall",  num::root::Status::DerivativeTooSmall)
        .value("DenominatorTooSmall", num::root::Status::DenominatorTooSmall)
        .value("MaxIterations",       num::root::Status::MaxIterations);

    py::class_<num::root::Result>(m, "Result")
        .def_readonly("x",       &num::root::Result::x)
        .def_readonly("iters",   &num::root::Result::iters)
        .def_readonly("status",  &num::root::Result::status)
        .def_readonly("message", &num::root::Result::message)
        .def_property_readonly("converged", &num::root::Result::converged);

    py::class_<num::root::IterationEntry>(m, "IterationEntry")
        .def_readonly("iteration", &num::root::IterationEntry::iteration)
        .def_readonly("x",         &num::root::IterationEntry::x)
        .def_readonly("fx",        &num::root::IterationEntry::fx);

    py::class_<num::root::ConvergenceLog>(m, "ConvergenceLog")
        .def_property_readonly("entries", &num::root::ConvergenceLog::entries)
        .def("__len__", &num::root::ConvergenceLog::size);

    py::class_<num::root::RootFinder>(m, "RootFinder")
        .def("find_root", &num::root::RootFinder::find_root)
        .def_property_readonly("method", &num::root::RootFinder::method)
        .def_property_readonly("convergence_log", &num::root::RootFinder::convergence_log,
                               py::return_value_policy::reference_internal);

    py::register_exception<num::root::ConfigError>(m, "ConfigError", PyExc_ValueError);

    // --- root finding functions ---
    m.def("build_root_finder",
        [](num::root::Method method,
           num::root::Function function,
           std::optional<num::root::Function> derivative,
           std::optional<double> initial_guess,
           std::optional<std::pair<double, double>> boundaries,
           std::optional<double> tolerance,
           std::optional<int> max_iterations,
           bool log_convergence) {
            num::root::RootFinderConfig cfg;
            cfg.method = method;
            cfg.function = std::move(function);
            if (derivative) {
                cfg.derivative = std::move(*derivative);
            }
            cfg.initial_guess = initial_guess;
            cfg.boundaries = boundaries;
            cfg.tolerance = tolerance;
            cfg.max_iterations = max_iterations;
            cfg.log_convergence = log_convergence;
            return num::root::build_root_finder(cfg);
        },
        "Validate a configuration and build a root finder",
        py::arg("method"),
        py::arg("function"),
        py::arg("derivative")      = py::none(),
        py::arg("initial_guess")   = py::none(),
        py::arg("boundaries")      = py::none(),
        py::arg("tolerance")       = py::none(),
        py::arg("max_iterations")  = py::none(),
        py::arg("log_convergence") = false);

    // --- interpolation ---
    py::enum_<num::interp::Kind>(m, "InterpolationKind")
        .value("Linear",           num::interp::Kind::Linear)
        .value("Quadratic",        num::interp::Kind::Quadratic)
        .value("Cubic",            num::interp::Kind::Cubic)
        .value("ConstantBackward", num::interp::Kind::ConstantBackward)
        .value("ConstantForward",  num::interp::Kind::ConstantForward);

    py::enum_<num::interp::Extrapolation>(m, "Extrapolation")
        .value("Disabled",     num::interp::Extrapolation::None)
        .value("Constant",     num::interp::Extrapolation::Constant)
        .value("ExtendSpline", num::interp::Extrapolation::ExtendSpline);

    py::class_<num::interp::Interpolator>(m, "Interpolator")
        .def(py::init<std::vector<double>, std::vector<double>,
                      num::interp::Kind, num::interp::Extrapolation>(),
             py::arg("x"), py::arg("y"),
             py::arg("kind") = num::interp::Kind::Cubic,
             py::arg("extrapolation") = num::interp::Extrapolation::None)
        .def("interpolate", &num::interp::Interpolator::interpolate)
        .def("__call__",    &num::interp::Interpolator::interpolate);
}
