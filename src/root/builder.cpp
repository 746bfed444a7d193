#include "libnumerics/root/builder.hpp"

#include "libnumerics/root/brent.hpp"
#include "libnumerics/root/iteration_driver.hpp"
#include "libnumerics/root/strategies.hpp"

#include <cmath>
#include <string>

namespace num::root {

namespace {

std::string prefix(Method method) {
    return std::string("build_root_finder(") + to_string(method) + "): ";
}

double require_tolerance(const RootFinderConfig& cfg) {
    if (!cfg.tolerance) {
        throw ConfigError(prefix(cfg.method) + "tolerance must be specified");
    }
    const double tol = *cfg.tolerance;
    if (!(tol > 0.0) || !std::isfinite(tol)) {
        throw ConfigError(prefix(cfg.method) + "tolerance must be positive and finite");
    }
    return tol;
}

int require_max_iterations(const RootFinderConfig& cfg) {
    if (!cfg.max_iterations) {
        throw ConfigError(prefix(cfg.method) + "max iterations must be specified");
    }
    if (*cfg.max_iterations < 1) {
        throw ConfigError(prefix(cfg.method) + "max iterations must be at least 1");
    }
    return *cfg.max_iterations;
}

std::pair<double, double> require_boundaries(const RootFinderConfig& cfg) {
    if (!cfg.boundaries) {
        throw ConfigError(prefix(cfg.method) + "boundaries must be specified");
    }
    const auto [x0, x1] = *cfg.boundaries;
    if (!std::isfinite(x0) || !std::isfinite(x1)) {
        throw ConfigError(prefix(cfg.method) + "boundaries must be finite");
    }
    if (x0 == x1) {
        throw ConfigError(prefix(cfg.method) + "boundaries must be distinct");
    }
    return *cfg.boundaries;
}

double require_initial_guess(const RootFinderConfig& cfg) {
    if (!cfg.initial_guess) {
        throw ConfigError(prefix(cfg.method) + "initial guess must be specified");
    }
    if (!std::isfinite(*cfg.initial_guess)) {
        throw ConfigError(prefix(cfg.method) + "initial guess must be finite");
    }
    return *cfg.initial_guess;
}

} // namespace

std::unique_ptr<RootFinder> build_root_finder(const RootFinderConfig& cfg) {
    if (cfg.method == Method::InverseQuadraticInterpolation) {
        throw ConfigError(prefix(cfg.method) + "unsupported method");
    }
    if (!cfg.function) {
        throw ConfigError(prefix(cfg.method) + "function must be specified");
    }
    const double tol = require_tolerance(cfg);
    const int max_iterations = require_max_iterations(cfg);
    const bool log_convergence = cfg.log_convergence.value_or(false);

    switch (cfg.method) {
        case Method::NewtonRaphson: {
            if (!cfg.derivative) {
                throw ConfigError(prefix(cfg.method) + "derivative must be specified");
            }
            const double x0 = require_initial_guess(cfg);
            return std::make_unique<IterationDriver>(NewtonRaphson{x0, tol}, cfg.function,
                                                     cfg.derivative, max_iterations, log_convergence);
        }
        case Method::Secant: {
            const auto [x0, x1] = require_boundaries(cfg);
            return std::make_unique<IterationDriver>(Secant{x0, x1, tol}, cfg.function,
                                                     cfg.derivative, max_iterations, log_convergence);
        }
        case Method::Bisection: {
            const auto [x0, x1] = require_boundaries(cfg);
            return std::make_unique<IterationDriver>(Bisection{x0, x1, tol}, cfg.function,
                                                     cfg.derivative, max_iterations, log_convergence);
        }
        case Method::Brent: {
            const auto [x0, x1] = require_boundaries(cfg);
            return std::make_unique<Brent>(cfg.function, x0, x1, tol, max_iterations, log_convergence);
        }
        default:
            break;
    }
    throw ConfigError(prefix(cfg.method) + "unsupported method");
}

} // namespace num::root
