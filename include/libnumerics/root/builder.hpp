#pragma once

#include "libnumerics/root/root_finder.hpp"
#include "libnumerics/root/types.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace num::root {

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Required per method:
//   NewtonRaphson            function, derivative, initial_guess
//   Bisection, Secant, Brent function, boundaries
// and for all of them tolerance (> 0) and max_iterations (>= 1).
struct RootFinderConfig {
    Method method = Method::Brent;
    Function function;
    Function derivative;
    std::optional<double> initial_guess;
    std::optional<std::pair<double, double>> boundaries;
    std::optional<double> tolerance;
    std::optional<int> max_iterations;
    std::optional<bool> log_convergence;  // false when unset
};

// Validates cfg and assembles the finder. Never evaluates the target function.
// Throws ConfigError describing the first problem found.
std::unique_ptr<RootFinder> build_root_finder(const RootFinderConfig& cfg);

class RootFinderBuilder {
public:
    explicit RootFinderBuilder(Method method) { cfg_.method = method; }

    RootFinderBuilder& function(Function f) { cfg_.function = std::move(f); return *this; }
    RootFinderBuilder& derivative(Function df) { cfg_.derivative = std::move(df); return *this; }
    RootFinderBuilder& initial_guess(double x) { cfg_.initial_guess = x; return *this; }
    RootFinderBuilder& boundaries(double x0, double x1) { cfg_.boundaries = std::make_pair(x0, x1); return *this; }
    RootFinderBuilder& tolerance(double tol) { cfg_.tolerance = tol; return *this; }
    RootFinderBuilder& max_iterations(int n) { cfg_.max_iterations = n; return *this; }
    RootFinderBuilder& log_convergence(bool on) { cfg_.log_convergence = on; return *this; }

    const RootFinderConfig& config() const { return cfg_; }

    std::unique_ptr<RootFinder> build() const { return build_root_finder(cfg_); }

private:
    RootFinderConfig cfg_;
};

} // namespace num::root
