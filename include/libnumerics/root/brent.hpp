#pragma once

#include "libnumerics/root/root_finder.hpp"

namespace num::root {

// Brent's method on the bracket [x0, x1]. Runs its own loop: the switch between
// inverse quadratic interpolation, secant and bisection steps needs the
// contrapoint and the last two step sizes, which the strategy contract does
// not carry between iterations.
//
// Log layout: entry 1 holds both endpoints, every later entry the single new
// estimate evaluated in that iteration.
class Brent final : public RootFinder {
public:
    // Throws std::invalid_argument for an empty f, non-finite endpoints,
    // a non-positive tolerance or max_iterations < 1.
    Brent(Function f, double x0, double x1, double tol, int max_iterations,
          bool log_convergence = false);

    Result find_root() override;
    const ConvergenceLog& convergence_log() const override { return log_; }
    Method method() const override { return Method::Brent; }

private:
    Function f_;
    double x0_;
    double x1_;
    double tol_;
    int max_iterations_;
    bool log_convergence_;
    ConvergenceLog log_;
};

} // namespace num::root
