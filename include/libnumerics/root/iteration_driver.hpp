#pragma once

#include "libnumerics/root/root_finder.hpp"
#include "libnumerics/root/strategies.hpp"

namespace num::root {

// Strategy-agnostic loop: evaluates f (and f' when given) at the points the
// strategy asks for, logs them, and stops on the strategy's verdict or on the
// iteration ceiling. Tolerance lives in the strategy.
class IterationDriver final : public RootFinder {
public:
    // Throws std::invalid_argument if f is empty, max_iterations < 1, or the
    // strategy needs a derivative and df is empty.
    IterationDriver(Strategy strategy,
                    Function f,
                    Function df,
                    int max_iterations,
                    bool log_convergence = false);

    Result find_root() override;
    const ConvergenceLog& convergence_log() const override { return log_; }
    Method method() const override { return method_of(strategy_); }

    int max_iterations() const { return max_iterations_; }
    bool logs_convergence() const { return log_convergence_; }

private:
    Strategy strategy_;  // as configured; every search runs on a copy
    Function f_;
    Function df_;
    int max_iterations_;
    bool log_convergence_;
    ConvergenceLog log_;
};

} // namespace num::root
