#include "libnumerics/root/iteration_driver.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace num::root {

namespace {

std::vector<double> evaluate(const Function& g, const std::vector<double>& x) {
    std::vector<double> out;
    out.reserve(x.size());
    for (double xi : x) {
        out.push_back(g(xi));
    }
    return out;
}

} // namespace

IterationDriver::IterationDriver(Strategy strategy,
                                 Function f,
                                 Function df,
                                 int max_iterations,
                                 bool log_convergence)
    : strategy_(std::move(strategy)),
      f_(std::move(f)),
      df_(std::move(df)),
      max_iterations_(max_iterations),
      log_convergence_(log_convergence) {
    if (!f_) {
        throw std::invalid_argument("IterationDriver: target function is empty");
    }
    if (max_iterations_ < 1) {
        throw std::invalid_argument("IterationDriver: max_iterations must be at least 1");
    }
    if (requires_derivative(strategy_) && !df_) {
        throw std::invalid_argument(std::string("IterationDriver: ")
                                    + to_string(method_of(strategy_))
                                    + " requires a derivative");
    }
}

Result IterationDriver::find_root() {
    log_.reset();
    Strategy strategy = strategy_;

    int iter = 1;
    std::vector<double> x = initial_points(strategy);
    for (;;) {
        std::vector<double> fx = evaluate(f_, x);
        std::vector<double> dfx;
        if (df_) {
            dfx = evaluate(df_, x);
        }
        if (log_convergence_) {
            log_.add_entry(static_cast<std::size_t>(iter), x, fx);
        }

        if (auto verdict = should_stop(strategy, fx, dfx)) {
            verdict->iters = iter;
            return *verdict;
        }
        if (iter >= max_iterations_) {
            Result res = failure(Status::MaxIterations,
                                 "Maximum iterations (" + std::to_string(max_iterations_)
                                 + ") reached without convergence");
            res.iters = iter;
            return res;
        }
        ++iter;
        x = next_points(strategy, fx, dfx);
    }
}

} // namespace num::root
