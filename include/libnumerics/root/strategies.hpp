#pragma once

#include "libnumerics/root/types.hpp"

#include <optional>
#include <variant>
#include <vector>

namespace num::root {

// Every strategy exposes the same three calls to the iteration driver:
//   initial_points()         first abscissas to evaluate
//   next_points(fx, dfx)     advance the internal state from f (and f') at the last points
//   should_stop(fx, dfx)     nullopt to continue, otherwise the final Result
// fx and dfx are indexed like the points they were evaluated at; dfx is empty
// when no derivative is supplied.

// Bracketing search on (x0, x1). The first call halves the bracket from the
// right; when the half on the left holds no sign change the bracket is pushed
// back out to the right and halved from the left.
class Bisection {
public:
    Bisection(double x0, double x1, double tol);

    std::vector<double> initial_points();
    std::vector<double> next_points(const std::vector<double>& fx, const std::vector<double>& dfx);
    std::optional<Result> should_stop(const std::vector<double>& fx, const std::vector<double>& dfx) const;

    double left() const { return x0_; }
    double right() const { return x1_; }

private:
    double x0_;
    double x1_;
    double tol_;
    bool search_left_ = false;
};

class Secant {
public:
    Secant(double x0, double x1, double tol);

    std::vector<double> initial_points();
    std::vector<double> next_points(const std::vector<double>& fx, const std::vector<double>& dfx);
    std::optional<Result> should_stop(const std::vector<double>& fx, const std::vector<double>& dfx) const;

private:
    double x0_;
    double x1_;
    double x2_;  // last secant candidate
    double tol_;
};

class NewtonRaphson {
public:
    NewtonRaphson(double x0, double tol);

    std::vector<double> initial_points();
    std::vector<double> next_points(const std::vector<double>& fx, const std::vector<double>& dfx);
    std::optional<Result> should_stop(const std::vector<double>& fx, const std::vector<double>& dfx) const;

    double current() const { return x0_; }

private:
    double x0_;
    double tol_;
};

using Strategy = std::variant<Bisection, Secant, NewtonRaphson>;

std::vector<double> initial_points(Strategy& strategy);
std::vector<double> next_points(Strategy& strategy,
                                const std::vector<double>& fx,
                                const std::vector<double>& dfx);
std::optional<Result> should_stop(const Strategy& strategy,
                                  const std::vector<double>& fx,
                                  const std::vector<double>& dfx);

bool requires_derivative(const Strategy& strategy);
Method method_of(const Strategy& strategy);

} // namespace num::root
