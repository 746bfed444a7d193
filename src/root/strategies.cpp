#include "libnumerics/root/strategies.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace num::root {

namespace {

constexpr double EPS = std::numeric_limits<double>::epsilon();

void check_tolerance(double tol, const char* who) {
    if (!(tol > 0.0) || !std::isfinite(tol)) {
        throw std::invalid_argument(std::string(who) + ": tolerance must be positive and finite");
    }
}

void check_finite(double x, const char* who) {
    if (!std::isfinite(x)) {
        throw std::invalid_argument(std::string(who) + ": starting point must be finite");
    }
}

void check_arity(const std::vector<double>& v, std::size_t n, const char* who) {
    if (v.size() != n) {
        throw std::invalid_argument(std::string(who) + ": expected " + std::to_string(n)
                                    + " values, got " + std::to_string(v.size()));
    }
}

} // namespace

// --- Bisection ---

Bisection::Bisection(double x0, double x1, double tol) : x0_(x0), x1_(x1), tol_(tol) {
    check_finite(x0, "Bisection");
    check_finite(x1, "Bisection");
    check_tolerance(tol, "Bisection");
}

std::vector<double> Bisection::initial_points() {
    x1_ = 0.5 * (x0_ + x1_);
    return {x0_, x1_};
}

std::vector<double> Bisection::next_points(const std::vector<double>& fx, const std::vector<double>&) {
    check_arity(fx, 2, "Bisection");
    if (fx[0] * fx[1] < 0.0) {
        x1_ = 0.5 * (x0_ + x1_);
        search_left_ = true;
    } else {
        x1_ = 2.0 * x1_ - x0_;
        x0_ = 0.5 * (x0_ + x1_);
        search_left_ = false;
    }
    return {x0_, x1_};
}

std::optional<Result> Bisection::should_stop(const std::vector<double>& fx, const std::vector<double>&) const {
    check_arity(fx, 2, "Bisection");
    // The endpoint moved by the last step is the freshly bisected point.
    const double f_new = search_left_ ? fx[1] : fx[0];
    if (std::abs(f_new) < tol_ || std::abs(x1_ - x0_) < tol_) {
        return success(0.5 * (x0_ + x1_));
    }
    return std::nullopt;
}

// --- Secant ---

Secant::Secant(double x0, double x1, double tol) : x0_(x0), x1_(x1), x2_(x1), tol_(tol) {
    check_finite(x0, "Secant");
    check_finite(x1, "Secant");
    check_tolerance(tol, "Secant");
}

std::vector<double> Secant::initial_points() {
    return {x0_, x1_};
}

std::vector<double> Secant::next_points(const std::vector<double>& fx, const std::vector<double>&) {
    check_arity(fx, 2, "Secant");
    x2_ = x1_ - fx[1] * (x1_ - x0_) / (fx[1] - fx[0]);
    x0_ = x1_;
    x1_ = x2_;
    return {x0_, x1_};
}

std::optional<Result> Secant::should_stop(const std::vector<double>& fx, const std::vector<double>&) const {
    check_arity(fx, 2, "Secant");
    if (std::abs(x0_ - x1_) < tol_) {
        return success(x2_);
    }
    if (std::abs(fx[0] - fx[1]) < EPS) {
        return failure(Status::DenominatorTooSmall,
                       "Secant: |f(x0) - f(x1)| below machine epsilon");
    }
    return std::nullopt;
}

// --- Newton-Raphson ---

NewtonRaphson::NewtonRaphson(double x0, double tol) : x0_(x0), tol_(tol) {
    check_finite(x0, "NewtonRaphson");
    check_tolerance(tol, "NewtonRaphson");
}

std::vector<double> NewtonRaphson::initial_points() {
    return {x0_};
}

std::vector<double> NewtonRaphson::next_points(const std::vector<double>& fx, const std::vector<double>& dfx) {
    check_arity(fx, 1, "NewtonRaphson");
    check_arity(dfx, 1, "NewtonRaphson");
    x0_ -= fx[0] / dfx[0];
    return {x0_};
}

std::optional<Result> NewtonRaphson::should_stop(const std::vector<double>& fx, const std::vector<double>& dfx) const {
    check_arity(fx, 1, "NewtonRaphson");
    check_arity(dfx, 1, "NewtonRaphson");
    // A zero derivative gives an inf/NaN candidate, which fails the tolerance test.
    const double candidate = x0_ - fx[0] / dfx[0];
    if (std::abs(x0_ - candidate) < tol_) {
        return success(candidate);
    }
    if (std::abs(dfx[0]) < EPS) {
        return failure(Status::DerivativeTooSmall,
                       "NewtonRaphson: derivative too close to zero");
    }
    return std::nullopt;
}

// --- dispatch ---

std::vector<double> initial_points(Strategy& strategy) {
    return std::visit([](auto& s) { return s.initial_points(); }, strategy);
}

std::vector<double> next_points(Strategy& strategy,
                                const std::vector<double>& fx,
                                const std::vector<double>& dfx) {
    return std::visit([&](auto& s) { return s.next_points(fx, dfx); }, strategy);
}

std::optional<Result> should_stop(const Strategy& strategy,
                                  const std::vector<double>& fx,
                                  const std::vector<double>& dfx) {
    return std::visit([&](const auto& s) { return s.should_stop(fx, dfx); }, strategy);
}

bool requires_derivative(const Strategy& strategy) {
    return std::holds_alternative<NewtonRaphson>(strategy);
}

Method method_of(const Strategy& strategy) {
    return std::visit([](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Bisection>) {
            return Method::Bisection;
        } else if constexpr (std::is_same_v<T, Secant>) {
            return Method::Secant;
        } else {
            return Method::NewtonRaphson;
        }
    }, strategy);
}

} // namespace num::root
