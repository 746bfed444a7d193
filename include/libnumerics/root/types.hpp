#pragma once

#include <functional>
#include <limits>
#include <string>
#include <utility>

namespace num::root {

using Function = std::function<double(double)>;

enum class Method {
    Bisection,
    Secant,
    NewtonRaphson,
    Brent,
    // Reserved: accepted by the config struct, rejected by the builder.
    InverseQuadraticInterpolation
};

enum class Status {
    Converged,
    InvalidBracket,       // f(a), f(b) not of opposite sign
    DerivativeTooSmall,   // |f'(x)| < machine epsilon
    DenominatorTooSmall,  // |f(x0) - f(x1)| < machine epsilon
    MaxIterations
};

struct Result {
    double x = std::numeric_limits<double>::quiet_NaN();
    int iters = 0;
    Status status = Status::MaxIterations;
    std::string message;

    bool converged() const { return status == Status::Converged; }
};

inline Result success(double x) {
    return {x, 0, Status::Converged, {}};
}

inline Result failure(Status status, std::string message) {
    return {std::numeric_limits<double>::quiet_NaN(), 0, status, std::move(message)};
}

const char* to_string(Method method);
const char* to_string(Status status);

} // namespace num::root
