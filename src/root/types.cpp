#include "libnumerics/root/types.hpp"

namespace num::root {

const char* to_string(Method method) {
    switch (method) {
        case Method::Bisection: return "Bisection";
        case Method::Secant: return "Secant";
        case Method::NewtonRaphson: return "NewtonRaphson";
        case Method::Brent: return "Brent";
        case Method::InverseQuadraticInterpolation: return "InverseQuadraticInterpolation";
    }
    return "Unknown";
}

const char* to_string(Status status) {
    switch (status) {
        case Status::Converged: return "Converged";
        case Status::InvalidBracket: return "InvalidBracket";
        case Status::DerivativeTooSmall: return "DerivativeTooSmall";
        case Status::DenominatorTooSmall: return "DenominatorTooSmall";
        case Status::MaxIterations: return "MaxIterations";
    }
    return "Unknown";
}

} // namespace num::root
