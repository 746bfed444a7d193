#pragma once

#include <cstddef>
#include <vector>

namespace num::interp {

enum class Kind {
    Linear,
    Quadratic,         // C1 quadratic spline, first segment linear
    Cubic,             // natural cubic spline
    ConstantBackward,  // value of the knot at or left of x
    ConstantForward    // value of the knot at or right of x
};

enum class Extrapolation {
    None,          // out-of-range x throws std::out_of_range
    Constant,      // nearest end value
    ExtendSpline   // continue the end segment's polynomial
};

// Piecewise polynomial through (x[i], y[i]). On segment j the value is
//   y[j] + b[j]*dx + c[j]*dx^2 + d[j]*dx^3,  dx = x - x[j].
class Interpolator {
public:
    // Throws std::invalid_argument unless x and y have the same length,
    // at least two points, and x is strictly increasing.
    Interpolator(std::vector<double> x,
                 std::vector<double> y,
                 Kind kind = Kind::Cubic,
                 Extrapolation extrapolation = Extrapolation::None);

    double interpolate(double x) const;
    double operator()(double x) const { return interpolate(x); }

    Kind kind() const { return kind_; }
    Extrapolation extrapolation() const { return extrapolation_; }
    double x_min() const { return x_.front(); }
    double x_max() const { return x_.back(); }
    std::size_t size() const { return x_.size(); }

private:
    std::vector<double> x_;
    std::vector<double> y_;
    std::vector<double> b_;
    std::vector<double> c_;
    std::vector<double> d_;
    Kind kind_;
    Extrapolation extrapolation_;

    double eval_segment(std::size_t j, double x) const;
    double extrapolate(double x) const;
};

} // namespace num::interp
