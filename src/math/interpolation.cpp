#include "libnumerics/math/interpolation.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace num::interp {

namespace {

struct Coefficients {
    std::vector<double> b;
    std::vector<double> c;
    std::vector<double> d;
};

Coefficients linear_coefficients(const std::vector<double>& x, const std::vector<double>& y) {
    const std::size_t n = x.size() - 1;
    Coefficients k{std::vector<double>(n), std::vector<double>(n, 0.0), std::vector<double>(n, 0.0)};
    for (std::size_t i = 0; i < n; ++i) {
        k.b[i] = (y[i + 1] - y[i]) / (x[i + 1] - x[i]);
    }
    return k;
}

// Slope carried across knots: b[i+1] = b[i] + 2 c[i] h[i], with c[0] = 0.
Coefficients quadratic_coefficients(const std::vector<double>& x, const std::vector<double>& y) {
    const std::size_t n = x.size() - 1;
    Coefficients k{std::vector<double>(n), std::vector<double>(n), std::vector<double>(n, 0.0)};
    k.b[0] = (y[1] - y[0]) / (x[1] - x[0]);
    k.c[0] = 0.0;
    for (std::size_t i = 1; i < n; ++i) {
        const double h_prev = x[i] - x[i - 1];
        const double h = x[i + 1] - x[i];
        k.b[i] = k.b[i - 1] + 2.0 * k.c[i - 1] * h_prev;
        const double slope = (y[i + 1] - y[i]) / h;
        k.c[i] = (slope - k.b[i]) / h;
    }
    return k;
}

// Natural cubic spline (second derivative zero at both ends), tridiagonal sweep.
Coefficients cubic_coefficients(const std::vector<double>& x, const std::vector<double>& y) {
    const std::size_t n = x.size() - 1;
    std::vector<double> h(n);
    for (std::size_t i = 0; i < n; ++i) {
        h[i] = x[i + 1] - x[i];
    }

    std::vector<double> alpha(n + 1, 0.0);
    for (std::size_t i = 1; i < n; ++i) {
        alpha[i] = 3.0 / h[i] * (y[i + 1] - y[i]) - 3.0 / h[i - 1] * (y[i] - y[i - 1]);
    }

    std::vector<double> l(n + 1, 1.0);
    std::vector<double> mu(n + 1, 0.0);
    std::vector<double> z(n + 1, 0.0);
    for (std::size_t i = 1; i < n; ++i) {
        l[i] = 2.0 * (x[i + 1] - x[i - 1]) - h[i - 1] * mu[i - 1];
        mu[i] = h[i] / l[i];
        z[i] = (alpha[i] - h[i - 1] * z[i - 1]) / l[i];
    }

    Coefficients k{std::vector<double>(n), std::vector<double>(n + 1, 0.0), std::vector<double>(n)};
    for (std::size_t j = n; j-- > 0;) {
        k.c[j] = z[j] - mu[j] * k.c[j + 1];
        k.b[j] = (y[j + 1] - y[j]) / h[j] - h[j] * (k.c[j + 1] + 2.0 * k.c[j]) / 3.0;
        k.d[j] = (k.c[j + 1] - k.c[j]) / (3.0 * h[j]);
    }
    k.c.resize(n);
    return k;
}

} // namespace

Interpolator::Interpolator(std::vector<double> x,
                           std::vector<double> y,
                           Kind kind,
                           Extrapolation extrapolation)
    : x_(std::move(x)), y_(std::move(y)), kind_(kind), extrapolation_(extrapolation) {
    if (x_.size() != y_.size() || x_.size() < 2) {
        throw std::invalid_argument("Interpolator: x and y must have the same length and at least two points");
    }
    for (std::size_t i = 0; i < x_.size(); ++i) {
        if (!std::isfinite(x_[i]) || !std::isfinite(y_[i])) {
            throw std::invalid_argument("Interpolator: table values must be finite");
        }
        if (i > 0 && !(x_[i] > x_[i - 1])) {
            throw std::invalid_argument("Interpolator: x must be strictly increasing");
        }
    }

    Coefficients k;
    switch (kind_) {
        case Kind::Linear:    k = linear_coefficients(x_, y_); break;
        case Kind::Quadratic: k = quadratic_coefficients(x_, y_); break;
        case Kind::Cubic:     k = cubic_coefficients(x_, y_); break;
        case Kind::ConstantBackward:
        case Kind::ConstantForward:
            break;
    }
    b_ = std::move(k.b);
    c_ = std::move(k.c);
    d_ = std::move(k.d);
}

double Interpolator::interpolate(double x) const {
    if (!std::isfinite(x)) {
        throw std::invalid_argument("Interpolator::interpolate: x must be finite");
    }
    if (x < x_.front() || x > x_.back()) {
        return extrapolate(x);
    }

    // upper_bound returns the first knot > x; the segment starts one before it.
    const auto it = std::upper_bound(x_.begin(), x_.end(), x);
    const std::size_t hi = static_cast<std::size_t>(it - x_.begin());
    const std::size_t j = std::min(hi - 1, x_.size() - 2);

    switch (kind_) {
        case Kind::ConstantBackward:
            return y_[hi - 1];
        case Kind::ConstantForward:
            return (x_[hi - 1] == x) ? y_[hi - 1] : y_[hi];
        default:
            return eval_segment(j, x);
    }
}

double Interpolator::eval_segment(std::size_t j, double x) const {
    const double dx = x - x_[j];
    return y_[j] + dx * (b_[j] + dx * (c_[j] + dx * d_[j]));
}

double Interpolator::extrapolate(double x) const {
    const bool below = x < x_.front();
    switch (extrapolation_) {
        case Extrapolation::None: {
            std::ostringstream msg;
            msg << "Interpolator: x = " << x << " is outside [" << x_.front() << ", "
                << x_.back() << "] and extrapolation is disabled";
            throw std::out_of_range(msg.str());
        }
        case Extrapolation::Constant:
            return below ? y_.front() : y_.back();
        case Extrapolation::ExtendSpline:
            if (kind_ == Kind::ConstantBackward || kind_ == Kind::ConstantForward) {
                return below ? y_.front() : y_.back();
            }
            return eval_segment(below ? 0 : x_.size() - 2, x);
    }
    return below ? y_.front() : y_.back();
}

} // namespace num::interp
