#include "libnumerics/root/brent.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace num::root {

namespace {

constexpr double EPS = std::numeric_limits<double>::epsilon();

bool strictly_between(double s, double lo, double hi) {
    if (lo > hi) {
        std::swap(lo, hi);
    }
    return lo < s && s < hi;
}

} // namespace

Brent::Brent(Function f, double x0, double x1, double tol, int max_iterations,
             bool log_convergence)
    : f_(std::move(f)),
      x0_(x0),
      x1_(x1),
      tol_(tol),
      max_iterations_(max_iterations),
      log_convergence_(log_convergence) {
    if (!f_) {
        throw std::invalid_argument("Brent: target function is empty");
    }
    if (!std::isfinite(x0) || !std::isfinite(x1)) {
        throw std::invalid_argument("Brent: bracket endpoints must be finite");
    }
    if (!(tol > 0.0) || !std::isfinite(tol)) {
        throw std::invalid_argument("Brent: tolerance must be positive and finite");
    }
    if (max_iterations < 1) {
        throw std::invalid_argument("Brent: max_iterations must be at least 1");
    }
}

Result Brent::find_root() {
    log_.reset();

    // b: best estimate, c: contrapoint (f(b), f(c) of opposite sign),
    // a: previous b. d: last step, e: the step before.
    double a = x0_;
    double b = x1_;
    double fa = f_(a);
    double fb = f_(b);
    std::size_t entry = 1;
    if (log_convergence_) {
        log_.add_entry(entry, {a, b}, {fa, fb});
    }

    if (!std::isfinite(fa) || !std::isfinite(fb)) {
        return failure(Status::InvalidBracket,
                       "Brent: function is not finite at a bracket endpoint");
    }
    if (fa * fb > 0.0) {
        return failure(Status::InvalidBracket,
                       "Brent: f(a) and f(b) must be of opposite signs");
    }

    double c = b;
    double fc = fb;
    double d = b - a;
    double e = d;

    for (int iter = 1; iter <= max_iterations_; ++iter) {
        if (fb * fc > 0.0) {
            // Sign change moved; the previous point becomes the contrapoint.
            c = a;
            fc = fa;
            d = b - a;
            e = d;
        }
        if (std::abs(fc) < std::abs(fb)) {
            a = b;
            b = c;
            c = a;
            fa = fb;
            fb = fc;
            fc = fa;
        }

        const double tol1 = 2.0 * EPS * std::abs(b) + 0.5 * tol_;
        const double m = 0.5 * (c - b);
        if (std::abs(m) <= tol1 || std::abs(fb) < tol_) {
            Result res = success(b);
            res.iters = iter;
            return res;
        }

        bool interpolated = false;
        if (std::abs(e) >= tol1 && std::abs(fa) > std::abs(fb)) {
            double s;
            if (fa != fc && fb != fc) {
                // inverse quadratic interpolation
                s = a * fb * fc / ((fa - fb) * (fa - fc))
                  + b * fa * fc / ((fb - fa) * (fb - fc))
                  + c * fa * fb / ((fc - fa) * (fc - fb));
            } else {
                // secant
                s = b - fb * (b - a) / (fb - fa);
            }
            if (strictly_between(s, (3.0 * c + b) / 4.0, b) && std::abs(s - b) < 0.5 * std::abs(e)) {
                e = d;
                d = s - b;
                interpolated = true;
            }
        }
        if (!interpolated) {
            d = m;
            e = d;
        }

        a = b;
        fa = fb;
        b += (std::abs(d) > tol1) ? d : std::copysign(tol1, m);
        fb = f_(b);
        if (log_convergence_) {
            log_.add_entry(++entry, {b}, {fb});
        }
    }

    Result res = failure(Status::MaxIterations,
                         "Brent: failed to converge within "
                         + std::to_string(max_iterations_) + " iterations");
    res.iters = max_iterations_;
    return res;
}

} // namespace num::root
