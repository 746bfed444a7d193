#include "libnumerics/math/interpolation.hpp"
#include "libnumerics/root/builder.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string join(const std::vector<double>& v) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(6);
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i > 0) out << ", ";
        out << v[i];
    }
    return out.str();
}

void print_log(const num::root::ConvergenceLog& log) {
    std::cout << std::left << std::setw(10) << "Iteration"
              << std::setw(32) << "x"
              << std::setw(32) << "f(x)" << "\n";
    for (const auto& entry : log.entries()) {
        std::cout << std::left << std::setw(10) << entry.iteration
                  << std::setw(32) << join(entry.x)
                  << std::setw(32) << join(entry.fx) << "\n";
    }
}

void report(const std::string& title, num::root::RootFinder& finder) {
    const auto res = finder.find_root();
    std::cout << "== " << title << " ==\n";
    std::cout << "status: " << num::root::to_string(res.status)
              << "  iterations: " << res.iters << "\n";
    if (res.converged()) {
        std::cout << "root:   " << std::setprecision(12) << res.x << "\n";
    } else {
        std::cout << "reason: " << res.message << "\n";
    }
    print_log(finder.convergence_log());
    std::cout << "\n";
}

} // namespace

int main() {
    using num::root::Method;
    using num::root::RootFinderBuilder;

    // x^3 - x - 2 = 0, root near 1.5213797
    auto f = [](double x) { return x * x * x - x - 2.0; };
    auto df = [](double x) { return 3.0 * x * x - 1.0; };

    auto newton = RootFinderBuilder(Method::NewtonRaphson)
                      .function(f).derivative(df).initial_guess(400.0)
                      .tolerance(1e-6).max_iterations(100).log_convergence(true).build();
    report("Newton-Raphson from x0 = 400", *newton);

    for (Method m : {Method::Secant, Method::Bisection, Method::Brent}) {
        auto finder = RootFinderBuilder(m)
                          .function(f).boundaries(-4.0, 4.0)
                          .tolerance(1e-6).max_iterations(100).log_convergence(true).build();
        report(std::string(num::root::to_string(m)) + " on [-4, 4]", *finder);
    }

    try {
        RootFinderBuilder(Method::InverseQuadraticInterpolation)
            .function(f).boundaries(-4.0, 4.0).tolerance(1e-6).max_iterations(100).build();
    } catch (const num::root::ConfigError& e) {
        std::cout << "rejected: " << e.what() << "\n\n";
    }

    // Invert a tabulated curve: where does the cubic spline through y = sqrt(x) reach 1.5?
    std::vector<double> xs, ys;
    for (int i = 0; i <= 8; ++i) {
        xs.push_back(0.5 * i);
        ys.push_back(std::sqrt(0.5 * i));
    }
    const num::interp::Interpolator curve(xs, ys, num::interp::Kind::Cubic);
    auto inverse = RootFinderBuilder(Method::Brent)
                       .function([&curve](double x) { return curve(x) - 1.5; })
                       .boundaries(curve.x_min(), curve.x_max())
                       .tolerance(1e-10).max_iterations(100).build();
    const auto res = inverse->find_root();
    std::cout << "spline(x) = 1.5 at x = " << std::setprecision(10) << res.x
              << " (exact 2.25)\n";
    return 0;
}
