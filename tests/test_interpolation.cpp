#include <catch2/catch_all.hpp>

#include "libnumerics/math/interpolation.hpp"
#include "libnumerics/root/builder.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using Catch::Approx;
using num::interp::Extrapolation;
using num::interp::Interpolator;
using num::interp::Kind;

TEST_CASE("Linear interpolation hits knots and midpoints", "[interp]") {
    const Interpolator lin({0.0, 1.0, 2.0, 3.0}, {0.0, 2.0, 4.0, 6.0}, Kind::Linear);
    CHECK(lin(0.0) == 0.0);
    CHECK(lin(1.0) == 2.0);
    CHECK(lin(3.0) == 6.0);
    CHECK(lin(0.5) == Approx(1.0));
    CHECK(lin(2.5) == Approx(5.0));
}

TEST_CASE("Extrapolation modes", "[interp][edge]") {
    const std::vector<double> x{0.0, 1.0, 2.0, 3.0};
    const std::vector<double> y{0.0, 2.0, 4.0, 6.0};

    const Interpolator none(x, y, Kind::Linear, Extrapolation::None);
    REQUIRE_THROWS_AS(none(-1.0), std::out_of_range);
    REQUIRE_THROWS_AS(none(3.5), std::out_of_range);

    const Interpolator flat(x, y, Kind::Linear, Extrapolation::Constant);
    CHECK(flat(-1.0) == 0.0);
    CHECK(flat(5.0) == 6.0);

    const Interpolator extend(x, y, Kind::Linear, Extrapolation::ExtendSpline);
    CHECK(extend(-1.0) == Approx(-2.0));
    CHECK(extend(4.0) == Approx(8.0));
}

TEST_CASE("Non-finite abscissas are rejected for every kind", "[interp][edge]") {
    const std::vector<double> x{0.0, 1.0, 2.0};
    const std::vector<double> y{1.0, 3.0, 2.0};
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    for (auto kind : {Kind::Linear, Kind::Quadratic, Kind::Cubic,
                      Kind::ConstantBackward, Kind::ConstantForward}) {
        const Interpolator f(x, y, kind, Extrapolation::Constant);
        INFO("kind " << static_cast<int>(kind));
        REQUIRE_THROWS_AS(f.interpolate(nan), std::invalid_argument);
        REQUIRE_THROWS_AS(f(inf), std::invalid_argument);
        REQUIRE_THROWS_AS(f(-inf), std::invalid_argument);
    }
}

TEST_CASE("Quadratic spline is continuous with a continuous slope", "[interp]") {
    const Interpolator q({0.0, 1.0, 2.0}, {0.0, 1.0, 4.0}, Kind::Quadratic, Extrapolation::ExtendSpline);
    CHECK(q(0.0) == Approx(0.0));
    CHECK(q(1.0) == Approx(1.0));
    CHECK(q(2.0) == Approx(4.0));
    CHECK(q(0.5) == Approx(0.5));    // first segment is linear
    CHECK(q(1.5) == Approx(2.0));
    CHECK(q(-1.0) == Approx(-1.0));
    CHECK(q(3.0) == Approx(11.0));

    const Interpolator wavy({0.0, 1.0, 2.5, 4.0, 5.5}, {1.0, 2.5, 3.5, 1.0, 0.5}, Kind::Quadratic);
    const double h = 1e-6;
    for (double knot : {1.0, 2.5, 4.0}) {
        const double left = (wavy(knot) - wavy(knot - h)) / h;
        const double right = (wavy(knot + h) - wavy(knot)) / h;
        CHECK(left == Approx(right).margin(1e-4));
    }
}

TEST_CASE("Natural cubic spline reference values", "[interp]") {
    std::vector<double> x{0.0, 1.0, 2.0, 3.0, 4.0};
    std::vector<double> y;
    for (double xi : x) {
        y.push_back(xi * xi * xi - xi * xi + 2.0 * xi - 1.0);
    }
    const Interpolator cubic(x, y, Kind::Cubic);
    CHECK(cubic(2.5) == Approx(13.098214285714).margin(1e-9));
    CHECK(cubic(1.5) == Approx(3.223214285714).margin(1e-9));
    CHECK(cubic(4.0) == Approx(55.0));

    const Interpolator extend({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 8.0, 27.0}, Kind::Cubic, Extrapolation::ExtendSpline);
    CHECK(extend(-1.0) == Approx(-1.0));
    CHECK(extend(4.0) == Approx(46.0));

    const Interpolator two({1.0, 2.0}, {1.0, 8.0}, Kind::Cubic, Extrapolation::ExtendSpline);
    CHECK(two(1.5) == Approx(4.5));
    CHECK(two(0.5) == Approx(-2.5));
}

TEST_CASE("Step interpolation picks the neighbouring knot", "[interp]") {
    const std::vector<double> x{0.0, 1.0, 2.0};
    const std::vector<double> y{10.0, 20.0, 30.0};
    const Interpolator back(x, y, Kind::ConstantBackward, Extrapolation::ExtendSpline);
    const Interpolator fwd(x, y, Kind::ConstantForward);

    CHECK(back(0.5) == 10.0);
    CHECK(back(1.0) == 20.0);
    CHECK(back(2.0) == 30.0);
    CHECK(back(-3.0) == 10.0);
    CHECK(fwd(0.5) == 20.0);
    CHECK(fwd(1.0) == 20.0);
    CHECK(fwd(1.5) == 30.0);
    CHECK(fwd(2.0) == 30.0);
}

TEST_CASE("Interpolator rejects malformed tables", "[interp][edge]") {
    REQUIRE_THROWS_AS(Interpolator({0.0}, {1.0}), std::invalid_argument);
    REQUIRE_THROWS_AS(Interpolator({0.0, 1.0}, {1.0}), std::invalid_argument);
    REQUIRE_THROWS_AS(Interpolator({0.0, 0.0, 1.0}, {1.0, 2.0, 3.0}), std::invalid_argument);
    REQUIRE_THROWS_AS(Interpolator({1.0, 0.0}, {1.0, 2.0}), std::invalid_argument);
}

TEST_CASE("Interpolated curve can be inverted with a root finder", "[interp][brent]") {
    const Interpolator curve({0.0, 1.0, 2.0, 3.0, 4.0}, {0.0, 1.0, 4.0, 9.0, 16.0}, Kind::Cubic);
    auto finder = num::root::RootFinderBuilder(num::root::Method::Brent)
                      .function([&curve](double x) { return curve(x) - 6.0; })
                      .boundaries(0.0, 4.0)
                      .tolerance(1e-10)
                      .max_iterations(100)
                      .build();
    const auto res = finder->find_root();
    REQUIRE(res.converged());
    CHECK(curve(res.x) == Approx(6.0).margin(1e-9));
    CHECK(res.x > 2.0);
    CHECK(res.x < 3.0);
}
