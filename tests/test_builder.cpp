#include <catch2/catch_all.hpp>

#include "libnumerics/root/builder.hpp"

#include <cmath>

using num::root::ConfigError;
using num::root::Method;
using num::root::RootFinderBuilder;
using Catch::Matchers::ContainsSubstring;

namespace {

struct Counted {
    int calls = 0;
    num::root::Function wrap() {
        return [this](double x) { ++calls; return x * x * x - x - 2.0; };
    }
};

double cubic_prime(double x) { return 3.0 * x * x - 1.0; }

} // namespace

TEST_CASE("Builder rejects missing method parameters before evaluating f", "[builder]") {
    Counted f;

    SECTION("Newton-Raphson without a derivative") {
        auto b = RootFinderBuilder(Method::NewtonRaphson)
                     .function(f.wrap()).initial_guess(1.0).tolerance(1e-6).max_iterations(50);
        REQUIRE_THROWS_WITH(b.build(), ContainsSubstring("derivative"));
    }
    SECTION("Newton-Raphson without an initial guess") {
        auto b = RootFinderBuilder(Method::NewtonRaphson)
                     .function(f.wrap()).derivative(cubic_prime).tolerance(1e-6).max_iterations(50);
        REQUIRE_THROWS_WITH(b.build(), ContainsSubstring("initial guess"));
    }
    SECTION("bracketing methods without boundaries") {
        for (Method m : {Method::Secant, Method::Bisection, Method::Brent}) {
            auto b = RootFinderBuilder(m).function(f.wrap()).tolerance(1e-6).max_iterations(50);
            REQUIRE_THROWS_AS(b.build(), ConfigError);
        }
    }
    CHECK(f.calls == 0);
}

TEST_CASE("Builder rejects the reserved interpolation method", "[builder]") {
    Counted f;
    auto b = RootFinderBuilder(Method::InverseQuadraticInterpolation)
                 .function(f.wrap()).boundaries(1.0, 2.0).tolerance(1e-6).max_iterations(50);
    REQUIRE_THROWS_AS(b.build(), ConfigError);
    REQUIRE_THROWS_WITH(b.build(), ContainsSubstring("unsupported method"));
    CHECK(f.calls == 0);
}

TEST_CASE("Builder validates shared parameters", "[builder][edge]") {
    Counted f;
    auto base = RootFinderBuilder(Method::Brent).function(f.wrap()).boundaries(1.0, 2.0);

    REQUIRE_THROWS_WITH(RootFinderBuilder(base).max_iterations(10).build(),
                        ContainsSubstring("tolerance"));
    REQUIRE_THROWS_AS(RootFinderBuilder(base).tolerance(0.0).max_iterations(10).build(), ConfigError);
    REQUIRE_THROWS_AS(RootFinderBuilder(base).tolerance(NAN).max_iterations(10).build(), ConfigError);
    REQUIRE_THROWS_WITH(RootFinderBuilder(base).tolerance(1e-6).build(),
                        ContainsSubstring("max iterations"));
    REQUIRE_THROWS_AS(RootFinderBuilder(base).tolerance(1e-6).max_iterations(0).build(), ConfigError);
    REQUIRE_THROWS_AS(RootFinderBuilder(base).tolerance(1e-6).max_iterations(10).boundaries(1.0, 1.0).build(),
                      ConfigError);
    REQUIRE_THROWS_WITH(RootFinderBuilder(Method::Brent).boundaries(1.0, 2.0).tolerance(1e-6).max_iterations(10).build(),
                        ContainsSubstring("function"));
    CHECK(f.calls == 0);
}

TEST_CASE("ConfigError is an invalid_argument", "[builder]") {
    num::root::RootFinderConfig cfg;
    cfg.method = Method::Secant;
    REQUIRE_THROWS_AS(num::root::build_root_finder(cfg), std::invalid_argument);
}

TEST_CASE("Built finders evaluate f only when searching", "[builder]") {
    Counted f;
    for (Method m : {Method::Secant, Method::Bisection, Method::Brent}) {
        f.calls = 0;
        auto finder = RootFinderBuilder(m)
                          .function(f.wrap())
                          .boundaries(1.0, 2.0)
                          .tolerance(1e-8)
                          .max_iterations(200)
                          .build();
        REQUIRE(finder);
        CHECK(finder->method() == m);
        CHECK(f.calls == 0);

        const auto res = finder->find_root();
        INFO("method " << num::root::to_string(m));
        REQUIRE(res.converged());
        CHECK(std::abs(res.x - 1.5213797068045676) < 1e-6);
        CHECK(f.calls > 0);
        // logging defaults to off
        CHECK(finder->convergence_log().empty());
    }
}

TEST_CASE("Config struct builds the same finder as the fluent builder", "[builder]") {
    num::root::RootFinderConfig cfg;
    cfg.method = Method::NewtonRaphson;
    cfg.function = [](double x) { return x * x * x - x - 2.0; };
    cfg.derivative = cubic_prime;
    cfg.initial_guess = 400.0;
    cfg.tolerance = 1e-6;
    cfg.max_iterations = 100;
    cfg.log_convergence = true;

    auto finder = num::root::build_root_finder(cfg);
    const auto res = finder->find_root();
    REQUIRE(res.converged());
    CHECK(std::abs(res.x - 1.5213797) < 1e-6);
    CHECK(finder->convergence_log().size() == static_cast<std::size_t>(res.iters));
}
