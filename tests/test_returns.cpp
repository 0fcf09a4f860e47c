/**
 * @file test_returns.cpp
 * @brief Unit tests for the return and excess return transforms
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "calc/errors.hpp"
#include "calc/returns.hpp"
#include <limits>

using namespace kelly::calc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Simple returns", "[Returns]") {
    SECTION("Hand-computed single asset") {
        Eigen::MatrixXd prices(3, 1);
        prices << 100.0, 110.0, 121.0;

        auto returns = compute_returns(prices);

        REQUIRE(returns.rows() == 2);
        REQUIRE(returns.cols() == 1);
        REQUIRE(returns(0, 0) == 0.1);
        REQUIRE(returns(1, 0) == 0.1);
    }

    SECTION("Multiple assets") {
        Eigen::MatrixXd prices(2, 2);
        prices << 100.0, 200.0,
                  110.0, 210.0;

        auto returns = compute_returns(prices);
        REQUIRE_THAT(returns(0, 0), WithinRel(0.1, 1e-9));
        REQUIRE_THAT(returns(0, 1), WithinRel(0.05, 1e-9));
    }

    SECTION("Every cell follows (p_t - p_{t-1}) / p_{t-1}") {
        Eigen::MatrixXd prices(5, 3);
        prices << 100.0, 50.0, 10.0,
                  101.5, 49.0, 10.2,
                   99.0, 51.3,  9.9,
                  102.2, 51.3, 10.5,
                  104.9, 48.7, 10.4;

        auto returns = compute_returns(prices);
        REQUIRE(returns.rows() == prices.rows() - 1);
        for (Eigen::Index t = 1; t < prices.rows(); ++t) {
            for (Eigen::Index k = 0; k < prices.cols(); ++k) {
                const double expected = (prices(t, k) - prices(t - 1, k)) / prices(t - 1, k);
                REQUIRE_THAT(returns(t - 1, k), WithinRel(expected, 1e-9) || WithinAbs(0.0, 1e-15));
            }
        }
    }

    SECTION("Drops the first row") {
        Eigen::MatrixXd prices(4, 1);
        prices << 100.0, 110.0, 121.0, 133.1;
        REQUIRE(compute_returns(prices).rows() == 3);
    }
}

TEST_CASE("Simple returns input validation", "[Returns]") {
    SECTION("Zero price") {
        Eigen::MatrixXd prices(3, 1);
        prices << 100.0, 0.0, 110.0;
        REQUIRE_THROWS_AS(compute_returns(prices), InvalidInput);
    }

    SECTION("Negative price") {
        Eigen::MatrixXd prices(2, 2);
        prices << 100.0, 5.0,
                  101.0, -5.0;
        REQUIRE_THROWS_AS(compute_returns(prices), InvalidInput);
    }

    SECTION("Missing price") {
        Eigen::MatrixXd prices(2, 1);
        prices << 100.0, std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(compute_returns(prices), InvalidInput);
    }

    SECTION("Single row") {
        Eigen::MatrixXd prices(1, 2);
        prices << 100.0, 200.0;
        REQUIRE_THROWS_AS(compute_returns(prices), InvalidInput);
    }

    SECTION("No instruments") {
        Eigen::MatrixXd prices(3, 0);
        REQUIRE_THROWS_AS(compute_returns(prices), InvalidInput);
    }

    SECTION("InvalidInput is an invalid_argument") {
        Eigen::MatrixXd prices(1, 1);
        prices << 100.0;
        REQUIRE_THROWS_AS(compute_returns(prices), std::invalid_argument);
    }
}

TEST_CASE("Excess returns", "[Returns]") {
    Eigen::MatrixXd returns(2, 2);
    returns << 0.10, 0.05,
               0.10, -0.02;

    SECTION("Subtracts annual_rf / 252") {
        auto excess = compute_excess_returns(returns, 0.0252);
        const double daily_rf = 0.0252 / 252; // 0.0001
        for (Eigen::Index i = 0; i < returns.rows(); ++i) {
            for (Eigen::Index j = 0; j < returns.cols(); ++j) {
                REQUIRE_THAT(excess(i, j), WithinAbs(returns(i, j) - daily_rf, 1e-15));
            }
        }
    }

    SECTION("Zero rate leaves returns unchanged") {
        auto excess = compute_excess_returns(returns, 0.0);
        REQUIRE((excess.array() == returns.array()).all());
    }

    SECTION("Custom periods per year") {
        auto excess = compute_excess_returns(returns, 0.12, 12);
        REQUIRE_THAT(excess(0, 0), WithinAbs(0.09, 1e-15));
    }

    SECTION("Negative rate adds the period rate") {
        auto excess = compute_excess_returns(returns, -0.0252);
        REQUIRE_THAT(excess(1, 1), WithinAbs(-0.0199, 1e-15));
    }

    SECTION("Invalid inputs") {
        REQUIRE_THROWS_AS(compute_excess_returns(Eigen::MatrixXd(0, 2), 0.05), InvalidInput);
        REQUIRE_THROWS_AS(compute_excess_returns(returns, std::numeric_limits<double>::infinity()), InvalidInput);
        REQUIRE_THROWS_AS(compute_excess_returns(returns, 0.05, 0), InvalidInput);
    }
}
