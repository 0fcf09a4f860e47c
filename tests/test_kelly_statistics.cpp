/**
 * @file test_kelly_statistics.cpp
 * @brief Unit tests for Sharpe ratio, growth rate and half Kelly
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "calc/errors.hpp"
#include "calc/kelly_statistics.hpp"
#include <limits>

using namespace kelly::calc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Single asset statistics", "[KellyStatistics]")
{
    Eigen::VectorXd mean(1);
    mean << 0.10;
    Eigen::MatrixXd cov(1, 1);
    cov << 0.04;

    Eigen::VectorXd leverage = cov.fullPivLu().solve(mean);
    REQUIRE_THAT(leverage(0), WithinRel(2.5, 1e-12));

    const double sharpe = compute_sharpe(mean, cov, leverage);
    REQUIRE_THAT(sharpe, WithinRel(0.5, 1e-12));

    // S^2 = M^T C^-1 M = 0.01 / 0.04
    REQUIRE_THAT(sharpe * sharpe, WithinRel(0.25, 1e-12));
    REQUIRE_THAT(compute_max_growth_rate(0.05, sharpe), WithinRel(0.175, 1e-12));
}

TEST_CASE("Maximum growth rate", "[KellyStatistics]")
{
    REQUIRE_THAT(compute_max_growth_rate(0.05, 1.0), WithinAbs(0.55, 1e-15));
    REQUIRE(compute_max_growth_rate(0.03, 0.0) == 0.03);
    REQUIRE(compute_max_growth_rate(-0.01, 0.0) == -0.01);
}

TEST_CASE("Half Kelly", "[KellyStatistics]")
{
    Eigen::VectorXd leverage(3);
    leverage << 2.0, -1.0, 0.5;

    auto half = compute_half_kelly(leverage);
    REQUIRE(half.size() == 3);
    REQUIRE(half(0) == 1.0);
    REQUIRE(half(1) == -0.5);
    REQUIRE(half(2) == 0.25);
}

TEST_CASE("Sharpe radicand handling", "[KellyStatistics]")
{
    Eigen::VectorXd mean(2);
    mean << 0.0, 0.0;

    SECTION("Positive definite covariance")
    {
        Eigen::MatrixXd cov(2, 2);
        cov << 0.04, 0.01,
               0.01, 0.09;
        Eigen::VectorXd leverage(2);
        leverage << 1.0, -2.0;

        auto estimate = estimate_sharpe(mean, cov, leverage);
        // 0.04 - 0.04 + 0.36
        REQUIRE_THAT(estimate.radicand, WithinAbs(0.36, 1e-14));
        REQUIRE_THAT(estimate.sharpe, WithinAbs(0.6, 1e-14));
        REQUIRE_FALSE(estimate.clamped);
    }

    SECTION("Rounding residue is clamped to zero")
    {
        Eigen::MatrixXd cov(2, 2);
        cov << 1.0, -1.0,
               -1.0, 1.0 - 1e-13;
        Eigen::VectorXd leverage(2);
        leverage << 1.0, 1.0;

        auto estimate = estimate_sharpe(mean, cov, leverage);
        REQUIRE(estimate.radicand < 0.0);
        REQUIRE(estimate.clamped);
        REQUIRE(estimate.sharpe == 0.0);
        REQUIRE(compute_sharpe(mean, cov, leverage) == 0.0);
    }

    SECTION("Materially negative radicand is an error")
    {
        Eigen::MatrixXd cov(2, 2);
        cov << 1.0, 0.0,
               0.0, -1.0;
        Eigen::VectorXd leverage(2);
        leverage << 1.0, 2.0;

        REQUIRE_THROWS_AS(estimate_sharpe(mean, cov, leverage), NumericInstability);
        REQUIRE_THROWS_AS(compute_sharpe(mean, cov, leverage), std::runtime_error);
    }
}

TEST_CASE("Sharpe input validation", "[KellyStatistics]")
{
    Eigen::VectorXd mean(2);
    mean << 0.1, 0.2;
    Eigen::MatrixXd cov = Eigen::MatrixXd::Identity(2, 2);

    SECTION("Leverage length mismatch")
    {
        Eigen::VectorXd leverage(3);
        leverage << 1.0, 1.0, 1.0;
        REQUIRE_THROWS_AS(compute_sharpe(mean, cov, leverage), InvalidInput);
    }

    SECTION("Non-square covariance")
    {
        Eigen::MatrixXd rect = Eigen::MatrixXd::Zero(2, 3);
        REQUIRE_THROWS_AS(compute_sharpe(mean, rect, mean), InvalidInput);
    }

    SECTION("Non-finite leverage")
    {
        Eigen::VectorXd leverage(2);
        leverage << 1.0, std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(compute_sharpe(mean, cov, leverage), InvalidInput);
    }
}
