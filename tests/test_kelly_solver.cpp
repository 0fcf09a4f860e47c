/**
 * @file test_kelly_solver.cpp
 * @brief Unit tests for the Kelly linear solve
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "calc/errors.hpp"
#include "calc/kelly_solver.hpp"
#include <limits>
#include <random>
#include <utility>
#include <vector>

using namespace kelly::calc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace
{
    Eigen::MatrixXd normal_returns(int n_obs,
                                   const std::vector<std::pair<double, double>> &mean_std,
                                   unsigned seed)
    {
        std::mt19937 gen(seed);
        Eigen::MatrixXd returns(n_obs, static_cast<Eigen::Index>(mean_std.size()));
        for (size_t j = 0; j < mean_std.size(); ++j)
        {
            std::normal_distribution<double> dist(mean_std[j].first, mean_std[j].second);
            for (int i = 0; i < n_obs; ++i)
            {
                returns(i, static_cast<Eigen::Index>(j)) = dist(gen);
            }
        }
        return returns;
    }
}

TEST_CASE("KellySolver construction", "[KellySolver]")
{
    KellySolver full;
    REQUIRE_FALSE(full.is_diagonal_only());
    REQUIRE(full.get_periods_per_year() == 252);
    REQUIRE(full.get_name() == "KellySolver(full)");

    KellySolver diag(true);
    REQUIRE(diag.is_diagonal_only());
    REQUIRE(diag.get_name() == "KellySolver(diagonal)");

    REQUIRE_THROWS_AS(KellySolver(false, 0), InvalidInput);
}

TEST_CASE("Single asset reduces to M / variance", "[KellySolver]")
{
    auto excess = normal_returns(10000, {{0.0004, 0.01}}, 42);

    KellySolver solver;
    auto allocation = solver.solve(excess);

    REQUIRE(allocation.leverage.size() == 1);
    REQUIRE(allocation.mean.size() == 1);
    REQUIRE(allocation.covariance.rows() == 1);

    const double expected = allocation.mean(0) / allocation.covariance(0, 0);
    REQUIRE_THAT(allocation.leverage(0), WithinRel(expected, 1e-6));
}

TEST_CASE("Annualisation of mean and covariance", "[KellySolver]")
{
    Eigen::MatrixXd excess(4, 2);
    excess << 0.010, 0.002,
              -0.004, 0.001,
              0.006, -0.003,
              0.002, 0.004;

    KellySolver solver;
    auto allocation = solver.solve(excess);

    Eigen::VectorXd daily_mean = excess.colwise().mean().transpose();
    Eigen::MatrixXd centered = excess.rowwise() - excess.colwise().mean();
    Eigen::MatrixXd daily_cov = centered.transpose() * centered / 3.0;

    REQUIRE_THAT((allocation.mean - 252.0 * daily_mean).cwiseAbs().maxCoeff(), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT((allocation.covariance - 252.0 * daily_cov).cwiseAbs().maxCoeff(), WithinAbs(0.0, 1e-12));

    // F satisfies C F = M
    Eigen::VectorXd residual = allocation.covariance * allocation.leverage - allocation.mean;
    REQUIRE_THAT(residual.cwiseAbs().maxCoeff(), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Diagonal-only solve", "[KellySolver]")
{
    SECTION("Uncorrelated assets agree with the full solve")
    {
        auto excess = normal_returns(50000, {{0.0004, 0.01}, {0.0003, 0.015}}, 42);

        auto full = KellySolver(false).solve(excess);
        auto diag = KellySolver(true).solve(excess);

        REQUIRE_THAT(full.leverage(0), WithinAbs(diag.leverage(0), 0.5));
        REQUIRE_THAT(full.leverage(1), WithinAbs(diag.leverage(1), 0.5));
    }

    SECTION("Cross-covariances are zeroed and F_i = M_i / C_ii")
    {
        Eigen::MatrixXd excess(4, 2);
        excess << 0.010, 0.008,
                  -0.004, -0.002,
                  0.006, 0.007,
                  0.002, 0.001;

        auto diag = KellySolver(true).solve(excess);

        REQUIRE(diag.covariance(0, 1) == 0.0);
        REQUIRE(diag.covariance(1, 0) == 0.0);
        for (Eigen::Index i = 0; i < 2; ++i)
        {
            REQUIRE_THAT(diag.leverage(i), WithinRel(diag.mean(i) / diag.covariance(i, i), 1e-12));
        }
    }
}

TEST_CASE("Singular covariance", "[KellySolver]")
{
    SECTION("Identical series")
    {
        Eigen::MatrixXd excess(3, 2);
        excess << 0.01, 0.01,
                  0.02, 0.02,
                  0.03, 0.03;
        REQUIRE_THROWS_AS(KellySolver().solve(excess), SingularCovariance);
    }

    SECTION("Collinear series")
    {
        Eigen::MatrixXd excess(4, 2);
        excess << 0.01, 0.02,
                  0.02, 0.04,
                  -0.01, -0.02,
                  0.03, 0.06;
        REQUIRE_THROWS_AS(KellySolver().solve(excess), SingularCovariance);
    }

    SECTION("Fewer observations than instruments")
    {
        Eigen::MatrixXd excess(3, 3);
        excess << 0.01, 0.03, -0.02,
                  0.02, -0.01, 0.01,
                  -0.01, 0.02, 0.00;
        REQUIRE_THROWS_AS(KellySolver().solve(excess), SingularCovariance);
    }

    SECTION("Constant series has zero variance")
    {
        Eigen::MatrixXd excess(3, 1);
        excess << 0.0625, 0.0625, 0.0625;
        REQUIRE_THROWS_AS(KellySolver().solve(excess), SingularCovariance);
        REQUIRE_THROWS_AS(KellySolver(true).solve(excess), SingularCovariance);
    }

    SECTION("Collinear series with rounding-sized noise")
    {
        auto excess = normal_returns(300, {{0.0004, 0.01}, {0.0, 1e-9}}, 7);
        excess.col(1) += 2.0 * excess.col(0);
        REQUIRE_THROWS_AS(KellySolver().solve(excess), SingularCovariance);
    }

    SECTION("Strongly correlated but independent series still solve")
    {
        auto excess = normal_returns(300, {{0.0004, 0.01}, {0.0, 0.005}}, 7);
        excess.col(1) += excess.col(0);
        auto allocation = KellySolver().solve(excess);
        REQUIRE(allocation.leverage.allFinite());
    }

    SECTION("Singular is distinct from invalid input")
    {
        Eigen::MatrixXd excess(3, 2);
        excess << 0.01, 0.01,
                  0.02, 0.02,
                  0.03, 0.03;
        REQUIRE_THROWS_AS(KellySolver().solve(excess), std::runtime_error);

        bool caught_invalid = false;
        try
        {
            KellySolver().solve(excess);
        }
        catch (const InvalidInput &)
        {
            caught_invalid = true;
        }
        catch (const SingularCovariance &)
        {
        }
        REQUIRE_FALSE(caught_invalid);
    }
}

TEST_CASE("KellySolver input validation", "[KellySolver]")
{
    SECTION("Single observation")
    {
        Eigen::MatrixXd excess(1, 2);
        excess << 0.01, 0.02;
        REQUIRE_THROWS_AS(KellySolver().solve(excess), InvalidInput);
    }

    SECTION("No instruments")
    {
        REQUIRE_THROWS_AS(KellySolver().solve(Eigen::MatrixXd(5, 0)), InvalidInput);
    }

    SECTION("Non-finite values")
    {
        Eigen::MatrixXd excess(3, 1);
        excess << 0.01, std::numeric_limits<double>::infinity(), 0.02;
        REQUIRE_THROWS_AS(KellySolver().solve(excess), InvalidInput);
    }
}
