/**
 * @file kelly_solver.cpp
 * @brief Implementation of the Kelly linear solve
 */

#include "calc/kelly_solver.hpp"
#include "calc/errors.hpp"
#include "risk/sample_covariance.hpp"

namespace kelly
{
    namespace calc
    {

        KellySolver::KellySolver(bool diagonal_only, int periods_per_year)
            : diagonal_only_(diagonal_only), periods_per_year_(periods_per_year)
        {
            if (periods_per_year_ <= 0)
            {
                throw InvalidInput("periods_per_year must be positive, got: " + std::to_string(periods_per_year_));
            }
        }

        KellyAllocation KellySolver::solve(const Eigen::MatrixXd &excess_returns) const
        {
            validate_excess_returns(excess_returns);

            const Eigen::Index n_obs = excess_returns.rows();
            const Eigen::Index n_assets = excess_returns.cols();

            KellyAllocation allocation;

            // Annualised mean: M = 252 * mean(r)
            allocation.mean = excess_returns.colwise().mean().transpose() * static_cast<double>(periods_per_year_);

            // Annualised covariance: C = 252 * cov(r), unbiased (n-1)
            risk::SampleCovariance estimator(true, static_cast<double>(periods_per_year_));
            allocation.covariance = estimator.estimate_covariance(excess_returns);

            if (diagonal_only_)
            {
                allocation.covariance = risk::RiskModel::diagonal_part(allocation.covariance);
            }

            // Centred data has rank at most n_obs - 1
            if (!diagonal_only_ && n_obs - 1 < n_assets)
            {
                throw SingularCovariance("Covariance matrix " + shape_of(allocation.covariance) +
                                         " is singular: " + std::to_string(n_obs) +
                                         " observations cannot identify " + std::to_string(n_assets) +
                                         " instruments");
            }

            Eigen::FullPivLU<Eigen::MatrixXd> lu(allocation.covariance);
            lu.setThreshold(kCovariancePivotTolerance);
            if (!lu.isInvertible())
            {
                throw SingularCovariance("Covariance matrix " + shape_of(allocation.covariance) +
                                         " is singular (rank " + std::to_string(lu.rank()) +
                                         "); check for duplicate, collinear or constant return series");
            }

            allocation.leverage = lu.solve(allocation.mean);

            if (!allocation.leverage.allFinite())
            {
                throw SingularCovariance("Linear solve against covariance matrix " +
                                         shape_of(allocation.covariance) +
                                         " produced non-finite leverage");
            }

            return allocation;
        }

        std::string KellySolver::get_name() const
        {
            return diagonal_only_ ? "KellySolver(diagonal)" : "KellySolver(full)";
        }

        void KellySolver::validate_excess_returns(const Eigen::MatrixXd &excess_returns)
        {
            if (excess_returns.cols() == 0)
            {
                throw InvalidInput("Excess returns matrix has no instruments (shape " + shape_of(excess_returns) + ")");
            }

            if (excess_returns.rows() < 2)
            {
                throw InvalidInput("Need at least 2 excess return observations to estimate covariance, got shape " +
                                   shape_of(excess_returns));
            }

            if (!excess_returns.allFinite())
            {
                throw InvalidInput("Excess returns matrix " + shape_of(excess_returns) + " contains NaN or Inf values");
            }
        }

    } // namespace calc
} // namespace kelly
