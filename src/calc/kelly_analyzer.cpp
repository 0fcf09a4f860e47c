/**
 * @file kelly_analyzer.cpp
 * @brief Implementation of the Kelly pipeline
 */

#include "calc/kelly_analyzer.hpp"
#include "calc/errors.hpp"
#include "calc/kelly_statistics.hpp"
#include "calc/returns.hpp"
#include <cmath>
#include <utility>

namespace kelly
{
    namespace calc
    {

        KellyAnalyzer::KellyAnalyzer(KellyParameters params) : params_(params)
        {
            if (!std::isfinite(params_.risk_free_rate))
            {
                throw InvalidInput("Risk-free rate must be finite");
            }
            if (params_.trading_days_per_year <= 0)
            {
                throw InvalidInput("trading_days_per_year must be positive, got: " +
                                   std::to_string(params_.trading_days_per_year));
            }
        }

        KellyAnalysis KellyAnalyzer::analyze(const MarketData &prices) const
        {
            return analyze(prices.get_Prices(), prices.get_tickers());
        }

        KellyAnalysis KellyAnalyzer::analyze(const Eigen::MatrixXd &prices,
                                             const std::vector<std::string> &tickers) const
        {
            if (static_cast<Eigen::Index>(tickers.size()) != prices.cols())
            {
                throw InvalidInput("Got " + std::to_string(tickers.size()) +
                                   " tickers for price matrix " + shape_of(prices));
            }

            const Eigen::MatrixXd returns = compute_returns(prices);
            const Eigen::MatrixXd excess = compute_excess_returns(
                returns, params_.risk_free_rate, params_.trading_days_per_year);

            KellySolver solver(params_.diagonal_only, params_.trading_days_per_year);
            KellyAllocation allocation = solver.solve(excess);

            const SharpeEstimate sharpe = estimate_sharpe(
                allocation.mean, allocation.covariance, allocation.leverage);

            KellyAnalysis analysis;
            analysis.tickers = tickers;
            analysis.half_kelly = compute_half_kelly(allocation.leverage);
            analysis.full_kelly = std::move(allocation.leverage);
            analysis.mean_excess = std::move(allocation.mean);
            analysis.covariance = std::move(allocation.covariance);
            analysis.sharpe_ratio = sharpe.sharpe;
            analysis.sharpe_clamped = sharpe.clamped;
            analysis.growth_rate = compute_max_growth_rate(params_.risk_free_rate, sharpe.sharpe);
            analysis.risk_free_rate = params_.risk_free_rate;
            analysis.num_observations = static_cast<size_t>(returns.rows());

            return analysis;
        }

    } // namespace calc
} // namespace kelly
