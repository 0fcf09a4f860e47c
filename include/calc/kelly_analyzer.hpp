/**
 * @file kelly_analyzer.hpp
 * @brief Complete Kelly pipeline from prices to allocation statistics
 *
 * prices -> returns -> excess returns -> (F, M, C) -> Sharpe, growth, half Kelly
 *
 * Each stage is a pure function; the analyzer only composes them and
 * performs no output. All errors propagate unchanged.
 */

#pragma once

#include "calc/kelly_solver.hpp"
#include "data/market_data.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace kelly
{
    namespace calc
    {

        /**
         * @struct KellyParameters
         * @brief Values the calculation consumes from configuration
         */
        struct KellyParameters
        {
            double risk_free_rate = 0.05;                    ///< Annual risk-free rate
            bool diagonal_only = false;                      ///< Ignore cross-covariances
            int trading_days_per_year = kTradingDaysPerYear; ///< Annualisation factor
        };

        /**
         * @struct KellyAnalysis
         * @brief Everything the presentation layer needs
         */
        struct KellyAnalysis
        {
            std::vector<std::string> tickers; ///< Instrument symbols, column order
            Eigen::VectorXd full_kelly;       ///< F
            Eigen::VectorXd half_kelly;       ///< F / 2
            Eigen::VectorXd mean_excess;      ///< M, annualised
            Eigen::MatrixXd covariance;       ///< C, annualised (diagonal if requested)
            double sharpe_ratio = 0.0;        ///< sqrt(F^T C F)
            double growth_rate = 0.0;         ///< r_f + S^2 / 2
            double risk_free_rate = 0.0;      ///< Annual rate used
            size_t num_observations = 0;      ///< Rows of the returns matrix
            bool sharpe_clamped = false;      ///< Negative rounding residue clamped to zero
        };

        /**
         * @class KellyAnalyzer
         * @brief Runs the Kelly pipeline for one set of instruments
         *
         * Usage Example:
         * @code
         * KellyAnalyzer analyzer(params);
         * KellyAnalysis result = analyzer.analyze(prices);
         * @endcode
         */
        class KellyAnalyzer
        {
        public:
            /**
             * @throws InvalidInput if the parameters are out of range
             */
            explicit KellyAnalyzer(KellyParameters params = KellyParameters());

            /**
             * @brief Analyse a cleaned price history
             * @param prices MarketData with at least 2 rows and no missing values
             * @throws InvalidInput, SingularCovariance, NumericInstability
             */
            KellyAnalysis analyze(const MarketData &prices) const;

            /**
             * @brief Analyse a bare price matrix with explicit symbols
             * @throws InvalidInput if the symbol count does not match the columns
             */
            KellyAnalysis analyze(const Eigen::MatrixXd &prices,
                                  const std::vector<std::string> &tickers) const;

            const KellyParameters &get_parameters() const { return params_; }

        private:
            KellyParameters params_;
        };

    } // namespace calc
} // namespace kelly
