/**
 * @file returns.hpp
 * @brief Price to return transforms
 *
 * Simple period returns and excess returns over a constant risk-free rate.
 * Both are pure functions of their inputs.
 */

#pragma once

#include <Eigen/Dense>

namespace kelly
{
    namespace calc
    {

        /// Trading days per year used for annualisation
        constexpr int kTradingDaysPerYear = 252;

        /**
         * @brief Compute simple returns (P_t - P_{t-1}) / P_{t-1}
         * @param prices Price matrix (dates x assets), at least 2 rows
         * @return Returns matrix with one fewer row than prices
         * @throws InvalidInput if fewer than 2 rows, no columns, or any price
         *         is non-positive or not finite
         */
        Eigen::MatrixXd compute_returns(const Eigen::MatrixXd &prices);

        /**
         * @brief Subtract the period risk-free rate from every return
         * @param returns Returns matrix (observations x assets)
         * @param annual_rf Annual risk-free rate as a fraction (0.05 = 5%)
         * @param periods_per_year Periods per year, the period rate is annual_rf / periods_per_year
         * @return Excess returns, same shape as returns
         * @throws InvalidInput if returns is empty, annual_rf is not finite or
         *         periods_per_year is not positive
         */
        Eigen::MatrixXd compute_excess_returns(const Eigen::MatrixXd &returns,
                                               double annual_rf,
                                               int periods_per_year = kTradingDaysPerYear);

    } // namespace calc
} // namespace kelly
