/**
 * @file kelly_statistics.hpp
 * @brief Risk-adjusted statistics of a Kelly allocation
 *
 * Given annualised mean M, covariance C and Kelly leverage F = C^-1 M:
 *
 *     Sharpe ratio      S = sqrt(F^T C F)
 *     Max growth rate   g = r_f + S^2 / 2
 *     Half Kelly        F / 2
 */

#pragma once

#include <Eigen/Dense>

namespace kelly
{
    namespace calc
    {

        /**
         * @struct SharpeEstimate
         * @brief Sharpe ratio together with the raw quadratic form
         */
        struct SharpeEstimate
        {
            double sharpe = 0.0;   ///< sqrt(max(radicand, 0))
            double radicand = 0.0; ///< F^T C F before clamping
            bool clamped = false;  ///< Radicand was slightly negative and clamped to zero
        };

        /**
         * @brief Relative tolerance below which a negative radicand is treated as rounding
         *
         * Measured against |F|^T |C| |F|.
         */
        constexpr double kSharpeRadicandTolerance = 1e-10;

        /**
         * @brief Compute the portfolio Sharpe ratio with clamp diagnostics
         * @param mean Annualised mean excess returns M (n)
         * @param covariance Annualised covariance C (n x n)
         * @param leverage Kelly leverage F (n)
         * @return SharpeEstimate
         * @throws InvalidInput on dimension mismatch or non-finite values
         * @throws NumericInstability if F^T C F is materially negative
         */
        SharpeEstimate estimate_sharpe(const Eigen::VectorXd &mean,
                                       const Eigen::MatrixXd &covariance,
                                       const Eigen::VectorXd &leverage);

        /**
         * @brief Compute the portfolio Sharpe ratio S = sqrt(F^T C F)
         * @throws InvalidInput on dimension mismatch or non-finite values
         * @throws NumericInstability if F^T C F is materially negative
         */
        double compute_sharpe(const Eigen::VectorXd &mean,
                              const Eigen::MatrixXd &covariance,
                              const Eigen::VectorXd &leverage);

        /**
         * @brief Maximum compounded growth rate g = r_f + S^2 / 2
         */
        double compute_max_growth_rate(double annual_rf, double sharpe);

        /**
         * @brief Half-Kelly leverage, elementwise F / 2
         */
        Eigen::VectorXd compute_half_kelly(const Eigen::VectorXd &leverage);

    } // namespace calc
} // namespace kelly
