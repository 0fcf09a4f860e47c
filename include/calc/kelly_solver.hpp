/**
 * @file kelly_solver.hpp
 * @brief Unconstrained Kelly-optimal leverage from excess returns
 *
 * For annualised mean excess returns M and covariance C the growth-optimal
 * leverage vector solves
 *
 *     C * F = M
 *
 * The system is solved with a full-pivoting LU decomposition; the inverse
 * of C is never formed. With a single instrument this reduces to
 * F = M / variance.
 *
 * Thread Safety: solve() is const and holds no mutable state.
 */

#pragma once

#include "calc/returns.hpp"
#include <Eigen/Dense>
#include <string>

namespace kelly
{
    namespace calc
    {

        /**
         * @brief Smallest LU pivot, relative to the largest, treated as non-zero
         *
         * Collinear return series leave rounding-sized pivots well below this.
         */
        constexpr double kCovariancePivotTolerance = 1e-10;

        /**
         * @struct KellyAllocation
         * @brief Output of the Kelly solve
         */
        struct KellyAllocation
        {
            Eigen::VectorXd leverage;   ///< F, Kelly leverage per instrument (negative = short)
            Eigen::VectorXd mean;       ///< M, annualised mean excess return
            Eigen::MatrixXd covariance; ///< C, annualised covariance actually solved against
        };

        /**
         * @class KellySolver
         * @brief Solves C * F = M for the Kelly leverage vector
         *
         * Usage Example:
         * @code
         * KellySolver solver(false);
         * KellyAllocation allocation = solver.solve(excess_returns);
         * double first_leverage = allocation.leverage(0);
         * @endcode
         */
        class KellySolver
        {
        public:
            /**
             * @brief Construct solver
             * @param diagonal_only Zero all cross-covariances before solving
             * @param periods_per_year Annualisation factor for mean and covariance
             * @throws InvalidInput if periods_per_year is not positive
             */
            explicit KellySolver(bool diagonal_only = false,
                                 int periods_per_year = kTradingDaysPerYear);

            /**
             * @brief Compute (F, M, C) from period excess returns
             * @param excess_returns Matrix (observations x instruments)
             * @return KellyAllocation with leverage, mean and covariance
             * @throws InvalidInput if there are no instruments, fewer than 2
             *         observations or non-finite values
             * @throws SingularCovariance if C is singular or near-singular
             *         (collinear series, zero variance, or fewer observations
             *         than instruments)
             */
            KellyAllocation solve(const Eigen::MatrixXd &excess_returns) const;

            bool is_diagonal_only() const { return diagonal_only_; }

            int get_periods_per_year() const { return periods_per_year_; }

            std::string get_name() const;

        private:
            static void validate_excess_returns(const Eigen::MatrixXd &excess_returns);

            bool diagonal_only_;
            int periods_per_year_;
        };

    } // namespace calc
} // namespace kelly
