/**
 * @file returns.cpp
 * @brief Implementation of the return transforms
 */

#include "calc/returns.hpp"
#include "calc/errors.hpp"
#include <cmath>

namespace kelly
{
    namespace calc
    {

        Eigen::MatrixXd compute_returns(const Eigen::MatrixXd &prices)
        {
            if (prices.cols() == 0)
            {
                throw InvalidInput("Price matrix has no instruments (shape " + shape_of(prices) + ")");
            }

            if (prices.rows() < 2)
            {
                throw InvalidInput("Need at least 2 price observations to calculate returns, got shape " + shape_of(prices));
            }

            for (Eigen::Index i = 0; i < prices.rows(); ++i)
            {
                for (Eigen::Index j = 0; j < prices.cols(); ++j)
                {
                    const double p = prices(i, j);
                    if (!std::isfinite(p) || p <= 0.0)
                    {
                        throw InvalidInput("Non-positive or missing price " + std::to_string(p) +
                                           " at row " + std::to_string(i) + ", column " + std::to_string(j) +
                                           " of price matrix " + shape_of(prices));
                    }
                }
            }

            const Eigen::Index n = prices.rows() - 1;
            auto current = prices.bottomRows(n).array();
            auto previous = prices.topRows(n).array();

            return ((current - previous) / previous).matrix();
        }

        Eigen::MatrixXd compute_excess_returns(const Eigen::MatrixXd &returns,
                                               double annual_rf,
                                               int periods_per_year)
        {
            if (returns.rows() == 0 || returns.cols() == 0)
            {
                throw InvalidInput("Returns matrix cannot be empty, got shape " + shape_of(returns));
            }

            if (!std::isfinite(annual_rf))
            {
                throw InvalidInput("Risk-free rate must be finite");
            }

            if (periods_per_year <= 0)
            {
                throw InvalidInput("periods_per_year must be positive, got: " + std::to_string(periods_per_year));
            }

            const double period_rf = annual_rf / periods_per_year;

            return (returns.array() - period_rf).matrix();
        }

    } // namespace calc
} // namespace kelly
