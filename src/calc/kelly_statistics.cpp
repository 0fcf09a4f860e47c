/**
 * @file kelly_statistics.cpp
 * @brief Implementation of Kelly portfolio statistics
 */

#include "calc/kelly_statistics.hpp"
#include "calc/errors.hpp"
#include <cmath>
#include <sstream>

namespace kelly
{
    namespace calc
    {

        SharpeEstimate estimate_sharpe(const Eigen::VectorXd &mean,
                                       const Eigen::MatrixXd &covariance,
                                       const Eigen::VectorXd &leverage)
        {
            const Eigen::Index n = leverage.size();

            if (n == 0 || covariance.rows() != n || covariance.cols() != n || mean.size() != n)
            {
                throw InvalidInput("Dimension mismatch: leverage " + std::to_string(n) +
                                   ", mean " + std::to_string(mean.size()) +
                                   ", covariance " + shape_of(covariance));
            }

            if (!leverage.allFinite() || !covariance.allFinite())
            {
                throw InvalidInput("Leverage and covariance must be finite to compute the Sharpe ratio");
            }

            SharpeEstimate estimate;
            estimate.radicand = leverage.dot(covariance * leverage);

            if (estimate.radicand < 0.0)
            {
                const Eigen::VectorXd abs_leverage = leverage.cwiseAbs();
                const double scale = abs_leverage.dot(covariance.cwiseAbs() * abs_leverage);

                if (-estimate.radicand > kSharpeRadicandTolerance * scale)
                {
                    std::ostringstream msg;
                    msg << "Sharpe radicand F'CF = " << estimate.radicand
                        << " is materially negative (scale " << scale
                        << "); covariance matrix " << shape_of(covariance)
                        << " is not positive definite";
                    throw NumericInstability(msg.str());
                }

                estimate.clamped = true;
                estimate.sharpe = 0.0;
                return estimate;
            }

            estimate.sharpe = std::sqrt(estimate.radicand);
            return estimate;
        }

        double compute_sharpe(const Eigen::VectorXd &mean,
                              const Eigen::MatrixXd &covariance,
                              const Eigen::VectorXd &leverage)
        {
            return estimate_sharpe(mean, covariance, leverage).sharpe;
        }

        double compute_max_growth_rate(double annual_rf, double sharpe)
        {
            return annual_rf + sharpe * sharpe / 2.0;
        }

        Eigen::VectorXd compute_half_kelly(const Eigen::VectorXd &leverage)
        {
            return leverage * 0.5;
        }

    } // namespace calc
} // namespace kelly
