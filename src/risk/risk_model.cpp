/**
 * @file risk_model.cpp
 * @brief Shared covariance estimator utilities
 */

#include "risk/risk_model.hpp"
#include <stdexcept>

namespace kelly
{
    namespace risk
    {
        Eigen::MatrixXd RiskModel::diagonal_part(const Eigen::MatrixXd &covariance)
        {
            if (covariance.rows() != covariance.cols())
            {
                throw std::invalid_argument("Cannot take the diagonal of a non-square " +
                                            std::to_string(covariance.rows()) + "x" +
                                            std::to_string(covariance.cols()) + " matrix");
            }

            return Eigen::MatrixXd(covariance.diagonal().asDiagonal());
        }

        void RiskModel::validate_returns(const Eigen::MatrixXd &returns)
        {
            if (returns.size() == 0)
            {
                throw std::invalid_argument("Returns matrix is empty");
            }
            if (returns.rows() < 2)
            {
                throw std::invalid_argument("Covariance needs at least 2 observations, got " +
                                            std::to_string(returns.rows()));
            }
            if (!returns.allFinite())
            {
                throw std::invalid_argument("Returns matrix contains NaN or Inf");
            }
        }

        Eigen::MatrixXd RiskModel::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }
    } // namespace risk
} // namespace kelly
