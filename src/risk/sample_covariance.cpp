/**
 * @file sample_covariance.cpp
 * @brief Implementation of the annualised sample covariance
 */

#include "risk/sample_covariance.hpp"
#include <cmath>
#include <stdexcept>

namespace kelly
{
    namespace risk
    {

        SampleCovariance::SampleCovariance(bool bias_correction, double periods_per_year)
            : bias_correction_(bias_correction), periods_per_year_(periods_per_year)
        {
            if (!std::isfinite(periods_per_year_) || periods_per_year_ <= 0.0)
            {
                throw std::invalid_argument("periods_per_year must be positive and finite, got: " +
                                            std::to_string(periods_per_year_));
            }
        }

        Eigen::MatrixXd SampleCovariance::estimate_covariance(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);

            const Eigen::MatrixXd deviations = returns.rowwise() - returns.colwise().mean();
            const double dof = static_cast<double>(bias_correction_ ? returns.rows() - 1 : returns.rows());

            return ensure_symmetric(deviations.transpose() * deviations * (periods_per_year_ / dof));
        }

        std::string SampleCovariance::get_name() const
        {
            return "SampleCovariance";
        }

    } // namespace risk
} // namespace kelly
