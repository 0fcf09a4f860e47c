/**
 * @file sample_covariance.hpp
 * @brief Annualised sample covariance
 *
 *     C = periods_per_year / (T - 1) * (X - mean(X))^T (X - mean(X))
 *
 * Variance of i.i.d. returns grows linearly with the horizon, so daily
 * returns with periods_per_year = 252 give annual covariance.
 */

#pragma once

#include "risk_model.hpp"

namespace kelly
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Classical estimator, singular when T - 1 < N or for collinear series
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /**
             * @param bias_correction Divide by T - 1 (pandas default) instead of T
             * @param periods_per_year Multiplier applied to the estimate
             * @throws std::invalid_argument if periods_per_year is not positive and finite
             */
            explicit SampleCovariance(bool bias_correction = true,
                                      double periods_per_year = 1.0);

            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const override;

            std::string get_name() const override;

            bool uses_bias_correction() const { return bias_correction_; }

            double get_periods_per_year() const { return periods_per_year_; }

        private:
            bool bias_correction_;
            double periods_per_year_;
        };

    } // namespace risk
} // namespace kelly
