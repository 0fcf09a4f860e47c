/**
 * @file risk_model.hpp
 * @brief Covariance estimation interface used by the Kelly solver
 *
 * An estimator turns a T x N matrix of period returns into an N x N
 * covariance matrix, scaled by its periods-per-year factor so that daily
 * input gives annual output.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace kelly
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Base class for covariance estimators
         *
         * @code
         * std::unique_ptr<RiskModel> model = std::make_unique<SampleCovariance>(true, 252.0);
         * Eigen::MatrixXd annual_cov = model->estimate_covariance(daily_excess);
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @param returns Observations in rows, instruments in columns
             * @return Exactly symmetric N x N covariance
             * @throws std::invalid_argument for an empty matrix, a single
             *         observation, or NaN/Inf entries
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const = 0;

            virtual std::string get_name() const = 0;

            /**
             * @brief Variances on the diagonal, zero covariances elsewhere
             * @throws std::invalid_argument if the matrix is not square
             */
            static Eigen::MatrixXd diagonal_part(const Eigen::MatrixXd &covariance);

        protected:
            static void validate_returns(const Eigen::MatrixXd &returns);

            /// (M + M^T) / 2
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace kelly
