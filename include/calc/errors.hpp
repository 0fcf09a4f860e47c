/**
 * @file errors.hpp
 * @brief Failure kinds raised by the Kelly calculation
 *
 * The calculation never recovers locally: each failure reaches the caller
 * as one of these types with the failed check and data shape in what().
 */

#pragma once

#include <Eigen/Dense>
#include <stdexcept>
#include <string>

namespace kelly
{
    namespace calc
    {

        /**
         * @class InvalidInput
         * @brief Malformed or degenerate price/returns matrix
         */
        class InvalidInput : public std::invalid_argument
        {
        public:
            explicit InvalidInput(const std::string &message)
                : std::invalid_argument(message)
            {
            }
        };

        /**
         * @class SingularCovariance
         * @brief Covariance matrix cannot be inverted, the linear solve is impossible
         */
        class SingularCovariance : public std::runtime_error
        {
        public:
            explicit SingularCovariance(const std::string &message)
                : std::runtime_error(message)
            {
            }
        };

        /**
         * @class NumericInstability
         * @brief A result contradicts positive-definiteness of the covariance
         */
        class NumericInstability : public std::runtime_error
        {
        public:
            explicit NumericInstability(const std::string &message)
                : std::runtime_error(message)
            {
            }
        };

        /**
         * @brief Format a matrix shape as "rows x cols" for error messages
         */
        inline std::string shape_of(const Eigen::MatrixXd &m)
        {
            return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
        }

    } // namespace calc
} // namespace kelly
