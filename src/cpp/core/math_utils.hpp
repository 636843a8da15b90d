#ifndef PLS_PREP_MATH_UTILS_HPP
#define PLS_PREP_MATH_UTILS_HPP

/**
 * @file math_utils.hpp
 * @brief Descriptive statistics used by the preprocessing transforms
 *
 * Column-wise summary quantities (means, std, L2 norms) that the
 * z-scoring and normalization routines are built on.
 */

#include <Eigen/Dense>

namespace pls {

/**
 * @brief Mean of each column
 * @param data Matrix where each column is a variable's observations
 * @return Row vector of means
 * @throws std::invalid_argument if data has no rows
 */
Eigen::RowVectorXd column_means(const Eigen::MatrixXd& data);

/**
 * @brief Standard deviation of each column
 *
 * Defaults to the population estimate (n divisor), which is what
 * z-scoring uses.
 *
 * @param data Matrix where each column is a variable's observations
 * @param ddof Delta degrees of freedom
 * @return Row vector of standard deviations
 * @throws std::invalid_argument if rows <= ddof
 */
Eigen::RowVectorXd column_std(const Eigen::MatrixXd& data, int ddof = 0);

/// L2 norm of each column
Eigen::RowVectorXd column_norms(const Eigen::MatrixXd& data);

/// L2 norm of each row
Eigen::VectorXd row_norms(const Eigen::MatrixXd& data);

} // namespace pls

#endif // PLS_PREP_MATH_UTILS_HPP
