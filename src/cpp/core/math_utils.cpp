#include "math_utils.hpp"

#include <stdexcept>
#include <string>

namespace pls {

Eigen::RowVectorXd column_means(const Eigen::MatrixXd& data) {
    if (data.rows() == 0) {
        throw std::invalid_argument("Cannot compute column means of matrix with no rows");
    }
    return data.colwise().mean();
}

Eigen::RowVectorXd column_std(const Eigen::MatrixXd& data, int ddof) {
    Eigen::Index n = data.rows();
    if (n == 0 || n <= ddof) {
        throw std::invalid_argument("Not enough observations for standard deviation (rows=" +
                                    std::to_string(n) + ", ddof=" + std::to_string(ddof) + ")");
    }

    // Two-pass: center first, then accumulate squares
    Eigen::MatrixXd centered = data.rowwise() - column_means(data);
    Eigen::RowVectorXd sum_sq = centered.array().square().colwise().sum();
    return (sum_sq / static_cast<double>(n - ddof)).array().sqrt();
}

Eigen::RowVectorXd column_norms(const Eigen::MatrixXd& data) {
    return data.colwise().norm();
}

Eigen::VectorXd row_norms(const Eigen::MatrixXd& data) {
    return data.rowwise().norm();
}

} // namespace pls
