#ifndef PLS_PREP_MATRIX_UTILS_HPP
#define PLS_PREP_MATRIX_UTILS_HPP

/**
 * @file matrix_utils.hpp
 * @brief Matrix preprocessing transforms using Eigen
 *
 * Provides the standardization steps applied to data blocks before
 * partial least squares decomposition:
 * - Column-wise z-scoring
 * - L2 (Frobenius) normalization along rows or columns
 * - Cross-covariance of two standardized blocks
 *
 * Degenerate slices (zero variance, zero norm) are mapped to zeros
 * rather than producing NaN or Inf.
 */

#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/math_utils.hpp"

namespace pls::core {

/**
 * @brief Axis along which normalize() operates
 */
enum class Axis : int {
    Columns = 0,  ///< Normalize each column
    Rows = 1      ///< Normalize each row
};

/**
 * @brief Convert integer axis (0 or 1) to Axis
 * @throws std::invalid_argument for any other value
 */
inline Axis to_axis(int axis) {
    switch (axis) {
        case 0:
            return Axis::Columns;
        case 1:
            return Axis::Rows;
        default:
            throw std::invalid_argument("Axis must be 0 or 1, got " + std::to_string(axis));
    }
}

/**
 * @brief Z-score each column: (x - mean) / std
 *
 * Uses the population standard deviation (n divisor). Columns with
 * zero variance, including constant columns, are set to zero.
 *
 * @param X Data matrix (N observations x J variables)
 * @return Z-scored copy of X
 * @throws std::invalid_argument if X has no rows
 */
inline Eigen::MatrixXd zscore(const Eigen::MatrixXd& X) {
    if (X.rows() == 0) {
        throw std::invalid_argument("Cannot z-score matrix with no observations");
    }

    Eigen::RowVectorXd avg = column_means(X);
    Eigen::RowVectorXd stdev = column_std(X, 0);

    Eigen::MatrixXd zarr(X.rows(), X.cols());
    for (Eigen::Index j = 0; j < X.cols(); ++j) {
        // A constant column can leave rounding residue in the mean
        bool constant = (X.col(j).array() == X(0, j)).all();
        if (constant || stdev(j) == 0.0) {
            zarr.col(j).setZero();
        } else {
            zarr.col(j) = (X.col(j).array() - avg(j)) / stdev(j);
        }
    }

    return zarr;
}

/**
 * @brief Normalize X by its L2 norm along an axis
 *
 * Slices whose norm is exactly zero are left as zeros.
 *
 * @param X Data matrix
 * @param axis Axis::Columns to scale each column, Axis::Rows for each row
 * @return Normalized copy of X
 */
inline Eigen::MatrixXd normalize(const Eigen::MatrixXd& X, Axis axis = Axis::Columns) {
    Eigen::MatrixXd normed = X;

    if (axis == Axis::Columns) {
        Eigen::RowVectorXd base = column_norms(X);
        for (Eigen::Index j = 0; j < X.cols(); ++j) {
            if (base(j) == 0.0) {
                normed.col(j).setZero();
            } else {
                normed.col(j) /= base(j);
            }
        }
    } else {
        Eigen::VectorXd base = row_norms(X);
        for (Eigen::Index i = 0; i < X.rows(); ++i) {
            if (base(i) == 0.0) {
                normed.row(i).setZero();
            } else {
                normed.row(i) /= base(i);
            }
        }
    }

    return normed;
}

/// Integer-axis overload (0 = columns, 1 = rows)
inline Eigen::MatrixXd normalize(const Eigen::MatrixXd& X, int axis) {
    return normalize(X, to_axis(axis));
}

/**
 * @brief Gather a subset of rows into a new matrix
 *
 * @param X Source matrix
 * @param rows Row indices, in output order
 * @return Matrix with rows.size() rows and X.cols() columns
 */
inline Eigen::MatrixXd take_rows(const Eigen::MatrixXd& X, const std::vector<Eigen::Index>& rows) {
    Eigen::MatrixXd out(static_cast<Eigen::Index>(rows.size()), X.cols());
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i] < 0 || rows[i] >= X.rows()) {
            throw std::invalid_argument("Row index " + std::to_string(rows[i]) +
                                        " out of range for matrix with " +
                                        std::to_string(X.rows()) + " rows");
        }
        out.row(static_cast<Eigen::Index>(i)) = X.row(rows[i]);
    }
    return out;
}

/**
 * @brief Cross-covariance of two standardized blocks
 *
 * Each block is z-scored, then column-normalized, and the result is
 *   xprod = Ynz' * Xnz / (N - 1)
 *
 * @param X Data matrix (N x J)
 * @param Y Data matrix (N x K)
 * @return K x J cross-covariance matrix
 * @throws std::invalid_argument if row counts differ or N < 2
 */
inline Eigen::MatrixXd compute_xcorr(const Eigen::MatrixXd& X, const Eigen::MatrixXd& Y) {
    if (X.rows() != Y.rows()) {
        throw std::invalid_argument("X and Y must have the same number of rows (" +
                                    std::to_string(X.rows()) + " vs " +
                                    std::to_string(Y.rows()) + ")");
    }
    if (X.rows() < 2) {
        throw std::invalid_argument("Need at least 2 observations for cross-covariance, got " +
                                    std::to_string(X.rows()));
    }

    Eigen::MatrixXd Xnz = normalize(zscore(X));
    Eigen::MatrixXd Ynz = normalize(zscore(Y));

    return (Ynz.transpose() * Xnz) / static_cast<double>(X.rows() - 1);
}

/**
 * @brief Cross-covariance of X and Y over all observations
 *
 * See the grouping-aware overload in grouping.hpp for per-group blocks.
 */
inline Eigen::MatrixXd xcorr(const Eigen::MatrixXd& X, const Eigen::MatrixXd& Y) {
    return compute_xcorr(X, Y);
}

}  // namespace pls::core

#endif  // PLS_PREP_MATRIX_UTILS_HPP
