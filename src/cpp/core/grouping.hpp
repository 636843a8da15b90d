#ifndef PLS_PREP_GROUPING_HPP
#define PLS_PREP_GROUPING_HPP

/**
 * @file grouping.hpp
 * @brief Group labels: dummy coding and group-wise cross-covariance
 *
 * A grouping vector assigns one label per observation. Labels may be any
 * type with operator< and operator== (integers, doubles, strings); they
 * need not be contiguous or sorted. Groups are always visited in
 * ascending order of their label value. NaN labels are rejected since
 * they cannot be ordered.
 */

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "core/matrix_utils.hpp"

namespace pls::core {

/**
 * @brief Sorted distinct labels of a grouping vector
 * @throws std::invalid_argument if a floating-point label is NaN
 */
template <typename Label>
std::vector<Label> unique_labels(const std::vector<Label>& grouping) {
    if constexpr (std::is_floating_point_v<Label>) {
        for (size_t i = 0; i < grouping.size(); ++i) {
            if (std::isnan(grouping[i])) {
                throw std::invalid_argument("Grouping label at row " + std::to_string(i) +
                                            " is NaN");
            }
        }
    }

    std::vector<Label> labels(grouping);
    std::sort(labels.begin(), labels.end());
    labels.erase(std::unique(labels.begin(), labels.end()), labels.end());
    return labels;
}

/**
 * @brief Partition observations into per-group row index sets
 *
 * @param grouping Label for each observation
 * @return One index list per unique label (ascending label order);
 *         indices keep their original order within a group
 */
template <typename Label>
std::vector<std::vector<Eigen::Index>> group_rows(const std::vector<Label>& grouping) {
    const std::vector<Label> labels = unique_labels(grouping);
    std::vector<std::vector<Eigen::Index>> rows(labels.size());

    for (size_t i = 0; i < grouping.size(); ++i) {
        auto it = std::lower_bound(labels.begin(), labels.end(), grouping[i]);
        rows[static_cast<size_t>(it - labels.begin())].push_back(static_cast<Eigen::Index>(i));
    }

    return rows;
}

/**
 * @brief Dummy (one-hot) code a grouping vector
 *
 * Column g is the indicator of the g-th smallest unique label.
 *
 * @param grouping Label for each of N observations
 * @return N x G indicator matrix
 */
template <typename Label>
Eigen::MatrixXi dummy_code(const std::vector<Label>& grouping) {
    const auto groups = group_rows(grouping);

    Eigen::MatrixXi Y = Eigen::MatrixXi::Zero(static_cast<Eigen::Index>(grouping.size()),
                                              static_cast<Eigen::Index>(groups.size()));
    for (size_t g = 0; g < groups.size(); ++g) {
        for (Eigen::Index row : groups[g]) {
            Y(row, static_cast<Eigen::Index>(g)) = 1;
        }
    }

    return Y;
}

/**
 * @brief Recover group numbers from a dummy-coded matrix
 *
 * Row i receives sum_n n * Y(i, n-1) for n = 1..G. For one-hot rows this
 * is the 1-based index of the set column, i.e. the rank of the original
 * label. Original label values are not recovered. Rows that are not
 * one-hot are not rejected: an all-zero row yields 0 and a row with
 * several set columns yields the sum of their indices.
 *
 * @param Y N x G indicator matrix
 * @return Length-N vector of group numbers
 */
inline Eigen::VectorXi reverse_dummy_code(const Eigen::MatrixXi& Y) {
    Eigen::VectorXi weights(Y.cols());
    for (Eigen::Index n = 0; n < Y.cols(); ++n) {
        weights(n) = static_cast<int>(n + 1);
    }
    return Y * weights;
}

/**
 * @brief Group-wise cross-covariance of X and Y
 *
 * Rows are partitioned by label, compute_xcorr() is applied to each
 * group's rows independently, and the G blocks (each K x J) are stacked
 * vertically in ascending label order.
 *
 * @param X Data matrix (N x J)
 * @param Y Data matrix (N x K)
 * @param grouping Label for each of the N observations
 * @return (K * G) x J matrix
 * @throws std::invalid_argument on row-count mismatch or if any group
 *         has fewer than 2 observations
 */
template <typename Label>
Eigen::MatrixXd xcorr(const Eigen::MatrixXd& X, const Eigen::MatrixXd& Y,
                      const std::vector<Label>& grouping) {
    if (X.rows() != Y.rows()) {
        throw std::invalid_argument("X and Y must have the same number of rows (" +
                                    std::to_string(X.rows()) + " vs " +
                                    std::to_string(Y.rows()) + ")");
    }
    if (static_cast<Eigen::Index>(grouping.size()) != X.rows()) {
        throw std::invalid_argument("Grouping length " + std::to_string(grouping.size()) +
                                    " does not match number of rows " +
                                    std::to_string(X.rows()));
    }

    const auto groups = group_rows(grouping);
    if (groups.empty()) {
        throw std::invalid_argument("Grouping defines no groups");
    }

    const Eigen::Index k = Y.cols();
    Eigen::MatrixXd xprod(k * static_cast<Eigen::Index>(groups.size()), X.cols());

    for (size_t g = 0; g < groups.size(); ++g) {
        const auto& rows = groups[g];
        if (rows.size() < 2) {
            throw std::invalid_argument("Group " + std::to_string(g) + " has " +
                                        std::to_string(rows.size()) +
                                        " observation(s); need at least 2");
        }
        xprod.middleRows(static_cast<Eigen::Index>(g) * k, k) =
            compute_xcorr(take_rows(X, rows), take_rows(Y, rows));
    }

    return xprod;
}

}  // namespace pls::core

#endif  // PLS_PREP_GROUPING_HPP
