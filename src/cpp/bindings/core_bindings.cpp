/**
 * @file core_bindings.cpp
 * @brief pybind11 bindings for preprocessing transforms and dummy coding
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include <cstdint>
#include <string>
#include <vector>

#include "core/grouping.hpp"
#include "core/matrix_utils.hpp"

namespace py = pybind11;
using namespace pls::core;

namespace {

enum class LabelKind { Integer, Floating, String };

/**
 * @brief Decide the C++ label type for a Python grouping sequence
 *
 * All elements are inspected: strings map to std::string, objects with
 * __index__ (Python and NumPy integers) to std::int64_t, anything else to
 * double. Mixing strings with numbers raises ValueError.
 */
LabelKind classify_labels(const py::object& grouping) {
    if (py::isinstance<py::str>(grouping) || py::isinstance<py::bytes>(grouping)) {
        throw py::type_error("grouping must be a sequence of labels, not a string");
    }
    if (!py::isinstance<py::sequence>(grouping)) {
        throw py::type_error("grouping must be a sequence of labels");
    }

    size_t n_str = 0;
    size_t n_int = 0;
    size_t n = 0;
    for (py::object item : py::reinterpret_borrow<py::sequence>(grouping)) {
        ++n;
        if (py::isinstance<py::str>(item)) {
            ++n_str;
        } else if (PyIndex_Check(item.ptr())) {
            ++n_int;
        }
    }

    if (n_str > 0 && n_str != n) {
        throw py::value_error("grouping mixes string and numeric labels");
    }
    if (n_str > 0) {
        return LabelKind::String;
    }
    return (n_int == n) ? LabelKind::Integer : LabelKind::Floating;
}

template <typename Label>
std::vector<Label> labels_as(const py::object& grouping) {
    try {
        return grouping.cast<std::vector<Label>>();
    } catch (const py::cast_error&) {
        throw py::value_error("grouping labels could not be converted; integer labels must "
                              "fit in 64 bits and other labels must be numeric or strings");
    }
}

/// Invoke fn with the grouping converted to its natural label vector
template <typename Fn>
auto with_labels(const py::object& grouping, Fn&& fn) {
    switch (classify_labels(grouping)) {
        case LabelKind::String:
            return fn(labels_as<std::string>(grouping));
        case LabelKind::Integer:
            return fn(labels_as<std::int64_t>(grouping));
        default:
            return fn(labels_as<double>(grouping));
    }
}

}  // anonymous namespace

void bind_core(py::module_& m) {
    py::enum_<Axis>(m, "Axis")
        .value("Columns", Axis::Columns)
        .value("Rows", Axis::Rows);

    m.def("zscore", &zscore,
          py::arg("X"),
          R"doc(
          Z-score X by subtracting column means and dividing by column std.

          Uses the population standard deviation. Zero-variance columns are
          returned as zeros instead of NaN.

          Args:
              X: (N x J) array

          Returns:
              (N x J) z-scored array
          )doc");

    m.def("normalize",
          py::overload_cast<const Eigen::MatrixXd&, int>(&normalize),
          py::arg("X"),
          py::arg("axis") = 0,
          R"doc(
          Normalize X by its L2 (Frobenius) norm along axis.

          Slices with zero norm are returned as zeros.

          Args:
              X: (N x K) array
              axis: 0 to normalize columns, 1 to normalize rows

          Returns:
              (N x K) normalized array
          )doc");

    m.def("compute_xcorr", &compute_xcorr,
          py::arg("X"), py::arg("Y"),
          "Cross-covariance of z-scored, column-normalized X and Y (K x J)");

    m.def("xcorr",
          [](const Eigen::MatrixXd& X, const Eigen::MatrixXd& Y,
             const py::object& grouping) -> Eigen::MatrixXd {
              if (grouping.is_none()) {
                  return xcorr(X, Y);
              }
              return with_labels(grouping, [&](const auto& labels) -> Eigen::MatrixXd {
                  return xcorr(X, Y, labels);
              });
          },
          py::arg("X"), py::arg("Y"), py::arg("grouping") = py::none(),
          R"doc(
          Cross-covariance matrix of X and Y.

          Args:
              X: (N x J) array
              Y: (N x K) array
              grouping: optional (N,) labels; cross-covariance is computed
                  separately per group and stacked row-wise in ascending
                  label order

          Returns:
              (K[*G] x J) array

          Raises:
              ValueError: if row counts differ, a group has fewer than 2 rows,
                  or the labels are NaN, mixed or not convertible
          )doc");

    m.def("dummy_code",
          [](const py::object& grouping) -> Eigen::MatrixXi {
              return with_labels(grouping, [](const auto& labels) -> Eigen::MatrixXi {
                  return dummy_code(labels);
              });
          },
          py::arg("grouping"),
          R"doc(
          Dummy code grouping into an (N x G) indicator array.

          Columns follow the ascending order of the unique labels.
          )doc");

    m.def("reverse_dummy_code", &reverse_dummy_code,
          py::arg("Y"),
          R"doc(
          Recover group numbers 1..G from a dummy-coded (N x G) array.

          Original label values are not recovered. Rows that are not one-hot
          yield the sum of their set column numbers (0 for an empty row).
          )doc");

    m.def("unique_labels",
          [](const py::object& grouping) -> py::object {
              return with_labels(grouping, [](const auto& labels) -> py::object {
                  return py::cast(unique_labels(labels));
              });
          },
          py::arg("grouping"),
          "Sorted distinct labels of grouping");
}
