/**
 * @file pls_cpp.cpp
 * @brief Main pybind11 module combining all C++ bindings
 *
 * This creates the 'pls_cpp' Python extension module that provides the
 * preprocessing primitives used by partial least squares routines.
 */

#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations of binding functions
void bind_core(py::module_& m);
void bind_rng(py::module_& m);

/**
 * @brief Main Python module definition
 *
 * Creates submodules:
 * - core: z-scoring, normalization, cross-covariance, dummy coding
 * - rng: RandomState and seed resolution
 */
PYBIND11_MODULE(pls_cpp, m) {
    m.doc() = R"doc(
        PLS preprocessing C++ extension module

        Submodules:
            core: zscore, normalize, xcorr, dummy_code, reverse_dummy_code
            rng: RandomState, get_seed

        Example:
            >>> from pls_cpp import core, rng
            >>> Xz = core.zscore(X)
            >>> cross = core.xcorr(X, Y, grouping=groups)
            >>> rs = rng.get_seed(1234)
            >>> perm = rs.permutation(X.shape[0])
    )doc";

    py::module_ core_module = m.def_submodule("core",
        R"doc(
        Preprocessing transforms.

        Functions:
            zscore: Column-wise standardization (zero-variance columns -> 0)
            normalize: L2 normalization along rows or columns (zero-norm -> 0)
            compute_xcorr: Cross-covariance of two standardized blocks
            xcorr: Cross-covariance, optionally per group and stacked
            dummy_code: One-hot coding of a grouping vector
            reverse_dummy_code: Group numbers 1..G from a dummy-coded array
        )doc");

    py::module_ rng_module = m.def_submodule("rng",
        R"doc(
        Random state handling.

        Classes:
            RandomState: Seedable Mersenne Twister generator

        Functions:
            get_seed: Resolve None / int / RandomState into a RandomState
        )doc");

    bind_core(core_module);
    bind_rng(rng_module);

    m.attr("__version__") = "0.1.0";
}
