/**
 * @file rng_bindings.cpp
 * @brief pybind11 bindings for RandomState and seed resolution
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <memory>

#include "rng/random_state.hpp"

namespace py = pybind11;
using namespace pls::rng;

void bind_rng(py::module_& m) {
    py::class_<RandomState, std::shared_ptr<RandomState>>(m, "RandomState",
        R"doc(
        Pseudo-random number generator (32-bit Mersenne Twister).

        Example:
            >>> rs = RandomState(1234)
            >>> perm = rs.permutation(10)
            >>> boot = rs.randint(0, 10, 10)
        )doc")
        .def(py::init<>(),
             "Construct seeded from the system entropy source")
        .def(py::init<std::uint32_t>(),
             py::arg("seed"),
             "Construct with a fixed seed")
        .def("seed", &RandomState::seed,
             py::arg("seed"),
             "Reseed the generator")
        .def("uniform", &RandomState::uniform,
             py::arg("low") = 0.0,
             py::arg("high") = 1.0,
             "Draw from the uniform distribution on [low, high)")
        .def("standard_normal", &RandomState::standard_normal,
             "Draw from the standard normal distribution")
        .def("randint", &RandomState::randint,
             py::arg("low"), py::arg("high"), py::arg("size"),
             "Draw size integers uniformly from [low, high) with replacement")
        .def("permutation", &RandomState::permutation,
             py::arg("n"),
             "Random permutation of 0..n-1");

    m.def("get_seed",
          [](const py::object& seed) -> std::shared_ptr<RandomState> {
              if (py::isinstance<py::int_>(seed)) {
                  int overflow = 0;
                  long long value = PyLong_AsLongLongAndOverflow(seed.ptr(), &overflow);
                  if (value == -1 && PyErr_Occurred()) {
                      throw py::error_already_set();
                  }
                  if (overflow != 0) {
                      throw py::value_error("Seed must be between 0 and 2**32 - 1");
                  }
                  return get_seed(static_cast<std::int64_t>(value));
              }
              if (py::isinstance<RandomState>(seed)) {
                  return get_seed(seed.cast<std::shared_ptr<RandomState>>());
              }
              return get_seed();
          },
          py::arg("seed") = py::none(),
          R"doc(
          Resolve seed into a RandomState.

          Args:
              seed: int to seed a new RandomState, an existing RandomState to
                  return as-is, or None (or any other value) for the shared
                  default RandomState

          Returns:
              RandomState instance

          Raises:
              ValueError: if an integer seed is outside [0, 2**32 - 1]
          )doc");

    m.def("default_random_state", &default_random_state,
          "Shared default RandomState used when no seed is given");

    m.def("set_default_random_state", &set_default_random_state,
          py::arg("state"),
          "Replace the shared default RandomState (None reseeds it)");
}
