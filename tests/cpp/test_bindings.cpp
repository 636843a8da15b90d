/**
 * @file test_bindings.cpp
 * @brief Tests for Python argument conversion in the pls_cpp bindings
 *
 * The bindings are registered as an embedded module so label dispatch and
 * seed handling can be exercised without building the extension module.
 * Only functions returning plain Python objects are called, so NumPy is
 * not required.
 */

#include <gtest/gtest.h>
#include <pybind11/embed.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>
#include <vector>

namespace py = pybind11;

void bind_core(py::module_& m);
void bind_rng(py::module_& m);

PYBIND11_EMBEDDED_MODULE(pls_cpp_embedded, m) {
    py::module_ core_module = m.def_submodule("core");
    py::module_ rng_module = m.def_submodule("rng");
    bind_core(core_module);
    bind_rng(rng_module);
}

namespace {

// Keeps one interpreter alive for the whole test run
class PythonEnvironment : public ::testing::Environment {
public:
    void SetUp() override { interpreter_ = std::make_unique<py::scoped_interpreter>(); }
    void TearDown() override { interpreter_.reset(); }

private:
    std::unique_ptr<py::scoped_interpreter> interpreter_;
};

::testing::Environment* const python_env =
    ::testing::AddGlobalTestEnvironment(new PythonEnvironment);

py::object submodule(const char* name) {
    return py::module_::import("pls_cpp_embedded").attr(name);
}

template <typename Fn>
bool raises_value_error(Fn&& fn) {
    try {
        fn();
    } catch (py::error_already_set& e) {
        return e.matches(PyExc_ValueError);
    }
    return false;
}

// ============== Label Dispatch Tests ==============

TEST(BindingsTest, IntegerLabelsKeepFullPrecision) {
    py::object core = submodule("core");
    py::object big = py::eval("2 ** 53");
    py::list grouping;
    grouping.append(big);
    grouping.append(big + py::int_(1));
    grouping.append(big);

    py::list labels = core.attr("unique_labels")(grouping);
    ASSERT_EQ(py::len(labels), 2u);
    py::object first = labels[0];
    EXPECT_TRUE(py::isinstance<py::int_>(first));
}

TEST(BindingsTest, FloatLabelsSorted) {
    py::object core = submodule("core");
    py::object labels = core.attr("unique_labels")(py::eval("[2.5, -1.0, 2.5]"));

    EXPECT_EQ(labels.cast<std::vector<double>>(), (std::vector<double>{-1.0, 2.5}));
}

TEST(BindingsTest, StringLabelsSorted) {
    py::object core = submodule("core");
    py::object labels = core.attr("unique_labels")(py::eval("['pat', 'ctl', 'pat']"));

    EXPECT_EQ(labels.cast<std::vector<std::string>>(),
              (std::vector<std::string>{"ctl", "pat"}));
}

TEST(BindingsTest, NanLabelRaisesValueError) {
    py::object core = submodule("core");
    py::object grouping = py::eval("[1.0, float('nan'), 1.0, 2.0]");

    EXPECT_TRUE(raises_value_error([&] { core.attr("unique_labels")(grouping); }));
}

TEST(BindingsTest, MixedLabelsRaiseValueError) {
    py::object core = submodule("core");

    EXPECT_TRUE(raises_value_error(
        [&] { core.attr("unique_labels")(py::eval("[1, 'a', 2]")); }));
    EXPECT_TRUE(raises_value_error(
        [&] { core.attr("unique_labels")(py::eval("['a', 'b', 3.0]")); }));
}

TEST(BindingsTest, OversizedIntegerLabelRaisesValueError) {
    py::object core = submodule("core");

    EXPECT_TRUE(raises_value_error(
        [&] { core.attr("unique_labels")(py::eval("[1, 2 ** 70]")); }));
}

// ============== get_seed Tests ==============

TEST(BindingsTest, GetSeedIntegerReproducible) {
    py::object rng = submodule("rng");
    py::object a = rng.attr("get_seed")(42);
    py::object b = rng.attr("get_seed")(42);

    EXPECT_FALSE(a.is(b));
    EXPECT_EQ(a.attr("uniform")().cast<double>(), b.attr("uniform")().cast<double>());
}

TEST(BindingsTest, GetSeedReturnsExistingInstance) {
    py::object rng = submodule("rng");
    py::object state = rng.attr("RandomState")(7);

    EXPECT_TRUE(rng.attr("get_seed")(state).is(state));
}

TEST(BindingsTest, GetSeedOtherTypesUseDefault) {
    py::object rng = submodule("rng");
    py::object fallback = rng.attr("default_random_state")();

    EXPECT_TRUE(rng.attr("get_seed")().is(fallback));
    EXPECT_TRUE(rng.attr("get_seed")(3.5).is(fallback));
}

TEST(BindingsTest, GetSeedOutOfRangeRaisesValueError) {
    py::object rng = submodule("rng");

    EXPECT_TRUE(raises_value_error([&] { rng.attr("get_seed")(-1); }));
    EXPECT_TRUE(raises_value_error([&] { rng.attr("get_seed")(py::eval("2 ** 32")); }));
    EXPECT_TRUE(raises_value_error([&] { rng.attr("get_seed")(py::eval("2 ** 70")); }));
}

}  // namespace
