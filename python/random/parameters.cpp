#include "sprout/random/integer_range_randomizer.hpp"
#include "sprout/random/parameters.hpp"

#include <nlohmann/json.hpp>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "sprout/error/exception.hpp"

namespace py = pybind11;
using namespace sprout::random;

PYBIND11_MODULE(parameters, m) {
    m.doc() = "Generation parameters and size draws for the sprout package";

    // Register exception translations
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p)
                std::rethrow_exception(p);
        } catch (const sprout::error::InvalidArgument& e) {
            PyErr_SetString(PyExc_ValueError, e.getMessage().c_str());
        } catch (const sprout::error::FailToOpenFile& e) {
            PyErr_SetString(PyExc_FileNotFoundError, e.getMessage().c_str());
        } catch (const sprout::error::Exception& e) {
            PyErr_SetString(PyExc_RuntimeError, e.getMessage().c_str());
        } catch (const nlohmann::json::exception& e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        }
    });

    py::class_<Range<int>>(m, "IntRange",
                           "Closed-open integer interval [min, max).")
        .def(py::init([](int min, int max) { return Range<int>{min, max}; }),
             py::arg("min"), py::arg("max"))
        .def_readwrite("min", &Range<int>::min)
        .def_readwrite("max", &Range<int>::max)
        .def("__eq__", [](const Range<int>& a, const Range<int>& b) {
            return a == b;
        })
        .def("__repr__", [](const Range<int>& r) {
            return "IntRange(" + std::to_string(r.min) + ", " +
                   std::to_string(r.max) + ")";
        });

    py::class_<GenerationParameters>(
        m, "GenerationParameters",
        R"(Parameters of one generation call.

Setters validate their argument and return the parameters, so calls can be
chained.

Examples:
    >>> from sprout.random.parameters import GenerationParameters
    >>> p = GenerationParameters().set_object_pool_size(3).set_seed(7)
    >>> p.object_pool_size
    3
)")
        .def(py::init<>())
        .def_property_readonly("object_pool_size",
                               &GenerationParameters::getObjectPoolSize)
        .def_property_readonly("randomization_depth",
                               &GenerationParameters::getRandomizationDepth)
        .def_property_readonly(
            "avoid_infinite_recursion",
            &GenerationParameters::isAvoidInfiniteRecursion)
        .def_property_readonly(
            "avoid_nulls_on_deepest_recursion_level",
            &GenerationParameters::isAvoidNullsOnDeepestRecursionLevel)
        .def_property_readonly("collection_size_range",
                               &GenerationParameters::getCollectionSizeRange)
        .def_property_readonly("seed", &GenerationParameters::getSeed)
        .def("set_object_pool_size", &GenerationParameters::setObjectPoolSize,
             py::arg("size"), py::return_value_policy::reference_internal,
             "Raises ValueError if size < 1.")
        .def("set_randomization_depth",
             &GenerationParameters::setRandomizationDepth, py::arg("depth"),
             py::return_value_policy::reference_internal,
             "Raises ValueError if depth < 0.")
        .def("set_avoid_infinite_recursion",
             &GenerationParameters::setAvoidInfiniteRecursion,
             py::arg("enabled"), py::return_value_policy::reference_internal)
        .def("set_avoid_nulls_on_deepest_recursion_level",
             &GenerationParameters::setAvoidNullsOnDeepestRecursionLevel,
             py::arg("enabled"), py::return_value_policy::reference_internal)
        .def("set_collection_size_range",
             &GenerationParameters::setCollectionSizeRange, py::arg("min"),
             py::arg("max"), py::return_value_policy::reference_internal,
             "Raises ValueError if min < 0 or min > max.")
        .def("set_seed", &GenerationParameters::setSeed, py::arg("seed"),
             py::return_value_policy::reference_internal,
             "Sets the size-draw seed; None makes draws non-reproducible.")
        .def_static(
            "from_json",
            [](const std::string& text) {
                return GenerationParameters::fromJson(
                    nlohmann::json::parse(text));
            },
            py::arg("text"),
            R"(Builds parameters from a JSON document.

Raises:
    ValueError: If the document is malformed or holds invalid values.
)")
        .def_static("load", &GenerationParameters::loadFromFile,
                    py::arg("path"),
                    R"(Reads parameters from a JSON file.

Raises:
    FileNotFoundError: If the file cannot be opened.
    ValueError: If the file is not valid JSON or holds invalid values.
)")
        .def("to_json",
             [](const GenerationParameters& p) { return p.toJson().dump(); })
        .def("__eq__", [](const GenerationParameters& a,
                          const GenerationParameters& b) { return a == b; });

    py::class_<IntegerRangeRandomizer>(
        m, "IntegerRangeRandomizer",
        R"(Draws integers from [min, max).

Args:
    min: Inclusive lower bound.
    max: Exclusive upper bound.
    seed: Optional seed; the same seed reproduces the same sequence.

Raises:
    ValueError: If min > max.
)")
        .def(py::init<int, int, std::optional<std::int64_t>>(),
             py::arg("min"), py::arg("max"), py::arg("seed") = py::none())
        .def("next", &IntegerRangeRandomizer::getRandomValue)
        .def_property_readonly("min", &IntegerRangeRandomizer::getMin)
        .def_property_readonly("max", &IntegerRangeRandomizer::getMax);

    m.def(
        "random_size",
        [](const GenerationParameters& parameters) {
            const auto range = parameters.getCollectionSizeRange();
            IntegerRangeRandomizer randomizer(range.min, range.max,
                                              parameters.getSeed());
            return randomizer.getRandomValue();
        },
        py::arg("parameters"),
        "First collection size drawn for the given parameters.");
}
