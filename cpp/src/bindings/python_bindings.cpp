#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "libkinda/assertions.hpp"
#include "libkinda/composition.hpp"
#include "libkinda/errors.hpp"
#include "libkinda/loops.hpp"
#include "libkinda/primitives.hpp"
#include "libkinda/runtime.hpp"
#include "libkinda/transformer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace py = pybind11;
using namespace libkinda;

namespace {

bool truthy(const py::object& condition) {
    return static_cast<bool>(py::bool_(condition));
}

// `with personality("chaotic", 8):` scope over the default runtime.
class PersonalityScope {
public:
    PersonalityScope(std::string mood, int chaos_level)
        : mood_(std::move(mood)), chaos_level_(chaos_level) {
        (void)parse_mood(mood_);
    }

    PersonalityScope& enter() {
        scope_ = std::make_unique<ScopedPersonality>(default_runtime().personality(), parse_mood(mood_), chaos_level_);
        return *this;
    }

    bool exit(const py::object&, const py::object&, const py::object&) {
        scope_.reset();
        return false;
    }

private:
    std::string mood_;
    int chaos_level_;
    std::unique_ptr<ScopedPersonality> scope_;
};

}  // namespace

PYBIND11_MODULE(_libkinda, m) {
    m.doc() = "libkinda python bindings";

    py::register_exception<TransformError>(m, "TransformError");
    py::register_exception<InvalidConfiguration>(m, "InvalidConfiguration", PyExc_ValueError);
    py::register_exception<StatisticalAssertionError>(m, "StatisticalAssertionError", PyExc_AssertionError);

    py::class_<TransformOptions>(m, "TransformOptions")
        .def(py::init<>())
        .def_readwrite("use_composition", &TransformOptions::use_composition)
        .def_readwrite("emit_import_header", &TransformOptions::emit_import_header)
        .def_readwrite("runtime_module", &TransformOptions::runtime_module)
        .def_readwrite("source_name", &TransformOptions::source_name)
        .def_readwrite("indent_unit", &TransformOptions::indent_unit)
        .def_readwrite("max_line_length", &TransformOptions::max_line_length);

    py::class_<SourceMap>(m, "SourceMap")
        .def("original_line", &SourceMap::original_line, py::arg("output_line"))
        .def("output_line", &SourceMap::output_line, py::arg("original_line"))
        .def_property_readonly("lines", &SourceMap::lines);

    py::class_<TransformResult>(m, "TransformResult")
        .def_readonly("text", &TransformResult::text)
        .def_readonly("source_map", &TransformResult::source_map)
        .def_readonly("helpers", &TransformResult::helpers);

    py::class_<Transformer>(m, "Transformer")
        .def(py::init<>())
        .def(py::init<TransformOptions>(), py::arg("options"))
        .def("transform", &Transformer::transform, py::arg("source"));

    py::class_<PersonalityScope>(m, "personality")
        .def(py::init<std::string, int>(), py::arg("mood"), py::arg("chaos_level") = kDefaultChaosLevel)
        .def("__enter__", &PersonalityScope::enter, py::return_value_policy::reference_internal)
        .def("__exit__", &PersonalityScope::exit);

    // Configuration of the process-wide runtime.
    m.def("set_context", [](const std::string& mood, int chaos_level) {
        default_runtime().set_context(mood, chaos_level);
    }, py::arg("mood"), py::arg("chaos_level") = kDefaultChaosLevel);

    m.def("current_context", []() {
        const auto& active = default_runtime().personality().active();
        return py::make_tuple(to_string(active.mood), active.chaos_level);
    });

    m.def("seed", [](std::uint64_t value) { default_runtime().reseed(value); }, py::arg("value"));

    m.def("set_error_mode", [](const std::string& mode) {
        default_runtime().events().set_mode(parse_error_mode(mode));
    }, py::arg("mode"));

    m.def("chaos_summary", []() { return default_runtime().events().summary(); });

    // Runtime surface called by transformed code.
    m.def("sometimes", [](const py::object& c) { return sometimes(default_runtime(), truthy(c)); },
          py::arg("condition") = true);
    m.def("maybe", [](const py::object& c) { return maybe(default_runtime(), truthy(c)); },
          py::arg("condition") = true);
    m.def("probably", [](const py::object& c) { return probably(default_runtime(), truthy(c)); },
          py::arg("condition") = true);
    m.def("rarely", [](const py::object& c) { return rarely(default_runtime(), truthy(c)); },
          py::arg("condition") = true);

    // One loop object per entry into a ~sometimes_while / ~eventually_until block.
    py::class_<SometimesWhileLoop>(m, "SometimesWhileLoop")
        .def("check", [](SometimesWhileLoop& loop, const py::object& c) { return loop.check(truthy(c)); },
             py::arg("condition"))
        .def_property_readonly("cycles", &SometimesWhileLoop::cycles)
        .def_property_readonly("iterations", &SometimesWhileLoop::iterations)
        .def_property_readonly("site", &SometimesWhileLoop::site);

    py::class_<EventuallyUntilLoop>(m, "EventuallyUntilLoop")
        .def("check", [](EventuallyUntilLoop& loop, const py::object& c) { return loop.should_continue(truthy(c)); },
             py::arg("condition"))
        .def_property_readonly("cycles", &EventuallyUntilLoop::cycles)
        .def_property_readonly("evaluations", &EventuallyUntilLoop::evaluations)
        .def_property_readonly("site", &EventuallyUntilLoop::site);

    m.def("sometimes_while_loop", [](const std::string& site) {
        return std::make_unique<SometimesWhileLoop>(default_runtime(), site);
    }, py::arg("site") = "sometimes_while");

    m.def("eventually_until_loop", [](const std::string& site) {
        return std::make_unique<EventuallyUntilLoop>(default_runtime(), site);
    }, py::arg("site") = "eventually_until");

    m.def("maybe_for_item_execute", []() { return maybe_for_item_execute(default_runtime()); });

    m.def("kinda_repeat_count", [](std::int64_t n) { return kinda_repeat_count(default_runtime(), n); },
          py::arg("n"));

    m.def("ish_comparison", [](const Value& left, const Value& right, std::optional<double> tolerance) {
        return ish_comparison(default_runtime(), left, right, tolerance);
    }, py::arg("left"), py::arg("right"), py::arg("tolerance") = py::none());

    m.def("ish_comparison_composed", [](const Value& left, const Value& right, std::optional<double> tolerance) {
        return ish_comparison_composed(default_runtime(), left, right, tolerance);
    }, py::arg("left"), py::arg("right"), py::arg("tolerance") = py::none());

    m.def("ish_value", [](const Value& value, std::optional<Value> target) {
        return ish_value(default_runtime(), value, target);
    }, py::arg("value"), py::arg("target") = py::none());

    m.def("ish_value_composed", [](const Value& value, std::optional<Value> target) {
        return ish_value_composed(default_runtime(), value, target);
    }, py::arg("value"), py::arg("target") = py::none());

    m.def("kinda_int", [](double value) { return kinda_int(default_runtime(), value); }, py::arg("value"));
    m.def("kinda_float", [](double value) { return kinda_float(default_runtime(), value); }, py::arg("value"));
    m.def("kinda_bool", [](const py::object& value) { return kinda_bool(default_runtime(), truthy(value)); },
          py::arg("value"));
    m.def("kinda_binary", []() { return kinda_binary(default_runtime()); });

    m.def("fuzzy_assign", [](const std::string& name, const Value& value) {
        return fuzzy_assign(default_runtime(), name, value);
    }, py::arg("name"), py::arg("value"));

    m.def("welp_fallback", [](const py::object& primary, const py::object& fallback) {
        auto evaluate = [&primary]() -> py::object {
            return PyCallable_Check(primary.ptr()) ? primary() : primary;
        };
        return welp_fallback<py::object>(default_runtime(), evaluate, fallback,
                                         [](const py::object& v) { return v.is_none(); });
    }, py::arg("primary"), py::arg("fallback"));

    m.def("assert_eventually", [](const py::object& condition, double timeout, double confidence) {
        EventuallyOptions options;
        options.timeout_seconds = timeout;
        options.confidence = confidence;
        assert_eventually(default_runtime(), [&condition]() { return truthy(condition()); }, options);
        return true;
    }, py::arg("condition"), py::arg("timeout") = 5.0, py::arg("confidence") = 0.95);

    m.def("assert_probability", [](const py::object& event, double expected_prob, double tolerance,
                                   std::size_t samples) {
        ProbabilityOptions options{expected_prob, tolerance, samples};
        assert_probability(default_runtime(), [&event]() { return truthy(event()); }, options);
        return true;
    }, py::arg("event"), py::arg("expected_prob") = 0.5, py::arg("tolerance") = 0.1, py::arg("samples") = 1000);

    m.def("sorta_print", [](py::args args) {
        if (gate(default_runtime(), ConstructKind::SortaPrint)) {
            py::print(*args);
            return true;
        }
        return false;
    });
}
