// PyBind11 bindings for the adabench core.
// Exposes rounding, confidence intervals, space expansion and the adaptive
// sampler. Drivers can be implemented in Python by subclassing
// BenchmarkDriver.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "sampling/adaptive_sampler.hpp"
#include "sampling/statistics.hpp"
#include "space/benchmark_description.hpp"
#include "space/execution_grouper.hpp"
#include "space/space_expander.hpp"

#include <optional>

namespace py = pybind11;

namespace {

// Python subclasses override prepare/run/describe. describe() is called
// once and cached, matching the C++ contract.
class PyBenchmarkDriver : public adabench::BenchmarkDriver {
public:
    void prepare() override {
        PYBIND11_OVERRIDE_PURE(void, adabench::BenchmarkDriver, prepare);
    }

    adabench::MetricSamples run() override {
        PYBIND11_OVERRIDE_PURE(adabench::MetricSamples, adabench::BenchmarkDriver, run);
    }

    const adabench::BenchmarkDescription& describe() const override {
        if (!cached_) {
            py::gil_scoped_acquire gil;
            py::function override = py::get_override(static_cast<const adabench::BenchmarkDriver*>(this), "describe");
            if (!override) {
                throw std::runtime_error("BenchmarkDriver subclass must implement describe()");
            }
            cached_ = override().cast<adabench::BenchmarkDescription>();
        }
        return *cached_;
    }

private:
    mutable std::optional<adabench::BenchmarkDescription> cached_;
};

adabench::BenchmarkTemplate templateFromJson(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text);
    adabench::BenchmarkTemplate tmpl;
    for (auto it = j.begin(); it != j.end(); ++it) {
        tmpl.set(it.key(), it.value());
    }
    return tmpl;
}

} // namespace

PYBIND11_MODULE(adabench_bindings, m) {
    m.doc() = "adabench C++ Core Bindings";

    // ── Statistics ──
    py::class_<adabench::ConfidenceInterval>(m, "ConfidenceInterval")
        .def(py::init<>())
        .def_readwrite("low", &adabench::ConfidenceInterval::low)
        .def_readwrite("high", &adabench::ConfidenceInterval::high)
        .def("width", &adabench::ConfidenceInterval::width);

    m.def("round_to_significant_digits", &adabench::roundToSignificantDigits,
          py::arg("x"), py::arg("digits") = 2);
    m.def("t_confidence_interval", &adabench::tConfidenceInterval,
          py::arg("samples"), py::arg("alpha") = 0.05);

    // ── BenchmarkDescription ──
    py::class_<adabench::BenchmarkDescription>(m, "BenchmarkDescription")
        .def(py::init<>())
        .def_static("from_json", [](const std::string& text) {
            return adabench::BenchmarkDescription::fromJson(nlohmann::json::parse(text));
        })
        .def("to_json", &adabench::BenchmarkDescription::toString)
        .def("has", &adabench::BenchmarkDescription::has)
        .def("__len__", &adabench::BenchmarkDescription::size)
        .def("__eq__", [](const adabench::BenchmarkDescription& a, const adabench::BenchmarkDescription& b) {
            return a == b;
        })
        .def("__repr__", &adabench::BenchmarkDescription::toString);

    // ── Space ──
    m.def("expand_templates", [](const std::vector<std::string>& templates_json) {
        std::vector<adabench::BenchmarkTemplate> templates;
        for (const auto& text : templates_json) {
            templates.push_back(templateFromJson(text));
        }
        return adabench::SpaceExpander::expandAll(templates);
    }, py::arg("templates_json"));

    m.def("group_by_execution_key", [](const std::vector<adabench::BenchmarkDescription>& descriptions) {
        std::vector<std::vector<adabench::BenchmarkDescription>> groups;
        for (auto& group : adabench::ExecutionGrouper::group(descriptions)) {
            groups.push_back(std::move(group.descriptions));
        }
        return groups;
    });

    // ── Sampler ──
    py::class_<adabench::BenchmarkDriver, PyBenchmarkDriver>(m, "BenchmarkDriver")
        .def(py::init<>())
        .def("prepare", &adabench::BenchmarkDriver::prepare)
        .def("run", &adabench::BenchmarkDriver::run)
        .def("describe", &adabench::BenchmarkDriver::describe,
             py::return_value_policy::copy);

    py::class_<adabench::SamplerConfig>(m, "SamplerConfig")
        .def(py::init<>())
        .def_readwrite("min_runs", &adabench::SamplerConfig::min_runs)
        .def_readwrite("max_runs", &adabench::SamplerConfig::max_runs)
        .def_readwrite("significance", &adabench::SamplerConfig::significance)
        .def_readwrite("significant_digits", &adabench::SamplerConfig::significant_digits);

    py::class_<adabench::SamplingOutcome>(m, "SamplingOutcome")
        .def_readonly("intervals", &adabench::SamplingOutcome::intervals)
        .def_readonly("runs", &adabench::SamplingOutcome::runs)
        .def_readonly("unconverged_metrics", &adabench::SamplingOutcome::unconverged_metrics);

    py::class_<adabench::AdaptiveSampler>(m, "AdaptiveSampler")
        .def(py::init<adabench::SamplerConfig>(), py::arg("config") = adabench::SamplerConfig{})
        .def("sample", &adabench::AdaptiveSampler::sample)
        .def_property_readonly("config", &adabench::AdaptiveSampler::config);
}
