// =============================================================================
// stockflow - Python bindings
// =============================================================================
// Thin entry points for Python callers that generate models upstream and
// summarize results downstream. Models travel as YAML/JSON text; results come
// back as plain dicts and lists.
// =============================================================================

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "stockflow/v1/core.hpp"

namespace py = pybind11;
using namespace stockflow::v1;

namespace {

py::dict series_to_dict(const TimeSeries& series, const std::map<std::string, std::string>& units) {
    py::dict columns;
    for (const auto& name : series.columns()) {
        columns[py::str(name)] = series.column(name);
    }
    py::dict out;
    out["columns"] = series.columns();
    out["data"] = columns;
    out["units"] = units;
    out["complete"] = series.complete();
    return out;
}

py::dict error_to_dict(const ErrorDetail& detail) {
    py::dict out;
    out["code"] = std::string(to_string(detail.code));
    out["entity"] = detail.entity;
    out["formula"] = detail.formula;
    out["time"] = detail.time ? py::object(py::float_(*detail.time)) : py::object(py::none());
    out["message"] = detail.message;
    return out;
}

SimulationOptions make_options(std::optional<Real> end_time,
                               std::optional<Real> dt,
                               const std::string& resolver,
                               int passes) {
    SimulationOptions options;
    options.end_time = end_time;
    options.dt = dt;
    options.resolver.max_passes = passes;
    if (resolver == "ordered") {
        options.resolver.strategy = ResolverStrategy::Ordered;
    } else if (resolver == "fixed" || resolver == "fixed_pass") {
        options.resolver.strategy = ResolverStrategy::FixedPass;
    } else {
        throw ConfigError(ErrorCode::InvalidOption, "resolver",
                          "Unknown resolver '" + resolver + "' (expected 'fixed' or 'ordered')");
    }
    return options;
}

py::dict simulate_text(const std::string& model_text,
                       std::optional<Real> end_time,
                       std::optional<Real> dt,
                       const std::string& resolver,
                       int passes) {
    parser::ModelParser parser;
    const ModelConfig model = parser.load_string_or_throw(model_text);
    Simulator sim(model, make_options(end_time, dt, resolver, passes));

    TimeSeries series;
    {
        py::gil_scoped_release release;
        series = sim.run();
    }
    py::dict out = series_to_dict(series, sim.component_units());
    out["warnings"] = parser.warnings();
    return out;
}

py::list run_batch_text(const std::string& batch_text,
                        unsigned int jobs,
                        const std::string& resolver,
                        int passes) {
    parser::ModelParser parser;
    const auto scenarios = parser.load_batch_string(batch_text);
    if (!parser.errors().empty()) {
        std::string message;
        for (const auto& error : parser.errors()) {
            if (!message.empty()) message += "\n";
            message += error;
        }
        throw ConfigError(ErrorCode::ParseFailure, "", message);
    }

    RunnerOptions options;
    options.max_workers = jobs;
    options.simulation = make_options(std::nullopt, std::nullopt, resolver, passes);

    std::vector<ScenarioOutcome> outcomes;
    {
        py::gil_scoped_release release;
        outcomes = run_scenarios(scenarios, options);
    }

    py::list out;
    for (const auto& outcome : outcomes) {
        py::dict entry;
        entry["scenario_label"] = outcome.label;
        entry["status"] = std::string(to_string(outcome.status));
        entry["wall_time_seconds"] = outcome.wall_time_seconds;
        entry["time_series"] = outcome.ok() ? py::object(series_to_dict(outcome.series, outcome.units))
                                            : py::object(py::none());
        entry["error"] = outcome.error ? py::object(error_to_dict(*outcome.error))
                                       : py::object(py::none());
        out.append(std::move(entry));
    }
    return out;
}

}  // namespace

// =============================================================================
// Module Registration
// =============================================================================

PYBIND11_MODULE(_stockflow, m) {
    m.doc() = "stockflow stock-flow-auxiliary simulator (C++ extension)";

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const SimulationError& e) {
            PyErr_SetString(PyExc_RuntimeError, e.what());
        } catch (const ConfigError& e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        } catch (const EvaluationError& e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        }
    });

    m.def("simulate", &simulate_text,
          py::arg("model_text"),
          py::arg("end_time") = py::none(),
          py::arg("dt") = py::none(),
          py::arg("resolver") = "fixed",
          py::arg("passes") = 5,
          "Simulate one model given as YAML/JSON text; returns a dict of columns");

    m.def("run_batch", &run_batch_text,
          py::arg("batch_text"),
          py::arg("jobs") = 0,
          py::arg("resolver") = "fixed",
          py::arg("passes") = 5,
          "Run a base model and its variations; returns one dict per scenario in input order");

    m.def("evaluate", [](const std::string& formula, const std::map<std::string, Real>& values) {
              Scope scope;
              for (const auto& [name, value] : values) scope.set(name, value);
              return evaluate(formula, scope);
          },
          py::arg("formula"), py::arg("values"),
          "Evaluate a formula against plain numeric values");

    m.attr("__version__") = "0.1.0";
}
