// PyBind11 bindings for the netclear core.
// Exposes intents, netting configuration and the netting engine to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "graph/intent.hpp"
#include "cycles/cycle.hpp"
#include "netting/netting_config.hpp"
#include "netting/netting_engine.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

namespace py = pybind11;

PYBIND11_MODULE(netclear_bindings, m) {
    m.doc() = "netclear obligation netting bindings";

    // ── Errors ──
    py::register_exception<netclear::NettingInvariantError>(m, "NettingInvariantError");
    py::register_exception<netclear::ExplorationLimitError>(m, "ExplorationLimitError");

    // ── Intent ──
    py::class_<netclear::Intent>(m, "Intent")
        .def(py::init<>())
        .def(py::init<std::string, std::string, std::string, uint64_t>(),
             py::arg("sender"), py::arg("receiver"), py::arg("token"), py::arg("amount"))
        .def_readwrite("sender", &netclear::Intent::sender)
        .def_readwrite("receiver", &netclear::Intent::receiver)
        .def_readwrite("token", &netclear::Intent::token)
        .def_readwrite("amount", &netclear::Intent::amount)
        .def("__eq__", &netclear::Intent::operator==)
        .def("__repr__", [](const netclear::Intent& i) {
            return "<Intent " + i.sender + " -> " + i.receiver + ": " +
                   std::to_string(i.amount) + " " + i.token + ">";
        });

    // ── NettingConfig ──
    py::class_<netclear::NettingConfig>(m, "NettingConfig")
        .def(py::init<>())
        .def_readwrite("max_cycle_length", &netclear::NettingConfig::max_cycle_length)
        .def_readwrite("max_cycles", &netclear::NettingConfig::max_cycles)
        .def_readwrite("max_expansions", &netclear::NettingConfig::max_expansions)
        .def_readwrite("budget_seconds", &netclear::NettingConfig::budget_seconds)
        .def_readwrite("dedupe_rotations", &netclear::NettingConfig::dedupe_rotations)
        .def_readwrite("verify_conservation", &netclear::NettingConfig::verify_conservation)
        .def("validate", &netclear::NettingConfig::validate);

    // ── NettingReport ──
    py::class_<netclear::NettingReport>(m, "NettingReport")
        .def(py::init<>())
        .def_readwrite("intents", &netclear::NettingReport::intents)
        .def_readwrite("parties", &netclear::NettingReport::parties)
        .def_readwrite("edges", &netclear::NettingReport::edges)
        .def_readwrite("sccs_found", &netclear::NettingReport::sccs_found)
        .def_readwrite("cycles_found", &netclear::NettingReport::cycles_found)
        .def_readwrite("nettings_applied", &netclear::NettingReport::nettings_applied)
        .def_readwrite("netted_by_token", &netclear::NettingReport::netted_by_token)
        .def_readwrite("gross_before", &netclear::NettingReport::gross_before)
        .def_readwrite("gross_after", &netclear::NettingReport::gross_after)
        .def_readwrite("elapsed_seconds", &netclear::NettingReport::elapsed_seconds);

    // ── NettingEngine ──
    py::class_<netclear::NettingEngine>(m, "NettingEngine")
        .def(py::init<netclear::NettingConfig>(),
             py::arg("config") = netclear::NettingConfig{})
        .def("run", &netclear::NettingEngine::run)
        .def_property_readonly("config", &netclear::NettingEngine::config);

    m.def("process_netting", &netclear::processNetting,
          py::arg("intents"), py::arg("config") = netclear::NettingConfig{});

    m.def("canonicalize_cycle",
          py::overload_cast<const std::vector<std::string>&>(&netclear::canonicalizeCycle));

    m.def("set_log_level", [](const std::string& level) {
        netclear::setLogLevel(netclear::parseLogLevel(level));
    });
}
