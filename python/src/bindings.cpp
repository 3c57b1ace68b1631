// SPDX-License-Identifier: MIT
// Python bindings for the yapb indicator library

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <yapb/indicator/bar.h>
#include <yapb/indicator/spinner.h>
#include <yapb/number/compact.h>
#include <yapb/number/moving_average.h>
#include <yapb/number/prefix.h>
#include <yapb/number/sigfigs.h>
#include <yapb/version.h>

#include <optional>
#include <string>

namespace py = pybind11;

namespace {

py::tuple prefixTuple(const yapb::PrefixResult& r) {
    if (r.prefix) {
        return py::make_tuple(r.mantissa, std::string(*r.prefix));
    }
    return py::make_tuple(r.mantissa, py::none());
}

std::string renderIndicator(const yapb::Indicator& ind, std::optional<std::size_t> width, char32_t fill) {
    yapb::RenderOptions opts;
    opts.width = width;
    opts.fill = fill;
    return ind.str(opts);
}

template <typename T>
void bindTableSpinner(py::module_& m, const char* name, const char* doc) {
    py::class_<T, yapb::Spinner>(m, name, doc)
        .def(py::init<>())
        .def_property_readonly("state", &T::state)
        .def_property_readonly_static("cycle_length", [](py::object) { return T::kCycleLength; });
}

}  // namespace

PYBIND11_MODULE(_yapb, m) {
    m.doc() = "yapb - progress bars, spinners and compact number formatting";
    m.attr("__version__") = YAPB_VERSION;

    // --- Indicator base ---
    py::class_<yapb::Indicator>(m, "Indicator")
        .def("render", &renderIndicator,
            py::arg("width") = py::none(), py::arg("fill") = U' ',
            "Render to a string. Width is honoured by Bar only.")
        .def("__str__", [](const yapb::Indicator& ind) { return ind.str(); });

    py::class_<yapb::Spinner, yapb::Indicator>(m, "Spinner")
        .def("set", &yapb::Spinner::set, py::arg("value"),
            "Set the counter to an absolute value (truncated/wrapped as needed).")
        .def("step", &yapb::Spinner::step, py::arg("count") = 1u,
            "Advance the counter, wrapping around.")
        .def("glyph", [](const yapb::Spinner& s) { return s.str(); },
            "The current glyph as a one-character string.");

    // --- Spinners ---
    bindTableSpinner<yapb::Spinner4>(m, "Spinner4", "Single quadrant block turning through 4 states.");
    bindTableSpinner<yapb::Spinner8>(m, "Spinner8", "Single braille dot turning through 8 states.");
    bindTableSpinner<yapb::Counter16>(m, "Counter16", "Quadrant blocks counting through 16 states.");

    py::class_<yapb::Counter256, yapb::Spinner>(m, "Counter256",
        "8-bit counter drawn as a braille bitmap.")
        .def(py::init<>())
        .def_property_readonly("state", &yapb::Counter256::state);

    py::class_<yapb::Snake, yapb::Spinner>(m, "Snake",
        "A run of 1-6 braille dots travelling around the cell.")
        .def(py::init<>())
        .def_property_readonly("state", &yapb::Snake::state);

    // --- Bar ---
    py::class_<yapb::Bar, yapb::Indicator>(m, "Bar",
        "High-resolution progress bar; progress is clamped to [0, 1] when rendered.")
        .def(py::init<>())
        .def("set", &yapb::Bar::set, py::arg("progress"))
        .def("step", &yapb::Bar::step, py::arg("delta"))
        .def("get", &yapb::Bar::get)
        .def("__repr__", [](const yapb::Bar& b) {
            return "<Bar progress=" + std::to_string(b.get()) + ">";
        });

    // --- Moving average ---
    py::class_<yapb::MovingAverage>(m, "MovingAverage")
        .def(py::init<double, double>(), py::arg("alpha"), py::arg("initial") = 0.0)
        .def("update", &yapb::MovingAverage::update, py::arg("sample"))
        .def("get", &yapb::MovingAverage::get)
        .def_property_readonly("alpha", &yapb::MovingAverage::alpha);

    // --- Numbers ---
    m.def("binary", [](double x) { return prefixTuple(yapb::binary(x)); }, py::arg("x"),
        "Scale by the largest binary prefix (Ki..Yi). Returns (mantissa, prefix or None).");

    m.def("si", [](double x) { return prefixTuple(yapb::si(x)); }, py::arg("x"),
        "Scale by the SI prefix leaving 1 <= |mantissa| < 1000. Returns (mantissa, prefix or None).");

    m.def("sigfigs", &yapb::formatSigFigs, py::arg("value"), py::arg("figures"),
        "Format with exactly `figures` significant digits.");

    m.def("format_binary", [](double x) { return yapb::toString(yapb::Binary{x}); }, py::arg("x"),
        "Compact binary-prefixed value, e.g. 12345 -> '12.1 Ki'.");

    m.def("format_scientific", [](double x) { return yapb::toString(yapb::Scientific{x}); }, py::arg("x"),
        "Compact SI-prefixed value, e.g. 0.001 -> '1.00 m'.");
}
