/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <optional>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "capture_orchestrator.hpp"
#include "errors.hpp"

namespace py = pybind11;

// One camera, one session token: repeated captures reuse the HTTP login.
class PyCamera {
public:
    PyCamera(std::string const& ip, std::string const& username, std::string const& password, bool verbose);
    std::optional<std::string> capture(std::optional<std::string> const& output,
        std::string const& format,
        std::string const& method);

private:
    tapocam::CaptureOrchestrator orchestrator_;
};

static tapocam::CaptureSettings make_settings(bool verbose)
{
    tapocam::CaptureSettings settings;
    settings.verbose_ = verbose;
    return settings;
}

PyCamera::PyCamera(std::string const& ip, std::string const& username, std::string const& password, bool verbose)
    : orchestrator_({ ip, username, password }, make_settings(verbose))
{
}

std::optional<std::string> PyCamera::capture(std::optional<std::string> const& output,
    std::string const& format,
    std::string const& method)
{
    auto output_format = tapocam::parse_output_format(format);
    auto capture_method = tapocam::parse_capture_method(method);
    auto path = output.value_or(tapocam::default_output_path(orchestrator_.endpoint().address_, output_format));

    tapocam::CaptureResult result;
    {
        py::gil_scoped_release release;
        result = orchestrator_.capture(path, output_format, capture_method);
    }

    if (!result.success_) {
        return {};
    }
    return result.output_path_;
}

static std::optional<std::string> capture_image(std::string const& ip,
    std::string const& username,
    std::string const& password,
    std::optional<std::string> const& output,
    std::string const& format,
    std::string const& method)
{
    PyCamera camera(ip, username, password, false);
    return camera.capture(output, format, method);
}

PYBIND11_MODULE(pytapocam, m)
{
    py::register_exception<tapocam::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);

    py::class_<PyCamera>(m, "Camera")
        .def(py::init<std::string const&, std::string const&, std::string const&, bool>(),
            py::arg("ip"), py::arg("username"), py::arg("password"), py::arg("verbose") = false)
        .def("capture", &PyCamera::capture, "Capture one image; returns its path or None",
            py::arg("output") = py::none(), py::arg("format") = "PNG", py::arg("method") = "auto");

    m.def("capture", &capture_image, "Capture one image from a camera; returns its path or None",
        py::arg("ip"), py::arg("username"), py::arg("password"), py::arg("output") = py::none(),
        py::arg("format") = "PNG", py::arg("method") = "auto");
}
