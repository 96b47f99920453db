#pragma once
// Error bindings: ErrorCode and the exception hierarchy

#include <nanobind/nanobind.h>

#include <tempora/error.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace tempora_python {

inline void bind_errors(nb::module_& m) {
    nb::enum_<tempora::ErrorCode>(m, "ErrorCode", "Failure categories of tempora operations")
        .value("invalid_argument", tempora::ErrorCode::invalid_argument,
               "Malformed input (bad date, zero step, zone/offset mismatch)")
        .value("unknown_zone", tempora::ErrorCode::unknown_zone,
               "Time zone name not in the zone database")
        .value("domain_error", tempora::ErrorCode::domain_error,
               "Timestamp requested before the epoch started")
        .value("data_error", tempora::ErrorCode::data_error,
               "Leap second list failed its consistency checks")
        .def("__str__",
             [](tempora::ErrorCode c) { return std::string(tempora::error_code_string(c)); });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    auto invalid_argument =
        nb::exception<std::invalid_argument>(m, "InvalidArgumentError", PyExc_ValueError);
    invalid_argument_error_type = invalid_argument.ptr();

    // Subclass of ValueError, like a bad argument
    auto unknown_zone = nb::exception<std::runtime_error>(m, "UnknownZoneError", PyExc_ValueError);
    unknown_zone_error_type = unknown_zone.ptr();

    auto domain = nb::exception<std::domain_error>(m, "DomainError", PyExc_ValueError);
    domain_error_type = domain.ptr();

    auto data = nb::exception<std::runtime_error>(m, "DataError", PyExc_RuntimeError);
    data_error_type = data.ptr();
}

} // namespace tempora_python
