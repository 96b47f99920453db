#pragma once
// Python helpers for tempora bindings

#include <nanobind/nanobind.h>

#include <tempora/error.hpp>

#include <utility>

namespace nb = nanobind;

namespace tempora_python {

// Exception type pointers (set during module init)
extern PyObject* invalid_argument_error_type;
extern PyObject* unknown_zone_error_type;
extern PyObject* domain_error_type;
extern PyObject* data_error_type;

inline PyObject* exception_type(tempora::ErrorCode code) {
    switch (code) {
        case tempora::ErrorCode::invalid_argument:
            return invalid_argument_error_type;
        case tempora::ErrorCode::unknown_zone:
            return unknown_zone_error_type;
        case tempora::ErrorCode::domain_error:
            return domain_error_type;
        case tempora::ErrorCode::data_error:
            return data_error_type;
    }
    return PyExc_RuntimeError;
}

/**
 * @brief Return the value of a Result or raise the matching Python exception
 */
template <typename T>
T unwrap(tempora::Result<T>&& result) {
    if (!result.has_value()) {
        PyErr_SetString(exception_type(result.error().code), result.error().what().c_str());
        throw nb::python_error();
    }
    return *std::move(result);
}

} // namespace tempora_python
