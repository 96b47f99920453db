// TEMPORA Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "date_time_bindings.hpp"
#include "error_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace tempora_python {
PyObject* invalid_argument_error_type = nullptr;
PyObject* unknown_zone_error_type = nullptr;
PyObject* domain_error_type = nullptr;
PyObject* data_error_type = nullptr;
} // namespace tempora_python

NB_MODULE(tempora, m) {
    m.doc() = "TEMPORA - Gregorian date-time, leap seconds and UTC/GPS/TAI epochs";

    // 1. Error types (sets the exception pointers used by every other binding)
    tempora_python::bind_errors(m);

    // 2. Value types (TimeUnit, TimeOffset, TimeZone, TimeEpoch)
    tempora_python::bind_core(m);

    // 3. DateTime, LeapSeconds, TimePeriod - need the value types
    tempora_python::bind_date_time(m);
}
