#pragma once

#include <pybind11/pybind11.h>
#include "py_object_traits.hpp"

namespace ptrie {

// Registers PersistentHashMap and PersistentVector on `m`
void defineModule(py::module_& m);

} // namespace ptrie
