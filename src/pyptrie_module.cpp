#include "bindings.hpp"

PYBIND11_MODULE(pyptrie, m) {
    ptrie::defineModule(m);
}
