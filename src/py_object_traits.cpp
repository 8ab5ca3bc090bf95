#include "py_object_traits.hpp"

namespace ptrie {
namespace pyutils {

uint32_t hashKey(const py::object& key) {
    Py_hash_t h = PyObject_Hash(key.ptr());
    if (h == -1) {
        throw py::error_already_set();
    }
    // Fold both halves so 64-bit hashes keep their high bits
    uint64_t bits = static_cast<uint64_t>(h);
    return static_cast<uint32_t>(bits ^ (bits >> 32));
}

bool objectsEqual(const py::object& a, const py::object& b) {
    // Fast path: same object
    if (a.is(b)) return true;

    // Use Python's rich comparison
    int result = PyObject_RichCompareBool(a.ptr(), b.ptr(), Py_EQ);
    if (result == -1) {
        throw py::error_already_set();
    }
    return result == 1;
}

} // namespace pyutils

PyHashMap emptyPyHashMap() {
    static const PyHashMap empty(&pyutils::hashKey);
    return empty;
}

} // namespace ptrie
