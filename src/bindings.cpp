#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>
#include <string>
#include "bindings.hpp"

namespace py = pybind11;
using ptrie::PyHashMap;
using ptrie::PyVector;

namespace {

// Wraps a Python callable as an alter() update function. None means "no value".
PyHashMap::UpdateFn wrapUpdate(const py::function& fn) {
    return [fn](const std::optional<py::object>& old) -> std::optional<py::object> {
        py::object result = fn(old ? *old : py::object(py::none()));
        if (result.is_none()) {
            return std::nullopt;
        }
        return result;
    };
}

py::list itemsList(const PyHashMap& m) {
    // Pre-allocate list with exact size
    py::list result(m.size());
    size_t idx = 0;
    m.forEach([&](const py::object& k, const py::object& v) {
        result[idx++] = py::make_tuple(k, v);
    });
    return result;
}

py::list keysList(const PyHashMap& m) {
    py::list result(m.size());
    size_t idx = 0;
    m.forEach([&](const py::object& k, const py::object&) {
        result[idx++] = k;
    });
    return result;
}

py::list valuesList(const PyHashMap& m) {
    py::list result(m.size());
    size_t idx = 0;
    m.forEach([&](const py::object&, const py::object& v) {
        result[idx++] = v;
    });
    return result;
}

py::list vectorList(const PyVector& v) {
    py::list result(v.size());
    size_t idx = 0;
    v.forEach([&](const py::object& elem) {
        result[idx++] = elem;
    });
    return result;
}

std::string mapRepr(const PyHashMap& m) {
    std::ostringstream oss;
    oss << "PersistentHashMap({";

    bool first = true;
    m.forEach([&](const py::object& k, const py::object& v) {
        if (!first) {
            oss << ", ";
        }
        first = false;

        // Use Python's repr for keys and values
        oss << py::repr(k).cast<std::string>();
        oss << ": ";
        oss << py::repr(v).cast<std::string>();
    });

    oss << "})";
    return oss.str();
}

std::string vectorRepr(const PyVector& v) {
    std::ostringstream oss;
    oss << "PersistentVector([";

    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << py::repr(v.nth(i)).cast<std::string>();

        // Limit output for large vectors
        if (i >= 10 && v.size() > 12) {
            oss << ", ... (" << (v.size() - 11) << " more)";
            i = v.size() - 2;  // Show last element
        }
    }

    oss << "])";
    return oss.str();
}

PyHashMap mapFromDict(const py::dict& d) {
    PyHashMap result = ptrie::emptyPyHashMap();
    for (auto item : d) {
        result = result.insert(py::reinterpret_borrow<py::object>(item.first),
                               py::reinterpret_borrow<py::object>(item.second));
    }
    return result;
}

PyHashMap mapFromItems(const py::iterable& items) {
    PyHashMap result = ptrie::emptyPyHashMap();
    for (auto item : items) {
        py::tuple t = item.cast<py::tuple>();
        if (t.size() != 2) {
            throw py::value_error("from_list() expects (key, value) pairs");
        }
        result = result.insert(t[0].cast<py::object>(), t[1].cast<py::object>());
    }
    return result;
}

PyVector vectorFromIterable(const py::iterable& items) {
    PyVector result;
    for (auto elem : items) {
        result = result.conj(py::reinterpret_borrow<py::object>(elem));
    }
    return result;
}

size_t normalizeIndex(const PyVector& v, Py_ssize_t idx) {
    // Handle negative indices
    if (idx < 0) {
        idx += static_cast<Py_ssize_t>(v.size());
    }
    if (idx < 0 || idx >= static_cast<Py_ssize_t>(v.size())) {
        throw py::index_error("PersistentVector index out of range");
    }
    return static_cast<size_t>(idx);
}

} // namespace

namespace ptrie {

void defineModule(py::module_& m) {
    m.doc() = "Persistent hash trie map (HAMT) and persistent vector implemented in C++";

    py::class_<PyHashMap>(m, "PersistentHashMap")
        .def(py::init([]() { return ptrie::emptyPyHashMap(); }),
             "Create an empty PersistentHashMap")

        // Core methods
        .def("insert", &PyHashMap::insert,
             py::arg("key"), py::arg("val"),
             "Associate key with value, returning new map.\n\n"
             "Args:\n"
             "    key: The key (must be hashable)\n"
             "    val: The value\n\n"
             "Returns:\n"
             "    A new PersistentHashMap with the association added")

        .def("assoc", &PyHashMap::insert,
             py::arg("key"), py::arg("val"),
             "Alias for insert().")

        .def("delete", &PyHashMap::erase,
             py::arg("key"),
             "Remove key, returning new map. Absent keys are ignored.\n\n"
             "Args:\n"
             "    key: The key to remove\n\n"
             "Returns:\n"
             "    A new PersistentHashMap without the key")

        .def("dissoc", &PyHashMap::erase,
             py::arg("key"),
             "Alias for delete().")

        .def("alter",
             [](const PyHashMap& self, py::function fn, py::object key) {
                 return self.alter(wrapUpdate(fn), key);
             },
             py::arg("fn"), py::arg("key"),
             "Replace the value at key with fn(old), returning new map.\n\n"
             "Args:\n"
             "    fn: Called with the current value, or None if absent.\n"
             "        Returning None removes the key.\n"
             "    key: The key to alter\n\n"
             "Returns:\n"
             "    A new PersistentHashMap")

        .def("insert_with",
             [](const PyHashMap& self, py::function fn, py::object key, py::object val) {
                 return self.insertWith(
                     [fn](const py::object& newVal, const py::object& oldVal) -> py::object {
                         return fn(newVal, oldVal);
                     },
                     key, val);
             },
             py::arg("fn"), py::arg("key"), py::arg("val"),
             "Insert val at key, storing fn(val, old) if key is already present.")

        .def("adjust",
             [](const PyHashMap& self, py::function fn, py::object key) {
                 return self.adjust(
                     [fn](const py::object& old) -> py::object { return fn(old); }, key);
             },
             py::arg("fn"), py::arg("key"),
             "Replace the value at key with fn(value) if key is present.")

        .def("get",
             [](const PyHashMap& self, py::object key, py::object default_val) -> py::object {
                 const py::object* found = self.find(key);
                 return found ? *found : default_val;
             },
             py::arg("key"), py::arg("default") = py::none(),
             "Get value for key, or default if not found.\n\n"
             "Args:\n"
             "    key: The key to look up\n"
             "    default: Value to return if key not found (default: None)\n\n"
             "Returns:\n"
             "    The value associated with key, or default")

        .def("lookup",
             [](const PyHashMap& self, py::object key) -> py::object {
                 std::optional<py::object> found = self.lookup(key);
                 return found ? *found : py::object(py::none());
             },
             py::arg("key"),
             "Get value for key, or None if not found.")

        .def("merge", &PyHashMap::merge,
             py::arg("other"),
             "Merge another PersistentHashMap, returning new map. Entries of other win.")

        .def("update",
             [](const PyHashMap& self, py::dict other) {
                 return self.merge(mapFromDict(other));
             },
             py::arg("other"),
             "Merge a dict, returning new map. Entries of other win.")

        // Python protocols
        .def("__getitem__",
             [](const PyHashMap& self, py::object key) -> py::object {
                 const py::object* found = self.find(key);
                 if (found == nullptr) {
                     throw py::key_error(py::repr(key).cast<std::string>());
                 }
                 return *found;
             },
             py::arg("key"),
             "Get item using bracket notation. Raises KeyError if not found.")

        .def("__contains__", &PyHashMap::member,
             py::arg("key"),
             "Check if key is in map.")

        .def("__len__", &PyHashMap::size,
             "Return number of entries in the map.")

        .def("__iter__",
             [](const PyHashMap& self) { return py::iter(keysList(self)); },
             "Iterate over keys in the map.")

        .def("keys", &keysList,
             "Return list of all keys.")

        .def("values", &valuesList,
             "Return list of all values.")

        .def("items", &itemsList,
             "Return list of (key, value) tuples.")

        .def("__eq__",
             [](const PyHashMap& self, py::object other) -> bool {
                 if (!py::isinstance<PyHashMap>(other)) {
                     return false;
                 }
                 return self.equals(other.cast<const PyHashMap&>(), ptrie::pyutils::objectsEqual);
             },
             py::arg("other"),
             "Check equality with another map.")

        .def("__ne__",
             [](const PyHashMap& self, py::object other) -> bool {
                 if (!py::isinstance<PyHashMap>(other)) {
                     return true;
                 }
                 return !self.equals(other.cast<const PyHashMap&>(), ptrie::pyutils::objectsEqual);
             },
             py::arg("other"),
             "Check inequality with another map.")

        .def("__or__", &PyHashMap::merge,
             py::arg("other"),
             "Merge with another map using | operator.")

        .def("__repr__", &mapRepr,
             "String representation of the map.")

        // Factory methods
        .def_static("from_dict", &mapFromDict,
                    py::arg("dict"),
                    "Create PersistentHashMap from dictionary.")

        .def_static("from_list", &mapFromItems,
                    py::arg("items"),
                    "Create PersistentHashMap from (key, value) pairs. Later pairs win.")

        // Pickle support
        .def(py::pickle(
            [](const PyHashMap& p) { // __getstate__
                return itemsList(p);
            },
            [](py::list items) { // __setstate__
                return mapFromItems(items);
            }
        ));

    py::class_<PyVector>(m, "PersistentVector")
        .def(py::init<>(),
             "Create an empty PersistentVector")

        // Core methods
        .def("conj", &PyVector::conj,
             py::arg("val"),
             "Append value to end of vector, returning new vector.\n\n"
             "Complexity: O(1) amortized")

        .def("append", &PyVector::append,
             py::arg("val"),
             "Alias for conj().")

        .def("assoc",
             [](const PyVector& self, Py_ssize_t idx, py::object val) {
                 return self.assoc(normalizeIndex(self, idx), val);
             },
             py::arg("idx"), py::arg("val"),
             "Update value at index, returning new vector.\n\n"
             "Complexity: O(log32 n)\n"
             "Raises:\n"
             "    IndexError: If index is out of range")

        .def("set",
             [](const PyVector& self, Py_ssize_t idx, py::object val) {
                 return self.assoc(normalizeIndex(self, idx), val);
             },
             py::arg("idx"), py::arg("val"),
             "Alias for assoc().")

        .def("nth",
             [](const PyVector& self, Py_ssize_t idx) -> py::object {
                 if (idx < 0) {
                     throw py::index_error("PersistentVector index out of range");
                 }
                 return self.nth(static_cast<size_t>(idx));
             },
             py::arg("idx"),
             "Get value at index.\n\n"
             "Raises:\n"
             "    IndexError: If index is out of range")

        .def("get",
             [](const PyVector& self, Py_ssize_t idx, py::object default_val) -> py::object {
                 if (idx < 0) {
                     return default_val;
                 }
                 std::optional<py::object> found = self.get(static_cast<size_t>(idx));
                 return found ? *found : default_val;
             },
             py::arg("idx"), py::arg("default") = py::none(),
             "Get value at index, or default if out of range.")

        .def("pop", &PyVector::pop,
             "Remove last element, returning new vector.\n\n"
             "Raises:\n"
             "    IndexError: If vector is empty")

        // Python protocols
        .def("__getitem__",
             [](const PyVector& self, Py_ssize_t idx) -> py::object {
                 return self.nth(normalizeIndex(self, idx));
             },
             py::arg("idx"),
             "Get item using bracket notation. Negative indices count from the end.")

        .def("__len__", &PyVector::size,
             "Return number of elements in the vector.")

        .def("__iter__",
             [](const PyVector& self) { return py::iter(vectorList(self)); },
             "Iterate over elements in the vector.")

        .def("list", &vectorList,
             "Convert to Python list.")

        .def("__eq__",
             [](const PyVector& self, py::object other) -> bool {
                 if (!py::isinstance<PyVector>(other)) {
                     return false;
                 }
                 return self.equals(other.cast<const PyVector&>(), ptrie::pyutils::objectsEqual);
             },
             py::arg("other"),
             "Check equality with another vector.")

        .def("__ne__",
             [](const PyVector& self, py::object other) -> bool {
                 if (!py::isinstance<PyVector>(other)) {
                     return true;
                 }
                 return !self.equals(other.cast<const PyVector&>(), ptrie::pyutils::objectsEqual);
             },
             py::arg("other"),
             "Check inequality with another vector.")

        .def("__repr__", &vectorRepr,
             "String representation of the vector.")

        // Factory methods
        .def_static("from_list", [](py::list l) { return vectorFromIterable(l); },
                    py::arg("list"),
                    "Create PersistentVector from Python list.")

        .def_static("from_iterable", &vectorFromIterable,
                    py::arg("iterable"),
                    "Create PersistentVector from any iterable.")

        .def_static("create",
                    [](py::args args) { return vectorFromIterable(args); },
                    "Create PersistentVector from arguments.\n\n"
                    "Example:\n"
                    "    v = PersistentVector.create(1, 2, 3)")

        // Pickle support
        .def(py::pickle(
            [](const PyVector& p) { // __getstate__
                return vectorList(p);
            },
            [](py::list items) { // __setstate__
                return vectorFromIterable(items);
            }
        ));
}

} // namespace ptrie
