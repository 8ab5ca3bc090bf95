#pragma once

#include <pybind11/pybind11.h>
#include <cstdint>
#include "hash_trie_map.hpp"
#include "persistent_vector.hpp"

namespace py = pybind11;

namespace ptrie {
namespace pyutils {

// Python's hash(), folded to the 32 bits the trie routes on
uint32_t hashKey(const py::object& key);

// Python's ==, with an identity fast path
bool objectsEqual(const py::object& a, const py::object& b);

struct KeyEqual {
    bool operator()(const py::object& a, const py::object& b) const {
        return objectsEqual(a, b);
    }
};

} // namespace pyutils

using PyHashMap = HashTrieMap<py::object, py::object, pyutils::KeyEqual>;
using PyVector = PersistentVector<py::object>;

// Empty map hashing with Python's hash()
PyHashMap emptyPyHashMap();

} // namespace ptrie
