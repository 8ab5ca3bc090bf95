#include <cstdint>
#include <string>
#include <pybind11/embed.h>
#include "bindings.hpp"

#include <catch2/catch.hpp>

namespace py = pybind11;
using namespace ptrie;

PYBIND11_EMBEDDED_MODULE(pyptrie, m) {
    ptrie::defineModule(m);
}

namespace {

py::object mapClass() {
    return py::module_::import("pyptrie").attr("PersistentHashMap");
}

py::object vectorClass() {
    return py::module_::import("pyptrie").attr("PersistentVector");
}

// True when f raises a Python exception of the given type
template <typename F>
bool raises(PyObject* type, F f) {
    try {
        f();
    } catch (py::error_already_set& e) {
        return e.matches(type);
    }
    return false;
}

} // namespace

TEST_CASE("hashKey folds 64-bit hashes into 32 bits")
{
    // hash(n) == n for small non-negative ints
    REQUIRE(pyutils::hashKey(py::int_(7)) == 7u);
    REQUIRE(pyutils::hashKey(py::int_((1LL << 40) + 5)) == ((1u << 8) ^ 5u));
    // hash(-1) is -2 in Python
    REQUIRE(pyutils::hashKey(py::int_(-1)) == 1u);

    REQUIRE(raises(PyExc_TypeError, [] { pyutils::hashKey(py::list()); }));
}

TEST_CASE("keys whose folded hashes collide stay distinct")
{
    // 2**32 folds to 1, the same as the key 1
    py::int_ big((1LL << 32));
    REQUIRE(pyutils::hashKey(big) == pyutils::hashKey(py::int_(1)));

    py::object m = mapClass()().attr("insert")(1, "one").attr("insert")(big, "big");
    REQUIRE(m.attr("__len__")().cast<size_t>() == 2);
    REQUIRE(m.attr("lookup")(1).cast<std::string>() == "one");
    REQUIRE(m.attr("lookup")(big).cast<std::string>() == "big");

    py::object rest = m.attr("delete")(1);
    REQUIRE(rest.attr("lookup")(1).is_none());
    REQUIRE(rest.attr("lookup")(big).cast<std::string>() == "big");
}

TEST_CASE("map lookup, get and getitem")
{
    py::object m = mapClass()().attr("insert")("a", 1);

    REQUIRE(m.attr("lookup")("a").cast<int>() == 1);
    REQUIRE(m.attr("lookup")("b").is_none());
    REQUIRE(mapClass()().attr("lookup")(1).is_none());

    REQUIRE(m.attr("get")("b", 42).cast<int>() == 42);
    REQUIRE(m.attr("__contains__")("a").cast<bool>());
    REQUIRE(raises(PyExc_KeyError, [&m] { m.attr("__getitem__")("b"); }));
}

TEST_CASE("unhashable keys raise TypeError")
{
    py::object m = mapClass()();

    REQUIRE(raises(PyExc_TypeError, [&m] { m.attr("insert")(py::list(), 1); }));
    REQUIRE(raises(PyExc_TypeError, [&m] { m.attr("lookup")(py::dict()); }));
    REQUIRE(m.attr("__len__")().cast<size_t>() == 0);
}

TEST_CASE("alter from Python")
{
    py::object m = mapClass()().attr("insert")("a", 1).attr("insert")("b", 2);

    SECTION("returning None deletes the key")
    {
        py::object removed = m.attr("alter")(py::eval("lambda old: None"), "a");
        REQUIRE(removed.attr("__len__")().cast<size_t>() == 1);
        REQUIRE_FALSE(removed.attr("__contains__")("a").cast<bool>());
        REQUIRE(m.attr("__contains__")("a").cast<bool>());
    }

    SECTION("an absent key is passed None")
    {
        py::object added = m.attr("alter")(py::eval("lambda old: 'new' if old is None else old"), "c");
        REQUIRE(added.attr("lookup")("c").cast<std::string>() == "new");
    }

    SECTION("the current value is passed in")
    {
        py::object doubled = m.attr("alter")(py::eval("lambda old: old * 2"), "b");
        REQUIRE(doubled.attr("lookup")("b").cast<int>() == 4);
    }

    SECTION("errors raised by the callback propagate")
    {
        py::object fn = py::eval("lambda old: 1 // 0");
        REQUIRE(raises(PyExc_ZeroDivisionError, [&] { m.attr("alter")(fn, "a"); }));
        REQUIRE(m.attr("lookup")("a").cast<int>() == 1);
    }
}

TEST_CASE("map equality with other operands")
{
    py::object m = mapClass()().attr("insert")(1, 2);
    py::object same = mapClass()().attr("insert")(1, 2);

    REQUIRE(m.attr("__eq__")(same).cast<bool>());
    REQUIRE_FALSE(m.attr("__ne__")(same).cast<bool>());

    REQUIRE_FALSE(m.attr("__eq__")(py::int_(3)).cast<bool>());
    REQUIRE(m.attr("__ne__")(py::int_(3)).cast<bool>());
    REQUIRE_FALSE(m.attr("__eq__")(py::dict()).cast<bool>());
    REQUIRE_FALSE(m.attr("__eq__")(vectorClass()()).cast<bool>());
}

TEST_CASE("vector indexing from Python")
{
    py::object v = vectorClass().attr("create")(1, 2, 3);

    REQUIRE(v.attr("__getitem__")(-1).cast<int>() == 3);
    REQUIRE(v.attr("__getitem__")(-3).cast<int>() == 1);
    REQUIRE(raises(PyExc_IndexError, [&v] { v.attr("__getitem__")(3); }));
    REQUIRE(raises(PyExc_IndexError, [&v] { v.attr("__getitem__")(-4); }));

    py::object updated = v.attr("set")(-3, 10);
    REQUIRE(updated.attr("__getitem__")(0).cast<int>() == 10);
    REQUIRE(v.attr("__getitem__")(0).cast<int>() == 1);
    REQUIRE(raises(PyExc_IndexError, [&v] { v.attr("set")(5, 0); }));

    REQUIRE(v.attr("nth")(2).cast<int>() == 3);
    REQUIRE(raises(PyExc_IndexError, [&v] { v.attr("nth")(-1); }));
    REQUIRE(raises(PyExc_IndexError, [&v] { v.attr("nth")(3); }));

    REQUIRE(v.attr("get")(7, "none").cast<std::string>() == "none");
    REQUIRE(raises(PyExc_IndexError, [] { vectorClass()().attr("pop")(); }));
}

TEST_CASE("pickle round trip")
{
    py::module_ pickle = py::module_::import("pickle");

    py::object m = mapClass()().attr("insert")("x", 1).attr("insert")(2, py::make_tuple(3, 4));
    py::object restoredMap = pickle.attr("loads")(pickle.attr("dumps")(m));
    REQUIRE(restoredMap.attr("__eq__")(m).cast<bool>());
    REQUIRE(restoredMap.attr("__len__")().cast<size_t>() == 2);

    py::object v = vectorClass();
    py::list items;
    for (int i = 0; i < 100; ++i) {
        items.append(i);
    }
    v = v.attr("from_list")(items);
    py::object restoredVec = pickle.attr("loads")(pickle.attr("dumps")(v));
    REQUIRE(restoredVec.attr("__eq__")(v).cast<bool>());
    REQUIRE(restoredVec.attr("__getitem__")(-1).cast<int>() == 99);
}
