#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include "persistent_vector.hpp"

#include <catch2/catch.hpp>

using namespace ptrie;

namespace {

using IntVector = PersistentVector<int>;

IntVector iota(int n) {
    IntVector v;
    for (int i = 0; i < n; ++i) {
        v = v.conj(i);
    }
    return v;
}

struct Counted {
    static int live;
    int value;

    explicit Counted(int v) : value(v) { ++live; }
    Counted(const Counted& other) : value(other.value) { ++live; }
    Counted& operator=(const Counted& other) = default;
    ~Counted() { --live; }
};

int Counted::live = 0;

} // namespace

TEST_CASE("empty vector")
{
    IntVector v;

    REQUIRE(v.empty());
    REQUIRE(v.size() == 0);
    REQUIRE(v.shift() == 0);
    REQUIRE(v.elems().empty());
    REQUIRE_THROWS_AS(v.nth(0), std::out_of_range);
    REQUIRE_THROWS_AS(v.assoc(0, 1), std::out_of_range);
    REQUIRE_THROWS_AS(v.pop(), std::out_of_range);
    REQUIRE_FALSE(v.get(0));
}

TEST_CASE("index law for every length up to 1025")
{
    IntVector v;
    for (int n = 0; n <= 1025; ++n) {
        REQUIRE(v.size() == static_cast<size_t>(n));
        for (int i = 0; i < n; ++i) {
            REQUIRE(v.nth(i) == i);
        }
        REQUIRE_THROWS_AS(v.nth(n), std::out_of_range);
        REQUIRE_FALSE(v.get(n));
        v = v.append(n);
    }
}

TEST_CASE("tail and leaf boundary")
{
    IntVector v33 = iota(33);
    REQUIRE(v33.tailOffset() == 32);
    // Index 31 sits in the root leaf, index 32 in the tail
    REQUIRE(v33.shift() == 0);
    REQUIRE(v33.nth(31) == 31);
    REQUIRE(v33.nth(32) == 32);

    IntVector v32 = iota(32);
    REQUIRE(v32.tailOffset() == 0);
    REQUIRE(v32.nth(31) == 31);

    IntVector v65 = iota(65);
    REQUIRE(v65.shift() == 5);
    REQUIRE(v65.tailOffset() == 64);

    IntVector v1057 = iota(32 * 32 + 33);
    REQUIRE(v1057.shift() >= 10);
    REQUIRE(v1057.tailOffset() == 1056);
    for (int i = 0; i < 1057; ++i) {
        REQUIRE(v1057.nth(i) == i);
    }
    REQUIRE_THROWS_AS(v1057.nth(1057), std::out_of_range);
}

TEST_CASE("deep trie")
{
    const int n = 40000;
    IntVector v = iota(n);

    REQUIRE(v.size() == static_cast<size_t>(n));
    REQUIRE(v.shift() == 15);
    for (int i = 0; i < n; i += 7) {
        REQUIRE(v[i] == i);
    }
    REQUIRE(v[n - 1] == n - 1);

    std::vector<int> all = v.elems();
    REQUIRE(all.size() == static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        REQUIRE(all[i] == i);
    }
}

TEST_CASE("set law")
{
    IntVector v = iota(1100);

    for (size_t i : {0u, 31u, 32u, 500u, 1023u, 1024u, 1087u, 1088u, 1099u}) {
        IntVector updated = v.set(i, -1);
        REQUIRE(updated.size() == v.size());
        for (size_t j = 0; j < v.size(); ++j) {
            if (j == i) {
                REQUIRE(updated.nth(j) == -1);
            } else {
                REQUIRE(updated.nth(j) == v.nth(j));
            }
        }
        // The source vector keeps its value
        REQUIRE(v.nth(i) == static_cast<int>(i));
    }

    REQUIRE_THROWS_AS(v.set(1100, 0), std::out_of_range);
}

TEST_CASE("repeating an identical set gives an equal vector")
{
    IntVector v = iota(100);

    REQUIRE(v.set(10, 10) == v);
    REQUIRE(v.set(99, 99) == v);
    REQUIRE(v.set(10, 11) != v);
    REQUIRE(v.set(10, 11).set(10, 11) == v.set(10, 11));
}

TEST_CASE("appending to an old version leaves newer versions alone")
{
    IntVector base = iota(64);
    IntVector a = base.conj(1);
    IntVector b = base.conj(2);

    REQUIRE(a.nth(64) == 1);
    REQUIRE(b.nth(64) == 2);
    REQUIRE(base.size() == 64);
    REQUIRE(a.size() == 65);
}

TEST_CASE("pop")
{
    const int n = 32 * 32 + 33;
    IntVector v = iota(n);
    std::vector<IntVector> versions;

    for (int size = n; size > 0; --size) {
        versions.push_back(v);
        v = v.pop();
        REQUIRE(v.size() == static_cast<size_t>(size - 1));
        if (size % 97 == 0 || size <= 70 || (size >= 1020 && size <= 1060)) {
            for (int i = 0; i < size - 1; ++i) {
                REQUIRE(v.nth(i) == i);
            }
        }
        if (size - 1 > 0) {
            REQUIRE(v.nth(size - 2) == size - 2);
        }
        REQUIRE_THROWS_AS(v.nth(size - 1), std::out_of_range);
    }

    REQUIRE(v.empty());
    REQUIRE(v.shift() == 0);
    REQUIRE_THROWS_AS(v.pop(), std::out_of_range);

    // Popping never touched the older versions
    for (size_t k = 0; k < versions.size(); k += 50) {
        const IntVector& old = versions[k];
        REQUIRE(old.size() == static_cast<size_t>(n) - k);
        REQUIRE(old.nth(old.size() - 1) == static_cast<int>(old.size()) - 1);
    }
}

TEST_CASE("pop then append grows the trie again")
{
    IntVector v = iota(65).pop().pop();
    REQUIRE(v.size() == 63);
    REQUIRE(v.shift() == 0);

    for (int i = 63; i < 2000; ++i) {
        v = v.conj(i);
    }
    for (int i = 0; i < 2000; ++i) {
        REQUIRE(v.nth(i) == i);
    }
}

TEST_CASE("fromList and elems")
{
    std::vector<std::string> words;
    for (int i = 0; i < 100; ++i) {
        words.push_back("w" + std::to_string(i));
    }

    PersistentVector<std::string> v = PersistentVector<std::string>::fromList(words);
    REQUIRE(v.size() == 100);
    REQUIRE(v.elems() == words);
    REQUIRE(v.nth(57) == "w57");

    std::vector<std::string> visited;
    v.forEach([&visited](const std::string& s) { visited.push_back(s); });
    REQUIRE(visited == words);

    REQUIRE(PersistentVector<std::string>::fromRange(words.begin(), words.begin() + 3).size() == 3);
}

TEST_CASE("vector nodes are reclaimed when the last version goes away")
{
    REQUIRE(Counted::live == 0);
    {
        PersistentVector<Counted> v;
        std::vector<PersistentVector<Counted>> versions;
        for (int i = 0; i < 3000; ++i) {
            v = v.conj(Counted(i));
            if (i % 100 == 0) versions.push_back(v);
        }
        v = v.assoc(5, Counted(-5)).pop().pop();
        REQUIRE(v.nth(5).value == -5);
        REQUIRE(versions[3].nth(5).value == 5);
    }
    REQUIRE(Counted::live == 0);
}
