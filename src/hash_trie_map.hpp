#pragma once

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include "bit_index.hpp"
#include "node_ref.hpp"

namespace ptrie {

// A Bitmap node that grows past this many children becomes a Full node
constexpr uint32_t FULL_PROMOTE_THRESHOLD = 16;
// A Full node that drops below this many children is repacked into a Bitmap node
constexpr uint32_t FULL_DEMOTE_THRESHOLD = 8;

enum class MapNodeKind : uint8_t {
    Empty,
    Leaf,
    Collision,
    Bitmap,
    Full
};

namespace detail {

// Abstract base class for all HAMT node types. Empty is a null NodeRef.
template <typename K, typename V, typename KeyEqual>
class MapNode : public RefCounted {
public:
    using Ref = NodeRef<const MapNode>;
    using UpdateFn = std::function<std::optional<V>(const std::optional<V>&)>;
    using Visitor = std::function<void(const K&, const V&)>;

    explicit MapNode(MapNodeKind kind) : kind_(kind) {}

    MapNodeKind kind() const { return kind_; }

    virtual const V* find(uint32_t shift, uint32_t hash,
                          const K& key, const KeyEqual& eq) const = 0;

    // Returns the replacement for this node (null for Empty, or the node
    // itself when nothing changed). `delta` receives the change in entry count.
    virtual Ref alter(uint32_t shift, uint32_t hash, const K& key,
                      const UpdateFn& fn, const KeyEqual& eq, int& delta) const = 0;

    virtual void iterate(const Visitor& visitor) const = 0;

private:
    MapNodeKind kind_;
};

// LeafNode: exactly one entry
template <typename K, typename V, typename KeyEqual>
class LeafNode : public MapNode<K, V, KeyEqual> {
    using Base = MapNode<K, V, KeyEqual>;

    uint32_t hash_;
    K key_;
    V value_;

public:
    using Ref = typename Base::Ref;
    using UpdateFn = typename Base::UpdateFn;
    using Visitor = typename Base::Visitor;

    LeafNode(uint32_t hash, const K& key, V value)
        : Base(MapNodeKind::Leaf), hash_(hash), key_(key), value_(std::move(value)) {}

    const V* find(uint32_t shift, uint32_t hash,
                  const K& key, const KeyEqual& eq) const override;

    Ref alter(uint32_t shift, uint32_t hash, const K& key,
              const UpdateFn& fn, const KeyEqual& eq, int& delta) const override;

    void iterate(const Visitor& visitor) const override {
        visitor(key_, value_);
    }

    uint32_t getHash() const { return hash_; }
    const K& getKey() const { return key_; }
    const V& getValue() const { return value_; }
};

// CollisionNode: two or more entries whose full hashes are identical
template <typename K, typename V, typename KeyEqual>
class CollisionNode : public MapNode<K, V, KeyEqual> {
    using Base = MapNode<K, V, KeyEqual>;

public:
    using Ref = typename Base::Ref;
    using UpdateFn = typename Base::UpdateFn;
    using Visitor = typename Base::Visitor;
    using EntryList = std::vector<std::pair<K, V>>;

    CollisionNode(uint32_t hash, EntryList entries)
        : Base(MapNodeKind::Collision), hash_(hash), entries_(std::move(entries)) {
        assert(entries_.size() >= 2);
    }

    const V* find(uint32_t shift, uint32_t hash,
                  const K& key, const KeyEqual& eq) const override;

    Ref alter(uint32_t shift, uint32_t hash, const K& key,
              const UpdateFn& fn, const KeyEqual& eq, int& delta) const override;

    void iterate(const Visitor& visitor) const override {
        for (const auto& entry : entries_) {
            visitor(entry.first, entry.second);
        }
    }

    uint32_t getHash() const { return hash_; }
    const EntryList& getEntries() const { return entries_; }

private:
    uint32_t hash_;
    EntryList entries_;
};

// BitmapNode: sparse node, one child per set bit of the mask
template <typename K, typename V, typename KeyEqual>
class BitmapNode : public MapNode<K, V, KeyEqual> {
    using Base = MapNode<K, V, KeyEqual>;

public:
    using Ref = typename Base::Ref;
    using UpdateFn = typename Base::UpdateFn;
    using Visitor = typename Base::Visitor;

    BitmapNode(uint32_t bitmap, std::vector<Ref> children)
        : Base(MapNodeKind::Bitmap), bitmap_(bitmap), children_(std::move(children)) {
        assert(children_.size() == popcount(bitmap_));
    }

    const V* find(uint32_t shift, uint32_t hash,
                  const K& key, const KeyEqual& eq) const override;

    Ref alter(uint32_t shift, uint32_t hash, const K& key,
              const UpdateFn& fn, const KeyEqual& eq, int& delta) const override;

    void iterate(const Visitor& visitor) const override {
        for (const auto& child : children_) {
            child->iterate(visitor);
        }
    }

    uint32_t getBitmap() const { return bitmap_; }
    const std::vector<Ref>& getChildren() const { return children_; }

private:
    uint32_t bitmap_;
    std::vector<Ref> children_;
};

// FullNode: dense node with one slot per fragment value
template <typename K, typename V, typename KeyEqual>
class FullNode : public MapNode<K, V, KeyEqual> {
    using Base = MapNode<K, V, KeyEqual>;

public:
    using Ref = typename Base::Ref;
    using UpdateFn = typename Base::UpdateFn;
    using Visitor = typename Base::Visitor;
    using SlotArray = std::array<Ref, BRANCH>;

    FullNode(uint32_t occupied, SlotArray children)
        : Base(MapNodeKind::Full), occupied_(occupied), children_(std::move(children)) {
        assert(occupied_ >= FULL_DEMOTE_THRESHOLD && occupied_ <= BRANCH);
    }

    const V* find(uint32_t shift, uint32_t hash,
                  const K& key, const KeyEqual& eq) const override;

    Ref alter(uint32_t shift, uint32_t hash, const K& key,
              const UpdateFn& fn, const KeyEqual& eq, int& delta) const override;

    void iterate(const Visitor& visitor) const override {
        for (const auto& child : children_) {
            if (child) child->iterate(visitor);
        }
    }

    uint32_t getOccupied() const { return occupied_; }
    const SlotArray& getChildren() const { return children_; }

private:
    // Bitmap node holding every live child except the one at `removedSlot`
    Ref pack(uint32_t removedSlot) const;

    uint32_t occupied_;
    SlotArray children_;
};

//=============================================================================
// Shared helpers
//=============================================================================

// Alter applied to an Empty node: materializes a Leaf if fn produces a value
template <typename K, typename V, typename KeyEqual>
typename MapNode<K, V, KeyEqual>::Ref
alterEmpty(uint32_t hash, const K& key,
           const typename MapNode<K, V, KeyEqual>::UpdateFn& fn, int& delta) {
    std::optional<V> created = fn(std::nullopt);
    if (!created) {
        return {};
    }
    ++delta;
    return makeNode<const LeafNode<K, V, KeyEqual>>(hash, key, std::move(*created));
}

// Merge two Leaf/Collision nodes that must live under one parent at `shift`
template <typename K, typename V, typename KeyEqual>
typename MapNode<K, V, KeyEqual>::Ref
combine(uint32_t shift,
        const typename MapNode<K, V, KeyEqual>::Ref& node1, uint32_t hash1,
        const typename MapNode<K, V, KeyEqual>::Ref& node2, uint32_t hash2) {
    using Ref = typename MapNode<K, V, KeyEqual>::Ref;

    if (shift >= HASH_WIDTH) {
        // Every fragment matched: the two hashes are identical
        typename CollisionNode<K, V, KeyEqual>::EntryList entries;
        auto collect = [&entries](const K& k, const V& v) { entries.emplace_back(k, v); };
        node1->iterate(collect);
        node2->iterate(collect);
        return makeNode<const CollisionNode<K, V, KeyEqual>>(hash1, std::move(entries));
    }

    uint32_t idx1 = fragment(hash1, shift);
    uint32_t idx2 = fragment(hash2, shift);

    std::vector<Ref> children;
    if (idx1 == idx2) {
        // Same index at this level, recurse deeper
        children.push_back(combine<K, V, KeyEqual>(shift + BITS, node1, hash1, node2, hash2));
        return makeNode<const BitmapNode<K, V, KeyEqual>>(bit(idx1), std::move(children));
    }

    children.reserve(2);
    if (idx1 < idx2) {
        children.push_back(node1);
        children.push_back(node2);
    } else {
        children.push_back(node2);
        children.push_back(node1);
    }
    return makeNode<const BitmapNode<K, V, KeyEqual>>(bit(idx1) | bit(idx2), std::move(children));
}

//=============================================================================
// LeafNode Implementation
//=============================================================================

template <typename K, typename V, typename KeyEqual>
const V* LeafNode<K, V, KeyEqual>::find(uint32_t, uint32_t,
                                        const K& key, const KeyEqual& eq) const {
    return eq(key_, key) ? &value_ : nullptr;
}

template <typename K, typename V, typename KeyEqual>
typename LeafNode<K, V, KeyEqual>::Ref
LeafNode<K, V, KeyEqual>::alter(uint32_t shift, uint32_t hash, const K& key,
                                const UpdateFn& fn, const KeyEqual& eq, int& delta) const {
    if (eq(key_, key)) {
        std::optional<V> updated = fn(std::optional<V>(value_));
        if (!updated) {
            --delta;
            return {};
        }
        return makeNode<const LeafNode>(hash_, key_, std::move(*updated));
    }

    // Different key: materialize the new entry, then push both one level down
    Ref created = alterEmpty<K, V, KeyEqual>(hash, key, fn, delta);
    if (!created) {
        return Ref(this);
    }
    return combine<K, V, KeyEqual>(shift, Ref(this), hash_, created, hash);
}

//=============================================================================
// CollisionNode Implementation
//=============================================================================

template <typename K, typename V, typename KeyEqual>
const V* CollisionNode<K, V, KeyEqual>::find(uint32_t, uint32_t,
                                             const K& key, const KeyEqual& eq) const {
    for (const auto& entry : entries_) {
        if (eq(entry.first, key)) {
            return &entry.second;
        }
    }
    return nullptr;
}

template <typename K, typename V, typename KeyEqual>
typename CollisionNode<K, V, KeyEqual>::Ref
CollisionNode<K, V, KeyEqual>::alter(uint32_t shift, uint32_t hash, const K& key,
                                     const UpdateFn& fn, const KeyEqual& eq, int& delta) const {
    if (hash != hash_) {
        Ref created = alterEmpty<K, V, KeyEqual>(hash, key, fn, delta);
        if (!created) {
            return Ref(this);
        }
        return combine<K, V, KeyEqual>(shift, Ref(this), hash_, created, hash);
    }

    for (size_t i = 0; i < entries_.size(); ++i) {
        if (!eq(entries_[i].first, key)) {
            continue;
        }

        std::optional<V> updated = fn(std::optional<V>(entries_[i].second));
        if (updated) {
            EntryList newEntries = entries_;
            newEntries[i].second = std::move(*updated);
            return makeNode<const CollisionNode>(hash_, std::move(newEntries));
        }

        --delta;
        if (entries_.size() == 2) {
            // One entry left, collapse to a leaf
            const auto& survivor = entries_[1 - i];
            return makeNode<const LeafNode<K, V, KeyEqual>>(hash_, survivor.first, survivor.second);
        }

        EntryList newEntries;
        newEntries.reserve(entries_.size() - 1);
        for (size_t j = 0; j < entries_.size(); ++j) {
            if (j != i) newEntries.push_back(entries_[j]);
        }
        return makeNode<const CollisionNode>(hash_, std::move(newEntries));
    }

    // Key not found, append
    std::optional<V> created = fn(std::nullopt);
    if (!created) {
        return Ref(this);
    }
    ++delta;
    EntryList newEntries = entries_;
    newEntries.emplace_back(key, std::move(*created));
    return makeNode<const CollisionNode>(hash_, std::move(newEntries));
}

//=============================================================================
// BitmapNode Implementation
//=============================================================================

template <typename K, typename V, typename KeyEqual>
const V* BitmapNode<K, V, KeyEqual>::find(uint32_t shift, uint32_t hash,
                                          const K& key, const KeyEqual& eq) const {
    uint32_t slot = fragment(hash, shift);

    // Check if this slot is occupied
    if ((bitmap_ & bit(slot)) == 0) {
        return nullptr;
    }
    return children_[rank(bitmap_, slot)]->find(shift + BITS, hash, key, eq);
}

template <typename K, typename V, typename KeyEqual>
typename BitmapNode<K, V, KeyEqual>::Ref
BitmapNode<K, V, KeyEqual>::alter(uint32_t shift, uint32_t hash, const K& key,
                                  const UpdateFn& fn, const KeyEqual& eq, int& delta) const {
    uint32_t slot = fragment(hash, shift);
    uint32_t bit_pos = bit(slot);
    uint32_t idx = rank(bitmap_, slot);
    bool exists = (bitmap_ & bit_pos) != 0;

    Ref child = exists ? children_[idx] : Ref();
    Ref newChild = exists ? child->alter(shift + BITS, hash, key, fn, eq, delta)
                          : alterEmpty<K, V, KeyEqual>(hash, key, fn, delta);

    if (newChild == child) {
        // Unchanged
        return Ref(this);
    }

    std::vector<Ref> newChildren;
    uint32_t newBitmap = bitmap_;
    bool added = false;

    if (!exists) {
        // Added: insert at the dense index
        newChildren.reserve(children_.size() + 1);
        newChildren.insert(newChildren.end(), children_.begin(), children_.begin() + idx);
        newChildren.push_back(newChild);
        newChildren.insert(newChildren.end(), children_.begin() + idx, children_.end());
        newBitmap |= bit_pos;
        added = true;
    } else if (!newChild) {
        // Removed
        newChildren.reserve(children_.size() - 1);
        for (size_t i = 0; i < children_.size(); ++i) {
            if (i != idx) newChildren.push_back(children_[i]);
        }
        newBitmap &= ~bit_pos;
    } else {
        // Modified
        newChildren = children_;
        newChildren[idx] = newChild;
    }

    if (newBitmap == 0) {
        return {};
    }

    if (newChildren.size() == 1 && newChildren[0]->kind() == MapNodeKind::Leaf) {
        // No singleton chains: the leaf moves up
        return newChildren[0];
    }

    if (added && newChildren.size() > FULL_PROMOTE_THRESHOLD) {
        typename FullNode<K, V, KeyEqual>::SlotArray slots;
        std::vector<uint32_t> liveSlots = setSlots(newBitmap);
        for (size_t i = 0; i < liveSlots.size(); ++i) {
            slots[liveSlots[i]] = std::move(newChildren[i]);
        }
        return makeNode<const FullNode<K, V, KeyEqual>>(
            static_cast<uint32_t>(liveSlots.size()), std::move(slots));
    }

    return makeNode<const BitmapNode>(newBitmap, std::move(newChildren));
}

//=============================================================================
// FullNode Implementation
//=============================================================================

template <typename K, typename V, typename KeyEqual>
const V* FullNode<K, V, KeyEqual>::find(uint32_t shift, uint32_t hash,
                                        const K& key, const KeyEqual& eq) const {
    const Ref& child = children_[fragment(hash, shift)];
    return child ? child->find(shift + BITS, hash, key, eq) : nullptr;
}

template <typename K, typename V, typename KeyEqual>
typename FullNode<K, V, KeyEqual>::Ref
FullNode<K, V, KeyEqual>::alter(uint32_t shift, uint32_t hash, const K& key,
                                const UpdateFn& fn, const KeyEqual& eq, int& delta) const {
    uint32_t slot = fragment(hash, shift);
    const Ref& child = children_[slot];
    Ref newChild = child ? child->alter(shift + BITS, hash, key, fn, eq, delta)
                         : alterEmpty<K, V, KeyEqual>(hash, key, fn, delta);

    if (newChild == child) {
        return Ref(this);
    }

    uint32_t occupied = occupied_;
    if (!child) {
        ++occupied;
    } else if (!newChild) {
        --occupied;
        if (occupied < FULL_DEMOTE_THRESHOLD) {
            return pack(slot);
        }
    }

    SlotArray newSlots = children_;
    newSlots[slot] = std::move(newChild);
    return makeNode<const FullNode>(occupied, std::move(newSlots));
}

template <typename K, typename V, typename KeyEqual>
typename FullNode<K, V, KeyEqual>::Ref
FullNode<K, V, KeyEqual>::pack(uint32_t removedSlot) const {
    uint32_t bitmap = 0;
    std::vector<Ref> children;
    children.reserve(occupied_ - 1);
    for (uint32_t slot = 0; slot < BRANCH; ++slot) {
        if (slot == removedSlot || !children_[slot]) {
            continue;
        }
        bitmap |= bit(slot);
        children.push_back(children_[slot]);
    }
    return makeNode<const BitmapNode<K, V, KeyEqual>>(bitmap, std::move(children));
}

} // namespace detail

/**
 * HashTrieMap - persistent hash map (HAMT)
 *
 * Every "modifying" operation returns a new map that shares all untouched
 * subtrees with this one; this map is never changed. Keys are routed by
 * 5-bit fragments of the 32-bit hash produced by the caller's hash function.
 *
 * Usage:
 *   HashTrieMap<std::string, int> m([](const std::string& s) { ... });
 *   auto m2 = m.insert("a", 1).insert("b", 2);
 *   m2.lookup("a");  // std::optional<int>(1)
 *   m.size();        // still 0
 */
template <typename K, typename V, typename KeyEqual = std::equal_to<K>>
class HashTrieMap {
public:
    using HashFn = std::function<uint32_t(const K&)>;
    using UpdateFn = std::function<std::optional<V>(const std::optional<V>&)>;
    using CombineFn = std::function<V(const V&, const V&)>;
    using Visitor = std::function<void(const K&, const V&)>;

private:
    using Node = detail::MapNode<K, V, KeyEqual>;
    using Ref = typename Node::Ref;

    std::shared_ptr<const HashFn> hashFn_;
    KeyEqual eq_;
    Ref root_;
    size_t count_;

    HashTrieMap(std::shared_ptr<const HashFn> hashFn, const KeyEqual& eq, Ref root, size_t count)
        : hashFn_(std::move(hashFn)), eq_(eq), root_(std::move(root)), count_(count) {}

    uint32_t hashOf(const K& key) const { return (*hashFn_)(key); }

public:
    explicit HashTrieMap(HashFn hashFn, const KeyEqual& eq = KeyEqual())
        : hashFn_(std::make_shared<const HashFn>(std::move(hashFn))), eq_(eq), count_(0) {}

    // Core operations (functional style)
    HashTrieMap alter(const UpdateFn& fn, const K& key) const;

    HashTrieMap insertWith(const CombineFn& combineFn, const K& key, const V& value) const {
        return alter([&](const std::optional<V>& old) -> std::optional<V> {
            if (!old) return value;
            return combineFn(value, *old);
        }, key);
    }

    HashTrieMap insert(const K& key, const V& value) const {
        return alter([&](const std::optional<V>&) -> std::optional<V> { return value; }, key);
    }

    // fn is applied to the present value only; returning none removes the key
    HashTrieMap update(const std::function<std::optional<V>(const V&)>& fn, const K& key) const {
        return alter([&](const std::optional<V>& old) -> std::optional<V> {
            if (!old) return std::nullopt;
            return fn(*old);
        }, key);
    }

    HashTrieMap adjust(const std::function<V(const V&)>& fn, const K& key) const {
        return alter([&](const std::optional<V>& old) -> std::optional<V> {
            if (!old) return std::nullopt;
            return fn(*old);
        }, key);
    }

    HashTrieMap erase(const K& key) const {
        return alter([](const std::optional<V>&) -> std::optional<V> { return std::nullopt; }, key);
    }

    // Entries of `other` win over entries of this map
    HashTrieMap merge(const HashTrieMap& other) const;

    const V* find(const K& key) const {
        if (!root_) return nullptr;
        return root_->find(0, hashOf(key), key, eq_);
    }

    std::optional<V> lookup(const K& key) const {
        const V* found = find(key);
        if (!found) return std::nullopt;
        return *found;
    }

    bool member(const K& key) const { return find(key) != nullptr; }

    // Size
    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    // Iteration (no ordering guarantee)
    void forEach(const Visitor& visitor) const {
        if (root_) root_->iterate(visitor);
    }

    std::vector<std::pair<K, V>> toList() const;
    std::vector<K> keys() const;
    std::vector<V> elems() const;

    MapNodeKind rootKind() const {
        return root_ ? root_->kind() : MapNodeKind::Empty;
    }

    // Equality: same key set, values compared with valueEq
    template <typename ValueEqual>
    bool equals(const HashTrieMap& other, ValueEqual valueEq) const;

    bool operator==(const HashTrieMap& other) const { return equals(other, std::equal_to<V>()); }
    bool operator!=(const HashTrieMap& other) const { return !(*this == other); }

    // Factory methods
    static HashTrieMap fromList(HashFn hashFn, const std::vector<std::pair<K, V>>& entries,
                                const KeyEqual& eq = KeyEqual()) {
        HashTrieMap result(std::move(hashFn), eq);
        for (const auto& entry : entries) {
            result = result.insert(entry.first, entry.second);
        }
        return result;
    }
};

//=============================================================================
// HashTrieMap Implementation
//=============================================================================

template <typename K, typename V, typename KeyEqual>
HashTrieMap<K, V, KeyEqual>
HashTrieMap<K, V, KeyEqual>::alter(const UpdateFn& fn, const K& key) const {
    uint32_t hash = hashOf(key);
    int delta = 0;

    Ref newRoot = root_ ? root_->alter(0, hash, key, fn, eq_, delta)
                        : detail::alterEmpty<K, V, KeyEqual>(hash, key, fn, delta);

    if (newRoot == root_) {
        // No change
        return *this;
    }
    size_t newCount = static_cast<size_t>(static_cast<std::ptrdiff_t>(count_) + delta);
    return HashTrieMap(hashFn_, eq_, std::move(newRoot), newCount);
}

template <typename K, typename V, typename KeyEqual>
HashTrieMap<K, V, KeyEqual>
HashTrieMap<K, V, KeyEqual>::merge(const HashTrieMap& other) const {
    if (other.root_ == nullptr) {
        return *this;
    }
    if (root_ == nullptr && other.hashFn_ == hashFn_) {
        return other;
    }

    HashTrieMap result = *this;
    other.forEach([&result](const K& k, const V& v) {
        result = result.insert(k, v);
    });
    return result;
}

template <typename K, typename V, typename KeyEqual>
std::vector<std::pair<K, V>> HashTrieMap<K, V, KeyEqual>::toList() const {
    std::vector<std::pair<K, V>> result;
    result.reserve(count_);
    forEach([&result](const K& k, const V& v) { result.emplace_back(k, v); });
    return result;
}

template <typename K, typename V, typename KeyEqual>
std::vector<K> HashTrieMap<K, V, KeyEqual>::keys() const {
    std::vector<K> result;
    result.reserve(count_);
    forEach([&result](const K& k, const V&) { result.push_back(k); });
    return result;
}

template <typename K, typename V, typename KeyEqual>
std::vector<V> HashTrieMap<K, V, KeyEqual>::elems() const {
    std::vector<V> result;
    result.reserve(count_);
    forEach([&result](const K&, const V& v) { result.push_back(v); });
    return result;
}

template <typename K, typename V, typename KeyEqual>
template <typename ValueEqual>
bool HashTrieMap<K, V, KeyEqual>::equals(const HashTrieMap& other, ValueEqual valueEq) const {
    if (count_ != other.count_) {
        return false;
    }

    if (root_ == other.root_) {
        return true;
    }

    // Check all entries match
    bool equal = true;
    forEach([&](const K& k, const V& v) {
        if (!equal) return;

        const V* otherVal = other.find(k);
        if (otherVal == nullptr || !valueEq(v, *otherVal)) {
            equal = false;
        }
    });
    return equal;
}

} // namespace ptrie
