#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "bit_index.hpp"
#include "node_ref.hpp"

namespace ptrie {

// Trie node: a Body holds child nodes, a Leaf holds 32 elements
template <typename T>
class VectorNode : public RefCounted {
public:
    using Ref = NodeRef<const VectorNode>;
    using Children = std::vector<Ref>;
    using Elements = std::vector<T>;

    explicit VectorNode(Children children) : slots_(std::move(children)) {}
    explicit VectorNode(Elements elements) : slots_(std::move(elements)) {}

    bool isLeaf() const { return slots_.index() == 1; }

    const Children& children() const { return std::get<0>(slots_); }
    const Elements& elements() const { return std::get<1>(slots_); }

    size_t arraySize() const {
        return isLeaf() ? elements().size() : children().size();
    }

private:
    std::variant<Children, Elements> slots_;
};

/**
 * PersistentVector - persistent random-access sequence
 *
 * A 32-way bit-partitioned trie plus a tail buffer of up to 32 elements.
 * Appends go to the tail and only touch the trie once every 32 elements;
 * updates copy the path from the root to the affected leaf.
 *
 * shift_ is 5 x trie height. Height 0 means the root is absent or a Leaf.
 */
template <typename T>
class PersistentVector {
public:
    using Visitor = std::function<void(const T&)>;

private:
    using Node = VectorNode<T>;
    using Ref = typename Node::Ref;
    using Children = typename Node::Children;
    using Elements = typename Node::Elements;

    Ref root_;
    std::shared_ptr<const Elements> tail_;
    size_t count_;
    uint32_t shift_;

    PersistentVector(Ref root, std::shared_ptr<const Elements> tail, size_t count, uint32_t shift)
        : root_(std::move(root)), tail_(std::move(tail)), count_(count), shift_(shift) {}

    static Ref makeBody(Children children) {
        return makeNode<const Node>(std::move(children));
    }

    static Ref makeLeaf(Elements elements) {
        return makeNode<const Node>(std::move(elements));
    }

    const Node* leafFor(size_t idx) const;
    Ref pushTail(const Ref& node, uint32_t level, const Ref& tailNode) const;
    static Ref newPath(uint32_t level, const Ref& node);
    Ref assocInTree(const Ref& node, uint32_t level, size_t idx, const T& val) const;
    Ref popTail(const Ref& node, uint32_t level) const;
    static void visitNode(const Node& node, const Visitor& visitor);

    void checkIndex(size_t idx) const {
        if (idx >= count_) {
            throw std::out_of_range("Index " + std::to_string(idx) +
                                    " out of range for vector of size " + std::to_string(count_));
        }
    }

public:
    PersistentVector()
        : tail_(std::make_shared<Elements>()), count_(0), shift_(0) {}

    // Core operations (functional style)
    PersistentVector conj(const T& val) const;
    PersistentVector assoc(size_t idx, const T& val) const;
    PersistentVector pop() const;

    const T& nth(size_t idx) const;

    // Aliases
    PersistentVector append(const T& val) const { return conj(val); }
    PersistentVector set(size_t idx, const T& val) const { return assoc(idx, val); }
    const T& operator[](size_t idx) const { return nth(idx); }

    // Checked read without exceptions
    std::optional<T> get(size_t idx) const {
        if (idx >= count_) {
            return std::nullopt;
        }
        return nth(idx);
    }

    // Size
    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    // First index held by the tail buffer
    size_t tailOffset() const {
        return count_ < BRANCH ? 0 : ((count_ - 1) & ~static_cast<size_t>(MASK));
    }

    uint32_t shift() const { return shift_; }

    // Iteration, in index order
    void forEach(const Visitor& visitor) const;
    std::vector<T> elems() const;

    template <typename ValueEqual>
    bool equals(const PersistentVector& other, ValueEqual valueEq) const;

    bool operator==(const PersistentVector& other) const { return equals(other, std::equal_to<T>()); }
    bool operator!=(const PersistentVector& other) const { return !(*this == other); }

    // Factory methods
    template <typename InputIt>
    static PersistentVector fromRange(InputIt first, InputIt last) {
        PersistentVector result;
        for (; first != last; ++first) {
            result = result.conj(*first);
        }
        return result;
    }

    static PersistentVector fromList(const std::vector<T>& list) {
        return fromRange(list.begin(), list.end());
    }
};

//=============================================================================
// PersistentVector Implementation
//=============================================================================

template <typename T>
PersistentVector<T> PersistentVector<T>::conj(const T& val) const {
    // Fast path: append to tail if there's room
    if (tail_->size() < BRANCH) {
        auto newTail = std::make_shared<Elements>(*tail_);
        newTail->push_back(val);
        return PersistentVector(root_, std::move(newTail), count_ + 1, shift_);
    }

    // Tail is full, need to push it to tree
    Ref tailNode = makeLeaf(*tail_);
    auto newTail = std::make_shared<Elements>();
    newTail->push_back(val);

    if (!root_) {
        // First full tail becomes the root leaf
        return PersistentVector(std::move(tailNode), std::move(newTail), count_ + 1, 0);
    }

    // Check if we need to expand the tree height
    size_t inTrie = count_ - BRANCH;
    if (inTrie == (static_cast<size_t>(1) << (shift_ + BITS))) {
        Children children;
        children.reserve(2);
        children.push_back(root_);
        children.push_back(newPath(shift_, tailNode));
        return PersistentVector(makeBody(std::move(children)), std::move(newTail),
                                count_ + 1, shift_ + BITS);
    }

    // Push tail into existing tree
    Ref newRoot = pushTail(root_, shift_, tailNode);
    return PersistentVector(std::move(newRoot), std::move(newTail), count_ + 1, shift_);
}

template <typename T>
typename PersistentVector<T>::Ref
PersistentVector<T>::pushTail(const Ref& node, uint32_t level, const Ref& tailNode) const {
    size_t subidx = ((count_ - 1) >> level) & MASK;
    Children children = node->children();

    if (level == BITS) {
        // Parent of leaves: the tail becomes the next leaf
        children.push_back(tailNode);
    } else if (subidx < children.size()) {
        // Recurse into existing child
        children[subidx] = pushTail(children[subidx], level - BITS, tailNode);
    } else {
        // Add new child
        children.push_back(newPath(level - BITS, tailNode));
    }
    return makeBody(std::move(children));
}

template <typename T>
typename PersistentVector<T>::Ref
PersistentVector<T>::newPath(uint32_t level, const Ref& node) {
    if (level == 0) {
        return node;
    }
    Children children;
    children.push_back(newPath(level - BITS, node));
    return makeBody(std::move(children));
}

template <typename T>
const typename PersistentVector<T>::Node* PersistentVector<T>::leafFor(size_t idx) const {
    const Node* node = root_.get();
    uint32_t level = shift_;

    // Descend through internal nodes until we reach a leaf
    while (level > 0) {
        node = node->children()[(idx >> level) & MASK].get();
        level -= BITS;
    }
    return node;
}

template <typename T>
const T& PersistentVector<T>::nth(size_t idx) const {
    checkIndex(idx);

    // Check if in tail
    size_t offset = tailOffset();
    if (idx >= offset) {
        return (*tail_)[idx - offset];
    }
    return leafFor(idx)->elements()[idx & MASK];
}

template <typename T>
PersistentVector<T> PersistentVector<T>::assoc(size_t idx, const T& val) const {
    checkIndex(idx);

    size_t offset = tailOffset();
    if (idx >= offset) {
        auto newTail = std::make_shared<Elements>(*tail_);
        (*newTail)[idx - offset] = val;
        return PersistentVector(root_, std::move(newTail), count_, shift_);
    }

    // In tree - path copying
    Ref newRoot = assocInTree(root_, shift_, idx, val);
    return PersistentVector(std::move(newRoot), tail_, count_, shift_);
}

template <typename T>
typename PersistentVector<T>::Ref
PersistentVector<T>::assocInTree(const Ref& node, uint32_t level, size_t idx, const T& val) const {
    if (level == 0) {
        Elements elements = node->elements();
        elements[idx & MASK] = val;
        return makeLeaf(std::move(elements));
    }

    size_t subidx = (idx >> level) & MASK;
    Children children = node->children();
    children[subidx] = assocInTree(children[subidx], level - BITS, idx, val);
    return makeBody(std::move(children));
}

template <typename T>
PersistentVector<T> PersistentVector<T>::pop() const {
    if (count_ == 0) {
        throw std::out_of_range("Can't pop empty vector");
    }

    if (count_ == 1) {
        return PersistentVector();
    }

    // If tail has more than one element, just remove the last
    if (tail_->size() > 1) {
        auto newTail = std::make_shared<Elements>(tail_->begin(), tail_->end() - 1);
        return PersistentVector(root_, std::move(newTail), count_ - 1, shift_);
    }

    // The rightmost leaf of the trie becomes the tail
    auto newTail = std::make_shared<Elements>(leafFor(count_ - 2)->elements());

    if (shift_ == 0) {
        return PersistentVector(Ref(), std::move(newTail), count_ - 1, 0);
    }

    Ref newRoot = popTail(root_, shift_);
    uint32_t newShift = shift_;
    if (newRoot && newRoot->children().size() == 1) {
        // Root has a single child: drop one level
        Ref child = newRoot->children()[0];
        newRoot = std::move(child);
        newShift -= BITS;
    }
    return PersistentVector(std::move(newRoot), std::move(newTail), count_ - 1, newShift);
}

template <typename T>
typename PersistentVector<T>::Ref
PersistentVector<T>::popTail(const Ref& node, uint32_t level) const {
    size_t subidx = ((count_ - 2) >> level) & MASK;
    Children children = node->children();

    if (level > BITS) {
        Ref newChild = popTail(children[subidx], level - BITS);
        if (!newChild && subidx == 0) {
            return {};
        }
        if (newChild) {
            children[subidx] = std::move(newChild);
        } else {
            children.pop_back();
        }
        return makeBody(std::move(children));
    }

    if (subidx == 0) {
        return {};
    }
    children.pop_back();
    return makeBody(std::move(children));
}

template <typename T>
void PersistentVector<T>::visitNode(const Node& node, const Visitor& visitor) {
    if (node.isLeaf()) {
        for (const auto& elem : node.elements()) {
            visitor(elem);
        }
        return;
    }
    for (const auto& child : node.children()) {
        visitNode(*child, visitor);
    }
}

template <typename T>
void PersistentVector<T>::forEach(const Visitor& visitor) const {
    if (root_) {
        visitNode(*root_, visitor);
    }
    for (const auto& elem : *tail_) {
        visitor(elem);
    }
}

template <typename T>
std::vector<T> PersistentVector<T>::elems() const {
    std::vector<T> result;
    result.reserve(count_);
    forEach([&result](const T& elem) { result.push_back(elem); });
    return result;
}

template <typename T>
template <typename ValueEqual>
bool PersistentVector<T>::equals(const PersistentVector& other, ValueEqual valueEq) const {
    if (this == &other) return true;
    if (count_ != other.count_) return false;
    if (root_ == other.root_ && tail_ == other.tail_) return true;

    for (size_t i = 0; i < count_; ++i) {
        if (!valueEq(nth(i), other.nth(i))) return false;
    }
    return true;
}

} // namespace ptrie
