#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace ptrie {

// Base class for all trie nodes with intrusive reference counting.
// Nodes are immutable once built, so the count is the only mutable state.
class RefCounted {
protected:
    mutable std::atomic<uint32_t> refcount_;

public:
    RefCounted() : refcount_(0) {}
    virtual ~RefCounted() = default;

    RefCounted(const RefCounted&) = delete;
    RefCounted& operator=(const RefCounted&) = delete;

    // Reference counting
    void addRef() const {
        refcount_.fetch_add(1, std::memory_order_relaxed);
    }

    void release() const {
        if (refcount_.fetch_sub(1, std::memory_order_release) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            delete this;
        }
    }

    uint32_t getRefCount() const {
        return refcount_.load(std::memory_order_relaxed);
    }
};

/**
 * NodeRef - owning handle to a reference-counted node
 *
 * Copying a handle shares the node; the node is deleted when the last handle
 * (in any version of any container) goes away. A null handle stands for an
 * empty subtree.
 */
template <typename T>
class NodeRef {
private:
    T* ptr_;

public:
    NodeRef() : ptr_(nullptr) {}
    NodeRef(std::nullptr_t) : ptr_(nullptr) {}

    explicit NodeRef(T* ptr) : ptr_(ptr) {
        if (ptr_) ptr_->addRef();
    }

    template <typename U>
    NodeRef(const NodeRef<U>& other) : ptr_(other.get()) {
        if (ptr_) ptr_->addRef();
    }

    NodeRef(const NodeRef& other) : ptr_(other.ptr_) {
        if (ptr_) ptr_->addRef();
    }

    NodeRef(NodeRef&& other) noexcept : ptr_(other.ptr_) {
        other.ptr_ = nullptr;
    }

    ~NodeRef() {
        if (ptr_) ptr_->release();
    }

    NodeRef& operator=(const NodeRef& other) {
        // other may live inside the node being released
        T* ptr = other.ptr_;
        if (ptr) ptr->addRef();
        if (ptr_) ptr_->release();
        ptr_ = ptr;
        return *this;
    }

    NodeRef& operator=(NodeRef&& other) noexcept {
        if (this != &other) {
            T* old = ptr_;
            ptr_ = other.ptr_;
            other.ptr_ = nullptr;
            if (old) old->release();
        }
        return *this;
    }

    T* get() const { return ptr_; }
    T* operator->() const { return ptr_; }
    T& operator*() const { return *ptr_; }
    explicit operator bool() const { return ptr_ != nullptr; }

    bool operator==(const NodeRef& other) const { return ptr_ == other.ptr_; }
    bool operator!=(const NodeRef& other) const { return ptr_ != other.ptr_; }
};

// Allocate a node and hand back its first reference
template <typename T, typename... Args>
NodeRef<T> makeNode(Args&&... args) {
    return NodeRef<T>(new T(std::forward<Args>(args)...));
}

} // namespace ptrie
