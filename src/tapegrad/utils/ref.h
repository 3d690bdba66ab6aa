// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <atomic>
#include <cstddef>
#include <utility>
#include <type_traits>

namespace tapegrad {
namespace utils {

// Base class for intrusive reference counting.
class RefCounted {
public:
    RefCounted() = default;

    RefCounted(const RefCounted&) = delete;
    RefCounted& operator=(const RefCounted&) = delete;
    RefCounted(RefCounted&&) = delete;
    RefCounted& operator=(RefCounted&&) = delete;

    virtual ~RefCounted() = default;

    void inc_ref() const noexcept {
        _ref_count.fetch_add(1, std::memory_order_relaxed);
    }

    // Returns true when the count dropped to 0.
    bool dec_ref() const noexcept {
        return _ref_count.fetch_sub(1, std::memory_order_acq_rel) == 1;
    }

    long use_count() const noexcept {
        return _ref_count.load(std::memory_order_relaxed);
    }

private:
    mutable std::atomic<long> _ref_count{0};
};

// Intrusive smart pointer.
template <typename T>
class Ref {
public:
    Ref() : _ptr(nullptr) {}
    Ref(std::nullptr_t) : _ptr(nullptr) {}

    Ref(T* ptr) : _ptr(ptr) {
        if (_ptr) _ptr->inc_ref();
    }

    // Ref<Tensor> -> Ref<const Tensor>
    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
    Ref(const Ref<U>& other) : _ptr(other.get()) {
        if (_ptr) _ptr->inc_ref();
    }

    Ref(const Ref& other) : _ptr(other._ptr) {
        if (_ptr) _ptr->inc_ref();
    }

    Ref(Ref&& other) noexcept : _ptr(other._ptr) {
        other._ptr = nullptr;
    }

    ~Ref() {
        reset();
    }

    Ref& operator=(const Ref& other) {
        if (this != &other) {
            T* old = _ptr;
            _ptr = other._ptr;
            if (_ptr) _ptr->inc_ref();
            release(old);
        }
        return *this;
    }

    Ref& operator=(Ref&& other) noexcept {
        if (this != &other) {
            T* old = _ptr;
            _ptr = other._ptr;
            other._ptr = nullptr;
            release(old);
        }
        return *this;
    }

    T* get() const noexcept { return _ptr; }
    T* operator->() const noexcept { return _ptr; }
    T& operator*() const noexcept { return *_ptr; }
    explicit operator bool() const noexcept { return _ptr != nullptr; }

    void reset() noexcept {
        T* old = _ptr;
        _ptr = nullptr;
        release(old);
    }

private:
    static void release(T* p) noexcept {
        if (p && p->dec_ref()) delete p;
    }

    T* _ptr;
};

template <typename T, typename U>
inline bool operator==(const Ref<T>& lhs, const Ref<U>& rhs) noexcept {
    return lhs.get() == rhs.get();
}

template <typename T, typename U>
inline bool operator!=(const Ref<T>& lhs, const Ref<U>& rhs) noexcept {
    return lhs.get() != rhs.get();
}

template <typename T>
inline bool operator==(const Ref<T>& lhs, std::nullptr_t) noexcept {
    return lhs.get() == nullptr;
}

template <typename T>
inline bool operator!=(const Ref<T>& lhs, std::nullptr_t) noexcept {
    return lhs.get() != nullptr;
}

} // namespace utils
} // namespace tapegrad
