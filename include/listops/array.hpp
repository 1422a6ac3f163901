#ifndef LISTOPS_ARRAY_HPP
#define LISTOPS_ARRAY_HPP

#include <cassert>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <new>
#include <utility>
#include "option.hpp"

// Array<T> - An owned array whose length is fixed at construction
// Equivalent to Rust's Box<[T]>
//
// This is the "fixed-size" side of the list <-> array conversions. Unlike
// std::vector it cannot grow or shrink; the length is decided once, when
// the elements are copied in.
//
// Guarantees:
// - Single ownership of the buffer (move-only, clone() for a deep copy)
// - T does not need a default constructor
// - Elements are destroyed in order when the Array is dropped

// @safe
namespace listops {

template<typename T>
class Array {
private:
    T* data_;
    size_t len_;

    // Allocates raw storage and copy-constructs [first, first + n) into it
    template<typename ForwardIt>
    void fill_from(ForwardIt first, size_t n) {
        if (n == 0) return;
        data_ = static_cast<T*>(::operator new(n * sizeof(T)));
        size_t built = 0;
        try {
            for (; built < n; ++built, ++first) {
                new (&data_[built]) T(*first);
            }
        } catch (...) {
            destroy(built);
            throw;
        }
        len_ = n;
    }

    void destroy(size_t count) {
        for (size_t i = 0; i < count; ++i) {
            data_[i].~T();
        }
        ::operator delete(data_);
        data_ = nullptr;
        len_ = 0;
    }

public:
    using value_type = T;
    using iterator = T*;
    using const_iterator = const T*;

    // Empty array
    Array() : data_(nullptr), len_(0) {}

    Array(std::initializer_list<T> init) : data_(nullptr), len_(0) {
        fill_from(init.begin(), init.size());
    }

    // Copies [first, last); needs forward iterators to size the buffer
    template<typename ForwardIt>
    Array(ForwardIt first, ForwardIt last) : data_(nullptr), len_(0) {
        fill_from(first, static_cast<size_t>(std::distance(first, last)));
    }

    // Copies len values starting at ptr
    Array(const T* ptr, size_t len) : data_(nullptr), len_(0) {
        if (ptr != nullptr) {
            fill_from(ptr, len);
        }
    }

    Array(const Array&) = delete;
    Array& operator=(const Array&) = delete;

    Array(Array&& other) noexcept : data_(other.data_), len_(other.len_) {
        other.data_ = nullptr;
        other.len_ = 0;
    }

    Array& operator=(Array&& other) noexcept {
        if (this != &other) {
            destroy(len_);
            data_ = other.data_;
            len_ = other.len_;
            other.data_ = nullptr;
            other.len_ = 0;
        }
        return *this;
    }

    ~Array() {
        destroy(len_);
    }

    // ========================================================================
    // Element access
    // ========================================================================

    // @lifetime: (&'a) -> &'a
    T& operator[](size_t index) {
        assert(index < len_ && "Array index out of bounds");
        return data_[index];
    }

    // @lifetime: (&'a) -> &'a
    const T& operator[](size_t index) const {
        assert(index < len_ && "Array index out of bounds");
        return data_[index];
    }

    // Checked access, None when out of range
    // @lifetime: (&'a) -> Option<&'a const T>
    Option<const T&> get(size_t index) const {
        if (index < len_) {
            return Option<const T&>(data_[index]);
        }
        return None;
    }

    // @lifetime: (&'a) -> Option<&'a const T>
    Option<const T&> first() const {
        return get(0);
    }

    // @lifetime: (&'a) -> Option<&'a const T>
    Option<const T&> last() const {
        if (len_ == 0) return None;
        return get(len_ - 1);
    }

    // @lifetime: (&'a) -> &'a
    T* data() { return data_; }
    const T* data() const { return data_; }

    size_t len() const { return len_; }
    size_t size() const { return len_; }
    bool is_empty() const { return len_ == 0; }

    // @lifetime: (&'a) -> &'a
    iterator begin() { return data_; }
    iterator end() { return data_ + len_; }
    const_iterator begin() const { return data_; }
    const_iterator end() const { return data_ + len_; }

    // @lifetime: owned
    Array clone() const {
        return Array(begin(), end());
    }

    bool operator==(const Array& other) const {
        if (len_ != other.len_) return false;
        for (size_t i = 0; i < len_; ++i) {
            if (!(data_[i] == other.data_[i])) return false;
        }
        return true;
    }

    bool operator!=(const Array& other) const {
        return !(*this == other);
    }
};

// Helper function to create an Array
template<typename T>
// @lifetime: owned
Array<T> array_of(std::initializer_list<T> init) {
    return Array<T>(init);
}

} // namespace listops

#endif // LISTOPS_ARRAY_HPP
