#ifndef LISTOPS_OPTION_HPP
#define LISTOPS_OPTION_HPP

#include <stdexcept>

// Option<const T&> - A borrowed value that may be absent
//
// listops never owns what a caller hands it, so only the borrowed form
// exists: Option<const std::vector<T>&> is a nullable list argument, and
// every list operation reads None exactly like an empty list.
//
// Guarantees:
// - Absence is a value (None), never a null pointer in the API
// - unwrap()/expect() on None throw std::runtime_error
// - The referenced value must outlive the Option

// @safe
namespace listops {

// @safe
struct None_t {
    constexpr None_t() noexcept = default;
};
inline constexpr None_t None{};

// Only Option<const T&> is defined
template<typename T>
class Option;

// @safe
template<typename T>
class Option<const T&> {
private:
    const T* target_;  // nullptr when None

public:
    Option() : target_(nullptr) {}
    Option(None_t) : target_(nullptr) {}
    Option(const T& value) : target_(&value) {}

    bool is_some() const { return target_ != nullptr; }
    bool is_none() const { return target_ == nullptr; }
    explicit operator bool() const { return is_some(); }

    // @lifetime: (&'a) -> &'a const T
    const T& unwrap() const {
        return expect("Called unwrap on None");
    }

    // @lifetime: (&'a) -> &'a const T
    const T& expect(const char* msg) const {
        if (is_none()) {
            throw std::runtime_error(msg);
        }
        return *target_;
    }

    // The borrowed value, or fallback when None
    // @lifetime: (&'a, &'b) -> &'c const T where 'a: 'c, 'b: 'c
    const T& unwrap_or(const T& fallback) const {
        return is_some() ? *target_ : fallback;
    }

    bool contains(const T& value) const {
        return is_some() && *target_ == value;
    }
};

} // namespace listops

#endif // LISTOPS_OPTION_HPP
