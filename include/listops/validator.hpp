#ifndef LISTOPS_VALIDATOR_HPP
#define LISTOPS_VALIDATOR_HPP

#include <string>
#include "option.hpp"

// Absent/empty checks shared by every list operation
//
// A value is "empty" when it is None, a null C string, or has zero length.
// Anything with a size() member counts as a container.

// @safe
namespace listops {

inline bool is_empty(const char* str) {
    return str == nullptr || *str == '\0';
}

inline bool is_empty(const std::string& str) {
    return str.empty();
}

template<typename Container>
bool is_empty(const Container& container) {
    return container.size() == 0;
}

template<typename T>
bool is_empty(const Option<const T&>& value) {
    return value.is_none() || is_empty(value.unwrap());
}

template<typename T>
bool is_not_empty(const T& value) {
    return !is_empty(value);
}

inline bool is_not_empty(const char* str) {
    return !is_empty(str);
}

} // namespace listops

#endif // LISTOPS_VALIDATOR_HPP
