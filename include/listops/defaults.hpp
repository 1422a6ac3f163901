#ifndef LISTOPS_DEFAULTS_HPP
#define LISTOPS_DEFAULTS_HPP

#include <vector>
#include "option.hpp"

// Default "empty" values handed back when an input is absent or empty

// @safe
namespace listops {

inline constexpr const char* EMPTY = "";

// One immutable empty list per element type
template<typename T>
// @lifetime: 'static
const std::vector<T>& empty_list() {
    static const std::vector<T> empty;
    return empty;
}

// The borrowed list, or the shared empty list when None
template<typename T>
// @lifetime: (&'a) -> &'a
const std::vector<T>& list_or_empty(Option<const std::vector<T>&> list) {
    return list.unwrap_or(empty_list<T>());
}

} // namespace listops

#endif // LISTOPS_DEFAULTS_HPP
