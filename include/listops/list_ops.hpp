#ifndef LISTOPS_LIST_OPS_HPP
#define LISTOPS_LIST_OPS_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <vector>
#include "array.hpp"
#include "defaults.hpp"
#include "hashset.hpp"
#include "option.hpp"
#include "validator.hpp"

// Generic list operations
//
// Every operation is pure: inputs are only read, results are new values.
// Absent inputs are passed as None (or an Option<const std::vector<T>&>)
// and behave exactly like empty ones. When a bare None is passed, name
// the element type explicitly: concat<int>(list, None).
//
// Operations backed by a HashSet (merge, merge_all, intersection,
// full_difference) return their elements in unspecified order. Element
// types need std::hash and operator== there, or the Hash/KeyEqual
// template arguments.

// @safe
namespace listops {

// ============================================================================
// Array <-> list
// ============================================================================

template<typename T>
// @lifetime: owned
std::vector<T> to_list(const Array<T>& source) {
    if (is_empty(source)) {
        return {};
    }
    return std::vector<T>(source.begin(), source.end());
}

template<typename T>
// @lifetime: owned
std::vector<T> to_list(Option<const Array<T>&> source) {
    if (source.is_none()) {
        return {};
    }
    return to_list(source.unwrap());
}

template<typename T, size_t N>
// @lifetime: owned
std::vector<T> to_list(const T (&source)[N]) {
    return std::vector<T>(source, source + N);
}

// A null pointer is an absent array
template<typename T>
// @lifetime: owned
std::vector<T> to_list(const T* source, size_t len) {
    if (source == nullptr || len == 0) {
        return {};
    }
    return std::vector<T>(source, source + len);
}

template<typename T>
// @lifetime: owned
Array<T> to_array(const std::vector<T>& list) {
    if (is_empty(list)) {
        return Array<T>();
    }
    return Array<T>(list.begin(), list.end());
}

template<typename T>
// @lifetime: owned
Array<T> to_array(Option<const std::vector<T>&> list) {
    return to_array(list_or_empty(list));
}

// ============================================================================
// Concatenation (order and duplicates preserved)
// ============================================================================

// Flattens the present lists in order, skipping None
template<typename T>
// @lifetime: owned
std::vector<T> concat_all(std::initializer_list<Option<const std::vector<T>&>> lists) {
    size_t total = 0;
    for (const auto& list : lists) {
        if (list.is_some()) {
            total += list.unwrap().size();
        }
    }

    std::vector<T> result;
    result.reserve(total);
    for (const auto& list : lists) {
        if (list.is_some()) {
            const std::vector<T>& items = list.unwrap();
            result.insert(result.end(), items.begin(), items.end());
        }
    }
    return result;
}

// a followed by b. When one side is empty the other is returned as is.
template<typename T>
// @lifetime: owned
std::vector<T> concat(const std::vector<T>& a, const std::vector<T>& b) {
    if (is_empty(a) && is_empty(b)) {
        return {};
    }
    if (is_empty(b)) {
        return a;
    }
    if (is_empty(a)) {
        return b;
    }

    std::vector<T> result;
    result.reserve(a.size() + b.size());
    result.insert(result.end(), a.begin(), a.end());
    result.insert(result.end(), b.begin(), b.end());
    return result;
}

template<typename T>
// @lifetime: owned
std::vector<T> concat(Option<const std::vector<T>&> a, Option<const std::vector<T>&> b) {
    return concat(list_or_empty(a), list_or_empty(b));
}

// ============================================================================
// Deduplicating merge (order unspecified)
// ============================================================================

// Union of every present list, duplicates removed. None entries are skipped.
template<typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
// @lifetime: owned
std::vector<T> merge_all(std::initializer_list<Option<const std::vector<T>&>> lists) {
    HashSet<T, Hash, KeyEqual> unique;
    for (const auto& list : lists) {
        if (list.is_some()) {
            const std::vector<T>& items = list.unwrap();
            unique.extend(items.begin(), items.end());
        }
    }
    return unique.drain();
}

// Union of a and b, duplicates removed.
// Unlike merge_all, returns {} as soon as either side is empty.
template<typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
// @lifetime: owned
std::vector<T> merge(const std::vector<T>& a, const std::vector<T>& b) {
    if (is_empty(a) || is_empty(b)) {
        return {};
    }
    auto unique = HashSet<T, Hash, KeyEqual>::from_range(a.begin(), a.end());
    unique.extend(b.begin(), b.end());
    return unique.drain();
}

template<typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
// @lifetime: owned
std::vector<T> merge(Option<const std::vector<T>&> a, Option<const std::vector<T>&> b) {
    return merge<T, Hash, KeyEqual>(list_or_empty(a), list_or_empty(b));
}

// ============================================================================
// Set relations
// ============================================================================

// Distinct values present in both lists (order unspecified)
template<typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
// @lifetime: owned
std::vector<T> intersection(const std::vector<T>& a, const std::vector<T>& b) {
    if (is_empty(a) || is_empty(b)) {
        return {};
    }
    using Set = HashSet<T, Hash, KeyEqual>;
    return Set::from_range(a.begin(), a.end())
        .intersection(Set::from_range(b.begin(), b.end()))
        .drain();
}

template<typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
// @lifetime: owned
std::vector<T> intersection(Option<const std::vector<T>&> a, Option<const std::vector<T>&> b) {
    return intersection<T, Hash, KeyEqual>(list_or_empty(a), list_or_empty(b));
}

// Values of a that never occur in b, keeping a's order and repeats.
// Returns {} when b is empty, not a.
template<typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
// @lifetime: owned
std::vector<T> difference(const std::vector<T>& a, const std::vector<T>& b) {
    if (is_empty(a) || is_empty(b)) {
        return {};
    }
    auto in_b = HashSet<T, Hash, KeyEqual>::from_range(b.begin(), b.end());
    std::vector<T> result;
    for (const T& value : a) {
        if (!in_b.contains(value)) {
            result.push_back(value);
        }
    }
    return result;
}

template<typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
// @lifetime: owned
std::vector<T> difference(Option<const std::vector<T>&> a, Option<const std::vector<T>&> b) {
    return difference<T, Hash, KeyEqual>(list_or_empty(a), list_or_empty(b));
}

// Distinct values that occur in exactly one of the lists (order unspecified).
// A true symmetric difference: when only one side has values of its own,
// those values are returned rather than {} (see DESIGN.md, full_difference).
template<typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
// @lifetime: owned
std::vector<T> full_difference(const std::vector<T>& a, const std::vector<T>& b) {
    if (is_empty(a) || is_empty(b)) {
        return {};
    }
    using Set = HashSet<T, Hash, KeyEqual>;
    return Set::from_range(a.begin(), a.end())
        .symmetric_difference(Set::from_range(b.begin(), b.end()))
        .drain();
}

template<typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
// @lifetime: owned
std::vector<T> full_difference(Option<const std::vector<T>&> a, Option<const std::vector<T>&> b) {
    return full_difference<T, Hash, KeyEqual>(list_or_empty(a), list_or_empty(b));
}

// ============================================================================
// Duplicate detection
// ============================================================================

// True if some value occurs more than once. Empty collections have none.
template<typename Collection,
         typename Hash = std::hash<typename Collection::value_type>,
         typename KeyEqual = std::equal_to<typename Collection::value_type>>
bool has_duplicates(const Collection& collection) {
    if (is_empty(collection)) {
        return false;
    }
    auto seen = HashSet<typename Collection::value_type, Hash, KeyEqual>::with_capacity(collection.size());
    for (const auto& value : collection) {
        if (!seen.insert(value)) {
            return true;
        }
    }
    return false;
}

template<typename Collection,
         typename Hash = std::hash<typename Collection::value_type>,
         typename KeyEqual = std::equal_to<typename Collection::value_type>>
bool has_duplicates(Option<const Collection&> collection) {
    if (collection.is_none()) {
        return false;
    }
    return has_duplicates<Collection, Hash, KeyEqual>(collection.unwrap());
}

} // namespace listops

#endif // LISTOPS_LIST_OPS_HPP
