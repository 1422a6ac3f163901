#ifndef LISTOPS_HASHSET_HPP
#define LISTOPS_HASHSET_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <unordered_set>
#include <utility>
#include <vector>

// HashSet<T> - A set of unique values backed by a hash table
//
// This is the set abstraction behind every deduplicating list operation.
// Iteration order is unspecified and may differ between runs and
// platforms; compare results as sets, never positionally.
//
// Guarantees:
// - Single ownership (move-only, use clone() for a deep copy)
// - T needs a hash (Hash) and an equality (KeyEqual)

// @safe
namespace listops {

template<typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
class HashSet {
private:
    using Table = std::unordered_set<T, Hash, KeyEqual>;
    Table table_;

public:
    using value_type = T;
    using const_iterator = typename Table::const_iterator;

    HashSet() = default;

    // @lifetime: owned
    static HashSet make() {
        return HashSet();
    }

    // @lifetime: owned
    static HashSet with_capacity(size_t cap) {
        HashSet set;
        set.table_.reserve(cap);
        return set;
    }

    // Collects the distinct values of [first, last)
    template<typename InputIt>
    // @lifetime: owned
    static HashSet from_range(InputIt first, InputIt last) {
        HashSet set;
        set.extend(first, last);
        return set;
    }

    HashSet(const HashSet&) = delete;
    HashSet& operator=(const HashSet&) = delete;

    HashSet(HashSet&& other) = default;
    HashSet& operator=(HashSet&& other) = default;

    // Returns true if the value was not already present
    bool insert(T value) {
        return table_.insert(std::move(value)).second;
    }

    bool contains(const T& value) const {
        return table_.find(value) != table_.end();
    }

    // Returns true if the value was present
    bool remove(const T& value) {
        return table_.erase(value) > 0;
    }

    template<typename InputIt>
    void extend(InputIt first, InputIt last) {
        for (; first != last; ++first) {
            table_.insert(*first);
        }
    }

    void extend(HashSet&& other) {
        while (!other.table_.empty()) {
            table_.insert(std::move(other.table_.extract(other.table_.begin()).value()));
        }
    }

    size_t len() const { return table_.size(); }
    size_t size() const { return table_.size(); }
    bool is_empty() const { return table_.empty(); }

    void clear() { table_.clear(); }

    // @lifetime: (&'a) -> &'a
    const_iterator begin() const { return table_.begin(); }
    const_iterator end() const { return table_.end(); }

    // ========================================================================
    // Set operations (each returns a new set)
    // ========================================================================

    // @lifetime: owned
    HashSet union_with(const HashSet& other) const {
        HashSet result = clone();
        result.extend(other.begin(), other.end());
        return result;
    }

    // @lifetime: owned
    HashSet intersection(const HashSet& other) const {
        const HashSet& smaller = len() <= other.len() ? *this : other;
        const HashSet& larger = len() <= other.len() ? other : *this;
        HashSet result;
        for (const T& value : smaller) {
            if (larger.contains(value)) {
                result.table_.insert(value);
            }
        }
        return result;
    }

    // Values in this set but not in other
    // @lifetime: owned
    HashSet difference(const HashSet& other) const {
        HashSet result;
        for (const T& value : table_) {
            if (!other.contains(value)) {
                result.table_.insert(value);
            }
        }
        return result;
    }

    // Values in exactly one of the two sets
    // @lifetime: owned
    HashSet symmetric_difference(const HashSet& other) const {
        HashSet result = difference(other);
        result.extend(other.difference(*this));
        return result;
    }

    // ========================================================================
    // Conversion
    // ========================================================================

    // @lifetime: owned
    HashSet clone() const {
        HashSet result;
        result.table_ = table_;
        return result;
    }

    // Copies the values out; the set is unchanged
    // @lifetime: owned
    std::vector<T> to_vec() const {
        return std::vector<T>(table_.begin(), table_.end());
    }

    // Moves the values out, leaving the set empty
    // @lifetime: owned
    std::vector<T> drain() {
        std::vector<T> result;
        result.reserve(table_.size());
        while (!table_.empty()) {
            result.push_back(std::move(table_.extract(table_.begin()).value()));
        }
        return result;
    }

    bool operator==(const HashSet& other) const {
        return table_ == other.table_;
    }

    bool operator!=(const HashSet& other) const {
        return !(*this == other);
    }
};

// Helper function to create a HashSet from a list of values
template<typename T>
// @lifetime: owned
HashSet<T> hashset_of(std::initializer_list<T> init) {
    return HashSet<T>::from_range(init.begin(), init.end());
}

} // namespace listops

#endif // LISTOPS_HASHSET_HPP
