#ifndef LISTOPS_STRINGS_HPP
#define LISTOPS_STRINGS_HPP

#include <string>
#include <vector>
#include "defaults.hpp"
#include "option.hpp"
#include "validator.hpp"

// String <-> list conversion
//
// The delimiter is always a literal string, never a pattern. A null
// const char* source or delimiter reads as absent, like an empty one.

// @safe
namespace listops {

inline constexpr const char* DEFAULT_DELIMITER = ",";
inline constexpr const char* WHITE_SPACE_DELIMITER = " ";

// Joins the elements in encounter order, separated by delimiter.
// Returns "" when the list or the delimiter is empty.
// @lifetime: owned
inline std::string join(const std::vector<std::string>& list,
                        const std::string& delimiter) {
    if (is_empty(list) || is_empty(delimiter)) {
        return EMPTY;
    }
    std::string result = list.front();
    for (size_t i = 1; i < list.size(); ++i) {
        result += delimiter;
        result += list[i];
    }
    return result;
}

// A null delimiter is an absent one
// @lifetime: owned
inline std::string join(const std::vector<std::string>& list,
                        const char* delimiter = DEFAULT_DELIMITER) {
    if (is_empty(delimiter)) {
        return EMPTY;
    }
    return join(list, std::string(delimiter));
}

// @lifetime: owned
inline std::string join(Option<const std::vector<std::string>&> list,
                        const std::string& delimiter) {
    return join(list_or_empty(list), delimiter);
}

// @lifetime: owned
inline std::string join(Option<const std::vector<std::string>&> list,
                        const char* delimiter = DEFAULT_DELIMITER) {
    return join(list_or_empty(list), delimiter);
}

// Splits source at every occurrence of delimiter.
// A leading delimiter produces a leading "" element; trailing empty
// elements are dropped, so a source made only of delimiters yields {}.
// Returns {} when the source or the delimiter is empty.
// @lifetime: owned
inline std::vector<std::string> split(const std::string& source,
                                      const std::string& delimiter) {
    std::vector<std::string> parts;
    if (is_empty(source) || is_empty(delimiter)) {
        return parts;
    }

    size_t start = 0;
    size_t found = source.find(delimiter);
    while (found != std::string::npos) {
        parts.push_back(source.substr(start, found - start));
        start = found + delimiter.size();
        found = source.find(delimiter, start);
    }
    parts.push_back(source.substr(start));

    while (!parts.empty() && parts.back().empty()) {
        parts.pop_back();
    }
    return parts;
}

// C string overloads: a null source or delimiter is an absent one,
// checked before any std::string is built from it.

// @lifetime: owned
inline std::vector<std::string> split(const std::string& source,
                                      const char* delimiter = DEFAULT_DELIMITER) {
    if (is_empty(delimiter)) {
        return {};
    }
    return split(source, std::string(delimiter));
}

// @lifetime: owned
inline std::vector<std::string> split(const char* source,
                                      const std::string& delimiter) {
    if (is_empty(source)) {
        return {};
    }
    return split(std::string(source), delimiter);
}

// @lifetime: owned
inline std::vector<std::string> split(const char* source,
                                      const char* delimiter = DEFAULT_DELIMITER) {
    if (is_empty(source) || is_empty(delimiter)) {
        return {};
    }
    return split(std::string(source), std::string(delimiter));
}

// @lifetime: owned
inline std::vector<std::string> split(Option<const std::string&> source,
                                      const std::string& delimiter) {
    if (source.is_none()) {
        return {};
    }
    return split(source.unwrap(), delimiter);
}

// @lifetime: owned
inline std::vector<std::string> split(Option<const std::string&> source,
                                      const char* delimiter = DEFAULT_DELIMITER) {
    if (source.is_none()) {
        return {};
    }
    return split(source.unwrap(), delimiter);
}

} // namespace listops

#endif // LISTOPS_STRINGS_HPP
