#ifndef LISTOPS_HPP
#define LISTOPS_HPP

// listops - Generic list operations for C++
//
// Conversions between strings, arrays and lists, concatenation,
// deduplicating merge, set relations and duplicate detection.
//
// Conventions shared by every operation:
// - Inputs are read-only; results are new values
// - None, null and empty inputs never throw, they yield an empty result
// - Set-backed results (merge, intersection, full_difference) are unordered

#include "listops/option.hpp"
#include "listops/defaults.hpp"
#include "listops/validator.hpp"
#include "listops/hashset.hpp"
#include "listops/array.hpp"
#include "listops/strings.hpp"
#include "listops/list_ops.hpp"

#endif // LISTOPS_HPP
