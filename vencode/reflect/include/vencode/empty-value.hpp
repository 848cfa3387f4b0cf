#pragma once

#include "vencode/value-ref.hpp"

namespace vencode {

// Tells whether 'value' is empty for omit-if-empty purposes.
// A type's own isCodecEmpty() has priority. Otherwise zero scalars, empty strings, slices, maps and channels,
// nil pointers, interfaces and functions are empty.
// In 'recursive' mode, pointers and interfaces are empty if their target is, arrays if all their elements are,
// and structs if all their fields are. In shallow mode, arrays and structs are compared with their zero value.
[[nodiscard]] bool IsEmptyValue(ValueRef value, bool recursive);

}  // namespace vencode
