#pragma once

#include <amc/smallvector.hpp>  // IWYU pragma: export
#include <amc/vector.hpp>       // IWYU pragma: export
#include <cstdint>
#include <memory>

namespace vencode {

template <class T, class Alloc = std::allocator<T>>
using vector = amc::vector<T, Alloc>;

// Inline storage for the first N elements, heap beyond.
template <class T, std::uintmax_t N, class Alloc = std::allocator<T>>
using SmallVector = amc::SmallVector<T, N, Alloc>;

}  // namespace vencode
