#ifndef BYTECACHE_MEASUREMENT_H
#define BYTECACHE_MEASUREMENT_H

#include <cstdint>

/// @brief Functors reporting how many bytes a cached value accounts for.
/// @details Values held through a pointer (raw or smart) are measured through that pointer.
namespace bytecache::measurement {

/// @brief Get the number of bytes held by an object, from its `size()` method.
/// @details For contiguous containers exposing `data()`, such as `std::vector<uint8_t>` or `std::string`, the
///          element count is scaled by the element width. Any other type is trusted to report bytes from `size()`.
template<typename T> struct Size {
    template<typename V> uint64_t operator()(const V& object) const;
};

/// @brief Account for every object as `sizeof(T)` bytes, for values of a fixed size.
template<typename T> struct SizeOf {
    template<typename V> uint64_t operator()(const V& object) const;
};

}  // namespace bytecache::measurement

#include "measurement.hpp"

#endif
