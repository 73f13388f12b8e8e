#ifndef BYTECACHE_ITEM_H
#define BYTECACHE_ITEM_H

#include <cstdint>
#include <utility>

namespace bytecache {

/// @brief A value stored in the cache along with the number of bytes it was measured at.
template<typename Value> struct Item {
    Item(Value value, uint64_t size) : m_value{std::move(value)}, m_size{size}
    {
    }
    Item(Item&& other) noexcept = default;
    Item(const Item& other)     = delete;
    Item& operator=(const Item&) = delete;
    Item& operator=(Item&&) noexcept = default;

    Value    m_value;  //!< The value stored in cache.
    uint64_t m_size;   //!< The size of the value, as reported by the cache measurement functor when it was stored.
};

template<typename Value> void swap(Item<Value>& a, Item<Value>& b)
{
    using std::swap;

    swap(a.m_value, b.m_value);
    swap(a.m_size, b.m_size);
}

}  // namespace bytecache

#endif
