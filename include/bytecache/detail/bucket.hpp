#include <cassert>
#include <iterator>
#include <type_traits>
#include <utility>

namespace bytecache::detail {

template<class K, class KH> bool Bucket<K, KH>::contains(const K& key) const
{
    return m_costs.find(key) != m_costs.end();
}

template<class K, class KH> std::optional<uint64_t> Bucket<K, KH>::get(const K& key) const
{
    auto key_and_cost = m_costs.find(key);
    if (key_and_cost != m_costs.end()) {
        return key_and_cost->second;
    }
    return std::nullopt;
}

template<class K, class KH> bool Bucket<K, KH>::insert(K key, uint64_t cost)
{
    auto [key_and_cost, inserted] = m_costs.try_emplace(std::move(key), cost);
    if (!inserted) {
        assert(key_and_cost->second <= m_usage);
        m_usage -= key_and_cost->second;
        key_and_cost->second = cost;
    }

    m_usage += cost;
    return inserted;
}

template<class K, class KH> bool Bucket<K, KH>::remove(const K& key)
{
    auto key_and_cost = m_costs.find(key);
    if (key_and_cost == m_costs.end()) {
        return false;
    }

    assert(key_and_cost->second <= m_usage);
    m_usage -= key_and_cost->second;
    m_costs.erase(key_and_cost);
    return true;
}

template<class K, class KH> template<class It> void Bucket<K, KH>::extend(It first, It last)
{
    using Category = typename std::iterator_traits<It>::iterator_category;

    // Only multi-pass iterators can be measured without consuming them.
    if constexpr (std::is_base_of_v<std::forward_iterator_tag, Category>) {
        m_costs.reserve(m_costs.size() + static_cast<size_t>(std::distance(first, last)));
    }

    for (; first != last; ++first) {
        const auto& [key, cost] = *first;
        insert(key, cost);
    }
}

template<class K, class KH> template<class Range> void Bucket<K, KH>::extend(const Range& range)
{
    extend(std::begin(range), std::end(range));
}

template<class K, class KH> void Bucket<K, KH>::clear()
{
    m_costs.clear();
    m_usage = 0;
}

template<class K, class KH> void Bucket<K, KH>::recycle()
{
    // Unlike clear(), erasing a range never shrinks the backing array.
    m_costs.erase(m_costs.begin(), m_costs.end());
    m_usage = 0;
}

template<class K, class KH> void Bucket<K, KH>::swap(Bucket& other) noexcept
{
    using std::swap;

    swap(m_costs, other.m_costs);
    swap(m_usage, other.m_usage);
}

template<class K, class KH> uint64_t Bucket<K, KH>::usage() const
{
    return m_usage;
}

template<class K, class KH> size_t Bucket<K, KH>::size() const
{
    return m_costs.size();
}

template<class K, class KH> bool Bucket<K, KH>::empty() const
{
    return m_costs.empty();
}

template<class K, class KH> size_t Bucket<K, KH>::capacity() const
{
    return m_costs.capacity();
}

template<class K, class KH> auto Bucket<K, KH>::begin() const -> const_iterator
{
    return m_costs.begin();
}

template<class K, class KH> auto Bucket<K, KH>::end() const -> const_iterator
{
    return m_costs.end();
}

template<class K, class KH> void swap(Bucket<K, KH>& lhs, Bucket<K, KH>& rhs) noexcept
{
    lhs.swap(rhs);
}

}  // namespace bytecache::detail
