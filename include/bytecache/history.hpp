#include <cassert>

namespace bytecache {

template<class K, class KH>
History<K, KH>::History(uint64_t max_generation_usage, size_t generation_count)
 : m_max_generation_usage{max_generation_usage},
   m_generation_count{generation_count}
{
}

template<class K, class KH> void History<K, KH>::hit(K key, uint64_t cost)
{
    const auto current_cost = m_next.get(key);
    if (current_cost) {
        if (*current_cost == cost) {
            return;
        }
    } else if (!m_old.remove(key)) {
        dig_out(key);
    }

    m_next.insert(std::move(key), cost);

    if (m_next.usage() >= m_max_generation_usage) {
        rotate();
    }

    assert(m_next.usage() < m_max_generation_usage || m_max_generation_usage == 0);
}

template<class K, class KH> bool History<K, KH>::remove(const K& key)
{
    return m_next.remove(key) || dig_out(key) || m_old.remove(key);
}

template<class K, class KH> template<class C> void History<K, KH>::spill(C& target)
{
    detail::traits::reserve_more(target, m_old.size());

    for (const auto& [key, cost] : m_old) {
        detail::traits::emplace_pair(target, key, cost);
    }

    m_old.recycle();
}

template<class K, class KH> bool History<K, KH>::contains(const K& key) const
{
    if (m_next.contains(key) || m_old.contains(key)) {
        return true;
    }

    for (const auto& generation : m_generations) {
        if (generation.contains(key)) {
            return true;
        }
    }
    return false;
}

template<class K, class KH> uint64_t History<K, KH>::reclaimable_usage() const
{
    return m_old.usage();
}

template<class K, class KH> bool History<K, KH>::is_reclaimable(const K& key) const
{
    return m_old.contains(key);
}

template<class K, class KH> void History<K, KH>::clear()
{
    m_next.clear();
    m_generations.clear();
    m_old.clear();
}

template<class K, class KH> uint64_t History<K, KH>::usage() const
{
    uint64_t total = m_old.usage();
    for (const auto& generation : m_generations) {
        total += generation.usage();
    }
    return total + m_next.usage();
}

template<class K, class KH> auto History<K, KH>::detailed_usage() const -> std::vector<BandUsage>
{
    std::vector<BandUsage> bands;
    bands.reserve(m_generations.size() + 2);

    bands.emplace_back(m_old.usage(), std::nullopt);
    for (const auto& generation : m_generations) {
        bands.emplace_back(generation.usage(), m_max_generation_usage);
    }
    bands.emplace_back(m_next.usage(), m_max_generation_usage);

    return bands;
}

template<class K, class KH> std::vector<uint64_t> History<K, KH>::simple_usage() const
{
    std::vector<uint64_t> bands;
    bands.reserve(m_generations.size() + 2);

    bands.push_back(m_old.usage());
    for (const auto& generation : m_generations) {
        bands.push_back(generation.usage());
    }
    bands.push_back(m_next.usage());

    return bands;
}

template<class K, class KH> uint64_t History<K, KH>::max_generation_usage() const
{
    return m_max_generation_usage;
}

template<class K, class KH> size_t History<K, KH>::generation_count() const
{
    return m_generation_count;
}

template<class K, class KH> bool History<K, KH>::dig_out(const K& key)
{
    for (auto& generation : m_generations) {
        if (generation.remove(key)) {
            return true;
        }
    }
    return false;
}

template<class K, class KH> void History<K, KH>::rotate()
{
    if (m_generation_count == 0) {
        // No ring to seal into: the generation is immediately due for reclamation.
        m_old.extend(m_next);
        m_next.recycle();
        return;
    }

    BucketType empty_generation;
    if (m_generations.size() >= m_generation_count) {
        // Recycle the storage of the oldest generation once its keys have been handed to the old band.
        empty_generation = std::move(m_generations.front());
        m_generations.pop_front();

        m_old.extend(empty_generation);
        empty_generation.recycle();
    }

    swap(empty_generation, m_next);
    m_generations.push_back(std::move(empty_generation));
}

}  // namespace bytecache
