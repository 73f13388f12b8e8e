#include <algorithm>
#include <cassert>
#include <utility>

namespace bytecache {

template<class K, class V, class MV, class KH, bool TS>
MemCache<K, V, MV, KH, TS>::MemCache(uint64_t limit)
 : MemCache(limit, std::max(limit / DEFAULT_GENERATION_DIVISOR, static_cast<uint64_t>(1)), DEFAULT_GENERATION_COUNT)
{
}

template<class K, class V, class MV, class KH, bool TS>
MemCache<K, V, MV, KH, TS>::MemCache(uint64_t limit, uint64_t generation_threshold, size_t generation_count)
 : m_limit{limit},
   m_mutex{},
   m_data{},
   m_history{generation_threshold, generation_count},
   m_hit_rate_acc(boost::accumulators::tag::rolling_window::window_size = m_statistics_window_size),
   m_byte_hit_rate_acc(boost::accumulators::tag::rolling_window::window_size = m_statistics_window_size)
{
}

template<class K, class V, class MV, class KH, bool TS> bool MemCache<K, V, MV, KH, TS>::contains(const K& key) const
{
    LockGuard guard(lock());
    return m_data.find(key) != m_data.end();
}

template<class K, class V, class MV, class KH, bool TS> std::optional<V> MemCache<K, V, MV, KH, TS>::find(const K& key)
{
    LockGuard guard(lock());

    auto key_and_item = m_data.find(key);
    if (key_and_item != m_data.end()) {
        m_history.hit(key_and_item->first, key_and_item->second.m_size);
        on_cache_hit(key_and_item->second);
        return key_and_item->second.m_value;
    }

    on_cache_miss();
    return std::nullopt;
}

template<class K, class V, class MV, class KH, bool TS> StoreResult MemCache<K, V, MV, KH, TS>::insert(K key, V value)
{
    LockGuard guard(lock());

    const auto new_size = static_cast<uint64_t>(m_measure_value(value));

    if (!free_memory(key, new_size)) {
        // The previous value must not survive a replacement that was refused.
        auto key_and_item = m_data.find(key);
        if (key_and_item != m_data.end()) {
            m_history.remove(key_and_item->first);
            m_data.erase(key_and_item);
        }
        return StoreResult::OutOfMemory;
    }

    const auto it_and_ok = m_data.insert_or_assign(std::move(key), CacheItem{std::move(value), new_size});
    m_history.hit(it_and_ok.first->first, new_size);

    assert(m_history.usage() <= m_limit);
    return StoreResult::Stored;
}

template<class K, class V, class MV, class KH, bool TS> bool MemCache<K, V, MV, KH, TS>::remove(const K& key)
{
    LockGuard guard(lock());

    auto key_and_item = m_data.find(key);
    if (key_and_item == m_data.end()) {
        return false;
    }

    [[maybe_unused]] const bool was_tracked = m_history.remove(key_and_item->first);
    assert(was_tracked);

    m_data.erase(key_and_item);
    return true;
}

template<class K, class V, class MV, class KH, bool TS> void MemCache<K, V, MV, KH, TS>::clear()
{
    LockGuard guard(lock());

    m_data.clear();
    m_history.clear();

    m_hit_rate_acc      = MeanAccumulator(boost::accumulators::tag::rolling_window::window_size = m_statistics_window_size);
    m_byte_hit_rate_acc = MeanAccumulator(boost::accumulators::tag::rolling_window::window_size = m_statistics_window_size);
}

template<class K, class V, class MV, class KH, bool TS> template<class C> void MemCache<K, V, MV, KH, TS>::collect_into(C& container) const
{
    LockGuard guard(lock());

    detail::traits::reserve_more(container, m_data.size());

    for (const auto& [key, cached_item] : m_data) {
        detail::traits::emplace_pair(container, key, cached_item.m_value);
    }
}

template<class K, class V, class MV, class KH, bool TS> template<class F> void MemCache<K, V, MV, KH, TS>::for_each(F unary_function) const
{
    LockGuard guard(lock());
    for (const auto& [key, cached_item] : m_data) {
        unary_function(key, cached_item.m_value);
    }
}

template<class K, class V, class MV, class KH, bool TS> size_t MemCache<K, V, MV, KH, TS>::number_of_items() const
{
    LockGuard guard(lock());
    return m_data.size();
}

template<class K, class V, class MV, class KH, bool TS> uint64_t MemCache<K, V, MV, KH, TS>::usage() const
{
    LockGuard guard(lock());
    return m_history.usage();
}

template<class K, class V, class MV, class KH, bool TS> uint64_t MemCache<K, V, MV, KH, TS>::limit() const
{
    return m_limit;
}

template<class K, class V, class MV, class KH, bool TS> auto MemCache<K, V, MV, KH, TS>::detailed_usage() const -> std::vector<BandUsage>
{
    LockGuard guard(lock());
    return m_history.detailed_usage();
}

template<class K, class V, class MV, class KH, bool TS> std::vector<uint64_t> MemCache<K, V, MV, KH, TS>::simple_usage() const
{
    LockGuard guard(lock());
    return m_history.simple_usage();
}

template<class K, class V, class MV, class KH, bool TS> auto MemCache<K, V, MV, KH, TS>::history() const -> HistoryType
{
    LockGuard guard(lock());
    return m_history;
}

template<class K, class V, class MV, class KH, bool TS> double MemCache<K, V, MV, KH, TS>::hit_rate() const
{
    LockGuard guard(lock());
    return boost::accumulators::rolling_mean(m_hit_rate_acc);
}

template<class K, class V, class MV, class KH, bool TS> double MemCache<K, V, MV, KH, TS>::byte_hit_rate() const
{
    LockGuard guard(lock());
    return boost::accumulators::rolling_mean(m_byte_hit_rate_acc);
}

template<class K, class V, class MV, class KH, bool TS> uint32_t MemCache<K, V, MV, KH, TS>::statistics_window_size() const
{
    return m_statistics_window_size;
}

template<class K, class V, class MV, class KH, bool TS> void MemCache<K, V, MV, KH, TS>::statistics_window_size(uint32_t window_size)
{
    LockGuard guard(lock());

    m_statistics_window_size = window_size;

    m_hit_rate_acc      = MeanAccumulator(boost::accumulators::tag::rolling_window::window_size = m_statistics_window_size);
    m_byte_hit_rate_acc = MeanAccumulator(boost::accumulators::tag::rolling_window::window_size = m_statistics_window_size);
}

template<class K, class V, class MV, class KH, bool TS> auto MemCache<K, V, MV, KH, TS>::lock() const -> LockGuard
{
    if constexpr (TS) {
        LockGuard guard{m_mutex};
        return guard;
    } else {
        LockGuard guard;
        return guard;
    }
}

template<class K, class V, class MV, class KH, bool TS> bool MemCache<K, V, MV, KH, TS>::free_memory(const K& key, uint64_t new_size)
{
    if (m_history.usage() + marginal_size(key, new_size) <= m_limit) {
        return true;
    }

    // A spill reclaims the whole old band at once and leaves nothing behind for a second one, so whether it makes
    // enough room is known upfront. A refused insertion must not evict anything.
    const uint64_t remaining_usage = m_history.usage() - m_history.reclaimable_usage();
    const uint64_t required_size   = m_history.is_reclaimable(key) ? new_size : marginal_size(key, new_size);
    if (remaining_usage + required_size > m_limit) {
        return false;
    }

    Spilled spilled;
    m_history.spill(spilled);

    for (const auto& [spilled_key, spilled_size] : spilled) {
        [[maybe_unused]] const auto erased = m_data.erase(spilled_key);
        assert(erased == 1);
    }

    assert(m_history.usage() + marginal_size(key, new_size) <= m_limit);
    return true;
}

template<class K, class V, class MV, class KH, bool TS> uint64_t MemCache<K, V, MV, KH, TS>::marginal_size(const K& key, uint64_t new_size) const
{
    auto key_and_item = m_data.find(key);
    if (key_and_item == m_data.end()) {
        return new_size;
    }

    const uint64_t existing_size = key_and_item->second.m_size;
    return new_size > existing_size ? new_size - existing_size : 0;
}

template<class K, class V, class MV, class KH, bool TS> void MemCache<K, V, MV, KH, TS>::on_cache_hit(const CacheItem& item)
{
    m_hit_rate_acc(1);
    m_byte_hit_rate_acc(item.m_size);
}

template<class K, class V, class MV, class KH, bool TS> void MemCache<K, V, MV, KH, TS>::on_cache_miss()
{
    m_hit_rate_acc(0);
    m_byte_hit_rate_acc(0);
}

}  // namespace bytecache
