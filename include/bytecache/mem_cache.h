#ifndef BYTECACHE_MEM_CACHE_H
#define BYTECACHE_MEM_CACHE_H

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include <absl/container/node_hash_map.h>
#include <absl/hash/hash.h>

#ifdef _WIN32
#    pragma warning(push)
#    pragma warning(disable : 4244)
#    pragma warning(disable : 4018)
#endif

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/rolling_mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>

#ifdef _WIN32
#    pragma warning(pop)
#endif

#include "history.h"
#include "item.h"
#include "measurement.h"

/// @brief Root namespace
namespace bytecache {

/// @brief Outcome of an insertion in a `MemCache`.
enum class StoreResult
{
    Stored,      //!< The value is in cache.
    OutOfMemory  //!< The value could not fit, even after reclaiming every aged-out generation.
};

/// @brief Byte-bounded in-memory cache with approximate least-recently-used eviction.
/// @details Values are kept in a hash map while their recency is tracked by a `History`. When an insertion
///          does not fit in the byte limit, the cache reclaims the generations that aged out of the history
///          and evicts their values. An insertion that still does not fit is refused.
///
///          Both insertions and lookups refresh the recency of a key.
/// @tparam Key The type of the key used for retrieving items.
/// @tparam Value The type of the items stored in the cache.
/// @tparam MeasureValue A functor returning the size of a cache value, in bytes.
/// @tparam KeyHash A default-constructible callable type returning a hash of a key. Defaults to `absl::Hash<Key>`.
/// @tparam ThreadSafe Whether to protect every operation with a single lock. `false` by default: without it,
///                    the owner of the cache is responsible for serializing accesses.
template<typename Key,
         typename Value,
         typename MeasureValue = measurement::Size<Value>,
         typename KeyHash      = absl::Hash<Key>,
         bool ThreadSafe       = false>
class MemCache
{
public:
    using CacheType   = MemCache<Key, Value, MeasureValue, KeyHash, ThreadSafe>;
    using HistoryType = History<Key, KeyHash>;
    using BandUsage   = typename HistoryType::BandUsage;
    using LockGuard   = std::unique_lock<std::recursive_mutex>;

    /// @brief The generation threshold is the limit divided by this value.
    static constexpr uint64_t DEFAULT_GENERATION_DIVISOR = 5;

    /// @brief Number of sealed generations kept by default.
    static constexpr size_t DEFAULT_GENERATION_COUNT = 2;

    /// @brief Constructor.
    /// @details Seals a generation every `limit / 5` bytes (at least one byte) and keeps two sealed generations.
    /// @param limit The maximum number of bytes the cache may hold.
    explicit MemCache(uint64_t limit);

    /// @brief Constructor with explicit history sizing.
    /// @param limit The maximum number of bytes the cache may hold.
    /// @param generation_threshold The usage at which a generation is sealed, in bytes.
    /// @param generation_count The number of sealed generations kept before they become due for eviction.
    MemCache(uint64_t limit, uint64_t generation_threshold, size_t generation_count);

    /// @brief Check whether a given key is stored in the cache.
    /// @details Does not refresh the recency of the key.
    /// @param key The key whose presence to test.
    /// @return Whether the key is in cache.
    [[nodiscard]] bool contains(const Key& key) const;

    /// @brief Find a given key in cache returning the associated value when it exists.
    /// @details A successful lookup refreshes the key exactly like an insertion would.
    /// @param key The key to lookup.
    /// @return The value if `key` is in cache, `std::nullopt` otherwise.
    std::optional<Value> find(const Key& key);

    /// @brief Insert a key/value pair in the cache.
    /// @details If the key already exists, the provided value replaces the previous one. Only the growth of the
    ///          value has to be made room for; shrinking or same-size replacements never evict anything.
    ///
    ///          When the value does not fit, the values whose keys aged out of the history are evicted, but only
    ///          if that makes enough room. Otherwise nothing is evicted, except the key itself if it was already in cache.
    /// @param key The key to associate with the value.
    /// @param value The value to store.
    /// @return `StoreResult::Stored` if the value is in cache, `StoreResult::OutOfMemory` otherwise.
    StoreResult insert(Key key, Value value);

    /// @brief Remove a key and its value from the cache.
    /// @param key The key to remove from the cache.
    /// @return Whether the key was present in cache.
    bool remove(const Key& key);

    /// @brief Clears the cache contents and statistics.
    void clear();

    /// @brief Copy the cache contents in the provided container.
    /// @details Uses `emplace_back` for sequence containers, and `emplace` for associative containers.
    ///          Does not refresh the recency of any key.
    /// @param container The container in which to insert the items.
    template<typename C> void collect_into(C& container) const;

    /// @brief Apply a function to all objects in cache.
    /// @param unary_function The function to be applied to all items in cache.
    ///                       The function should have the signature `void fn(const Key& key, const Value& value)`.
    template<typename F> void for_each(F unary_function) const;

    /// @brief Get the number of items currently stored in the cache.
    [[nodiscard]] size_t number_of_items() const;

    /// @brief Get the number of bytes currently stored in the cache.
    [[nodiscard]] uint64_t usage() const;

    /// @brief Get the maximum number of bytes the cache may hold.
    [[nodiscard]] uint64_t limit() const;

    /// @brief Get the usage of each history band, from the band due for eviction to the most recent one.
    [[nodiscard]] std::vector<BandUsage> detailed_usage() const;

    /// @brief Same as `detailed_usage()`, without the band capacities.
    [[nodiscard]] std::vector<uint64_t> simple_usage() const;

    /// @brief Get a copy of the history tracking the recency of the cached keys.
    /// @details The copy is taken under the cache lock and does not follow later operations on the cache.
    [[nodiscard]] HistoryType history() const;

    /// @brief Compute and return the running hit rate of the cache.
    /// @details The hit rate is computed using a sliding window of the last `statistics_window_size()` lookups.
    /// @return The hit rate, as a fraction.
    [[nodiscard]] double hit_rate() const;

    /// @brief Compute and return the running byte hit rate of the cache, in bytes.
    /// @details The byte hit rate represents the average amount of data served by each lookup.
    /// @return The byte hit rate, in bytes.
    [[nodiscard]] double byte_hit_rate() const;

    /// @brief Get the size of the sliding window used for computing statistics.
    [[nodiscard]] uint32_t statistics_window_size() const;

    /// @brief Set the size of the sliding window used for computing statistics.
    /// @warning This resets the access log.
    /// @param window_size The desired statistics window size.
    void statistics_window_size(uint32_t window_size);

protected:
    LockGuard lock() const;

private:
    using CacheItem = Item<Value>;
    using DataMap   = absl::node_hash_map<Key, CacheItem, KeyHash>;
    using Spilled   = std::vector<std::pair<Key, uint64_t>>;

    using RollingMeanTag        = boost::accumulators::tag::rolling_mean;
    using RollingMeanStatistics = boost::accumulators::stats<RollingMeanTag>;
    using MeanAccumulator       = boost::accumulators::accumulator_set<uint64_t, RollingMeanStatistics>;

    uint64_t m_limit;
    uint32_t m_statistics_window_size = 1000;

    MeasureValue m_measure_value;

    mutable std::recursive_mutex m_mutex;
    DataMap                      m_data;
    HistoryType                  m_history;

    MeanAccumulator m_hit_rate_acc;
    MeanAccumulator m_byte_hit_rate_acc;

    bool     free_memory(const Key& key, uint64_t new_size);
    uint64_t marginal_size(const Key& key, uint64_t new_size) const;

    void on_cache_hit(const CacheItem& item);
    void on_cache_miss();
};

}  // namespace bytecache

#include "mem_cache.hpp"

#endif
