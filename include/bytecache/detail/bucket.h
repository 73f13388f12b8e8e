#ifndef BYTECACHE_BUCKET_H
#define BYTECACHE_BUCKET_H

#include <cstdint>
#include <optional>

#include <absl/container/flat_hash_map.h>
#include <absl/hash/hash.h>

namespace bytecache::detail {

/// @brief A set of keys, each accounting for a number of bytes.
/// @details The bucket keeps a running total of the bytes of all the keys it holds.
///          This total is adjusted on every mutation and is never recomputed, except by `clear()`.
///          A bucket holds no eviction logic of its own.
/// @tparam Key The type of the keys tracked by the bucket.
/// @tparam KeyHash A default-constructible callable type returning a hash of a key.
template<typename Key, typename KeyHash = absl::Hash<Key>> class Bucket
{
    using CostMap = absl::flat_hash_map<Key, uint64_t, KeyHash>;

public:
    using value_type     = typename CostMap::value_type;
    using const_iterator = typename CostMap::const_iterator;

    /// @brief Check whether a key is held by this bucket.
    [[nodiscard]] bool contains(const Key& key) const;

    /// @brief Get the cost associated with a key.
    /// @param key The key to lookup.
    /// @return The cost of the key if it is in the bucket, `std::nullopt` otherwise.
    [[nodiscard]] std::optional<uint64_t> get(const Key& key) const;

    /// @brief Insert a key in the bucket.
    /// @details If the key is already present, its cost is replaced and the bucket usage
    ///          is adjusted by the difference between the two costs.
    /// @param key The key to insert.
    /// @param cost The number of bytes accounted to the key.
    /// @return Whether the key is new to the bucket.
    bool insert(Key key, uint64_t cost);

    /// @brief Remove a key from the bucket.
    /// @details Removing an absent key is a no-op.
    /// @param key The key to remove.
    /// @return Whether the key was present.
    bool remove(const Key& key);

    /// @brief Insert every `(key, cost)` pair in `[first, last)`.
    /// @details Equivalent to calling `insert()` on every pair. Storage is reserved beforehand
    ///          when the size of the range can be computed without consuming it.
    template<typename It> void extend(It first, It last);

    /// @brief Insert every `(key, cost)` pair of a range.
    template<typename Range> void extend(const Range& range);

    /// @brief Remove all keys and reset the usage.
    /// @details Large buckets release their storage.
    void clear();

    /// @brief Remove all keys and reset the usage, keeping the allocated storage for the next keys.
    void recycle();

    /// @brief Exchange the contents of two buckets without copying any key.
    void swap(Bucket& other) noexcept;

    /// @brief Get the total cost of all keys held.
    [[nodiscard]] uint64_t usage() const;

    /// @brief Get the number of keys held.
    [[nodiscard]] size_t size() const;

    [[nodiscard]] bool empty() const;

    /// @brief Get the number of keys the bucket can hold without allocating.
    [[nodiscard]] size_t capacity() const;

    [[nodiscard]] const_iterator begin() const;
    [[nodiscard]] const_iterator end() const;

private:
    CostMap  m_costs;
    uint64_t m_usage = 0;
};

template<class K, class KH> void swap(Bucket<K, KH>& lhs, Bucket<K, KH>& rhs) noexcept;

}  // namespace bytecache::detail

#include "bucket.hpp"

#endif
