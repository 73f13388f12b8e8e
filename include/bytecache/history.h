#ifndef BYTECACHE_HISTORY_H
#define BYTECACHE_HISTORY_H

#include <cstdint>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

#include <absl/hash/hash.h>

#include "detail/bucket.h"
#include "detail/traits.h"

namespace bytecache {

/// @brief Approximate recency tracker built out of generations of keys.
/// @details Keys that were hit recently live in the `next` generation. Once the usage of `next`
///          reaches the generation threshold, `next` is sealed and pushed at the back of a ring of
///          at most `generation_count` generations. When the ring is full, its oldest generation
///          falls into the `old` band, from which `spill()` reclaims it.
///
///          A key lives in at most one of `next`, the ring or `old` at any time. Hitting a key that
///          aged into the ring or into `old` moves it back into `next`.
///
///          The generation threshold is checked after inserting into `next`: an item larger than
///          the threshold is admitted anyway and seals its generation on its own.
///
///          This class does no locking.
/// @tparam Key The type of the tracked keys.
/// @tparam KeyHash A default-constructible callable type returning a hash of a key. Defaults to `absl::Hash<Key>`.
template<typename Key, typename KeyHash = absl::Hash<Key>> class History
{
public:
    using BucketType = detail::Bucket<Key, KeyHash>;

    /// @brief Usage of a band, along with its capacity. The `old` band has no capacity.
    using BandUsage = std::pair<uint64_t, std::optional<uint64_t>>;

    /// @brief Constructor.
    /// @param max_generation_usage The usage at which the `next` generation gets sealed, in bytes.
    /// @param generation_count The number of sealed generations kept before they fall into the `old` band.
    History(uint64_t max_generation_usage, size_t generation_count);

    /// @brief Mark a key as recently used.
    /// @details If the key is already in `next` with the same cost, nothing happens. If its cost changed,
    ///          the cost is updated in place. Otherwise the key is removed from the band holding it and
    ///          inserted in `next`, which may trigger a generation rotation.
    /// @param key The key that was used.
    /// @param cost The number of bytes accounted to the key.
    void hit(Key key, uint64_t cost);

    /// @brief Stop tracking a key.
    /// @param key The key to remove.
    /// @return Whether the key was tracked.
    bool remove(const Key& key);

    /// @brief Move the contents of the `old` band into a container and empty the band.
    /// @details The container receives `(key, cost)` pairs. Uses `emplace_back` for sequence containers and
    ///          `emplace` for associative containers. Room is reserved when the container has `size()` and `reserve()`.
    /// @param target The container receiving the spilled keys.
    template<typename C> void spill(C& target);

    /// @brief Check whether a key is tracked in any band.
    [[nodiscard]] bool contains(const Key& key) const;

    /// @brief Get the total cost of the keys the next `spill()` would hand out.
    [[nodiscard]] uint64_t reclaimable_usage() const;

    /// @brief Check whether a key is due for reclamation, i.e. whether the next `spill()` would hand it out.
    [[nodiscard]] bool is_reclaimable(const Key& key) const;

    /// @brief Stop tracking all keys.
    void clear();

    /// @brief Get the total cost of all tracked keys.
    [[nodiscard]] uint64_t usage() const;

    /// @brief Get the usage of every band, oldest first: `old`, the sealed generations, then `next`.
    [[nodiscard]] std::vector<BandUsage> detailed_usage() const;

    /// @brief Same as `detailed_usage()`, without the capacities.
    [[nodiscard]] std::vector<uint64_t> simple_usage() const;

    [[nodiscard]] uint64_t max_generation_usage() const;
    [[nodiscard]] size_t   generation_count() const;

private:
    uint64_t m_max_generation_usage;
    size_t   m_generation_count;

    BucketType             m_next;
    std::deque<BucketType> m_generations;
    BucketType             m_old;

    bool dig_out(const Key& key);
    void rotate();
};

}  // namespace bytecache

#include "history.hpp"

#endif
