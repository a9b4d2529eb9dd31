// bucket.hpp
// Hash-slot helpers shared by CoarseMap and StripedMap.
// -----------------------------------------------------------
// A bucket is a short unordered sequence of key/value entries whose keys
// hash to the same slot.  Keys are unique within a bucket.  None of these
// helpers lock: the owning map holds the lock that covers the bucket.

#ifndef SYNCDS_BUCKET_HPP
#define SYNCDS_BUCKET_HPP

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace syncds
{

    /*  Entries are moved in place when a value is replaced or a hole is
        filled, so those moves must not throw for an overwrite or a remove
        to leave the bucket intact.  Both maps static_assert this.      */
    template <typename K, typename V>
    inline constexpr bool nothrow_entry_v =
        std::is_nothrow_move_constructible_v<K> && std::is_nothrow_move_assignable_v<K> &&
        std::is_nothrow_move_constructible_v<V> && std::is_nothrow_move_assignable_v<V>;

    template <typename K, typename V>
    using Bucket = std::vector<std::pair<K, V>>;

    template <typename K, typename V>
    using Table = std::vector<Bucket<K, V>>;

    template <typename K, typename V, typename KeyEqual>
    typename Bucket<K, V>::iterator find_entry(Bucket<K, V> &bucket, const K &key,
                                               const KeyEqual &eq)
    {
        auto it = bucket.begin();
        while (it != bucket.end() && !eq(it->first, key))
            ++it;
        return it;
    }

    template <typename K, typename V, typename KeyEqual>
    typename Bucket<K, V>::const_iterator find_entry(const Bucket<K, V> &bucket, const K &key,
                                                     const KeyEqual &eq)
    {
        auto it = bucket.begin();
        while (it != bucket.end() && !eq(it->first, key))
            ++it;
        return it;
    }

    /*  Replace the value of an existing entry, returning the old one. */
    template <typename K, typename V>
    std::optional<V> exchange_value(typename Bucket<K, V>::iterator it, V &&value) noexcept
    {
        std::optional<V> previous(std::move(it->second));
        it->second = std::move(value);
        return previous;
    }

    /*  Remove the entry at `it` (order inside a bucket is irrelevant, so
        the last entry fills the hole) and hand back its value.          */
    template <typename K, typename V>
    std::optional<V> take_entry(Bucket<K, V> &bucket, typename Bucket<K, V>::iterator it) noexcept
    {
        std::optional<V> value(std::move(it->second));
        if (it != bucket.end() - 1)
            *it = std::move(bucket.back());
        bucket.pop_back();
        return value;
    }

    /*────────────────────────────────────────────────────────────────────────
      rehash(old, new_count, hasher)
      ──────────────────────────────
      Builds a table of `new_count` buckets holding every entry of `old`
      at index hash(key) % new_count.

      Phase 1 (may throw: user hash, allocation) computes every target
      index and reserves every destination bucket.  Phase 2 only moves
      entries into reserved storage.  Entries are moved with
      std::move_if_noexcept, so `old` is intact if anything throws and the
      caller's table is unchanged.
     ────────────────────────────────────────────────────────────────────────*/
    template <typename K, typename V, typename Hash>
    Table<K, V> rehash(Table<K, V> &old, std::size_t new_count, const Hash &hasher)
    {
        std::vector<std::size_t> targets;
        std::vector<std::size_t> sizes(new_count, 0);
        for (const auto &bucket : old)
            for (const auto &entry : bucket)
            {
                const std::size_t idx = hasher(entry.first) % new_count;
                targets.push_back(idx);
                ++sizes[idx];
            }

        Table<K, V> fresh(new_count);
        for (std::size_t i = 0; i < new_count; ++i)
            fresh[i].reserve(sizes[i]);

        std::size_t t = 0;
        for (auto &bucket : old)
            for (auto &entry : bucket)
                fresh[targets[t++]].push_back(std::move_if_noexcept(entry));

        return fresh;
    }

    /*  Every entry sits in its home slot and no key repeats in a bucket. */
    template <typename K, typename V, typename Hash, typename KeyEqual>
    bool well_placed(const Table<K, V> &table, std::size_t &entries, const Hash &hasher,
                     const KeyEqual &eq)
    {
        entries = 0;
        for (std::size_t i = 0; i < table.size(); ++i)
        {
            const Bucket<K, V> &bucket = table[i];
            for (std::size_t a = 0; a < bucket.size(); ++a)
            {
                if (hasher(bucket[a].first) % table.size() != i)
                    return false;
                for (std::size_t b = a + 1; b < bucket.size(); ++b)
                    if (eq(bucket[a].first, bucket[b].first))
                        return false;
            }
            entries += bucket.size();
        }
        return true;
    }

} // namespace syncds

#endif // SYNCDS_BUCKET_HPP
