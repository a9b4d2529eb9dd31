// striped_map.hpp
// Thread-safe hash map with lock striping and a stop-the-world resize.
// -----------------------------------------------------------
// * A fixed bank of S mutexes ("stripes") guards a growable bucket array.
//   Stripe i owns every bucket whose index is congruent to i modulo S.
// * The bucket count is always a multiple of S (it starts as one and only
//   ever doubles), therefore
//        stripe_of(hash % buckets) == (hash % buckets) % S == hash % S
//   and a key's stripe never changes across resizes, even though its
//   bucket does.  S itself never changes.
// * put / get / remove lock exactly one stripe.  Operations on different
//   stripes run fully in parallel.
// * Resize takes EVERY stripe in increasing index order.  Single-stripe
//   operations take one lock from that same total order, so no cycle of
//   waiters can form, and nobody runs while entries migrate.

#ifndef SYNCDS_STRIPED_MAP_HPP
#define SYNCDS_STRIPED_MAP_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "bucket.hpp"
#include "map_config.hpp"

namespace syncds
{

    /*═══════════════════════════════════════════════════════════════════════════
     *  StripeGuard - ordered acquisition of a whole lock bank
     *═══════════════════════════════════════════════════════════════════════════
     *  Locks every mutex of the bank in increasing index order and unlocks
     *  them in reverse order on destruction.  Used by resize and by the
     *  whole-table queries (validate) that need a frozen table.
     *═══════════════════════════════════════════════════════════════════════════*/
    class StripeGuard
    {
    public:
        explicit StripeGuard(std::vector<std::mutex> &bank) : bank_(bank)
        {
            for (; held_ < bank_.size(); ++held_)
                bank_[held_].lock();
        }

        ~StripeGuard()
        {
            while (held_ > 0)
                bank_[--held_].unlock();
        }

        StripeGuard(const StripeGuard &) = delete;
        StripeGuard &operator=(const StripeGuard &) = delete;

    private:
        std::vector<std::mutex> &bank_;
        std::size_t held_{0};
    };

    template <typename K, typename V, typename Hash = std::hash<K>,
              typename KeyEqual = std::equal_to<K>>
    class StripedMap
    {
        static_assert(nothrow_entry_v<K, V>,
                      "StripedMap keys and values must be nothrow move constructible and assignable");

    public:
        using BucketT = Bucket<K, V>;
        using handle = std::shared_ptr<StripedMap>;

        /*───────────────────────────────────────────────────────────────────────
          Constructor
          ───────────
          • Validates `config` (throws std::invalid_argument).
          • Allocates stripe_count mutexes; this number is final.
          • Rounds initial_bucket_count up to a multiple of stripe_count so
            that stripe_of(bucket) = bucket % S covers every bucket.
         ──────────────────────────────────────────────────────────────────────*/
        explicit StripedMap(MapConfig config = MapConfig{}, Hash h = Hash{},
                            KeyEqual eq = KeyEqual{})
            : config_(checked(config)), hasher_(std::move(h)), equal_(std::move(eq)),
              stripes_(config_.stripe_count)
        {
            const std::size_t s = config_.stripe_count;
            config_.initial_bucket_count = (config_.initial_bucket_count + s - 1) / s * s;
            table_.resize(config_.initial_bucket_count);
        }

        static handle make(MapConfig config = MapConfig{}, Hash h = Hash{},
                           KeyEqual eq = KeyEqual{})
        {
            return std::make_shared<StripedMap>(config, std::move(h), std::move(eq));
        }

        StripedMap(const StripedMap &) = delete;
        StripedMap &operator=(const StripedMap &) = delete;

        // ────────────────────────────────────────────────────────────────────
        //  put(key, value)
        //
        //  1. hash once, lock stripe hash % S.
        //  2. key present → overwrite, return the previous value.
        //  3. key absent and this insertion would push the load factor over
        //     the threshold → remember the bucket count we saw, drop the
        //     stripe, run resize(seen) and start over against whatever
        //     table is installed by then.  Growing before linking keeps a
        //     failed rehash from leaving a half-done put behind.
        //  4. otherwise append to the bucket and bump the entry count.
        //
        //  The count is read under this stripe only, so inserts racing on
        //  other stripes can overshoot the threshold by at most S-1 entries
        //  (see MapConfig::exceeded_by); the next insert then grows.
        // ────────────────────────────────────────────────────────────────────
        std::optional<V> put(K key, V value)
        {
            const std::size_t h = hasher_(key);

            for (;;)
            {
                std::size_t seen = 0;
                {
                    std::lock_guard<std::mutex> guard(stripe_for(h));

                    BucketT &bucket = table_[h % table_.size()];
                    auto it = find_entry(bucket, key, equal_);
                    if (it != bucket.end())
                        return exchange_value<K, V>(it, std::move(value));

                    const std::size_t entries = count_.load(std::memory_order_relaxed);
                    if (!config_.exceeded_by(entries + 1, table_.size()))
                    {
                        bucket.emplace_back(std::move(key), std::move(value));
                        count_.fetch_add(1, std::memory_order_relaxed);
                        return std::nullopt;
                    }
                    seen = table_.size();
                }

                resize(seen);
            }
        }

        std::optional<V> get(const K &key) const
        {
            const std::size_t h = hasher_(key);
            std::lock_guard<std::mutex> guard(stripe_for(h));

            const BucketT &bucket = table_[h % table_.size()];
            auto it = find_entry(bucket, key, equal_);
            if (it == bucket.end())
                return std::nullopt;
            return it->second;
        }

        std::optional<V> remove(const K &key)
        {
            const std::size_t h = hasher_(key);
            std::lock_guard<std::mutex> guard(stripe_for(h));

            BucketT &bucket = table_[h % table_.size()];
            auto it = find_entry(bucket, key, equal_);
            if (it == bucket.end())
                return std::nullopt;

            std::optional<V> value = take_entry(bucket, it);
            count_.fetch_sub(1, std::memory_order_relaxed);
            return value;
        }

        bool contains(const K &key) const
        {
            const std::size_t h = hasher_(key);
            std::lock_guard<std::mutex> guard(stripe_for(h));

            const BucketT &bucket = table_[h % table_.size()];
            return find_entry(bucket, key, equal_) != bucket.end();
        }

        /*  Entry count.  Exact whenever no put/remove is in flight. */
        std::size_t size() const noexcept { return count_.load(std::memory_order_relaxed); }

        bool empty() const noexcept { return size() == 0; }

        std::size_t stripe_count() const noexcept { return stripes_.size(); }

        /*  The table is only replaced while ALL stripes are held, so any
            single stripe is enough to read a consistent bucket count.     */
        std::size_t bucket_count() const
        {
            std::lock_guard<std::mutex> guard(stripes_.front());
            return table_.size();
        }

        double load_factor() const
        {
            std::lock_guard<std::mutex> guard(stripes_.front());
            return static_cast<double>(count_.load(std::memory_order_relaxed)) /
                   static_cast<double>(table_.size());
        }

        std::size_t resize_count() const
        {
            std::lock_guard<std::mutex> guard(stripes_.front());
            return resizes_;
        }

        /*  Effective configuration (initial_bucket_count after rounding). */
        const MapConfig &config() const noexcept { return config_; }

        /*────────────────────────────────────────────────────────────────────
          validate()
          ──────────
          Freezes the table (all stripes) and checks that
            • the bucket count is a multiple of the stripe count;
            • every entry sits in bucket hash % bucket_count;
            • no key appears twice in a bucket;
            • the entry count matches.
         ────────────────────────────────────────────────────────────────────*/
        bool validate() const
        {
            StripeGuard all(stripes_);
            std::size_t entries = 0;
            return table_.size() % stripes_.size() == 0 &&
                   well_placed(table_, entries, hasher_, equal_) &&
                   entries == count_.load(std::memory_order_relaxed);
        }

    private:
        static const MapConfig &checked(const MapConfig &config)
        {
            config.validate();
            return config;
        }

        std::mutex &stripe_for(std::size_t h) const { return stripes_[h % stripes_.size()]; }

        /*════════════════════════════════════════════════════════════════════
          resize(seen)
          ════════════
          `seen` is the bucket count the caller observed when it decided
          the table must grow.

          1. Acquire every stripe, index 0 → S-1 (StripeGuard).
          2. Re-check under the full lock:
               • bucket count still == seen?  Otherwise another thread
                 already grew the table for this crossing → done.
               • still over the threshold with one more entry?  Removes
                 may have brought the load back down → done.
          3. Build a table of 2·seen buckets holding every entry (see
             rehash(): throws leave the old table installed), install it,
             count the resize.
          4. StripeGuard releases S-1 → 0.
         ════════════════════════════════════════════════════════════════════*/
        void resize(std::size_t seen)
        {
            StripeGuard all(stripes_);

            if (table_.size() != seen)
                return;
            if (!config_.exceeded_by(count_.load(std::memory_order_relaxed) + 1, seen))
                return;

            table_ = rehash(table_, seen * 2, hasher_);
            ++resizes_;
        }

        MapConfig config_;
        Hash hasher_;
        KeyEqual equal_;

        mutable std::vector<std::mutex> stripes_; // size fixed at construction
        Table<K, V> table_;                       // replaced only under all stripes
        std::atomic<std::size_t> count_{0};       // written under a stripe lock
        std::size_t resizes_{0};                  // written under all stripes
    };

} // namespace syncds

#endif // SYNCDS_STRIPED_MAP_HPP
