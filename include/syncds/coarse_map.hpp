// coarse_map.hpp
// Thread-safe hash map: growable bucket array behind ONE mutex.
// -----------------------------------------------------------
// * put / get / remove / contains and the resize all run under the same
//   table mutex; the acquisition is the linearization point.
// * When an insertion pushes entries / buckets above the configured
//   threshold the table doubles and every entry is rehashed before the
//   mutex is released.

#ifndef SYNCDS_COARSE_MAP_HPP
#define SYNCDS_COARSE_MAP_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "bucket.hpp"
#include "map_config.hpp"

namespace syncds
{

    template <typename K, typename V, typename Hash = std::hash<K>,
              typename KeyEqual = std::equal_to<K>>
    class CoarseMap
    {
        static_assert(nothrow_entry_v<K, V>,
                      "CoarseMap keys and values must be nothrow move constructible and assignable");

    public:
        using BucketT = Bucket<K, V>;
        using handle = std::shared_ptr<CoarseMap>;

        /*  Throws std::invalid_argument if `config` is unusable. */
        explicit CoarseMap(MapConfig config = MapConfig{}, Hash h = Hash{},
                           KeyEqual eq = KeyEqual{})
            : config_(config), hasher_(std::move(h)), equal_(std::move(eq))
        {
            config_.validate();
            table_.resize(config_.initial_bucket_count);
        }

        static handle make(MapConfig config = MapConfig{}, Hash h = Hash{},
                           KeyEqual eq = KeyEqual{})
        {
            return std::make_shared<CoarseMap>(config, std::move(h), std::move(eq));
        }

        CoarseMap(const CoarseMap &) = delete;
        CoarseMap &operator=(const CoarseMap &) = delete;

        /*  Insert or overwrite.  Returns the previous value if key existed. */
        std::optional<V> put(K key, V value)
        {
            std::lock_guard<std::mutex> guard(mtx_);

            BucketT *bucket = &table_[slot(key)];
            auto it = find_entry(*bucket, key, equal_);
            if (it != bucket->end())
                return exchange_value<K, V>(it, std::move(value));

            // Grow first when this insertion crosses the threshold, so a
            // failed rehash leaves the map exactly as it was.
            if (config_.exceeded_by(count_ + 1, table_.size()))
            {
                resize();
                bucket = &table_[slot(key)];
            }

            bucket->emplace_back(std::move(key), std::move(value));
            ++count_;
            return std::nullopt;
        }

        std::optional<V> get(const K &key) const
        {
            std::lock_guard<std::mutex> guard(mtx_);

            const BucketT &bucket = table_[slot(key)];
            auto it = find_entry(bucket, key, equal_);
            if (it == bucket.end())
                return std::nullopt;
            return it->second;
        }

        /*  Returns the removed value, or nullopt if key was absent. */
        std::optional<V> remove(const K &key)
        {
            std::lock_guard<std::mutex> guard(mtx_);

            BucketT &bucket = table_[slot(key)];
            auto it = find_entry(bucket, key, equal_);
            if (it == bucket.end())
                return std::nullopt;

            std::optional<V> value = take_entry(bucket, it);
            --count_;
            return value;
        }

        bool contains(const K &key) const
        {
            std::lock_guard<std::mutex> guard(mtx_);
            const BucketT &bucket = table_[slot(key)];
            return find_entry(bucket, key, equal_) != bucket.end();
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> guard(mtx_);
            return count_;
        }

        bool empty() const { return size() == 0; }

        std::size_t bucket_count() const
        {
            std::lock_guard<std::mutex> guard(mtx_);
            return table_.size();
        }

        double load_factor() const
        {
            std::lock_guard<std::mutex> guard(mtx_);
            return static_cast<double>(count_) / static_cast<double>(table_.size());
        }

        std::size_t resize_count() const
        {
            std::lock_guard<std::mutex> guard(mtx_);
            return resizes_;
        }

        const MapConfig &config() const noexcept { return config_; }

        /*  Every entry in its home bucket, no duplicate keys, count matches. */
        bool validate() const
        {
            std::lock_guard<std::mutex> guard(mtx_);
            std::size_t entries = 0;
            return well_placed(table_, entries, hasher_, equal_) && entries == count_;
        }

    private:
        std::size_t slot(const K &key) const { return hasher_(key) % table_.size(); }

        /*  Caller holds mtx_.  rehash() leaves table_ untouched if it throws. */
        void resize()
        {
            table_ = rehash(table_, table_.size() * 2, hasher_);
            ++resizes_;
        }

        MapConfig config_;
        Hash hasher_;
        KeyEqual equal_;

        Table<K, V> table_;
        std::size_t count_{0};
        std::size_t resizes_{0};
        mutable std::mutex mtx_;
    };

} // namespace syncds

#endif // SYNCDS_COARSE_MAP_HPP
