// map_config.hpp
// Construction-time options shared by CoarseMap and StripedMap.

#ifndef SYNCDS_MAP_CONFIG_HPP
#define SYNCDS_MAP_CONFIG_HPP

#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace syncds
{

    /*-------------------------------------------------------------------------
     *  struct MapConfig
     *-------------------------------------------------------------------------
     *  initial_bucket_count   - buckets allocated at construction.
     *  stripe_count           - StripedMap only: number of locks, fixed for
     *                           the life of the map.  Ignored by CoarseMap.
     *  load_factor_threshold  - a table doubles once entries / buckets
     *                           exceeds this value after an insertion.
     *-------------------------------------------------------------------------*/
    struct MapConfig
    {
        static constexpr std::size_t DEFAULT_BUCKETS = 16;
        static constexpr std::size_t DEFAULT_STRIPES = 16;
        static constexpr double DEFAULT_LOAD_FACTOR = 0.75;

        std::size_t initial_bucket_count = DEFAULT_BUCKETS;
        std::size_t stripe_count = DEFAULT_STRIPES;
        double load_factor_threshold = DEFAULT_LOAD_FACTOR;

        /*  Throws std::invalid_argument on a configuration no map can use. */
        void validate() const
        {
            if (initial_bucket_count == 0)
                throw std::invalid_argument("syncds: initial_bucket_count must be positive");
            if (stripe_count == 0)
                throw std::invalid_argument("syncds: stripe_count must be positive");
            if (!std::isfinite(load_factor_threshold) || load_factor_threshold <= 0.0)
                throw std::invalid_argument("syncds: load_factor_threshold must be a positive finite number, got " +
                                            std::to_string(load_factor_threshold));
        }

        /*  Smallest power-of-two table (at least DEFAULT_BUCKETS) that holds
            `capacity` entries without crossing the threshold.  Throws
            std::length_error when no size_t bucket count is large enough. */
        static MapConfig for_capacity(std::size_t capacity,
                                      double load_factor = DEFAULT_LOAD_FACTOR)
        {
            MapConfig config;
            config.load_factor_threshold = load_factor;
            config.validate();

            const double needed = std::ceil(static_cast<double>(capacity) / load_factor);
            std::size_t buckets = DEFAULT_BUCKETS;
            while (static_cast<double>(buckets) < needed)
            {
                if (buckets > std::numeric_limits<std::size_t>::max() / 2)
                    throw std::length_error("syncds: no bucket count holds " +
                                            std::to_string(capacity) + " entries");
                buckets <<= 1;
            }
            config.initial_bucket_count = buckets;
            return config;
        }

        /*  True when `entries` in `buckets` buckets is above the threshold.
            StripedMap evaluates this under one stripe with a count that
            other stripes keep changing: up to stripe_count - 1 concurrent
            insertions may each pass the check against the same count, so
            a striped table can hold floor(threshold * buckets) +
            stripe_count - 1 entries before the next insertion grows it.  */
        bool exceeded_by(std::size_t entries, std::size_t buckets) const noexcept
        {
            return static_cast<double>(entries) >
                   load_factor_threshold * static_cast<double>(buckets);
        }
    };

} // namespace syncds

#endif // SYNCDS_MAP_CONFIG_HPP
