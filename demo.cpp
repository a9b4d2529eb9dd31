#include "syncds/syncds.hpp"

#include "print.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace
{
    bool report(bool ok, const std::string &what)
    {
        if (ok)
            util::println("  ✔ {}", what);
        else
            util::eprintln("  ✘ {}", what);
        return ok;
    }
}

int main()
{
    constexpr int NKEYS = 20'000; // key space
    constexpr int WRITERS = 8;    // mixed add/remove, put/remove
    constexpr int READERS = 8;    // heavy lookups
    constexpr int UPDATERS = 4;   // overwriting puts
    constexpr auto TEST_DURATION = std::chrono::seconds(2);

    auto set = syncds::FineGrainedSet<int>::make();
    syncds::MapConfig config;
    config.stripe_count = 8;
    auto map = syncds::StripedMap<int, int>::make(config);
    bool ok = true;

    // ── 1. bulk parallel insert ──────────────────────────────────────────
    std::vector<int> keys(NKEYS);
    std::iota(keys.begin(), keys.end(), 0);
    std::shuffle(keys.begin(), keys.end(),
                 std::mt19937{std::random_device{}()});

    auto ceil_div = [](size_t a, size_t b)
    { return (a + b - 1) / b; };

    std::vector<std::thread> threads;
    for (int w = 0; w < WRITERS; ++w)
    {
        size_t beg = w * ceil_div(NKEYS, WRITERS);
        size_t end = std::min<size_t>(beg + ceil_div(NKEYS, WRITERS), NKEYS);
        threads.emplace_back([&keys, set, map, beg, end]
                             {
            for (size_t i = beg; i < end; ++i)
            {
                set->add(keys[i]);
                map->put(keys[i], keys[i]);
            } });
    }
    for (auto &t : threads)
        t.join();
    threads.clear();
    util::println("[phase-1] bulk insert done: {} buckets after {} resizes",
                  map->bucket_count(), map->resize_count());

    // ── 2. verify content ────────────────────────────────────────────────
    bool all_present = set->size() == NKEYS && map->size() == NKEYS;
    for (int k : keys)
    {
        auto v = map->get(k);
        all_present = all_present && set->contains(k) && v && *v == k;
    }
    ok &= report(all_present, util::format("all {} keys present in both containers", NKEYS));

    // ── 3. mixed stress workload ─────────────────────────────────────────
    const auto stop_time = std::chrono::steady_clock::now() + TEST_DURATION;
    std::atomic<bool> stop{false};
    std::atomic<int> watchdog_failures{0};

    // 3-a watchdog validating invariants every 50 ms
    std::thread watchdog([&]
                         {
        while (!stop.load(std::memory_order_acquire)) {
            if (!set->validate(false) || !map->validate())
                watchdog_failures++;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });

    // Prepare unique seeds (avoid shared RNG)
    std::vector<uint32_t> seeds;
    {
        std::random_device rd;
        seeds.resize(WRITERS + READERS + UPDATERS);
        for (auto &s : seeds)
            s = rd();
    }
    size_t seed_idx = 0;

    auto rand_key = [](std::mt19937 &g)
    {
        std::uniform_int_distribution<int> d(-NKEYS / 4, NKEYS * 5 / 4);
        return d(g); // may be outside range
    };

    // 3-b writer threads: odd ones insert, even ones remove
    for (int i = 0; i < WRITERS; ++i)
    {
        uint32_t seed = seeds[seed_idx++];
        threads.emplace_back([&, i, seed]
                             {
            std::mt19937 rng{seed};
            while (std::chrono::steady_clock::now() < stop_time) {
                int k = rand_key(rng);
                if (i & 1) {
                    set->add(k);
                    map->put(k, k);
                } else {
                    set->remove(k);
                    map->remove(k);
                }
            } });
    }

    // 3-c updater threads: overwrite existing keys with new values
    for (int i = 0; i < UPDATERS; ++i)
    {
        uint32_t seed = seeds[seed_idx++];
        threads.emplace_back([&, seed]
                             {
            std::mt19937 rng{seed};
            std::uniform_int_distribution<int> d(0, NKEYS - 1);
            while (std::chrono::steady_clock::now() < stop_time) {
                int k = d(rng);
                map->put(k, k + 42);
            } });
    }

    // 3-d reader threads
    for (int i = 0; i < READERS; ++i)
    {
        uint32_t seed = seeds[seed_idx++];
        threads.emplace_back([&, seed]
                             {
            std::mt19937 rng{seed};
            while (std::chrono::steady_clock::now() < stop_time) {
                int k = rand_key(rng);
                (void) set->contains(k);
                (void) map->get(k);
            } });
    }

    // 3-e join everything, stop watchdog
    for (auto &t : threads)
        t.join();
    stop.store(true, std::memory_order_release);
    watchdog.join();
    util::println("[phase-2] mixed stress finished");
    ok &= report(watchdog_failures.load() == 0, "watchdog saw no broken invariant");

    // ── 4. final validation & stats ──────────────────────────────────────
    ok &= report(set->validate() && map->validate(), "final validation");

    size_t survivors = 0;
    for (int k = -NKEYS / 4; k < NKEYS * 5 / 4; ++k)
        if (set->contains(k))
            ++survivors;
    ok &= report(survivors == set->size(), util::format("{} keys currently in the set", survivors));

    util::println("  map: {} entries, {} buckets, load factor {}, {} resizes",
                  map->size(), map->bucket_count(), map->load_factor(), map->resize_count());

    if (!ok)
        return 1;
    util::println("🎉 ALL DEMO CHECKS PASSED");
    return 0;
}
